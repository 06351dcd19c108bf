#include <catch2/catch.hpp>

#include <kvfile/exception.hpp>

#include <string>

using namespace kvfile;

TEST_CASE("exceptions record their throw site", "[exception]") {
    SECTION("thrown with the macro") {
        int line = 0;
        try {
            line = __LINE__ + 1;
            KVFILE_THROW(bad_argument("bad block size"));
        } catch (const usage_error& e) {
            REQUIRE(std::string(e.what()) == "bad block size");
            REQUIRE(e.site().line == line);
            REQUIRE(std::string(e.site().file).find("exception_test.cpp") != std::string::npos);

            const std::string text = e.describe();
            REQUIRE(text.find("bad block size (") == 0);
            REQUIRE(text.find(":" + std::to_string(line) + ")") != std::string::npos);
        }
    }

    SECTION("thrown directly") {
        try {
            throw store_error("commit failed");
        } catch (const io_error& e) {
            REQUIRE(e.site().line == 0);
            REQUIRE(e.describe() == "commit failed");
        }
    }
}
