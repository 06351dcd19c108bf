#include <catch2/catch.hpp>

#include <kvfile/formatting.hpp>
#include <kvfile/serialization.hpp>

#include <array>

using namespace kvfile;

template<typename T>
auto make_serialized(T value) {
    std::array<byte, serialized_size<T>()> buffer;
    serialize<T>(value, buffer.data());
    return buffer;
}

TEST_CASE("big endian integers", "[serialization]") {
    REQUIRE(serialized_size<u8>() == 1);
    REQUIRE(serialized_size<u16>() == 2);
    REQUIRE(serialized_size<u32>() == 4);
    REQUIRE(serialized_size<u64>() == 8);

    REQUIRE(make_serialized<u16>(0x1234) == std::array<byte, 2>{0x12, 0x34});
    REQUIRE(make_serialized<u32>(0x01020304) == std::array<byte, 4>{1, 2, 3, 4});
    REQUIRE(make_serialized<u64>(0x0102030405060708) ==
            std::array<byte, 8>{1, 2, 3, 4, 5, 6, 7, 8});
    REQUIRE(make_serialized<i32>(-2) == std::array<byte, 4>{0xff, 0xff, 0xff, 0xfe});

    const byte counter[] = {0x00, 0x00, 0x01, 0x00};
    REQUIRE(deserialize<u32>(counter) == 256);

    const byte negative[] = {0xff, 0xff};
    REQUIRE(deserialize<i16>(negative) == -1);
}

TEST_CASE("counter in a block header", "[serialization]") {
    std::array<byte, 32> header{};
    header[23] = 0xee;
    header[28] = 0xee;

    serialize<u32>(0xdeadbeef, header.data() + 24);
    REQUIRE(deserialize<u32>(header.data() + 24) == 0xdeadbeef);
    REQUIRE(header[24] == 0xde);
    REQUIRE(header[27] == 0xef);

    // Neighbours are untouched.
    REQUIRE(header[23] == 0xee);
    REQUIRE(header[28] == 0xee);
}

TEST_CASE("hex formatting", "[formatting]") {
    const byte data[] = {0x00, 0x0f, 0xab, 0xff};
    REQUIRE(format_hex(data, 4) == "00 0F AB FF");
    REQUIRE(format_hex(data, 4, 2) == "00 0F\nAB FF");
    REQUIRE(format_hex(data, 0) == "");
    REQUIRE(format_hex(data, 3, 1) == "00\n0F\nAB");

    REQUIRE(format_dump(data, 4, 3) == "     0 - 00 0F AB\n     3 - FF\n");
    REQUIRE(format_dump(data, 0) == "");
}
