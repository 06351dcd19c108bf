#include <catch2/catch.hpp>

#include <kvfile/math.hpp>

#include <limits>
#include <stdexcept>

using namespace kvfile;

TEST_CASE("valid block sizes are powers of two", "[math]") {
    for (u32 size = 32; size != 0 && size <= (u32(1) << 16); size <<= 1) {
        REQUIRE(is_pow2(size));
        REQUIRE_FALSE(is_pow2(size + 1));
    }

    REQUIRE(is_pow2(u64(1) << 63));
    REQUIRE_FALSE(is_pow2(0u));
    REQUIRE_FALSE(is_pow2(8191u));
    REQUIRE_FALSE(is_pow2(std::numeric_limits<u64>::max()));
}

TEST_CASE("rounding up to a power of two", "[math]") {
    REQUIRE(round_towards_pow2(0u) == 1);
    REQUIRE(round_towards_pow2(1u) == 1);
    REQUIRE(round_towards_pow2(32u) == 32);
    REQUIRE(round_towards_pow2(43u) == 64);
    REQUIRE(round_towards_pow2(4097u) == 8192);
    REQUIRE(round_towards_pow2(u64(5) << 40) == u64(1) << 43);

    // Does not fit.
    REQUIRE(round_towards_pow2(u32(0x80000001)) == 0);
}

TEST_CASE("number of blocks covering a file", "[math]") {
    const u64 block_size = 4096;
    REQUIRE(ceil_div<u64>(0, block_size) == 0);
    REQUIRE(ceil_div<u64>(1, block_size) == 1);
    REQUIRE(ceil_div<u64>(4095, block_size) == 1);
    REQUIRE(ceil_div<u64>(4096, block_size) == 1);
    REQUIRE(ceil_div<u64>(4097, block_size) == 2);
    REQUIRE(ceil_div<u64>(10 * 4096, block_size) == 10);

    const u64 max = std::numeric_limits<u64>::max();
    REQUIRE(ceil_div<u64>(max, block_size) == max / block_size + 1);
}

TEST_CASE("checked addition", "[math]") {
    const u64 max = std::numeric_limits<u64>::max();

    REQUIRE(checked_add<u64>(8192, 4096) == 12288);
    REQUIRE(checked_add<u64>(max - 4096, 4096) == max);
    REQUIRE_THROWS_AS(checked_add<u64>(max - 4095, 4096), std::overflow_error);

    REQUIRE(checked_add<i32>(-7, 3) == -4);
    REQUIRE_THROWS_AS(checked_add<i32>(std::numeric_limits<i32>::max(), 1), std::overflow_error);
}
