#ifndef KVFILE_MATH_HPP
#define KVFILE_MATH_HPP

#include <kvfile/assert.hpp>
#include <kvfile/defs.hpp>

#include <stdexcept>
#include <type_traits>

namespace kvfile {

/// \defgroup math Math functions
/// Integer helpers for block arithmetic.
/// @{

/// True if `v` is a power of two. Zero is not.
template<typename T, std::enable_if_t<std::is_unsigned_v<T>>* = nullptr>
constexpr bool is_pow2(T v) noexcept {
    return v != 0 && (v & (v - 1)) == 0;
}

/// Returns the smallest power of two that is greater than or equal to `v`.
/// Returns 1 for `v == 0` and 0 if the result does not fit into `T`.
template<typename T, std::enable_if_t<std::is_unsigned_v<T>>* = nullptr>
constexpr T round_towards_pow2(T v) noexcept {
    T result = 1;
    while (result != 0 && result < v)
        result <<= 1;
    return result;
}

/// Returns `ceil(a / b)` for `b > 0`.
/// Used to compute the number of blocks that cover `a` bytes.
template<typename T, std::enable_if_t<std::is_unsigned_v<T>>* = nullptr>
constexpr T ceil_div(T a, T b) {
    KVFILE_CONSTEXPR_ASSERT(b > 0, "Divisor must not be zero.");
    return a / b + (a % b != 0 ? 1 : 0);
}

/// Returns `a + b`. Throws std::overflow_error if the result does not fit into `T`.
template<typename T, std::enable_if_t<std::is_integral_v<T>>* = nullptr>
constexpr T checked_add(T a, T b) {
    T result = 0;
    if (__builtin_add_overflow(a, b, &result))
        throw std::overflow_error("Addition overflows.");
    return result;
}

/// @}

} // namespace kvfile

#endif // KVFILE_MATH_HPP
