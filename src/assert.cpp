#include <kvfile/assert.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>

namespace kvfile::detail {

constexpr_assertion::constexpr_assertion(const char* file, int line, const char* cond,
                                         const char* message) {
    assertion_failed(file, line, cond, message);
}

void assertion_failed(const char* file, int line, const char* cond, const char* message) {
    fmt::print(stderr, "kvfile: assertion `{}` failed: {}\n    (in {}:{})\n", cond,
               message ? message : "", file, line);
    std::fflush(stderr);
    std::abort();
}

void unreachable_reached(const char* file, int line, const char* message) {
    fmt::print(stderr, "kvfile: unreachable code executed: {}\n    (in {}:{})\n",
               message ? message : "", file, line);
    std::fflush(stderr);
    std::abort();
}

} // namespace kvfile::detail
