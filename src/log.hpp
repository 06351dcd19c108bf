#ifndef KVFILE_LOG_HPP
#define KVFILE_LOG_HPP

#include <kvfile/defs.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <utility>

#ifdef KVFILE_TRACE_IO
#    define KVFILE_TRACE(...) (fmt::print("kvfile: {}\n", fmt::format(__VA_ARGS__)))
#else
#    define KVFILE_TRACE(...)
#endif

namespace kvfile::detail {

// Reports errors that cannot be propagated to a caller.
template<typename... Args>
void log_error(fmt::format_string<Args...> format, Args&&... args) {
    fmt::print(stderr, "kvfile: error: {}\n", fmt::format(format, std::forward<Args>(args)...));
}

} // namespace kvfile::detail

#endif // KVFILE_LOG_HPP
