#ifndef KVFILE_ASSERT_HPP
#define KVFILE_ASSERT_HPP

/// \defgroup assertions Assertion Macros
/// Assertions guard internal invariants. Errors that can be caused by
/// a caller or by the store are reported with exceptions instead.
/// @{

#ifndef NDEBUG
#    define KVFILE_DEBUG
#endif

#ifdef KVFILE_DEBUG

/// Aborts with a message if `cond` is false. Compiled out in release builds.
#    define KVFILE_ASSERT(cond, message)                                                 \
        do {                                                                             \
            if (!(cond))                                                                 \
                ::kvfile::detail::assertion_failed(__FILE__, __LINE__, #cond, (message)); \
        } while (0)

/// Like KVFILE_ASSERT, but can be used in constexpr functions.
#    define KVFILE_CONSTEXPR_ASSERT(cond, message)                                       \
        do {                                                                             \
            if (!(cond))                                                                 \
                throw ::kvfile::detail::constexpr_assertion(__FILE__, __LINE__, #cond,   \
                                                            (message));                  \
        } while (0)

#else

#    define KVFILE_ASSERT(cond, message)
#    define KVFILE_CONSTEXPR_ASSERT(cond, message)

#endif

/// Aborts with a message if `cond` is false, in every build mode.
#define KVFILE_CHECK(cond, message)                                                  \
    do {                                                                             \
        if (__builtin_expect(!(cond), 0))                                            \
            ::kvfile::detail::assertion_failed(__FILE__, __LINE__, #cond, (message)); \
    } while (0)

/// Marks code that cannot be reached (e.g. after a switch over all enum values).
#define KVFILE_UNREACHABLE(message) \
    (::kvfile::detail::unreachable_reached(__FILE__, __LINE__, (message)))

/// @}

namespace kvfile::detail {

// Thrown from constexpr contexts; the constructor never returns.
struct constexpr_assertion {
    constexpr_assertion(const char* file, int line, const char* cond, const char* message);
};

[[noreturn]] void assertion_failed(const char* file, int line, const char* cond,
                                   const char* message);

[[noreturn]] void unreachable_reached(const char* file, int line, const char* message);

} // namespace kvfile::detail

#endif // KVFILE_ASSERT_HPP
