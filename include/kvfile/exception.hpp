#ifndef KVFILE_EXCEPTION_HPP
#define KVFILE_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

/// Throws the given kvfile::exception after recording the throwing
/// file, line and function in it.
#define KVFILE_THROW(e) \
    throw ::kvfile::detail::located((e), ::kvfile::throw_site{__FILE__, __LINE__, __func__})

namespace kvfile {

/// The place in the source code that threw an exception.
/// Empty for exceptions thrown without KVFILE_THROW.
struct throw_site {
    const char* file = "";
    int line = 0;
    const char* function = "";
};

/// Base class of all exceptions thrown by kvfile.
class exception : public std::runtime_error {
public:
    using runtime_error::runtime_error;

    const throw_site& site() const noexcept { return m_site; }

    /// Called by KVFILE_THROW.
    void set_site(const throw_site& site) noexcept { m_site = site; }

    /// "message (function at file:line)", or just the message if the
    /// throw site is unknown.
    std::string describe() const {
        std::string result = what();
        if (m_site.line > 0) {
            result += " (";
            result += m_site.function;
            result += " at ";
            result += m_site.file;
            result += ":";
            result += std::to_string(m_site.line);
            result += ")";
        }
        return result;
    }

private:
    throw_site m_site;
};

namespace detail {

template<typename E>
E located(E&& e, const throw_site& site) {
    static_assert(std::is_base_of<exception, std::decay_t<E>>::value,
                  "KVFILE_THROW requires a kvfile::exception.");
    e.set_site(site);
    return std::forward<E>(e);
}

} // namespace detail

/// Persisted data has an impossible shape.
class corruption_error : public exception {
public:
    using exception::exception;
};

/// Data could not be read from or written to a file.
class io_error : public exception {
public:
    using exception::exception;
};

/// A read crossed a block boundary, or a write did not cover exactly one block.
class alignment_error : public io_error {
public:
    using io_error::io_error;
};

/// The file is missing and should not be created, or it exists and
/// should have been created exclusively.
class cannot_open : public io_error {
public:
    using io_error::io_error;
};

/// A transaction of the store failed and was rolled back.
class store_error : public io_error {
public:
    using io_error::io_error;
};

/// The caller broke the contract of an operation.
class usage_error : public exception {
public:
    using exception::exception;
};

/// The object is not in a state that allows the operation.
class bad_operation : public usage_error {
public:
    using usage_error::usage_error;
};

/// An argument is out of range.
class bad_argument : public usage_error {
public:
    using usage_error::usage_error;
};

} // namespace kvfile

#endif // KVFILE_EXCEPTION_HPP
