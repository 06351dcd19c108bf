#ifndef KVFILE_DEFERRED_HPP
#define KVFILE_DEFERRED_HPP

#include <utility>

namespace kvfile {

/// Invokes a function object when the enclosing scope is left,
/// unless `disable()` was called before.
///
/// \code
///     deferred guard = [&]() noexcept { rollback(); };
///     do_work();
///     guard.disable();
/// \endcode
template<typename Function>
class deferred {
public:
    deferred(Function fn)
        : m_fn(std::move(fn)) {}

    ~deferred() {
        if (m_active)
            m_fn();
    }

    void disable() noexcept { m_active = false; }

    deferred(const deferred&) = delete;
    deferred& operator=(const deferred&) = delete;

private:
    Function m_fn;
    bool m_active = true;
};

} // namespace kvfile

#endif // KVFILE_DEFERRED_HPP
