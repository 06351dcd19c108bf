#ifndef KVFILE_LOCK_HPP
#define KVFILE_LOCK_HPP

#include <kvfile/defs.hpp>

#include <functional>
#include <string>
#include <vector>

namespace kvfile {

/// The lock levels used by the database engine, in increasing order.
enum class lock_level : int {
    /// No lock is held.
    none = 0,

    /// Reading is allowed. Any number of handles can hold a shared lock.
    shared = 1,

    /// The holder intends to write in the future. At most one handle at a time.
    reserved = 2,

    /// The holder waits for shared locks to drain. New shared locks are refused.
    pending = 3,

    /// Writing is allowed. No other handle holds any lock.
    exclusive = 4,
};

const char* to_string(lock_level level) noexcept;

/// Coordinates access to files between multiple handles (and possibly processes).
/// Files are identified by their name.
class lock_manager {
public:
    lock_manager() = default;

    virtual ~lock_manager();

    /// Attempts to raise the lock held on `name` from `current` to `target`.
    /// Returns false if the lock cannot be granted right now, in which case
    /// nothing changes.
    ///
    /// \pre `current < target`.
    virtual bool acquire(const std::string& name, lock_level current, lock_level target) = 0;

    /// Lowers the lock held on `name` from `current` to `target`.
    ///
    /// \pre `target < current`.
    virtual void release(const std::string& name, lock_level current,
                         lock_level target) noexcept = 0;

    lock_manager(const lock_manager&) = delete;
    lock_manager& operator=(const lock_manager&) = delete;
};

/// Callbacks invoked around the lock transitions of a file handle.
///
/// Hooks of the same kind are invoked in registration order.
/// Every hook receives the lock level before (`from`) and after (`to`) the transition.
/// A hook that throws aborts the transition (for `before_*` hooks) or
/// leaves the new lock level in place (for `after_*` hooks).
class lock_hooks {
public:
    using hook = std::function<void(lock_level from, lock_level to)>;

public:
    lock_hooks() = default;

    /// Registers a hook invoked before a lock is raised.
    void before_acquire(hook h) { m_before_acquire.push_back(std::move(h)); }

    /// Registers a hook invoked after a lock has been raised.
    void after_acquire(hook h) { m_after_acquire.push_back(std::move(h)); }

    /// Registers a hook invoked before a lock is lowered.
    void before_release(hook h) { m_before_release.push_back(std::move(h)); }

    /// Registers a hook invoked after a lock has been lowered.
    void after_release(hook h) { m_after_release.push_back(std::move(h)); }

    void run_before_acquire(lock_level from, lock_level to) const { run(m_before_acquire, from, to); }
    void run_after_acquire(lock_level from, lock_level to) const { run(m_after_acquire, from, to); }
    void run_before_release(lock_level from, lock_level to) const { run(m_before_release, from, to); }
    void run_after_release(lock_level from, lock_level to) const { run(m_after_release, from, to); }

private:
    static void run(const std::vector<hook>& hooks, lock_level from, lock_level to) {
        for (const hook& h : hooks) {
            h(from, to);
        }
    }

private:
    std::vector<hook> m_before_acquire;
    std::vector<hook> m_after_acquire;
    std::vector<hook> m_before_release;
    std::vector<hook> m_after_release;
};

} // namespace kvfile

#endif // KVFILE_LOCK_HPP
