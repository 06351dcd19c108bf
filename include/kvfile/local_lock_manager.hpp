#ifndef KVFILE_LOCAL_LOCK_MANAGER_HPP
#define KVFILE_LOCAL_LOCK_MANAGER_HPP

#include <kvfile/defs.hpp>
#include <kvfile/lock.hpp>

#include <mutex>
#include <string>
#include <unordered_map>

namespace kvfile {

/// A lock manager for handles that live in the same process.
///
/// Any number of handles may hold a shared lock. At most one handle holds a lock
/// above the shared level (reserved, pending or exclusive). A pending lock refuses
/// new shared locks and an exclusive lock requires that no other handle
/// holds a shared lock.
class local_lock_manager final : public lock_manager {
public:
    local_lock_manager() = default;

    bool acquire(const std::string& name, lock_level current, lock_level target) override;
    void release(const std::string& name, lock_level current, lock_level target) noexcept override;

    /// Number of handles that hold (at least) a shared lock on the file.
    u32 shared_count(const std::string& name) const;

    /// The highest level held on the file by any handle.
    lock_level level(const std::string& name) const;

private:
    struct entry {
        // Number of shared (or higher) holders.
        u32 shared = 0;

        // Level held by the single writer, if any (reserved, pending or exclusive).
        lock_level writer = lock_level::none;
    };

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, entry> m_entries;
};

} // namespace kvfile

#endif // KVFILE_LOCAL_LOCK_MANAGER_HPP
