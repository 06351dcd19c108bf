#include <kvfile/local_lock_manager.hpp>

#include <kvfile/assert.hpp>

#include "log.hpp"

namespace kvfile {

bool local_lock_manager::acquire(const std::string& name, lock_level current, lock_level target) {
    KVFILE_ASSERT(current < target, "Must raise the lock level.");

    std::lock_guard lock(m_mutex);
    entry& e = m_entries[name];

    bool granted = false;
    if (target == lock_level::shared) {
        KVFILE_ASSERT(current == lock_level::none, "Shared locks are acquired from none.");
        granted = e.writer < lock_level::pending;
        if (granted)
            ++e.shared;
    } else {
        KVFILE_ASSERT(current >= lock_level::shared, "Must hold a shared lock first.");

        // We own the writer slot if we already hold a level above shared.
        const bool owner = current > lock_level::shared;
        if (!owner && e.writer != lock_level::none) {
            granted = false;
        } else if (target == lock_level::exclusive && e.shared > 1) {
            granted = false;
        } else {
            e.writer = target;
            granted = true;
        }
    }

    if (!granted && e.shared == 0 && e.writer == lock_level::none)
        m_entries.erase(name);

    KVFILE_TRACE("lock {} {} -> {}: {}", name, to_string(current), to_string(target),
                 granted ? "granted" : "busy");
    return granted;
}

void local_lock_manager::release(const std::string& name, lock_level current,
                                 lock_level target) noexcept {
    KVFILE_ASSERT(target < current, "Must lower the lock level.");

    std::lock_guard lock(m_mutex);
    auto pos = m_entries.find(name);
    if (pos == m_entries.end())
        return;

    entry& e = pos->second;
    if (current > lock_level::shared) {
        e.writer = target > lock_level::shared ? target : lock_level::none;
    }
    if (target == lock_level::none && e.shared > 0) {
        --e.shared;
    }
    if (e.shared == 0 && e.writer == lock_level::none) {
        m_entries.erase(pos);
    }

    KVFILE_TRACE("unlock {} {} -> {}", name, to_string(current), to_string(target));
}

u32 local_lock_manager::shared_count(const std::string& name) const {
    std::lock_guard lock(m_mutex);
    auto pos = m_entries.find(name);
    return pos == m_entries.end() ? 0 : pos->second.shared;
}

lock_level local_lock_manager::level(const std::string& name) const {
    std::lock_guard lock(m_mutex);
    auto pos = m_entries.find(name);
    if (pos == m_entries.end())
        return lock_level::none;
    if (pos->second.writer != lock_level::none)
        return pos->second.writer;
    return pos->second.shared > 0 ? lock_level::shared : lock_level::none;
}

} // namespace kvfile
