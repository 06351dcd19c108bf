#ifndef KVFILE_PROTOCOL_LOCK_PROTOCOL_HPP
#define KVFILE_PROTOCOL_LOCK_PROTOCOL_HPP

#include "../cache/block_cache.hpp"

#include <kvfile/block_file.hpp>
#include <kvfile/lock.hpp>
#include <kvfile/store.hpp>

namespace kvfile::detail {

/// Offset of the change counter in block 0. The counter belongs to the file header
/// of the database engine and is stored as a 4 byte big endian integer.
inline constexpr u32 change_counter_offset = 24;

/// Pending out-of-band rollback.
struct rollback_state {
    /// True if the writes of the current lock hold must be discarded.
    bool active = false;

    /// File size observed when the shared lock was acquired.
    u64 saved_size = 0;
};

/// Ties the contents of the write cache to the lock held on the file.
///
/// - Acquiring a shared lock reloads the metadata and invalidates the cache.
/// - Acquiring an exclusive lock enables writes to the store.
/// - Releasing an exclusive lock flushes the cache to the primary table in a
///   single transaction.
/// - Releasing any lock while a rollback is pending discards the writes and
///   bumps the change counter of the file instead.
class lock_protocol {
public:
    inline lock_protocol(store_session& session, file_metadata& metadata,
                         cache_impl::block_cache& cache, block_file_stats& stats);

    /// Registers the protocol with the given hooks.
    /// The flush runs before the rollback on every release.
    inline void attach(lock_hooks& hooks);

    /// Called after the lock level was raised from `from` to `to`.
    inline void acquired(lock_level from, lock_level to);

    /// Called before an exclusive lock is lowered. Writes the cache to the primary table
    /// (unless a rollback is pending) and clears it. The cache is left untouched
    /// if the flush fails.
    inline void flush(lock_level from, lock_level to);

    /// Called before any lock is lowered. Performs the pending rollback, if any.
    inline void rollback(lock_level from, lock_level to);

    /// Requests that all writes of the current lock hold be discarded.
    void signal_rollback() noexcept { m_rollback.active = true; }

    const rollback_state& rollback_status() const noexcept { return m_rollback; }

    lock_protocol(const lock_protocol&) = delete;
    lock_protocol& operator=(const lock_protocol&) = delete;

private:
    inline void reload_metadata();

    // Persists the write cache. Runs inside the flush transaction.
    inline void write_blocks(transaction& tx);

private:
    store_session& m_session;
    file_metadata& m_metadata;
    cache_impl::block_cache& m_cache;
    block_file_stats& m_stats;
    rollback_state m_rollback;
};

} // namespace kvfile::detail

#endif // KVFILE_PROTOCOL_LOCK_PROTOCOL_HPP
