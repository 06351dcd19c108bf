#ifndef KVFILE_BLOCK_FILE_HPP
#define KVFILE_BLOCK_FILE_HPP

#include <kvfile/defs.hpp>
#include <kvfile/lock.hpp>
#include <kvfile/store.hpp>
#include <kvfile/vfs.hpp>

#include <memory>

namespace kvfile {

namespace detail {

class block_file_impl;

} // namespace detail

/// Settings for files opened by a store_vfs.
struct block_file_options {
    /// The size of a block, in bytes. Only used for newly created files;
    /// existing files keep the block size they were created with.
    /// Must be a power of two and at least 32.
    u32 block_size = 8192;

    /// The number of blocks kept in memory by the write cache.
    /// Older blocks are moved to the overflow table of the store.
    size_t write_cache_blocks = 2048;
};

/// Throws bad_argument if the options are invalid.
void check_options(const block_file_options& options);

/// Contains performance statistics for a single file.
struct block_file_stats {
    /// Number of reads served from the write cache.
    u64 cache_hits = 0;

    /// Number of blocks fetched from the store (either table).
    u64 store_reads = 0;

    /// Number of blocks moved from the write cache to the overflow table.
    u64 spills = 0;

    /// Number of committed flush transactions.
    u64 flushes = 0;

    /// Number of out-of-band rollbacks.
    u64 rollbacks = 0;
};

/// A file whose blocks live in a transactional key value store.
///
/// Writes are buffered in a write cache and only become durable when an exclusive
/// lock is released. Acquiring a shared lock discards the cache and reloads the file's
/// metadata, so every lock hold starts from the committed state of the store.
class block_file final : public file {
public:
    /// Opens the file `name` in the given store.
    ///
    /// Throws cannot_open if the file does not exist and `vfs::open_create` was not specified,
    /// or if the file exists and `vfs::open_exclusive` was specified.
    ///
    /// \param v
    ///     The vfs the file belongs to.
    /// \param store
    ///     The store holding the file's blocks. Must outlive the file.
    /// \param locks
    ///     The lock manager coordinating handles of the same file. Must outlive the file.
    block_file(kvfile::vfs& v, transactional_store& store, lock_manager& locks, const char* name,
               vfs::access_t access, int mode, const block_file_options& options);

    ~block_file();

    bool read_only() const noexcept override;
    const char* name() const noexcept override;
    u32 sector_size() const noexcept override;
    int device_characteristics() const noexcept override;

    io_status read(u64 offset, void* buffer, u32 count) override;
    void write(u64 offset, const void* buffer, u32 count) override;
    u64 file_size() override;
    void truncate(u64 size) override;

    /// Does nothing. Changes become durable when the exclusive lock is released.
    void sync() override;

    bool lock(lock_level level) override;
    void unlock(lock_level level) override;
    lock_level current_lock() const noexcept override;

    /// Releases any lock held by this handle and discards unflushed writes.
    /// No lock hooks are invoked.
    void close() override;

    /// The block size of this file.
    u32 block_size() const noexcept;

    /// Requests that all writes made during the current lock hold be discarded.
    /// The rollback is performed when the lock is released next: the change counter
    /// in the header of block 0 is incremented and the file size is reset to the
    /// size observed when the shared lock was acquired.
    void signal_rollback();

    /// True if a rollback was signalled but not yet performed.
    bool rollback_pending() const noexcept;

    /// The hooks invoked around lock transitions. Additional hooks
    /// registered here run after the built in ones.
    lock_hooks& hooks();

    /// Number of blocks in the in-memory write cache.
    size_t cached_blocks() const noexcept;

    /// Number of blocks that were moved to the overflow table.
    size_t spilled_blocks() const noexcept;

    /// Returns performance statistics for this file.
    block_file_stats stats() const;

private:
    detail::block_file_impl& impl() const;

private:
    std::unique_ptr<detail::block_file_impl> m_impl;
};

} // namespace kvfile

#endif // KVFILE_BLOCK_FILE_HPP
