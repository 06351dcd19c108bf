#include <kvfile/block_file.hpp>

#include "cache/block.hpp"
#include "cache/block_cache.hpp"
#include "cache/block_map.hpp"
#include "cache/block_pool.hpp"
#include "cache/spill_set.hpp"
#include "cache/write_list.hpp"
#include "protocol/lock_protocol.hpp"

#include "cache/block.ipp"
#include "cache/block_cache.ipp"
#include "protocol/lock_protocol.ipp"

#include "log.hpp"

#include <kvfile/exception.hpp>
#include <kvfile/math.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <optional>
#include <utility>

namespace kvfile {

void check_options(const block_file_options& options) {
    if (!is_pow2(options.block_size) || options.block_size < 32) {
        KVFILE_THROW(bad_argument(fmt::format(
            "Invalid block size {}: must be a power of two and at least 32.", options.block_size)));
    }
    if (options.write_cache_blocks == 0) {
        KVFILE_THROW(bad_argument("The write cache must hold at least one block."));
    }
}

namespace detail {

class block_file_impl {
public:
    block_file_impl(transactional_store& store, lock_manager& locks, const char* name,
                    bool read_only, int mode, const block_file_options& options);

    ~block_file_impl();

    const std::string& name() const noexcept { return m_name; }
    bool read_only() const noexcept { return m_read_only; }
    u32 block_size() const noexcept { return m_metadata.block_size; }
    u64 file_size() const noexcept { return m_metadata.file_size; }
    lock_level level() const noexcept { return m_level; }
    lock_hooks& hooks() noexcept { return m_hooks; }
    const block_file_stats& stats() const noexcept { return m_stats; }
    const cache_impl::block_cache& cache() const noexcept { return m_cache; }
    lock_protocol& protocol() noexcept { return m_protocol; }

    io_status read(u64 offset, byte* buffer, u32 count);
    void write(u64 offset, const byte* buffer, u32 count);
    void truncate(u64 size);

    bool lock(lock_level level);
    void unlock(lock_level level);
    void close() noexcept;

    void check_open() const {
        if (m_closed) {
            KVFILE_THROW(bad_operation(fmt::format("The file {} has been closed.", m_name)));
        }
    }

private:
    static file_metadata open_metadata(store_session& session, const std::string& name,
                                       int mode, const block_file_options& options);

    void check_writable() const {
        if (m_read_only) {
            KVFILE_THROW(io_error(fmt::format(
                "The file {} cannot be modified because it was opened in read-only mode.",
                m_name)));
        }
    }

private:
    const std::string m_name;
    const bool m_read_only;

    lock_manager& m_locks;
    store_session m_session;

    /// Loaded on open, reloaded whenever a shared lock is acquired.
    file_metadata m_metadata;

    block_file_stats m_stats;
    cache_impl::block_cache m_cache;
    lock_protocol m_protocol;
    lock_hooks m_hooks;

    lock_level m_level = lock_level::none;
    bool m_closed = false;
};

block_file_impl::block_file_impl(transactional_store& store, lock_manager& locks,
                                 const char* name, bool read_only, int mode,
                                 const block_file_options& options)
    : m_name(name)
    , m_read_only(read_only)
    , m_locks(locks)
    , m_session(store, transaction_mode::read_write)
    , m_metadata(open_metadata(m_session, m_name, mode, options))
    , m_stats()
    , m_cache(m_session, m_name, m_metadata.block_size, options.write_cache_blocks, m_stats)
    , m_protocol(m_session, m_metadata, m_cache, m_stats) {
    m_protocol.attach(m_hooks);
}

block_file_impl::~block_file_impl() {
    close();
}

file_metadata block_file_impl::open_metadata(store_session& session, const std::string& name,
                                             int mode, const block_file_options& options) {
    check_options(options);

    std::optional<file_metadata> metadata;
    session.run([&](transaction& tx) { metadata = tx.get_metadata(name); });

    if (metadata) {
        if ((mode & vfs::open_create) && (mode & vfs::open_exclusive)) {
            KVFILE_THROW(cannot_open(fmt::format("The file {} already exists.", name)));
        }
        if (!is_pow2(metadata->block_size)) {
            KVFILE_THROW(corruption_error(fmt::format(
                "The file {} has an invalid block size ({}).", name, metadata->block_size)));
        }
        return std::move(*metadata);
    }

    if (!(mode & vfs::open_create)) {
        KVFILE_THROW(cannot_open(fmt::format("The file {} does not exist.", name)));
    }

    file_metadata created;
    created.name = name;
    created.file_size = 0;
    created.block_size = options.block_size;

    // Not awaited. Every later transaction of this store observes the new record.
    session.post([created](transaction& tx) { tx.put_metadata(created); });
    KVFILE_TRACE("created {} with block size {}", name, created.block_size);
    return created;
}

io_status block_file_impl::read(u64 offset, byte* buffer, u32 count) {
    check_open();

    const u32 size = block_size();
    const u64 index = offset / size;
    const u32 offset_in_block = static_cast<u32>(offset % size);
    if (count > size - offset_in_block) {
        KVFILE_THROW(alignment_error(
            fmt::format("Read of {} bytes at offset {} crosses a block boundary (block size {}).",
                        count, offset, size)));
    }

    if (offset >= m_metadata.file_size) {
        std::memset(buffer, 0, count);
        return io_status::short_read;
    }

    if (!m_cache.read(index, offset_in_block, buffer, count)) {
        // Never written, the block is part of a hole in the file.
        std::memset(buffer, 0, count);
    }
    return io_status::ok;
}

void block_file_impl::write(u64 offset, const byte* buffer, u32 count) {
    check_open();
    check_writable();

    const u32 size = block_size();
    if (offset % size != 0 || count != size) {
        KVFILE_THROW(alignment_error(
            fmt::format("Write of {} bytes at offset {} does not cover exactly one block "
                        "(block size {}).",
                        count, offset, size)));
    }

    m_metadata.file_size = std::max(m_metadata.file_size, checked_add<u64>(offset, count));
    m_cache.write(offset / size, buffer);
}

void block_file_impl::truncate(u64 size) {
    check_open();
    check_writable();

    // Blocks beyond the new size are removed by the next flush.
    m_metadata.file_size = size;
}

bool block_file_impl::lock(lock_level level) {
    check_open();

    if (level <= m_level)
        return true;

    if (m_level == lock_level::none && level != lock_level::shared) {
        KVFILE_THROW(bad_operation(fmt::format(
            "Cannot acquire a {} lock on {} without holding a shared lock first.",
            to_string(level), m_name)));
    }

    m_hooks.run_before_acquire(m_level, level);
    if (!m_locks.acquire(m_name, m_level, level))
        return false;

    lock_level from = std::exchange(m_level, level);
    m_hooks.run_after_acquire(from, level);
    return true;
}

void block_file_impl::unlock(lock_level level) {
    check_open();

    if (level >= m_level)
        return;

    m_hooks.run_before_release(m_level, level);
    m_locks.release(m_name, m_level, level);

    lock_level from = std::exchange(m_level, level);
    m_hooks.run_after_release(from, level);
}

void block_file_impl::close() noexcept {
    if (m_closed)
        return;

    if (m_level != lock_level::none) {
        m_locks.release(m_name, m_level, lock_level::none);
        m_level = lock_level::none;
    }
    m_cache.clear();
    m_closed = true;
}

} // namespace detail

block_file::block_file(kvfile::vfs& v, transactional_store& store, lock_manager& locks,
                       const char* name, vfs::access_t access, int mode,
                       const block_file_options& options)
    : file(v)
    , m_impl(std::make_unique<detail::block_file_impl>(store, locks, name,
                                                       access == vfs::read_only, mode, options)) {}

block_file::~block_file() {}

bool block_file::read_only() const noexcept {
    return impl().read_only();
}

const char* block_file::name() const noexcept {
    return impl().name().c_str();
}

u32 block_file::sector_size() const noexcept {
    return impl().block_size();
}

int block_file::device_characteristics() const noexcept {
    return iocap_safe_append | iocap_undeletable_when_open;
}

io_status block_file::read(u64 offset, void* buffer, u32 count) {
    KVFILE_ASSERT(buffer != nullptr || count == 0, "Buffer null pointer");
    return impl().read(offset, static_cast<byte*>(buffer), count);
}

void block_file::write(u64 offset, const void* buffer, u32 count) {
    KVFILE_ASSERT(buffer != nullptr, "Buffer null pointer");
    impl().write(offset, static_cast<const byte*>(buffer), count);
}

u64 block_file::file_size() {
    impl().check_open();
    return impl().file_size();
}

void block_file::truncate(u64 size) {
    impl().truncate(size);
}

void block_file::sync() {
    impl().check_open();
}

bool block_file::lock(lock_level level) {
    return impl().lock(level);
}

void block_file::unlock(lock_level level) {
    impl().unlock(level);
}

lock_level block_file::current_lock() const noexcept {
    return impl().level();
}

void block_file::close() {
    impl().close();
}

u32 block_file::block_size() const noexcept {
    return impl().block_size();
}

void block_file::signal_rollback() {
    impl().check_open();
    impl().protocol().signal_rollback();
}

bool block_file::rollback_pending() const noexcept {
    return impl().protocol().rollback_status().active;
}

lock_hooks& block_file::hooks() {
    return impl().hooks();
}

size_t block_file::cached_blocks() const noexcept {
    return impl().cache().size();
}

size_t block_file::spilled_blocks() const noexcept {
    return impl().cache().spilled();
}

block_file_stats block_file::stats() const {
    return impl().stats();
}

detail::block_file_impl& block_file::impl() const {
    KVFILE_ASSERT(m_impl, "Invalid file instance.");
    return *m_impl;
}

} // namespace kvfile
