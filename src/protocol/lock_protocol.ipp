#ifndef KVFILE_PROTOCOL_LOCK_PROTOCOL_IPP
#define KVFILE_PROTOCOL_LOCK_PROTOCOL_IPP

#include "lock_protocol.hpp"

#include "../log.hpp"

#include <kvfile/exception.hpp>
#include <kvfile/math.hpp>
#include <kvfile/serialization.hpp>

#include <fmt/format.h>

#include <limits>
#include <optional>
#include <vector>

namespace kvfile::detail {

lock_protocol::lock_protocol(store_session& session, file_metadata& metadata,
                             cache_impl::block_cache& cache, block_file_stats& stats)
    : m_session(session)
    , m_metadata(metadata)
    , m_cache(cache)
    , m_stats(stats) {}

void lock_protocol::attach(lock_hooks& hooks) {
    hooks.after_acquire([this](lock_level from, lock_level to) { acquired(from, to); });
    hooks.before_release([this](lock_level from, lock_level to) { flush(from, to); });
    hooks.before_release([this](lock_level from, lock_level to) { rollback(from, to); });
}

void lock_protocol::acquired(lock_level from, lock_level to) {
    unused(from);

    switch (to) {
    case lock_level::shared:
        m_session.set_mode(transaction_mode::read_only);
        m_cache.clear();

        // Another handle may have changed the file since we last held a lock.
        reload_metadata();
        m_rollback.saved_size = m_metadata.file_size;
        break;
    case lock_level::exclusive:
        m_session.set_mode(transaction_mode::read_write);
        break;
    default:
        break;
    }
}

void lock_protocol::flush(lock_level from, lock_level to) {
    unused(to);
    if (from != lock_level::exclusive)
        return;

    const bool overflowed = m_cache.reached_capacity();
    if (!m_rollback.active) {
        m_session.run([&](transaction& tx) {
            tx.put_metadata(m_metadata);
            write_blocks(tx);

            // Remove the blocks beyond the end of the (possibly truncated) file.
            const u64 end = ceil_div<u64>(m_metadata.file_size, m_metadata.block_size);
            tx.primary().remove(m_metadata.name, end, std::numeric_limits<u64>::max());
        });
        ++m_stats.flushes;
        KVFILE_TRACE("flushed {} ({} bytes, {} cached, {} spilled)", m_metadata.name,
                     m_metadata.file_size, m_cache.size(), m_cache.spilled());
    }

    if (overflowed) {
        // Best effort, the spilled blocks are unreachable from now on.
        m_session.store().post(transaction_mode::read_write, [name = m_metadata.name](
                                                                 transaction& tx) {
            tx.overflow().remove(name, 0, std::numeric_limits<u64>::max());
        });
    }
    m_cache.clear();
}

void lock_protocol::rollback(lock_level from, lock_level to) {
    unused(to);
    if (!m_rollback.active)
        return;

    // All changes may have fit into the engine's own page cache, in which case
    // the file was never locked exclusively. Writing the counter still needs
    // a writable transaction.
    if (from != lock_level::exclusive)
        m_session.set_mode(transaction_mode::read_write);

    m_session.run([&](transaction& tx) {
        std::optional<block_record> header = tx.primary().get(m_metadata.name, 0);
        if (!header) {
            // Nothing was ever committed, so the engine has nothing to invalidate.
            return;
        }
        if (header->data.size() < change_counter_offset + serialized_size<u32>()) {
            KVFILE_THROW(corruption_error(
                fmt::format("The first block of {} is too small to hold the change counter.",
                            m_metadata.name)));
        }

        byte* counter = header->data.data() + change_counter_offset;
        serialize<u32>(deserialize<u32>(counter) + 1, counter);
        tx.primary().put(*header);
    });

    KVFILE_TRACE("rolled back {} to {} bytes", m_metadata.name, m_rollback.saved_size);
    m_metadata.file_size = m_rollback.saved_size;
    m_rollback.active = false;
    ++m_stats.rollbacks;
}

void lock_protocol::reload_metadata() {
    std::optional<file_metadata> metadata;
    m_session.run([&](transaction& tx) { metadata = tx.get_metadata(m_metadata.name); });
    if (!metadata) {
        KVFILE_THROW(io_error(
            fmt::format("The metadata of {} is missing from the store.", m_metadata.name)));
    }
    if (metadata->block_size != m_metadata.block_size) {
        KVFILE_THROW(corruption_error(
            fmt::format("The block size of {} changed from {} to {}.", m_metadata.name,
                        m_metadata.block_size, metadata->block_size)));
    }
    m_metadata = std::move(*metadata);
}

void lock_protocol::write_blocks(transaction& tx) {
    const file_metadata& meta = m_metadata;
    const u64 block_size = meta.block_size;

    // Blocks beyond the end of the file were truncated away.
    auto in_file = [&](u64 index) { return index * block_size < meta.file_size; };

    m_cache.for_each([&](const cache_impl::block& blk) {
        if (in_file(blk.index()))
            tx.primary().put(m_cache.make_record(blk));
    });

    if (!m_cache.reached_capacity())
        return;

    // Move the spilled blocks over from the overflow table, one page at a time.
    // Stale overflow entries (blocks that were written again after being spilled)
    // are no longer in the spill set and are skipped.
    std::optional<u64> after;
    while (true) {
        std::vector<block_record> page = tx.overflow().get_all(meta.name, after, m_cache.capacity());
        if (page.empty())
            break;

        for (const block_record& record : page) {
            if (m_cache.is_spilled(record.index) && in_file(record.index))
                tx.primary().put(record);
        }
        after = page.back().index;
    }
}

} // namespace kvfile::detail

#endif // KVFILE_PROTOCOL_LOCK_PROTOCOL_IPP
