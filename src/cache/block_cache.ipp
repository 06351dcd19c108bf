#ifndef KVFILE_CACHE_BLOCK_CACHE_IPP
#define KVFILE_CACHE_BLOCK_CACHE_IPP

#include "block_cache.hpp"

#include "../log.hpp"

#include <kvfile/exception.hpp>

#include <fmt/format.h>

#include <cstring>
#include <optional>
#include <utility>

namespace kvfile::detail::cache_impl {

block_cache::block_cache(store_session& session, std::string name, u32 block_size,
                         size_t capacity, block_file_stats& stats)
    : m_session(session)
    , m_name(std::move(name))
    , m_block_size(block_size)
    , m_capacity(capacity)
    , m_max_pooled_blocks((capacity + 8) < capacity ? size_t(-1) : (capacity + 8))
    , m_stats(stats)
    , m_pool()
    , m_blocks(capacity + 1) {
    KVFILE_CHECK(capacity > 0, "cache capacity must be at least 1.");
}

block_cache::~block_cache() {
    clear();
    m_pool.clear();
}

bool block_cache::read(u64 index, u32 offset, byte* buffer, u32 count) {
    KVFILE_ASSERT(offset <= m_block_size && count <= m_block_size - offset,
                  "Reading out of bounds.");

    if (block* blk = m_blocks.find(index)) {
        ++m_stats.cache_hits;
        std::memcpy(buffer, blk->data() + offset, count);
        return true;
    }

    const bool spilled = m_spilled.contains(index);

    std::optional<block_record> record;
    m_session.run([&](transaction& tx) {
        block_table& table = spilled ? tx.overflow() : tx.primary();
        record = table.get(m_name, index);
    });
    ++m_stats.store_reads;
    KVFILE_TRACE("read block {} of {} from the {} table: {}", index, m_name,
                 spilled ? "overflow" : "primary", record ? "found" : "missing");

    if (!record) {
        if (spilled) {
            KVFILE_THROW(corruption_error(
                fmt::format("Spilled block {} of {} is missing from the overflow table.", index,
                            m_name)));
        }
        return false;
    }

    if (record->data.size() != m_block_size) {
        KVFILE_THROW(corruption_error(
            fmt::format("Block {} of {} has an invalid size (expected {} bytes, got {}).", index,
                        m_name, m_block_size, record->data.size())));
    }
    std::memcpy(buffer, record->data.data() + offset, count);
    return true;
}

void block_cache::write(u64 index, const byte* data) {
    block* blk = m_blocks.find(index);
    if (blk) {
        m_list.unlink(blk);
    } else {
        blk = allocate_block();
        blk->m_index = index;
        m_blocks.insert(blk);
    }

    std::memcpy(blk->m_data, data, m_block_size);
    put(blk);
}

void block_cache::clear() noexcept {
    while (block* blk = m_list.oldest()) {
        drop(blk);
    }

    KVFILE_ASSERT(m_blocks.size() == 0, "no cached blocks can remain.");
    m_spilled.clear();
    m_reached_capacity = false;
}

block_record block_cache::make_record(const block& blk) const {
    block_record record;
    record.name = m_name;
    record.index = blk.index();
    record.data.assign(blk.data(), blk.data() + m_block_size);
    return record;
}

void block_cache::put(block* blk) {
    m_list.push_newest(blk);
    m_spilled.remove(blk->index());
    if (m_list.size() >= m_capacity)
        m_reached_capacity = true;

    while (m_list.size() > m_capacity) {
        block* victim = m_list.spill_candidate();
        if (!victim)
            break;
        spill(victim);
    }
}

void block_cache::spill(block* blk) {
    // The write is not awaited. The store executes posted work before any
    // transaction submitted later, so reading the block back from the overflow
    // table observes this write. Spills happen at any lock level, so they
    // do not use the session's mode.
    m_session.store().post(transaction_mode::read_write, [record = make_record(*blk)](
                                                             transaction& tx) {
        tx.overflow().put(record);
    });

    KVFILE_TRACE("spill block {} of {}", blk->index(), m_name);
    m_spilled.add(blk->index());
    drop(blk);
    ++m_stats.spills;
}

void block_cache::drop(block* blk) noexcept {
    m_list.unlink(blk);
    m_blocks.remove(blk);
    free_block(blk);
}

block* block_cache::allocate_block() {
    block* blk = m_pool.remove();
    if (!blk) {
        blk = new block(m_block_size);
    }
    return blk;
}

// Add to pool or delete depending on the number of blocks in memory.
void block_cache::free_block(block* blk) noexcept {
    if (m_blocks.size() + m_pool.size() < m_max_pooled_blocks) {
        blk->reset();
        m_pool.add(blk);
    } else {
        delete blk;
    }
}

} // namespace kvfile::detail::cache_impl

#endif // KVFILE_CACHE_BLOCK_CACHE_IPP
