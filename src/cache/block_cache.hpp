#ifndef KVFILE_CACHE_BLOCK_CACHE_HPP
#define KVFILE_CACHE_BLOCK_CACHE_HPP

#include "base.hpp"
#include "block.hpp"
#include "block_map.hpp"
#include "block_pool.hpp"
#include "spill_set.hpp"
#include "write_list.hpp"

#include <kvfile/block_file.hpp>
#include <kvfile/store.hpp>

#include <string>

namespace kvfile::detail::cache_impl {

/// The two-tier write cache of a single file.
///
/// Written blocks are kept in memory until the cache holds more than `capacity` blocks.
/// The oldest blocks (except block 0) are then moved to the overflow table of the store;
/// their indices are remembered in the spill set. Nothing is ever written to the primary
/// table by the cache itself, that is the job of the flush (see lock_protocol).
class block_cache {
public:
    inline block_cache(store_session& session, std::string name, u32 block_size,
                       size_t capacity, block_file_stats& stats);

    inline ~block_cache();

    const std::string& name() const noexcept { return m_name; }
    u32 block_size() const noexcept { return m_block_size; }
    size_t capacity() const noexcept { return m_capacity; }

    /// Number of blocks held in memory.
    size_t size() const noexcept { return m_list.size(); }

    /// Number of blocks that live in the overflow table.
    size_t spilled() const noexcept { return m_spilled.size(); }

    bool is_cached(u64 index) const noexcept { return m_blocks.find(index) != nullptr; }
    bool is_spilled(u64 index) const noexcept { return m_spilled.contains(index); }

    /// True if the cache was filled up to its capacity since the last clear().
    /// Blocks may have been moved to the overflow table in that case.
    bool reached_capacity() const noexcept { return m_reached_capacity; }

    /// Copies `count` bytes at `offset` of the block with the given index into `buffer`.
    /// The block is taken from memory, from the overflow table (if it was spilled)
    /// or from the primary table, in that order.
    ///
    /// Returns false if the block does not exist in any of those places.
    inline bool read(u64 index, u32 offset, byte* buffer, u32 count);

    /// Replaces the content of the block with the given index.
    /// `data` must point to `block_size()` bytes.
    inline void write(u64 index, const byte* data);

    /// Drops all blocks, including the spilled ones, without writing anything.
    inline void clear() noexcept;

    /// Invokes `fn(const block&)` for every block in memory, oldest block first.
    template<typename Function>
    void for_each(Function&& fn) const {
        for (const block& blk : m_list) {
            fn(blk);
        }
    }

    /// Returns a copy of the given block for storage in a table.
    inline block_record make_record(const block& blk) const;

    block_cache(const block_cache&) = delete;
    block_cache& operator=(const block_cache&) = delete;

private:
    /// Makes the block the newest block of the write cache
    /// and evicts older blocks if necessary.
    inline void put(block* blk);

    /// Moves a single block to the overflow table.
    inline void spill(block* blk);

    /// Removes the block from the cache and releases it.
    inline void drop(block* blk) noexcept;

    /// Returns a new block instance, possibly
    /// from the free list.
    inline block* allocate_block();

    /// Deallocates a block (or puts it into the free list
    /// for later use).
    inline void free_block(block* blk) noexcept;

private:
    store_session& m_session;
    const std::string m_name;

    /// Size of a single block.
    const u32 m_block_size;

    /// Maximum number of blocks in memory. Block 0 is allowed to exceed
    /// this limit because it is never spilled.
    const size_t m_capacity;

    /// Maximum number of block instances (used + pooled).
    const size_t m_max_pooled_blocks;

    block_file_stats& m_stats;

    /// Contains previously allocated instances that
    /// can be reused for future blocks.
    block_pool m_pool;

    /// Contains all blocks that are currently in memory.
    block_map m_blocks;

    /// The same blocks, ordered by the time of their last write.
    write_list m_list;

    /// Blocks that have been moved to the overflow table.
    spill_set m_spilled;

    bool m_reached_capacity = false;
};

} // namespace kvfile::detail::cache_impl

#endif // KVFILE_CACHE_BLOCK_CACHE_HPP
