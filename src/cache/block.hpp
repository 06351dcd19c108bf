#ifndef KVFILE_CACHE_BLOCK_HPP
#define KVFILE_CACHE_BLOCK_HPP

#include "base.hpp"

namespace kvfile::detail::cache_impl {

/*
 * The in-memory copy of a block written during the current lock hold.
 * While it is cached, the block is linked into the write_list and the block_map.
 * Otherwise it waits in the block_pool (or is deleted).
 */
struct block {
    u64 m_index = 0;

    /// block_size bytes, allocated once.
    byte* m_data = nullptr;

    block_pool_hook m_pool_hook;
    write_list_hook m_list_hook;
    block_map_hook m_map_hook;

    inline explicit block(u32 block_size);
    inline ~block();

    block(const block&) = delete;
    block& operator=(const block&) = delete;

    /// Prepares a dropped block for the pool. The data is left as is,
    /// the next write replaces all of it.
    void reset() noexcept {
        KVFILE_ASSERT(!m_pool_hook.is_linked() && !m_list_hook.is_linked()
                          && !m_map_hook.is_linked(),
                      "Block is still linked.");
        m_index = 0;
    }

    u64 index() const { return m_index; }
    byte* data() const { return m_data; }
    bool cached() const { return m_list_hook.is_linked(); }
};

/// Key extractor for the block map.
struct index_of_block {
    using type = u64;

    u64 operator()(const block& blk) const noexcept { return blk.m_index; }
};

} // namespace kvfile::detail::cache_impl

#endif // KVFILE_CACHE_BLOCK_HPP
