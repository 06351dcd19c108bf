#ifndef KVFILE_CACHE_BLOCK_MAP_HPP
#define KVFILE_CACHE_BLOCK_MAP_HPP

#include "base.hpp"
#include "block.hpp"

#include <kvfile/math.hpp>

#include <boost/container_hash/hash.hpp>
#include <boost/intrusive/unordered_set.hpp>

#include <algorithm>
#include <vector>

namespace kvfile::detail::cache_impl {

/// Finds the cached block for a block index in constant time.
/// The map does not own its blocks.
class block_map {
public:
    /// The bucket array is sized once for `capacity` blocks and never rehashed.
    explicit block_map(size_t capacity)
        : m_buckets(bucket_count(capacity))
        , m_map(map_t::bucket_traits(m_buckets.data(), m_buckets.size())) {}

    /// \pre No block with the same index is in the map.
    void insert(block* blk) noexcept {
        KVFILE_ASSERT(!blk->m_map_hook.is_linked(), "Block is already mapped.");

        auto result = m_map.insert(*blk);
        KVFILE_ASSERT(result.second, "Duplicate block index.");
        unused(result);
    }

    /// \pre The block is in the map.
    void remove(block* blk) noexcept {
        KVFILE_ASSERT(blk->m_map_hook.is_linked(), "Block is not mapped.");
        m_map.erase(m_map.iterator_to(*blk));
    }

    /// Returns the block with the given index or nullptr.
    block* find(u64 index) const noexcept {
        auto pos = m_map.find(index);
        return pos == m_map.end() ? nullptr : const_cast<block*>(&*pos);
    }

    size_t size() const noexcept { return m_map.size(); }

    block_map(const block_map&) = delete;
    block_map& operator=(const block_map&) = delete;

private:
    struct index_hash {
        size_t operator()(u64 index) const noexcept { return boost::hash_value(index); }
    };

    using map_t = boost::intrusive::unordered_set<
        block,
        boost::intrusive::member_hook<block, block_map_hook, &block::m_map_hook>,
        boost::intrusive::key_of_value<index_of_block>,
        boost::intrusive::hash<index_hash>,
        boost::intrusive::power_2_buckets<true>>;

    // Load factor of at most 0.75 for a full cache, between 2^5 and 2^20 buckets.
    static size_t bucket_count(size_t capacity) {
        capacity = std::min(capacity, size_t(1) << 19);
        return round_towards_pow2(std::max(size_t(32), capacity + capacity / 3 + 1));
    }

private:
    std::vector<map_t::bucket_type> m_buckets;
    map_t m_map;
};

} // namespace kvfile::detail::cache_impl

#endif // KVFILE_CACHE_BLOCK_MAP_HPP
