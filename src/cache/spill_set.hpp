#ifndef KVFILE_CACHE_SPILL_SET_HPP
#define KVFILE_CACHE_SPILL_SET_HPP

#include "base.hpp"

#include <unordered_set>

namespace kvfile::detail::cache_impl {

/// Indices of the blocks that were evicted from the write cache into the
/// overflow table. A block is never both in the write cache and in the spill set.
class spill_set {
public:
    spill_set() = default;

    bool contains(u64 index) const noexcept { return m_indices.count(index) > 0; }

    void add(u64 index) {
        bool inserted = m_indices.insert(index).second;
        KVFILE_ASSERT(inserted, "Block was already spilled.");
        unused(inserted);
    }

    /// Removes the index (if it is present).
    void remove(u64 index) noexcept { m_indices.erase(index); }

    void clear() noexcept { m_indices.clear(); }

    size_t size() const noexcept { return m_indices.size(); }

    spill_set(const spill_set&) = delete;
    spill_set& operator=(const spill_set&) = delete;

private:
    std::unordered_set<u64> m_indices;
};

} // namespace kvfile::detail::cache_impl

#endif // KVFILE_CACHE_SPILL_SET_HPP
