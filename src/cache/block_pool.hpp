#ifndef KVFILE_CACHE_BLOCK_POOL_HPP
#define KVFILE_CACHE_BLOCK_POOL_HPP

#include "base.hpp"
#include "block.hpp"

#include <boost/intrusive/list.hpp>

namespace kvfile::detail::cache_impl {

/// Unused block objects (and their data buffers), kept for reuse
/// so that a busy write cache does not allocate on every write.
/// The pool owns the blocks it contains.
class block_pool {
public:
    block_pool() = default;
    ~block_pool() { clear(); }

    /// Takes ownership of an unused block.
    void add(block* blk) noexcept {
        KVFILE_ASSERT(!blk->cached(), "Block is still in the write cache.");
        m_free.push_front(*blk);
    }

    /// Hands out a pooled block, or nullptr if the pool is empty.
    block* remove() noexcept {
        if (m_free.empty())
            return nullptr;

        block& blk = m_free.front();
        m_free.pop_front();
        return &blk;
    }

    size_t size() const noexcept { return m_free.size(); }

    /// Deletes all pooled blocks.
    void clear() noexcept { m_free.clear_and_dispose([](block* blk) { delete blk; }); }

    block_pool(const block_pool&) = delete;
    block_pool& operator=(const block_pool&) = delete;

private:
    boost::intrusive::list<
        block, boost::intrusive::member_hook<block, block_pool_hook, &block::m_pool_hook>>
        m_free;
};

} // namespace kvfile::detail::cache_impl

#endif // KVFILE_CACHE_BLOCK_POOL_HPP
