#ifndef KVFILE_CACHE_WRITE_LIST_HPP
#define KVFILE_CACHE_WRITE_LIST_HPP

#include "base.hpp"
#include "block.hpp"

#include <boost/intrusive/list.hpp>

namespace kvfile::detail::cache_impl {

/// The blocks of the write cache, from the least recently written
/// block (front) to the most recently written one (back).
/// Does not own the blocks.
class write_list {
public:
    write_list() = default;
    ~write_list() { m_list.clear(); }

    auto begin() const noexcept { return m_list.begin(); }
    auto end() const noexcept { return m_list.end(); }

    /// Appends a block that has just been written.
    void push_newest(block* blk) noexcept {
        KVFILE_ASSERT(!blk->cached(), "Block is already listed.");
        m_list.push_back(*blk);
    }

    void unlink(block* blk) noexcept {
        KVFILE_ASSERT(blk->cached(), "Block is not listed.");
        m_list.erase(m_list.iterator_to(*blk));
    }

    block* oldest() noexcept { return m_list.empty() ? nullptr : &m_list.front(); }

    /// The least recently written block other than block 0, which holds
    /// the file header and is never spilled. Null if there is none.
    block* spill_candidate() noexcept {
        for (block& blk : m_list) {
            if (blk.index() != 0)
                return &blk;
        }
        return nullptr;
    }

    size_t size() const noexcept { return m_list.size(); }

    write_list(const write_list&) = delete;
    write_list& operator=(const write_list&) = delete;

private:
    boost::intrusive::list<
        block, boost::intrusive::member_hook<block, write_list_hook, &block::m_list_hook>>
        m_list;
};

} // namespace kvfile::detail::cache_impl

#endif // KVFILE_CACHE_WRITE_LIST_HPP
