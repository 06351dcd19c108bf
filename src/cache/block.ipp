#ifndef KVFILE_CACHE_BLOCK_IPP
#define KVFILE_CACHE_BLOCK_IPP

#include "block.hpp"

namespace kvfile::detail::cache_impl {

block::block(u32 block_size)
    : m_data(new byte[block_size]) {}

block::~block() {
    delete[] m_data;
}

} // namespace kvfile::detail::cache_impl

#endif // KVFILE_CACHE_BLOCK_IPP
