#ifndef KVFILE_CACHE_BASE_HPP
#define KVFILE_CACHE_BASE_HPP

#include <kvfile/assert.hpp>
#include <kvfile/defs.hpp>

#include <boost/intrusive/list_hook.hpp>
#include <boost/intrusive/unordered_set_hook.hpp>

namespace kvfile::detail::cache_impl {

struct block;
class block_cache;
class block_map;
class block_pool;
class spill_set;
class write_list;

using write_list_hook = boost::intrusive::list_member_hook<>;

using block_map_hook = boost::intrusive::unordered_set_member_hook<>;

using block_pool_hook = boost::intrusive::list_member_hook<>;

} // namespace kvfile::detail::cache_impl

#endif // KVFILE_CACHE_BASE_HPP
