#include <kvfile/vfs.hpp>

namespace kvfile {

file::~file() {}

vfs::~vfs() {}

} // namespace kvfile
