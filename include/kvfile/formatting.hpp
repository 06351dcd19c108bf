#ifndef KVFILE_FORMATTING_HPP
#define KVFILE_FORMATTING_HPP

#include <kvfile/defs.hpp>

#include <limits>
#include <string>

namespace kvfile {

/// Formats the bytes as upper case hex numbers separated by spaces.
/// A line break replaces the space after every `numbers_per_line` numbers.
std::string format_hex(const byte* data, size_t size,
                       size_t numbers_per_line = std::numeric_limits<size_t>::max());

/// Formats the bytes like a hex dump: one line per `bytes_per_line` bytes,
/// prefixed with the offset of the first byte in that line.
std::string format_dump(const byte* data, size_t size, size_t bytes_per_line = 16);

} // namespace kvfile

#endif // KVFILE_FORMATTING_HPP
