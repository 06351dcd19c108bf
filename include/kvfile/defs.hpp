#ifndef KVFILE_DEFS_HPP
#define KVFILE_DEFS_HPP

#include <climits>
#include <cstddef>
#include <cstdint>

namespace kvfile {

/// \defgroup defs Definitions
/// @{

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i16 = std::int16_t;
using i32 = std::int32_t;

/// Block contents are arrays of raw bytes.
using byte = unsigned char;

using std::size_t;

static_assert(CHAR_BIT == 8, "Only 8 bit bytes are supported.");

/// Silences warnings about arguments that are only used in debug builds.
template<typename... Args>
void unused(Args&&...) {}

/// @}

} // namespace kvfile

#endif // KVFILE_DEFS_HPP
