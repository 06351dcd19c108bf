#ifndef KVFILE_SERIALIZATION_HPP
#define KVFILE_SERIALIZATION_HPP

#include <kvfile/defs.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>
#include <type_traits>

// Integers inside of blocks are big endian. The database engine
// uses that byte order for the header fields of block 0.

namespace kvfile {

/// Number of bytes used by an integer of type `T` inside a block.
template<typename T>
constexpr size_t serialized_size() {
    static_assert(std::is_integral_v<T>, "Only integers can be serialized.");
    return sizeof(T);
}

/// Stores `value` at `buffer`, which must have room for serialized_size<T>() bytes.
template<typename T>
void serialize(T value, byte* buffer) {
    const T big = boost::endian::native_to_big(value);
    std::memcpy(buffer, &big, serialized_size<T>());
}

/// Loads an integer of type `T` from `buffer`.
template<typename T>
T deserialize(const byte* buffer) {
    T big;
    std::memcpy(&big, buffer, serialized_size<T>());
    return boost::endian::big_to_native(big);
}

} // namespace kvfile

#endif // KVFILE_SERIALIZATION_HPP
