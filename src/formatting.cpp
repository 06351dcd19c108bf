#include <kvfile/formatting.hpp>

#include <kvfile/assert.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace kvfile {

std::string format_hex(const byte* data, size_t size, size_t numbers_per_line) {
    KVFILE_ASSERT(data || size == 0, "Invalid data pointer.");
    KVFILE_ASSERT(numbers_per_line > 0, "Lines must not be empty.");

    fmt::memory_buffer buf;
    for (size_t i = 0; i < size; ++i) {
        if (i > 0)
            buf.push_back(i % numbers_per_line == 0 ? '\n' : ' ');
        fmt::format_to(std::back_inserter(buf), "{:02X}", data[i]);
    }
    return fmt::to_string(buf);
}

std::string format_dump(const byte* data, size_t size, size_t bytes_per_line) {
    KVFILE_ASSERT(bytes_per_line > 0, "Lines must not be empty.");

    fmt::memory_buffer buf;
    for (size_t offset = 0; offset < size; offset += bytes_per_line) {
        const size_t count = std::min(bytes_per_line, size - offset);
        fmt::format_to(std::back_inserter(buf), "{:6} - {}\n", offset,
                       format_hex(data + offset, count));
    }
    return fmt::to_string(buf);
}

} // namespace kvfile
