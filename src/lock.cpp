#include <kvfile/lock.hpp>

#include <kvfile/assert.hpp>

namespace kvfile {

const char* to_string(lock_level level) noexcept {
    switch (level) {
    case lock_level::none:
        return "none";
    case lock_level::shared:
        return "shared";
    case lock_level::reserved:
        return "reserved";
    case lock_level::pending:
        return "pending";
    case lock_level::exclusive:
        return "exclusive";
    }
    KVFILE_UNREACHABLE("invalid lock level");
}

lock_manager::~lock_manager() {}

} // namespace kvfile
