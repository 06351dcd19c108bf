#include <kvfile/store_vfs.hpp>

#include <kvfile/exception.hpp>

#include "log.hpp"

#include <limits>
#include <optional>
#include <string>

namespace kvfile {

store_vfs::store_vfs(transactional_store& store, lock_manager& locks,
                     const block_file_options& options)
    : m_store(store)
    , m_locks(locks)
    , m_options(options) {
    check_options(m_options);
}

store_vfs::~store_vfs() {}

std::unique_ptr<file> store_vfs::open(const char* path, access_t access, int mode) {
    return open_file(path, access, mode);
}

std::unique_ptr<block_file> store_vfs::open_file(const char* path, access_t access, int mode) {
    if (!path) {
        KVFILE_THROW(bad_argument("The path must not be null."));
    }
    if (access == read_only && (mode & open_create)) {
        KVFILE_THROW(bad_argument("Cannot create a file in read-only mode."));
    }
    return std::make_unique<block_file>(*this, m_store, m_locks, path, access, mode, m_options);
}

bool store_vfs::exists(const char* path) {
    if (!path) {
        KVFILE_THROW(bad_argument("The path must not be null."));
    }

    const std::string name(path);
    std::optional<file_metadata> metadata;
    m_store.run(transaction_mode::read_only,
                [&](transaction& tx) { metadata = tx.get_metadata(name); });
    return metadata.has_value();
}

void store_vfs::remove(const char* path) {
    if (!path) {
        KVFILE_THROW(bad_argument("The path must not be null."));
    }

    const std::string name(path);
    m_store.run(transaction_mode::read_write, [&](transaction& tx) {
        constexpr u64 last = std::numeric_limits<u64>::max();
        tx.remove_metadata(name);
        tx.primary().remove(name, 0, last);
        tx.overflow().remove(name, 0, last);
    });
    KVFILE_TRACE("removed {}", name);
}

} // namespace kvfile
