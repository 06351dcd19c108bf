#ifndef KVFILE_STORE_VFS_HPP
#define KVFILE_STORE_VFS_HPP

#include <kvfile/block_file.hpp>
#include <kvfile/defs.hpp>
#include <kvfile/lock.hpp>
#include <kvfile/store.hpp>
#include <kvfile/vfs.hpp>

#include <memory>

namespace kvfile {

/// A virtual file system whose files are stored in a transactional key value store.
/// Every file opened by this vfs is a block_file.
class store_vfs final : public vfs {
public:
    /// Constructs a new vfs. The store and the lock manager must outlive
    /// the vfs and all files opened through it.
    ///
    /// Throws bad_argument if the options are invalid.
    store_vfs(transactional_store& store, lock_manager& locks,
              const block_file_options& options = block_file_options());

    ~store_vfs();

    const char* name() const noexcept override { return "store"; }

    std::unique_ptr<file> open(const char* path, access_t access = read_only,
                               int mode = open_normal) override;

    /// Like open(), but returns the concrete file type.
    std::unique_ptr<block_file> open_file(const char* path, access_t access = read_only,
                                          int mode = open_normal);

    bool exists(const char* path) override;

    /// Removes the metadata and all blocks of the file in a single transaction.
    void remove(const char* path) override;

    transactional_store& store() const noexcept { return m_store; }
    lock_manager& locks() const noexcept { return m_locks; }
    const block_file_options& options() const noexcept { return m_options; }

private:
    transactional_store& m_store;
    lock_manager& m_locks;
    block_file_options m_options;
};

} // namespace kvfile

#endif // KVFILE_STORE_VFS_HPP
