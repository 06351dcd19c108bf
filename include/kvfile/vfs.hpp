#ifndef KVFILE_VFS_HPP
#define KVFILE_VFS_HPP

#include <kvfile/defs.hpp>
#include <kvfile/lock.hpp>

#include <memory>

namespace kvfile {

class file;
class vfs;

/// Result of a successful read operation.
enum class io_status {
    /// All requested bytes were read.
    ok,

    /// The read started at or beyond the end of the file.
    /// The buffer has been filled with zeroes.
    short_read,
};

/// Capabilities reported by file::device_characteristics().
/// The values match the flags understood by the database engine.
enum device_flags : int {
    /// Data is appended to the file before the file size is increased.
    iocap_safe_append = 0x00000200,

    /// The file cannot be deleted while it is open.
    iocap_undeletable_when_open = 0x00000800,
};

/// The file operations used by the database engine.
///
/// Files are block oriented: reads must not cross a block boundary and
/// writes must cover exactly one block.
class file {
public:
    file(kvfile::vfs& v)
        : m_vfs(v) {}

    virtual ~file();

    kvfile::vfs& get_vfs() const { return m_vfs; }

    /// False if writes and truncation are refused.
    virtual bool read_only() const noexcept = 0;

    virtual const char* name() const noexcept = 0;

    /// Equal to the block size: the unit of every write.
    virtual u32 sector_size() const noexcept = 0;

    /// Returns a combination of \ref device_flags.
    virtual int device_characteristics() const noexcept = 0;

    /// Copies `count` bytes starting at `offset` into `buffer`.
    /// The range must lie within a single block.
    ///
    /// A read that starts at or past the end of the file zero-fills `buffer`
    /// and reports io_status::short_read.
    virtual io_status read(u64 offset, void* buffer, u32 count) = 0;

    /// Replaces the block at `offset` with `count` bytes from `buffer`.
    /// `offset` must be block aligned and `count` must equal the block size.
    /// The file size grows to cover the block.
    virtual void write(u64 offset, const void* buffer, u32 count) = 0;

    /// Logical size in bytes.
    virtual u64 file_size() = 0;

    /// Sets the logical size. Blocks past the new end are dropped when
    /// the changes are flushed.
    virtual void truncate(u64 size) = 0;

    /// Durability is tied to the exclusive lock, so this only checks
    /// that the file is still open.
    virtual void sync() = 0;

    /// Raises the lock held on this file to (at least) the given level.
    /// Returns false if the lock is currently held by someone else.
    virtual bool lock(lock_level level) = 0;

    /// Lowers the lock held on this file to (at most) the given level.
    virtual void unlock(lock_level level) = 0;

    /// The lock level currently held by this handle.
    virtual lock_level current_lock() const noexcept = 0;

    /// Drops unflushed writes and releases the lock. Further calls throw.
    virtual void close() = 0;

    file(const file&) = delete;
    file& operator=(const file&) = delete;

private:
    kvfile::vfs& m_vfs;
};

/// A namespace of block files.
class vfs {
public:
    enum access_t {
        read_only,
        read_write,
    };

    /// Bit flags for open().
    enum flags_t {
        open_normal = 0,

        /// Create the file if it is missing.
        open_create = 1 << 0,

        /// Together with open_create: fail if the file exists.
        open_exclusive = 1 << 1,
    };

public:
    vfs() = default;

    virtual ~vfs();

    virtual const char* name() const noexcept = 0;

    /// Throws cannot_open if the file is missing (without open_create)
    /// or present (with open_create | open_exclusive).
    virtual std::unique_ptr<file>
    open(const char* path, access_t access = read_only, int mode = open_normal) = 0;

    virtual bool exists(const char* path) = 0;

    /// Deletes the file's metadata and blocks. Missing files are ignored.
    virtual void remove(const char* path) = 0;

    vfs(const vfs&) = delete;
    vfs& operator=(const vfs&) = delete;
};

} // namespace kvfile

#endif // KVFILE_VFS_HPP
