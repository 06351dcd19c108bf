#ifndef KVFILE_STORE_HPP
#define KVFILE_STORE_HPP

#include <kvfile/defs.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kvfile {

class transaction;

/// The kind of transaction opened by a store.
enum class transaction_mode {
    /// Transactions can only read. Any write operation fails.
    read_only,

    /// Transactions can read and write.
    read_write,
};

const char* to_string(transaction_mode mode) noexcept;

/// Describes a single file. Stored in the primary table
/// under the key (name, "metadata").
struct file_metadata {
    /// Name of the file.
    std::string name;

    /// Logical size of the file, in bytes.
    u64 file_size = 0;

    /// Size of every block of the file. Fixed when the file is created.
    u32 block_size = 0;
};

/// A single block of a file, as persisted in a table.
struct block_record {
    std::string name;
    u64 index = 0;

    /// Exactly `block_size` bytes.
    std::vector<byte> data;
};

/// A table of block records, keyed by (file name, block index).
/// Table handles are only valid during the transaction that returned them.
class block_table {
public:
    virtual ~block_table();

    /// Returns the block with the given key, or an empty optional if there is no such block.
    virtual std::optional<block_record> get(const std::string& name, u64 index) = 0;

    /// Inserts the record, replacing any existing block with the same key.
    virtual void put(const block_record& record) = 0;

    /// Removes all blocks of the given file whose index lies in `[first, last)`.
    virtual void remove(const std::string& name, u64 first, u64 last) = 0;

    /// Returns up to `limit` blocks of the given file in ascending index order.
    /// Starts after the block index `after` if it is set, or with the
    /// first block of the file otherwise.
    virtual std::vector<block_record>
    get_all(const std::string& name, std::optional<u64> after, size_t limit) = 0;
};

/// An atomic unit of work against the two tables of a store.
/// Either all operations become visible (when the transaction function returns normally)
/// or none of them do (when it throws).
class transaction {
public:
    virtual ~transaction();

    /// The mode this transaction was opened with.
    virtual transaction_mode mode() const noexcept = 0;

    /// The authoritative block table.
    virtual block_table& primary() = 0;

    /// The table that holds blocks evicted from a write cache
    /// that have not been committed yet.
    virtual block_table& overflow() = 0;

    /// Reads the metadata record of the given file.
    virtual std::optional<file_metadata> get_metadata(const std::string& name) = 0;

    /// Inserts or replaces the metadata record `m.name`.
    virtual void put_metadata(const file_metadata& m) = 0;

    /// Removes the metadata record of the given file (if it exists).
    virtual void remove_metadata(const std::string& name) = 0;
};

/// Interface of a transactional key value store.
///
/// Implementations must guarantee that work submitted through `post()` is executed
/// in submission order and before any transaction that is submitted after it
/// (through either `run()` or `post()`).
class transactional_store {
public:
    using transaction_fn = std::function<void(transaction&)>;

public:
    transactional_store() = default;

    virtual ~transactional_store();

    /// Name of this store (for error reporting only).
    virtual const char* name() const noexcept = 0;

    /// Runs `fn` in a new transaction and waits for the transaction to complete.
    /// The transaction commits when `fn` returns normally. If `fn` throws, or
    /// if the commit fails, the transaction is aborted and the exception is propagated.
    virtual void run(transaction_mode mode, const transaction_fn& fn) = 0;

    /// Submits `fn` for execution in a new transaction without waiting for it.
    /// Failures cannot be observed by the caller.
    virtual void post(transaction_mode mode, transaction_fn fn) = 0;

    transactional_store(const transactional_store&) = delete;
    transactional_store& operator=(const transactional_store&) = delete;
};

/// A per-file view of a store that remembers the mode used for
/// the next transactions.
class store_session {
public:
    explicit store_session(transactional_store& store,
                           transaction_mode mode = transaction_mode::read_write)
        : m_store(&store)
        , m_mode(mode) {}

    transactional_store& store() const noexcept { return *m_store; }

    /// The mode of transactions opened by `run()` and `post()`.
    transaction_mode mode() const noexcept { return m_mode; }

    /// Changes the mode of the transactions opened from now on.
    void set_mode(transaction_mode mode) noexcept { m_mode = mode; }

    /// \copydoc transactional_store::run
    void run(const transactional_store::transaction_fn& fn) { m_store->run(m_mode, fn); }

    /// \copydoc transactional_store::post
    void post(transactional_store::transaction_fn fn) { m_store->post(m_mode, std::move(fn)); }

private:
    transactional_store* m_store;
    transaction_mode m_mode;
};

} // namespace kvfile

#endif // KVFILE_STORE_HPP
