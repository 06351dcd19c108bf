#ifndef KVFILE_MEMORY_STORE_HPP
#define KVFILE_MEMORY_STORE_HPP

#include <kvfile/defs.hpp>
#include <kvfile/store.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kvfile {

namespace detail {

class memory_store_impl;

} // namespace detail

/**
 * A simple in-memory store implementation.
 * Data is not persisted in any way; everything will be lost
 * once the store instance is being destroyed.
 *
 * Posted transactions are queued and executed (in order) right before
 * the next call to run(), or when drain() is called.
 *
 * The main use of this class is for unit testing.
 */
class memory_store final : public transactional_store {
public:
    /// Identifies one of the two tables (for inspection).
    enum table_id {
        primary,
        overflow,
    };

public:
    memory_store();
    ~memory_store();

    const char* name() const noexcept override { return "memory"; }

    void run(transaction_mode mode, const transaction_fn& fn) override;
    void post(transaction_mode mode, transaction_fn fn) override;

    /// Executes all posted transactions. Failures are reported on stderr.
    void drain();

    /// Number of posted transactions that have not been executed yet.
    size_t pending() const;

    /// Number of committed transactions.
    u64 transactions() const;

    /// Makes the next transaction fail (with a store_error) after its function
    /// has completed. All changes made by that transaction are rolled back.
    void fail_next_commit();

    /// Returns the committed metadata record of the given file.
    std::optional<file_metadata> metadata(const std::string& name) const;

    /// Returns the committed content of the given block.
    std::optional<std::vector<byte>> block(table_id table, const std::string& name, u64 index) const;

    /// Returns the indices of all committed blocks of the given file, in ascending order.
    std::vector<u64> indices(table_id table, const std::string& name) const;

private:
    detail::memory_store_impl& impl() const;

private:
    std::unique_ptr<detail::memory_store_impl> m_impl;
};

} // namespace kvfile

#endif // KVFILE_MEMORY_STORE_HPP
