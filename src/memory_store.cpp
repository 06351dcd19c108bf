#include <kvfile/memory_store.hpp>

#include <kvfile/assert.hpp>
#include <kvfile/deferred.hpp>
#include <kvfile/exception.hpp>

#include "log.hpp"

#include <fmt/format.h>

#include <deque>
#include <map>
#include <utility>

namespace kvfile {

namespace detail {

namespace {

using block_key = std::pair<std::string, u64>;
using block_map_t = std::map<block_key, std::vector<byte>>;

// Reverts a single change made by a transaction.
using undo_fn = std::function<void()>;

// All changes of the running transaction, in the order they were made.
class undo_log {
public:
    void add(undo_fn fn) { m_entries.push_back(std::move(fn)); }

    // Reverts all changes, most recent change first.
    void revert() noexcept {
        for (auto i = m_entries.rbegin(), e = m_entries.rend(); i != e; ++i) {
            (*i)();
        }
        m_entries.clear();
    }

private:
    std::vector<undo_fn> m_entries;
};

class memory_table final : public block_table {
public:
    memory_table(const char* table_name, block_map_t& blocks, undo_log& log,
                 transaction_mode mode)
        : m_table_name(table_name)
        , m_blocks(blocks)
        , m_log(log)
        , m_mode(mode) {}

    std::optional<block_record> get(const std::string& name, u64 index) override {
        auto pos = m_blocks.find(block_key(name, index));
        if (pos == m_blocks.end())
            return {};

        return block_record{name, index, pos->second};
    }

    void put(const block_record& record) override {
        check_writable();

        block_key key(record.name, record.index);
        auto pos = m_blocks.find(key);
        if (pos != m_blocks.end()) {
            m_log.add([this, key, old = pos->second]() { m_blocks[key] = old; });
            pos->second = record.data;
        } else {
            m_log.add([this, key]() { m_blocks.erase(key); });
            m_blocks.emplace(std::move(key), record.data);
        }
    }

    void remove(const std::string& name, u64 first, u64 last) override {
        check_writable();
        if (first >= last)
            return;

        auto pos = m_blocks.lower_bound(block_key(name, first));
        while (pos != m_blocks.end() && pos->first.first == name && pos->first.second < last) {
            m_log.add([this, key = pos->first, old = pos->second]() { m_blocks[key] = old; });
            pos = m_blocks.erase(pos);
        }
    }

    std::vector<block_record>
    get_all(const std::string& name, std::optional<u64> after, size_t limit) override {
        std::vector<block_record> result;

        auto pos = m_blocks.lower_bound(block_key(name, 0));
        if (after) {
            pos = m_blocks.upper_bound(block_key(name, *after));
        }
        for (; pos != m_blocks.end() && pos->first.first == name && result.size() < limit; ++pos) {
            result.push_back(block_record{name, pos->first.second, pos->second});
        }
        return result;
    }

private:
    void check_writable() const {
        if (m_mode != transaction_mode::read_write) {
            KVFILE_THROW(store_error(
                fmt::format("Cannot modify table {} in a read-only transaction.", m_table_name)));
        }
    }

private:
    const char* m_table_name;
    block_map_t& m_blocks;
    undo_log& m_log;
    transaction_mode m_mode;
};

} // namespace

class memory_store_impl {
public:
    memory_store_impl() = default;

    void run(transaction_mode mode, const transactional_store::transaction_fn& fn);
    void post(transaction_mode mode, transactional_store::transaction_fn fn);
    void drain();

    size_t pending() const { return m_queue.size(); }
    u64 transactions() const { return m_transactions; }
    void fail_next_commit() { m_fail_next_commit = true; }

    std::optional<file_metadata> metadata(const std::string& name) const;
    std::optional<std::vector<byte>>
    block(memory_store::table_id table, const std::string& name, u64 index) const;
    std::vector<u64> indices(memory_store::table_id table, const std::string& name) const;

private:
    class memory_transaction;

    struct posted_work {
        transaction_mode mode;
        transactional_store::transaction_fn fn;
    };

    void execute(transaction_mode mode, const transactional_store::transaction_fn& fn);

    const block_map_t& table(memory_store::table_id table) const {
        return table == memory_store::primary ? m_primary : m_overflow;
    }

private:
    std::map<std::string, file_metadata> m_metadata;
    block_map_t m_primary;
    block_map_t m_overflow;

    // Posted work, in submission order.
    std::deque<posted_work> m_queue;

    // True while a transaction is executing.
    bool m_in_transaction = false;

    bool m_fail_next_commit = false;
    u64 m_transactions = 0;
};

class memory_store_impl::memory_transaction final : public transaction {
public:
    memory_transaction(memory_store_impl& store, transaction_mode mode)
        : m_store(store)
        , m_mode(mode)
        , m_primary("primary", store.m_primary, m_log, mode)
        , m_overflow("overflow", store.m_overflow, m_log, mode) {}

    transaction_mode mode() const noexcept override { return m_mode; }

    block_table& primary() override { return m_primary; }
    block_table& overflow() override { return m_overflow; }

    std::optional<file_metadata> get_metadata(const std::string& name) override {
        auto pos = m_store.m_metadata.find(name);
        if (pos == m_store.m_metadata.end())
            return {};
        return pos->second;
    }

    void put_metadata(const file_metadata& m) override {
        check_writable();

        auto& metadata = m_store.m_metadata;
        auto pos = metadata.find(m.name);
        if (pos != metadata.end()) {
            m_log.add([&metadata, old = pos->second]() { metadata[old.name] = old; });
            pos->second = m;
        } else {
            m_log.add([&metadata, name = m.name]() { metadata.erase(name); });
            metadata.emplace(m.name, m);
        }
    }

    void remove_metadata(const std::string& name) override {
        check_writable();

        auto& metadata = m_store.m_metadata;
        auto pos = metadata.find(name);
        if (pos == metadata.end())
            return;

        m_log.add([&metadata, old = pos->second]() { metadata[old.name] = old; });
        metadata.erase(pos);
    }

    void abort() noexcept { m_log.revert(); }

private:
    void check_writable() const {
        if (m_mode != transaction_mode::read_write) {
            KVFILE_THROW(store_error("Cannot modify metadata in a read-only transaction."));
        }
    }

private:
    memory_store_impl& m_store;
    transaction_mode m_mode;
    undo_log m_log;
    memory_table m_primary;
    memory_table m_overflow;
};

void memory_store_impl::run(transaction_mode mode,
                            const transactional_store::transaction_fn& fn) {
    if (m_in_transaction) {
        KVFILE_THROW(bad_operation("Transactions of the memory store cannot be nested."));
    }

    drain();
    execute(mode, fn);
}

void memory_store_impl::post(transaction_mode mode, transactional_store::transaction_fn fn) {
    m_queue.push_back(posted_work{mode, std::move(fn)});
}

void memory_store_impl::drain() {
    while (!m_queue.empty()) {
        posted_work work = std::move(m_queue.front());
        m_queue.pop_front();

        try {
            execute(work.mode, work.fn);
        } catch (const exception& e) {
            log_error("background transaction failed: {}", e.describe());
        }
    }
}

void memory_store_impl::execute(transaction_mode mode,
                                const transactional_store::transaction_fn& fn) {
    memory_transaction tx(*this, mode);

    m_in_transaction = true;
    deferred guard = [&]() noexcept {
        tx.abort();
        m_in_transaction = false;
    };

    fn(tx);
    if (m_fail_next_commit) {
        m_fail_next_commit = false;
        KVFILE_THROW(store_error("Injected commit failure."));
    }

    guard.disable();
    m_in_transaction = false;
    ++m_transactions;
}

std::optional<file_metadata> memory_store_impl::metadata(const std::string& name) const {
    auto pos = m_metadata.find(name);
    if (pos == m_metadata.end())
        return {};
    return pos->second;
}

std::optional<std::vector<byte>>
memory_store_impl::block(memory_store::table_id id, const std::string& name, u64 index) const {
    const block_map_t& blocks = table(id);
    auto pos = blocks.find(block_key(name, index));
    if (pos == blocks.end())
        return {};
    return pos->second;
}

std::vector<u64> memory_store_impl::indices(memory_store::table_id id,
                                            const std::string& name) const {
    const block_map_t& blocks = table(id);

    std::vector<u64> result;
    for (auto pos = blocks.lower_bound(block_key(name, 0));
         pos != blocks.end() && pos->first.first == name; ++pos) {
        result.push_back(pos->first.second);
    }
    return result;
}

} // namespace detail

memory_store::memory_store()
    : m_impl(std::make_unique<detail::memory_store_impl>()) {}

memory_store::~memory_store() {}

void memory_store::run(transaction_mode mode, const transaction_fn& fn) {
    impl().run(mode, fn);
}

void memory_store::post(transaction_mode mode, transaction_fn fn) {
    impl().post(mode, std::move(fn));
}

void memory_store::drain() {
    impl().drain();
}

size_t memory_store::pending() const {
    return impl().pending();
}

u64 memory_store::transactions() const {
    return impl().transactions();
}

void memory_store::fail_next_commit() {
    impl().fail_next_commit();
}

std::optional<file_metadata> memory_store::metadata(const std::string& name) const {
    return impl().metadata(name);
}

std::optional<std::vector<byte>>
memory_store::block(table_id table, const std::string& name, u64 index) const {
    return impl().block(table, name, index);
}

std::vector<u64> memory_store::indices(table_id table, const std::string& name) const {
    return impl().indices(table, name);
}

detail::memory_store_impl& memory_store::impl() const {
    if (!m_impl) {
        KVFILE_THROW(bad_operation("Invalid store instance."));
    }
    return *m_impl;
}

} // namespace kvfile
