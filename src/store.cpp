#include <kvfile/store.hpp>

#include <kvfile/assert.hpp>

namespace kvfile {

const char* to_string(transaction_mode mode) noexcept {
    switch (mode) {
    case transaction_mode::read_only:
        return "read_only";
    case transaction_mode::read_write:
        return "read_write";
    }
    KVFILE_UNREACHABLE("invalid transaction mode");
}

block_table::~block_table() {}

transaction::~transaction() {}

transactional_store::~transactional_store() {}

} // namespace kvfile
