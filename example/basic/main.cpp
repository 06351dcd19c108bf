#include <kvfile/formatting.hpp>
#include <kvfile/local_lock_manager.hpp>
#include <kvfile/memory_store.hpp>
#include <kvfile/serialization.hpp>
#include <kvfile/store_vfs.hpp>

#include <fmt/format.h>

#include <iostream>
#include <stdexcept>
#include <vector>

namespace example {

struct settings {
    // Print stats on exit?
    bool print_stats = true;

    // Number of blocks kept in memory before they are spilled.
    size_t cache_blocks = 16;

    // Number of blocks written by every transaction.
    kvfile::u64 blocks_per_round = 64;
};

static std::vector<kvfile::byte> make_block(kvfile::u32 block_size, kvfile::u64 index,
                                            kvfile::u32 round) {
    std::vector<kvfile::byte> data(block_size);
    kvfile::serialize<kvfile::u64>(index, data.data());
    kvfile::serialize<kvfile::u32>(round, data.data() + 8);
    return data;
}

static void write_round(kvfile::block_file& f, const settings& s, kvfile::u32 round) {
    const kvfile::u32 block_size = f.block_size();

    if (!f.lock(kvfile::lock_level::shared) || !f.lock(kvfile::lock_level::reserved) ||
        !f.lock(kvfile::lock_level::exclusive))
        throw std::logic_error("Failed to lock the file.");

    for (kvfile::u64 i = 0; i < s.blocks_per_round; ++i) {
        std::vector<kvfile::byte> data = make_block(block_size, i, round);
        f.write(i * block_size, data.data(), block_size);
    }
    f.unlock(kvfile::lock_level::none);
}

} // namespace example

int main() {
    using namespace example;

    settings s;

    kvfile::block_file_options options;
    options.block_size = 4096;
    options.write_cache_blocks = s.cache_blocks;

    kvfile::memory_store store;
    kvfile::local_lock_manager locks;
    kvfile::store_vfs vfs(store, locks, options);

    auto f = vfs.open_file("example.db", kvfile::vfs::read_write, kvfile::vfs::open_create);
    for (kvfile::u32 round = 1; round <= 3; ++round) {
        write_round(*f, s, round);
    }

    // Discard the writes of a fourth round.
    if (!f->lock(kvfile::lock_level::shared) || !f->lock(kvfile::lock_level::exclusive))
        throw std::logic_error("Failed to lock the file.");
    std::vector<kvfile::byte> block = make_block(options.block_size, 0, 4);
    f->write(0, block.data(), options.block_size);
    f->signal_rollback();
    f->unlock(kvfile::lock_level::none);

    if (!f->lock(kvfile::lock_level::shared))
        throw std::logic_error("Failed to lock the file.");
    kvfile::io_status status = f->read(0, block.data(), options.block_size);
    f->unlock(kvfile::lock_level::none);
    if (status != kvfile::io_status::ok)
        throw std::logic_error("Block 0 is missing after three committed rounds.");

    fmt::print("File size: {} bytes\n", f->file_size());
    fmt::print("Block 0:\n{}", kvfile::format_dump(block.data(), 32));

    if (s.print_stats) {
        kvfile::block_file_stats stats = f->stats();
        std::cout << "\n"
                  << "I/O statistics:\n"
                  << "  Cache hits:  " << stats.cache_hits << "\n"
                  << "  Store reads: " << stats.store_reads << "\n"
                  << "  Spills:      " << stats.spills << "\n"
                  << "  Flushes:     " << stats.flushes << "\n"
                  << "  Rollbacks:   " << stats.rollbacks << "\n"
                  << std::flush;
    }
}
