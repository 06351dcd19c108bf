#include <catch2/catch.hpp>

#include <kvfile/block_file.hpp>
#include <kvfile/exception.hpp>

#include "test_store.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>

using namespace kvfile;

static bool all_zero(const std::vector<byte>& data) {
    return std::all_of(data.begin(), data.end(), [](byte b) { return b == 0; });
}

TEST_CASE("block file properties", "[block-file]") {
    test_store env(test_options(64, 4));
    auto f = env.create("db");

    REQUIRE(std::string(f->name()) == "db");
    REQUIRE_FALSE(f->read_only());
    REQUIRE(f->block_size() == 64);
    REQUIRE(f->sector_size() == 64);
    REQUIRE(f->file_size() == 0);
    REQUIRE(f->current_lock() == lock_level::none);
    REQUIRE(&f->get_vfs() == &env.vfs());
    REQUIRE(f->device_characteristics() == (iocap_safe_append | iocap_undeletable_when_open));
    REQUIRE(f->device_characteristics() == 0xA00);
}

TEST_CASE("aligned block io", "[block-file]") {
    test_store env(test_options(64, 4));
    auto f = env.create("db");
    lock_exclusive(*f);

    const std::vector<byte> b0 = test_block(64, 1);
    const std::vector<byte> b1 = test_block(64, 2);

    write_block(*f, 0, b0);
    REQUIRE(f->file_size() == 64);
    write_block(*f, 1, b1);
    REQUIRE(f->file_size() == 128);

    SECTION("written blocks are read back") {
        REQUIRE(read_block(*f, 0) == b0);
        REQUIRE(read_block(*f, 1) == b1);
        REQUIRE(f->stats().cache_hits == 2);
        REQUIRE(f->stats().store_reads == 0);
    }

    SECTION("partial reads within a block") {
        byte buffer[8];
        REQUIRE(f->read(64 + 56, buffer, 8) == io_status::ok);
        REQUIRE(buffer[7] == 2);

        REQUIRE(f->read(32, buffer, 1) == io_status::ok);
        REQUIRE(buffer[0] == 1);
    }

    SECTION("overwriting a block") {
        const std::vector<byte> b2 = test_block(64, 3);
        write_block(*f, 0, b2);
        REQUIRE(read_block(*f, 0) == b2);
        REQUIRE(f->file_size() == 128);
        REQUIRE(f->cached_blocks() == 2);
    }

    SECTION("reads at or beyond the end of the file") {
        std::vector<byte> buffer(64, 0xff);
        REQUIRE(f->read(128, buffer.data(), 64) == io_status::short_read);
        REQUIRE(all_zero(buffer));

        std::fill(buffer.begin(), buffer.end(), 0xff);
        REQUIRE(f->read(640, buffer.data(), 64) == io_status::short_read);
        REQUIRE(all_zero(buffer));
    }

    SECTION("holes read as zeroes") {
        write_block(*f, 4, test_block(64, 5));
        REQUIRE(f->file_size() == 320);

        std::vector<byte> buffer(64, 0xff);
        REQUIRE(f->read(2 * 64, buffer.data(), 64) == io_status::ok);
        REQUIRE(all_zero(buffer));
    }

    SECTION("reads across a block boundary") {
        byte buffer[128];
        REQUIRE_THROWS_AS(f->read(60, buffer, 8), alignment_error);
        REQUIRE_THROWS_AS(f->read(0, buffer, 65), alignment_error);
    }

    SECTION("unaligned writes") {
        const std::vector<byte> data = test_block(64, 9);
        REQUIRE_THROWS_AS(f->write(10, data.data(), 64), alignment_error);
        REQUIRE_THROWS_AS(f->write(64, data.data(), 32), alignment_error);
        REQUIRE_THROWS_AS(f->write(64, data.data(), 0), alignment_error);

        // Alignment errors are io errors.
        REQUIRE_THROWS_AS(f->write(1, data.data(), 64), io_error);
        REQUIRE(f->file_size() == 128);
    }

    SECTION("truncate only changes the size") {
        f->truncate(64);
        REQUIRE(f->file_size() == 64);
        REQUIRE(f->cached_blocks() == 2);

        std::vector<byte> buffer(64);
        REQUIRE(f->read(64, buffer.data(), 64) == io_status::short_read);

        f->truncate(1000);
        REQUIRE(f->file_size() == 1000);
    }

    SECTION("sync does nothing") {
        f->sync();
        env.store().drain();
        REQUIRE(env.store().indices(memory_store::primary, "db").empty());
    }

    f->unlock(lock_level::none);
}

TEST_CASE("read only handles", "[block-file]") {
    test_store env(test_options(64, 4));
    {
        auto f = env.create("db");
        lock_exclusive(*f);
        write_block(*f, 0, test_block(64, 1));
        f->unlock(lock_level::none);
    }

    auto f = env.open("db", store_vfs::read_only);
    REQUIRE(f->read_only());
    REQUIRE(f->lock(lock_level::shared));
    REQUIRE(f->file_size() == 64);
    REQUIRE(read_block(*f, 0) == test_block(64, 1));

    const std::vector<byte> data = test_block(64, 2);
    REQUIRE_THROWS_AS(f->write(0, data.data(), 64), io_error);
    REQUIRE_THROWS_AS(f->truncate(0), io_error);
    REQUIRE(read_block(*f, 0) == test_block(64, 1));
    f->unlock(lock_level::none);
}

TEST_CASE("block file locking", "[block-file]") {
    test_store env(test_options(64, 4));
    auto f = env.create("db");

    SECTION("raising the lock from none requires a shared lock first") {
        REQUIRE_THROWS_AS(f->lock(lock_level::exclusive), bad_operation);
        REQUIRE_THROWS_AS(f->lock(lock_level::reserved), bad_operation);
        REQUIRE(f->current_lock() == lock_level::none);
    }

    SECTION("lock levels only move in one direction") {
        REQUIRE(f->lock(lock_level::shared));
        REQUIRE(f->lock(lock_level::exclusive));
        REQUIRE(f->current_lock() == lock_level::exclusive);

        // Already held.
        REQUIRE(f->lock(lock_level::shared));
        REQUIRE(f->current_lock() == lock_level::exclusive);

        f->unlock(lock_level::shared);
        REQUIRE(f->current_lock() == lock_level::shared);
        f->unlock(lock_level::exclusive);
        REQUIRE(f->current_lock() == lock_level::shared);
        f->unlock(lock_level::none);
        REQUIRE(f->current_lock() == lock_level::none);
        REQUIRE(env.locks().level("db") == lock_level::none);
    }

    SECTION("busy locks") {
        auto other = env.open("db");
        REQUIRE(other->lock(lock_level::shared));
        REQUIRE(f->lock(lock_level::shared));
        REQUIRE(f->lock(lock_level::reserved));

        REQUIRE_FALSE(other->lock(lock_level::reserved));
        REQUIRE(other->current_lock() == lock_level::shared);

        REQUIRE_FALSE(f->lock(lock_level::exclusive));
        REQUIRE(f->current_lock() == lock_level::reserved);

        other->unlock(lock_level::none);
        REQUIRE(f->lock(lock_level::exclusive));
        f->unlock(lock_level::none);
    }

    SECTION("custom hooks run after the built in ones") {
        std::vector<std::string> events;
        auto record = [&](const char* kind) {
            return [&events, kind](lock_level from, lock_level to) {
                events.push_back(fmt::format("{} {}->{}", kind, to_string(from), to_string(to)));
            };
        };
        f->hooks().before_acquire(record("before-acquire"));
        f->hooks().after_acquire(record("after-acquire"));
        f->hooks().before_release(record("before-release"));
        f->hooks().after_release(record("after-release"));

        REQUIRE(f->lock(lock_level::shared));
        REQUIRE(f->lock(lock_level::exclusive));
        write_block(*f, 0, test_block(64, 1));

        f->hooks().before_release([&](lock_level, lock_level) {
            // The flush has already happened.
            REQUIRE(env.store().block(memory_store::primary, "db", 0));
        });
        f->unlock(lock_level::none);

        REQUIRE(events == std::vector<std::string>{
                              "before-acquire none->shared",
                              "after-acquire none->shared",
                              "before-acquire shared->exclusive",
                              "after-acquire shared->exclusive",
                              "before-release exclusive->none",
                              "after-release exclusive->none",
                          });
    }

    SECTION("failing hooks abort the transition") {
        f->hooks().before_acquire([](lock_level, lock_level to) {
            if (to == lock_level::exclusive)
                KVFILE_THROW(bad_operation("refused"));
        });

        REQUIRE(f->lock(lock_level::shared));
        REQUIRE_THROWS_AS(f->lock(lock_level::exclusive), bad_operation);
        REQUIRE(f->current_lock() == lock_level::shared);
        REQUIRE(env.locks().level("db") == lock_level::shared);
        f->unlock(lock_level::none);
    }
}

TEST_CASE("closing a block file", "[block-file]") {
    test_store env(test_options(64, 4));
    auto f = env.create("db");
    lock_exclusive(*f);
    write_block(*f, 0, test_block(64, 1));

    f->close();
    REQUIRE(f->cached_blocks() == 0);
    REQUIRE(f->current_lock() == lock_level::none);
    REQUIRE(env.locks().level("db") == lock_level::none);

    // Unflushed writes are gone.
    env.store().drain();
    REQUIRE(env.store().indices(memory_store::primary, "db").empty());

    byte buffer[64];
    REQUIRE_THROWS_AS(f->read(0, buffer, 64), bad_operation);
    REQUIRE_THROWS_AS(f->write(0, buffer, 64), bad_operation);
    REQUIRE_THROWS_AS(f->lock(lock_level::shared), bad_operation);
    REQUIRE_THROWS_AS(f->file_size(), bad_operation);

    // Closing twice is fine.
    f->close();
}

TEST_CASE("destroying a locked file releases the lock", "[block-file]") {
    test_store env(test_options(64, 4));
    {
        auto f = env.create("db");
        lock_exclusive(*f);
        REQUIRE(env.locks().level("db") == lock_level::exclusive);
    }
    REQUIRE(env.locks().level("db") == lock_level::none);
    REQUIRE(env.locks().shared_count("db") == 0);
}
