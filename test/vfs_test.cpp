#include <catch2/catch.hpp>

#include <kvfile/exception.hpp>
#include <kvfile/store_vfs.hpp>

#include "test_store.hpp"

#include <string>

using namespace kvfile;

TEST_CASE("store vfs", "[vfs]") {
    test_store env(test_options(64, 8));
    vfs& v = env.vfs();

    REQUIRE(std::string(v.name()) == "store");
    REQUIRE_FALSE(v.exists("db"));

    SECTION("missing files cannot be opened") {
        REQUIRE_THROWS_AS(v.open("db", vfs::read_write), cannot_open);
        REQUIRE_THROWS_AS(v.open("db", vfs::read_only), cannot_open);
        REQUIRE_FALSE(v.exists("db"));
    }

    SECTION("create a file") {
        auto f = v.open("db", vfs::read_write, vfs::open_create);
        REQUIRE(f->file_size() == 0);
        REQUIRE(f->sector_size() == 64);

        // The metadata write is not awaited, but later transactions observe it.
        REQUIRE(env.store().pending() == 1);
        REQUIRE(v.exists("db"));
        REQUIRE(env.store().metadata("db")->block_size == 64);
        REQUIRE(env.store().metadata("db")->file_size == 0);

        auto again = v.open("db", vfs::read_only);
        REQUIRE(again->read_only());
        REQUIRE(again->sector_size() == 64);

        auto create_again = v.open("db", vfs::read_write, vfs::open_create);
        REQUIRE(create_again->file_size() == 0);
    }

    SECTION("exclusive creation") {
        auto f = v.open("db", vfs::read_write, vfs::open_create | vfs::open_exclusive);
        REQUIRE_THROWS_AS(v.open("db", vfs::read_write, vfs::open_create | vfs::open_exclusive),
                          cannot_open);
    }

    SECTION("existing files keep their block size") {
        {
            auto f = v.open("db", vfs::read_write, vfs::open_create);
        }

        store_vfs other(env.store(), env.locks(), test_options(128, 8));
        auto f = other.open_file("db", vfs::read_write);
        REQUIRE(f->block_size() == 64);

        auto created = other.open_file("db2", vfs::read_write, vfs::open_create);
        REQUIRE(created->block_size() == 128);
    }

    SECTION("files cannot be created in read only mode") {
        REQUIRE_THROWS_AS(v.open("db", vfs::read_only, vfs::open_create), bad_argument);
    }

    SECTION("remove a file") {
        auto f = env.create("db");
        lock_exclusive(*f);
        for (u64 i = 0; i < 12; ++i) {
            write_block(*f, i, test_block(64, byte(i)));
        }
        REQUIRE(f->spilled_blocks() > 0);
        f->unlock(lock_level::none);

        // Leave some overflow entries behind.
        lock_exclusive(*f);
        for (u64 i = 0; i < 12; ++i) {
            write_block(*f, i, test_block(64, byte(i)));
        }
        env.store().drain();
        REQUIRE_FALSE(env.store().indices(memory_store::overflow, "db").empty());
        f->close();

        auto keep = env.create("keep");
        lock_exclusive(*keep);
        write_block(*keep, 0, test_block(64, 1));
        keep->unlock(lock_level::none);

        v.remove("db");
        REQUIRE_FALSE(v.exists("db"));
        REQUIRE(env.store().indices(memory_store::primary, "db").empty());
        REQUIRE(env.store().indices(memory_store::overflow, "db").empty());
        REQUIRE(v.exists("keep"));
        REQUIRE(env.store().indices(memory_store::primary, "keep") == std::vector<u64>{0});

        // Removing a missing file does nothing.
        v.remove("db");
    }
}

TEST_CASE("invalid vfs options", "[vfs]") {
    memory_store store;
    local_lock_manager locks;

    REQUIRE_THROWS_AS(store_vfs(store, locks, test_options(100, 8)), bad_argument);
    REQUIRE_THROWS_AS(store_vfs(store, locks, test_options(16, 8)), bad_argument);
    REQUIRE_THROWS_AS(store_vfs(store, locks, test_options(64, 0)), bad_argument);
    REQUIRE_NOTHROW(store_vfs(store, locks, test_options(32, 1)));

    REQUIRE_THROWS_AS(check_options(test_options(0, 1)), bad_argument);
    REQUIRE_NOTHROW(check_options(block_file_options()));
}
