// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>

using namespace torlink::util;

TEST_CASE("File utilities", "[util][files]") {
    auto test_dir = std::filesystem::temp_directory_path() / "torlink_files_test";
    std::filesystem::remove_all(test_dir);

    SECTION("ensure_directory creates directories") {
        auto subdir = test_dir / "sub" / "nested";
        REQUIRE(ensure_directory(subdir));
        REQUIRE(std::filesystem::is_directory(subdir));
        REQUIRE(ensure_directory(subdir));
    }

    SECTION("atomic_write_file creates parents and round-trips") {
        auto file_path = test_dir / "a" / "peerinfo.json";
        REQUIRE(atomic_write_file(file_path, "{\"id\":\"QmPeer\"}"));
        auto text = read_file_string(file_path);
        REQUIRE(text.has_value());
        REQUIRE(*text == "{\"id\":\"QmPeer\"}");
    }

    SECTION("atomic_write_file overwrites and leaves no temp files") {
        auto file_path = test_dir / "data.txt";
        REQUIRE(atomic_write_file(file_path, "old"));
        REQUIRE(atomic_write_file(file_path, "new contents"));
        REQUIRE(read_file_string(file_path) == std::string("new contents"));

        size_t entries = 0;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
            (void)entry;
            ++entries;
        }
        REQUIRE(entries == 1);
    }

    SECTION("read_file_string rejects missing and oversized files") {
        REQUIRE_FALSE(read_file_string(test_dir / "missing").has_value());

        auto file_path = test_dir / "big";
        REQUIRE(atomic_write_file(file_path, std::string(64, 'x')));
        REQUIRE_FALSE(read_file_string(file_path, 32).has_value());
        REQUIRE(read_file_string(file_path, 64).has_value());
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("DirectoryLock", "[util][fs_lock]") {
    auto test_dir = std::filesystem::temp_directory_path() / "torlink_lock_test";
    std::filesystem::remove_all(test_dir);
    REQUIRE(ensure_directory(test_dir));

    DirectoryLock lock(test_dir);
    REQUIRE_FALSE(lock.held());
    REQUIRE(lock.acquire() == LockResult::Success);
    REQUIRE(lock.held());
    REQUIRE(std::filesystem::exists(test_dir / ".lock"));

    // Re-acquiring a held lock is a no-op
    REQUIRE(lock.acquire() == LockResult::Success);

    lock.release();
    REQUIRE_FALSE(lock.held());

    SECTION("Missing directory cannot be locked") {
        DirectoryLock missing(test_dir / "does" / "not" / "exist");
        REQUIRE(missing.acquire() == LockResult::ErrorWrite);
        REQUIRE_FALSE(missing.reason().empty());
    }

    std::filesystem::remove_all(test_dir);
}
