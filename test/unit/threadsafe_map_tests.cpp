// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "util/threadsafe_containers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <thread>
#include <vector>

using namespace torlink::util;

TEST_CASE("ThreadSafeMap - lookups", "[util][threadsafe_map]") {
    ThreadSafeMap<std::string, int> map;

    REQUIRE(map.Size() == 0);
    REQUIRE_FALSE(map.Get("a").has_value());
    REQUIRE_FALSE(map.Read("a", [](const int&) { FAIL("reader called"); }));

    map.Upsert("a", [](int& v) { v = 12; });
    REQUIRE(map.Contains("a"));
    REQUIRE(map.Get("a") == 12);

    int seen = 0;
    REQUIRE(map.Read("a", [&](const int& v) { seen = v; }));
    REQUIRE(seen == 12);
    REQUIRE_FALSE(map.Contains("b"));
}

TEST_CASE("ThreadSafeMap - Upsert returns the callback result", "[util][threadsafe_map]") {
    ThreadSafeMap<std::string, std::vector<int>> map;

    auto size = map.Upsert("k", [](std::vector<int>& v) {
        v.push_back(1);
        return v.size();
    });
    REQUIRE(size == 1);
    size = map.Upsert("k", [](std::vector<int>& v) {
        v.push_back(2);
        return v.size();
    });
    REQUIRE(size == 2);
}

TEST_CASE("ThreadSafeMap - EraseIf", "[util][threadsafe_map]") {
    ThreadSafeMap<std::string, int> map;
    for (int i = 0; i < 6; ++i) {
        map.Upsert("k" + std::to_string(i), [i](int& v) { v = i; });
    }

    REQUIRE(map.EraseIf([](const std::string&, const int& v) { return v % 2 == 0; }) == 3);
    REQUIRE(map.Size() == 3);
    REQUIRE_FALSE(map.Contains("k0"));
    REQUIRE(map.Get("k1") == 1);

    REQUIRE(map.EraseIf([](const std::string& k, const int&) { return k == "missing"; }) == 0);
    REQUIRE(map.Size() == 3);
}

TEST_CASE("ThreadSafeMap - snapshots", "[util][threadsafe_map]") {
    ThreadSafeMap<int, int> map;
    for (int i = 0; i < 5; ++i) {
        map.Upsert(i, [i](int& v) { v = i * i; });
    }

    REQUIRE(map.Keys().size() == 5);

    int sum = 0;
    map.ForEach([&](const int&, const int& v) { sum += v; });
    REQUIRE(sum == 0 + 1 + 4 + 9 + 16);

    auto taken = map.TakeAll();
    REQUIRE(taken.size() == 5);
    REQUIRE(map.Size() == 0);
}

TEST_CASE("ThreadSafeMap - concurrent upserts", "[util][threadsafe_map]") {
    ThreadSafeMap<int, int> map;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 1000; ++i) {
                map.Upsert(i % 10, [](int& v) { return ++v; });
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    int total = 0;
    map.ForEach([&](const int&, const int& v) { total += v; });
    REQUIRE(total == 8000);
    REQUIRE(map.Size() == 10);
}
