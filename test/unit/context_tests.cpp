// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "util/context.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>

using namespace torlink::util;
using namespace std::chrono_literals;

TEST_CASE("Context - background never expires", "[util][context]") {
    Context ctx;
    REQUIRE_FALSE(ctx.Done());
    REQUIRE(ctx.Error().empty());
    REQUIRE_FALSE(ctx.Deadline().has_value());
    REQUIRE_FALSE(ctx.Remaining().has_value());
    REQUIRE_FALSE(ctx.WaitFor(5ms));
}

TEST_CASE("Context - cancellation", "[util][context]") {
    Context parent = Context::WithCancel(Context());
    Context child = Context::WithTimeout(parent, 10s);

    SECTION("Cancel propagates to children with the cause") {
        parent.Cancel("shutting down");
        REQUIRE(parent.Done());
        REQUIRE(child.Done());
        REQUIRE(child.Error() == "shutting down");
    }

    SECTION("Cancelling a child leaves the parent alone") {
        child.Cancel();
        REQUIRE(child.Done());
        REQUIRE(child.Error() == Context::kCanceled);
        REQUIRE_FALSE(parent.Done());
    }

    SECTION("Second cancel keeps the first cause") {
        parent.Cancel("first");
        parent.Cancel("second");
        REQUIRE(parent.Error() == "first");
    }

    SECTION("Deriving from a cancelled context is already done") {
        parent.Cancel();
        Context late = Context::WithCancel(parent);
        REQUIRE(late.Done());
    }

    SECTION("WaitFor wakes on cancel") {
        std::thread canceller([&] {
            std::this_thread::sleep_for(20ms);
            parent.Cancel();
        });
        auto start = std::chrono::steady_clock::now();
        REQUIRE(child.WaitFor(5s));
        REQUIRE(std::chrono::steady_clock::now() - start < 2s);
        canceller.join();
    }
}

TEST_CASE("Context - deadlines", "[util][context]") {
    SECTION("Expired deadline reports deadline exceeded") {
        Context ctx = Context::WithTimeout(Context(), 10ms);
        REQUIRE(ctx.WaitFor(1s));
        REQUIRE(ctx.Done());
        REQUIRE(ctx.Error() == Context::kDeadlineExceeded);
        REQUIRE(ctx.Remaining() == Context::Clock::duration::zero());
    }

    SECTION("Child inherits the earlier parent deadline") {
        Context parent = Context::WithTimeout(Context(), 50ms);
        Context child = Context::WithTimeout(parent, 1h);
        REQUIRE(child.Deadline() == parent.Deadline());
    }

    SECTION("Child keeps its own earlier deadline") {
        Context parent = Context::WithTimeout(Context(), 1h);
        Context child = Context::WithTimeout(parent, 10ms);
        REQUIRE(*child.Deadline() < *parent.Deadline());
    }
}
