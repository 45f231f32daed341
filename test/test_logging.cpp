// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license
// Test logging initialization

#include "util/logging.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <cstdlib>
#include <string>

namespace {

// Console only, quiet unless TORLINK_TEST_LOGLEVEL asks for more
class TestLoggingListener : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(Catch::TestRunInfo const&) override {
        const char* env = std::getenv("TORLINK_TEST_LOGLEVEL");
        const std::string level = env ? env : "off";
        torlink::util::LogManager::Initialize(level, false, "");
        if (level == "trace") {
            for (const auto& component : torlink::util::LogManager::ComponentNames()) {
                torlink::util::LogManager::SetComponentLevel(component, "trace");
            }
        }
    }

    void testRunEnded(Catch::TestRunStats const&) override {
        torlink::util::LogManager::Shutdown();
    }
};

} // namespace

CATCH_REGISTER_LISTENER(TestLoggingListener)
