// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace agentmesh;

namespace
{

struct Captured
{
    log::Level level;
    std::string agent;
    std::string message;
};

/// @brief Installs a capturing sink for the lifetime of the object.
struct CaptureSink
{
    std::vector<Captured> records;
    log::Level previousLevel = log::getLevel();

    CaptureSink()
    {
        log::setCallback([this](const log::Record& record) {
            records.push_back(Captured { record.level, std::string(record.agent), std::string(record.message) });
        });
    }

    ~CaptureSink()
    {
        log::setCallback({});
        log::setLevel(previousLevel);
    }
};

} // namespace

TEST_CASE("levelFromString", "[log]")
{
    CHECK(log::levelFromString("error") == log::Level::Error);
    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(log::levelFromString("trace") == log::Level::Trace);
    CHECK(log::levelFromString("loud") == log::Level::Info);
    CHECK(log::levelName(log::Level::Debug) == "debug");
}

TEST_CASE("log records are filtered by level", "[log]")
{
    auto sink = CaptureSink {};
    log::setLevel(log::Level::Warning);

    log::error("e {}", 1);
    log::warning("w");
    log::info("i");
    log::debug("d");

    REQUIRE(sink.records.size() == 2);
    CHECK(sink.records[0].level == log::Level::Error);
    CHECK(sink.records[0].message == "e 1");
    CHECK(sink.records[1].level == log::Level::Warning);
}

TEST_CASE("AgentScope tags records of the current thread", "[log]")
{
    auto sink = CaptureSink {};
    log::setLevel(log::Level::Info);

    log::info("outside");
    {
        auto const outer = log::AgentScope("alice");
        log::info("as alice");
        {
            auto const inner = log::AgentScope("bob");
            CHECK(log::currentAgent() == "bob");
            log::info("as bob");
        }
        std::jthread([] { log::info("other thread"); }).join();
        log::info("alice again");
    }

    REQUIRE(sink.records.size() == 5);
    CHECK(sink.records[0].agent.empty());
    CHECK(sink.records[1].agent == "alice");
    CHECK(sink.records[2].agent == "bob");
    CHECK(sink.records[3].agent.empty());
    CHECK(sink.records[4].agent == "alice");
    CHECK(log::currentAgent().empty());
}
