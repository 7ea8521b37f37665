#include "../libkbfit/include/event_bus.hpp"
#include "../libkbfit/include/logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace kbfit;

namespace {

struct CaptureSink final : ILogSink {
    std::vector<std::string>* lines;

    explicit CaptureSink(std::vector<std::string>* out) : lines(out) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        lines->push_back(std::string(Logger::level_to_string(level)) + "|" + std::string(tag) + "|" +
                         std::string(message));
    }
};

struct Ping {
    int value = 0;
};

struct Pong {
    std::string text;
};

} // namespace

TEST_CASE("Logger fans out to sinks and removes them", "[logger]") {
    std::vector<std::string> lines;
    auto sink = std::make_unique<CaptureSink>(&lines);
    const ILogSink* handle = sink.get();
    Logger::add_sink(std::move(sink));

    Logger::log(LogLevel::Warning, "hello", "test");
    Logger::log(LogLevel::Debug, "details");

    Logger::remove_sink(handle);
    Logger::log(LogLevel::Error, "not captured", "test");

    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "WARN|test|hello");
    CHECK(lines[1] == "DEBUG|kbfit|details");
}

TEST_CASE("Log level names", "[logger]") {
    CHECK(Logger::string_to_level("debug") == LogLevel::Debug);
    CHECK(Logger::string_to_level("Info") == LogLevel::Info);
    CHECK(Logger::string_to_level("WARNING") == LogLevel::Warning);
    CHECK(Logger::string_to_level("warn") == LogLevel::Warning);
    CHECK(Logger::string_to_level("NONE") == LogLevel::None);
    CHECK(Logger::string_to_level("ERROR") == LogLevel::Error);
    CHECK(Logger::string_to_level("bogus") == LogLevel::Error);
}

TEST_CASE("Event bus routes by event type", "[events]") {
    EventBus bus;
    std::vector<int> pings;
    std::vector<std::string> pongs;
    bus.subscribe<Ping>([&pings](const Ping& p) { pings.push_back(p.value); });
    bus.subscribe<Ping>([&pings](const Ping& p) { pings.push_back(p.value * 10); });
    bus.subscribe<Pong>([&pongs](const Pong& p) { pongs.push_back(p.text); });

    bus.publish(Ping{1});
    bus.publish(Pong{"a"});

    CHECK(pings == std::vector<int>{1, 10});
    CHECK(pongs == std::vector<std::string>{"a"});

    SECTION("clear drops all handlers") {
        bus.clear();
        bus.publish(Ping{2});
        CHECK(pings.size() == 2);
    }

    SECTION("publishing without subscribers is a no-op") {
        EventBus empty;
        CHECK_NOTHROW(empty.publish(Ping{3}));
    }
}
