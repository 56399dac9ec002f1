#include <catch2/catch_test_macros.hpp>
#include <progression/core/log.hpp>
#include <string>
#include <vector>

using namespace progression::core;

namespace {

struct CapturedLine {
    LogLevel level;
    std::string category;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void log(LogLevel level, const std::string& category, const std::string& message) override {
        lines.push_back({level, category, message});
    }

    std::vector<CapturedLine> lines;
};

class LogFixture {
protected:
    LogFixture() {
        m_previous_level = get_log_level();
        add_log_sink(&sink);
    }

    ~LogFixture() {
        remove_log_sink(&sink);
        set_log_level(m_previous_level);
    }

    CaptureSink sink;

private:
    LogLevel m_previous_level;
};

} // namespace

TEST_CASE_METHOD(LogFixture, "Log sink receives formatted messages", "[core][log]") {
    set_log_level(LogLevel::Trace);

    log_info("counters", "Set {} to {}", "levels_completed", 3);

    REQUIRE(sink.lines.size() == 1);
    REQUIRE(sink.lines[0].level == LogLevel::Info);
    REQUIRE(sink.lines[0].category == "counters");
    REQUIRE(sink.lines[0].message == "Set levels_completed to 3");
}

TEST_CASE_METHOD(LogFixture, "Log level filters lower severities", "[core][log]") {
    set_log_level(LogLevel::Warn);

    log_debug("test", "hidden {}", 1);
    log_info("test", "hidden {}", 2);
    log_warning("test", "shown {}", 3);
    log_error("test", "shown {}", 4);

    REQUIRE(sink.lines.size() == 2);
    REQUIRE(sink.lines[0].level == LogLevel::Warn);
    REQUIRE(sink.lines[1].level == LogLevel::Error);
}

TEST_CASE_METHOD(LogFixture, "Uncategorized log overloads", "[core][log]") {
    set_log_level(LogLevel::Trace);

    SECTION("Plain message") {
        log(LogLevel::Info, "plain message");
        REQUIRE(sink.lines.size() == 1);
        REQUIRE(sink.lines[0].category.empty());
        REQUIRE(sink.lines[0].message == "plain message");
    }

    SECTION("Formatted message") {
        log(LogLevel::Error, "[Config] {} errors in {}", 2, "progression.json");
        REQUIRE(sink.lines.size() == 1);
        REQUIRE(sink.lines[0].message == "[Config] 2 errors in progression.json");
    }
}

TEST_CASE_METHOD(LogFixture, "Removed sinks stop receiving", "[core][log]") {
    set_log_level(LogLevel::Trace);

    remove_log_sink(&sink);
    log_info("test", "not captured");
    REQUIRE(sink.lines.empty());

    add_log_sink(&sink);
    log_info("test", "captured");
    REQUIRE(sink.lines.size() == 1);
}

TEST_CASE("LogLevel names", "[core][log]") {
    REQUIRE(std::string(to_string(LogLevel::Debug)) == "debug");
    REQUIRE(std::string(to_string(LogLevel::Warn)) == "warn");
    REQUIRE(std::string(to_string(LogLevel::Fatal)) == "fatal");
}
