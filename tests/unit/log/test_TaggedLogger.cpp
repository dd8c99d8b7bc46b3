#include <doctest/doctest.h>
#include "EnvGuard.hpp"
#include "log/TaggedLogger.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Clears every logger variable for the lifetime of a test.
struct CleanLogEnvironment {
    EnvGuard enabled{"LONGPRESS_LOG_ENABLED", nullptr};
    EnvGuard log{"LONGPRESS_LOG", nullptr};
    EnvGuard clearSkips{"LONGPRESS_LOG_CLEAR_DEFAULT_SKIPS", nullptr};
    EnvGuard enableTags{"LONGPRESS_LOG_ENABLE_TAGS", nullptr};
    EnvGuard skipTags{"LONGPRESS_LOG_SKIP_TAGS", nullptr};
};

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

// A scoped logger joins its worker on destruction, so everything queued inside
// the lambda is flushed before captureStderr restores the stream.
template <typename... Tags>
auto logOnce(std::string const& message, Tags... tags) -> std::string {
    return captureStderr([&] {
        LP::TaggedLogger logger;
        logger.log_impl(message, std::source_location::current(), tags...);
    });
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logger is silent unless enabled") {
    CleanLogEnvironment env;
    CHECK(logOnce("hold started", "LongPress").empty());
}

TEST_CASE("LONGPRESS_LOG_ENABLED turns output on with tag, thread and location") {
    CleanLogEnvironment env;
    EnvGuard enable("LONGPRESS_LOG_ENABLED", "1");

    auto output = logOnce("hold started, 3s", "LongPress");

    CHECK(output.find("[LongPress]") != std::string::npos);
    CHECK(output.find("hold started, 3s") != std::string::npos);
    CHECK(output.find("[Thread 0]") != std::string::npos);
    CHECK(output.find("test_TaggedLogger.cpp:") != std::string::npos);
}

TEST_CASE("LONGPRESS_LOG accepts any value except false-ish ones") {
    CleanLogEnvironment env;
    SUBCASE("on") {
        EnvGuard enable("LONGPRESS_LOG", "on");
        CHECK(logOnce("visible", "LongPress").find("visible") != std::string::npos);
    }
    SUBCASE("off") {
        EnvGuard enable("LONGPRESS_LOG", "off");
        CHECK(logOnce("hidden", "LongPress").empty());
    }
    SUBCASE("zero") {
        EnvGuard enable("LONGPRESS_LOG", "0");
        CHECK(logOnce("hidden", "LongPress").empty());
    }
}

TEST_CASE("countdown ticks are skipped by default") {
    CleanLogEnvironment env;
    EnvGuard enable("LONGPRESS_LOG_ENABLED", "1");

    CHECK(logOnce("2s left", "LongPress", "Tick").empty());
    CHECK(logOnce("noise", "INFO").empty());
}

TEST_CASE("clearing default skips shows ticks") {
    CleanLogEnvironment env;
    EnvGuard enable("LONGPRESS_LOG_ENABLED", "1");
    EnvGuard clear("LONGPRESS_LOG_CLEAR_DEFAULT_SKIPS", "1");

    CHECK(logOnce("2s left", "LongPress", "Tick").find("2s left") != std::string::npos);
}

TEST_CASE("enabled tags require every tag of a message to be enabled") {
    CleanLogEnvironment env;
    EnvGuard enable("LONGPRESS_LOG_ENABLED", "1");
    EnvGuard tags("LONGPRESS_LOG_ENABLE_TAGS", "LongPress, Lifecycle");

    CHECK(logOnce("kept", "LongPress").find("kept") != std::string::npos);
    CHECK(logOnce("kept too", "Lifecycle", "LongPress").find("kept too") != std::string::npos);
    CHECK(logOnce("dropped", "LongPress", "EventLoop").empty());
}

TEST_CASE("skip tags are trimmed and added to the defaults") {
    CleanLogEnvironment env;
    EnvGuard enable("LONGPRESS_LOG_ENABLED", "1");
    EnvGuard skip("LONGPRESS_LOG_SKIP_TAGS", " EventLoop , Element ");

    CHECK(logOnce("loop", "EventLoop").empty());
    CHECK(logOnce("mount", "Element").empty());
    CHECK(logOnce("tick", "Tick").empty());
    CHECK(logOnce("click", "ClickButton").find("click") != std::string::npos);
}

TEST_CASE("setLoggingEnabled overrides the environment") {
    CleanLogEnvironment env;
    EnvGuard enable("LONGPRESS_LOG_ENABLED", "1");

    auto suppressed = captureStderr([] {
        LP::TaggedLogger logger;
        logger.setLoggingEnabled(false);
        logger.log_impl("suppressed", std::source_location::current(), "LongPress");
    });
    CHECK(suppressed.empty());

    auto named = captureStderr([] {
        LP::TaggedLogger logger;
        logger.setThreadName("UiLoop");
        logger.log_impl("named", std::source_location::current(), "LongPress");
    });
    CHECK(named.find("[UiLoop]") != std::string::npos);
}

TEST_CASE("lp_log macro goes through the global logger with sorted tags") {
    CleanLogEnvironment env;

    auto output = captureStderr([] {
        LP::set_thread_name("MacroThread");
        LP::set_logging_enabled(true);
        lp_log("via macro", "Tick2", "Alpha");
        std::this_thread::sleep_for(50ms);
        LP::set_logging_enabled(false);
    });

    CHECK(output.find("[Alpha][Tick2]") != std::string::npos);
    CHECK(output.find("[MacroThread]") != std::string::npos);
}

TEST_CASE("source path is shortened to parent directory and file") {
    CleanLogEnvironment env;
    EnvGuard enable("LONGPRESS_LOG_ENABLED", "1");

    auto nested = captureStderr([] {
        LP::TaggedLogger logger;
#line 42 "src/longpress/ui/LongPressButton.cpp"
        logger.log_impl("nested", std::source_location::current(), "LongPress");
#line 188 "tests/unit/log/test_TaggedLogger.cpp"
    });
    CHECK(nested.find("[ui/LongPressButton.cpp:42]") != std::string::npos);

    auto flat = captureStderr([] {
        LP::TaggedLogger logger;
#line 7 "Standalone.cpp"
        logger.log_impl("flat", std::source_location::current(), "LongPress");
#line 197 "tests/unit/log/test_TaggedLogger.cpp"
    });
    CHECK(flat.find("[Standalone.cpp:7]") != std::string::npos);
}

} // TEST_SUITE
