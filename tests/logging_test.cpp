#include <source_location>
#include <string>

#include <gtest/gtest.h>

#include "refreshlatch/logging.hpp"

namespace {

    std::string g_debug_message;
    std::string g_error_message;

    void        capture_debug_message(std::string_view message) {
        g_debug_message = std::string(message);
    }

    void capture_error_message(std::string_view message) {
        g_error_message = std::string(message);
    }

} // namespace

TEST(LoggingFormat, TagsLevelAndContext) {
    const auto debug = refreshlatch::format_log_entry(refreshlatch::LogLevel::kDebug, "refresh latch", "show fired");
    const auto error = refreshlatch::format_log_entry(refreshlatch::LogLevel::kError, "refresh latch", "sink failed");

    EXPECT_TRUE(debug.starts_with("[refreshlatch][debug] refresh latch: show fired @logging_test.cpp:"));
    EXPECT_TRUE(error.starts_with("[refreshlatch][error] refresh latch: sink failed @logging_test.cpp:"));
}

TEST(LoggingFormat, HandlesEmptyContext) {
    const auto text = refreshlatch::format_log_entry(refreshlatch::LogLevel::kError, "", "ready");

    EXPECT_TRUE(text.starts_with("[refreshlatch][error] ready @"));
}

TEST(LoggingFormat, AppendsCallerLocation) {
    const auto location = std::source_location::current();
    const auto text     = refreshlatch::format_log_entry(refreshlatch::LogLevel::kDebug, "settings", "loaded", location);

    EXPECT_NE(text.find("@logging_test.cpp:" + std::to_string(location.line())), std::string::npos);
}

TEST(DebugLog, UsesSinkWhenEnabled) {
    refreshlatch::set_debug_log_sink(capture_debug_message);
    g_debug_message.clear();

    refreshlatch::debug_log(true, "refresh latch", "hide scheduled delay=400ms");

    EXPECT_TRUE(g_debug_message.starts_with("[refreshlatch][debug] refresh latch: hide scheduled delay=400ms"));
    EXPECT_NE(g_debug_message.find("logging_test.cpp"), std::string::npos);
    refreshlatch::clear_debug_log_sink();
}

TEST(DebugLog, NoopWhenDisabled) {
    refreshlatch::set_debug_log_sink(capture_debug_message);
    g_debug_message.clear();

    refreshlatch::debug_log(false, "refresh latch", "show fired");

    EXPECT_TRUE(g_debug_message.empty());
    refreshlatch::clear_debug_log_sink();
}

TEST(DebugLog, NoopWithoutSink) {
    refreshlatch::clear_debug_log_sink();
    g_debug_message.clear();

    refreshlatch::debug_log(true, "refresh latch", "show fired");

    EXPECT_TRUE(g_debug_message.empty());
}

TEST(ErrorLog, UsesSink) {
    refreshlatch::set_error_log_sink(capture_error_message);
    g_error_message.clear();

    refreshlatch::error_log("scheduled callback", "sink failed");

    EXPECT_TRUE(g_error_message.starts_with("[refreshlatch][error] scheduled callback: sink failed"));
    EXPECT_NE(g_error_message.find("logging_test.cpp"), std::string::npos);
    refreshlatch::clear_error_log_sink();
}
