#include "test_support.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace benchkit;
using namespace benchkit::test_support;

TEST(Log, ParseLevel) {
    log::Level level = log::Level::Info;
    EXPECT_TRUE(log::parse_level("DEBUG", level));
    EXPECT_EQ(level, log::Level::Debug);
    EXPECT_TRUE(log::parse_level("warning", level));
    EXPECT_EQ(level, log::Level::Warn);
    EXPECT_TRUE(log::parse_level("off", level));
    EXPECT_EQ(level, log::Level::Off);
    EXPECT_FALSE(log::parse_level("loud", level));
    EXPECT_EQ(level, log::Level::Off);
}

TEST(Log, SinkReceivesFormattedLines) {
    LogCapture capture;
    log::info("ran {} instances in {:.1f}s", 3, 1.5);
    ASSERT_EQ(capture.lines.size(), 1u);
    EXPECT_EQ(capture.lines[0].first, log::Level::Info);
    EXPECT_EQ(capture.lines[0].second, "ran 3 instances in 1.5s");
}

TEST(Log, ThresholdFiltersLowerLevels) {
    LogCapture capture;
    log::set_threshold(log::Level::Warn);
    log::debug("hidden");
    log::info("hidden");
    log::warn("shown");
    log::error("shown too");
    EXPECT_EQ(capture.lines.size(), 2u);
    EXPECT_FALSE(log::enabled(log::Level::Off));
}

TEST(Log, FileScopeMirrorsWhileAlive) {
    const auto path = (std::filesystem::temp_directory_path() / "benchkit_log_test.log").string();
    std::filesystem::remove(path);

    LogCapture capture;
    {
        log::FileScope scope(path);
        ASSERT_TRUE(scope.is_open());
        log::info("inside scope");
    }
    log::info("outside scope");

    std::ifstream      in(path);
    std::ostringstream text;
    text << in.rdbuf();
    EXPECT_NE(text.str().find("INFO inside scope"), std::string::npos);
    EXPECT_EQ(text.str().find("outside scope"), std::string::npos);
    EXPECT_EQ(capture.lines.size(), 2u);
    std::filesystem::remove(path);
}

TEST(Log, SinkMayLogAgain) {
    LogCapture                                      capture;
    std::vector<std::pair<log::Level, std::string>> seen;
    auto inner = log::set_sink([&](log::Level level, std::string_view message) {
        seen.emplace_back(level, std::string(message));
        if (level == log::Level::Error)
            log::warn("relayed: {}", message);
    });

    log::error("disk full");
    log::set_sink(std::move(inner));

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].second, "disk full");
    EXPECT_EQ(seen[1].first, log::Level::Warn);
    EXPECT_EQ(seen[1].second, "relayed: disk full");
}
