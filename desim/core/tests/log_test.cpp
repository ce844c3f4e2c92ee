#include <desim/core/log.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

using namespace desim::core;

namespace {

std::string read_all(FILE* file) {
    std::rewind(file);
    std::string content;
    char buffer[256];
    while (std::fgets(buffer, sizeof(buffer), file) != nullptr) {
        content += buffer;
    }
    return content;
}

} // anonymous namespace

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::tmpfile();
        ASSERT_NE(sink_, nullptr);
        Logger::instance().set_sink(sink_);
        Logger::instance().set_level(LogLevel::Info);
    }

    void TearDown() override {
        Logger::instance().set_sink(stderr);
        Logger::instance().set_level(LogLevel::Warn);
        if (sink_ != nullptr) {
            std::fclose(sink_);
        }
    }

    FILE* sink_{nullptr};
};

TEST_F(LogTest, ParseLevel) {
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("WARNING"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("Debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

TEST_F(LogTest, LevelFiltering) {
    EXPECT_TRUE(log_enabled(LogLevel::Warn, LogLevel::Error));
    EXPECT_TRUE(log_enabled(LogLevel::Warn, LogLevel::Warn));
    EXPECT_FALSE(log_enabled(LogLevel::Warn, LogLevel::Info));
    EXPECT_FALSE(log_enabled(LogLevel::Off, LogLevel::Error));
}

TEST_F(LogTest, WritesClockContext) {
    Logger::instance().log(LogLevel::Warn, 3, 2.5, "undefined transition with {}", "Idle");
    Logger::instance().log(LogLevel::Debug, "dropped");

    const std::string content = read_all(sink_);
    EXPECT_EQ(content, "[WARN] [clock 3 @ 2.5] undefined transition with Idle\n");
}

TEST_F(LogTest, NullSinkDiscards) {
    Logger::instance().set_sink(nullptr);
    Logger::instance().log(LogLevel::Error, "lost");
    Logger::instance().set_sink(sink_);

    EXPECT_TRUE(read_all(sink_).empty());
}
