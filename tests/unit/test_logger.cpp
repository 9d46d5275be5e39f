#include <iostream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "core/logging/logger.hpp"

namespace {

using strand::core::logging::Logger;
using strand::core::logging::LogLevel;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::get().set_output(captured_); }

    void TearDown() override {
        Logger::get().set_output(std::cout);
        Logger::get().set_min_level(LogLevel::INFO);
        Logger::get().set_context_id("");
    }

    std::ostringstream captured_;
};

TEST_F(LoggerTest, PrefixesLevelAndContext) {
    Logger::get().set_context_id("thread-42");
    STRAND_LOG_WARN("tool slow");
    EXPECT_EQ(captured_.str(), "[WARN ] [thread-42] tool slow\n");
}

TEST_F(LoggerTest, DropsLinesBelowMinimumLevel) {
    Logger::get().set_min_level(LogLevel::WARN);
    EXPECT_FALSE(Logger::get().enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::get().enabled(LogLevel::ERROR));

    STRAND_LOG_INFO("hidden");
    STRAND_LOG_ERROR("shown");
    EXPECT_EQ(captured_.str(), "[ERROR] shown\n");
}

TEST_F(LoggerTest, DebugRequiresVerboseLevel) {
    STRAND_LOG_DEBUG("quiet");
    EXPECT_TRUE(captured_.str().empty());

    Logger::get().set_min_level(LogLevel::DEBUG);
    STRAND_LOG_DEBUG("loud");
    EXPECT_EQ(captured_.str(), "[DEBUG] loud\n");
}

}  // namespace
