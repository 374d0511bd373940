#include "strata/core/Log.hh"
#include <gtest/gtest.h>

namespace strata {
namespace Tests {

class LoggingTest : public ::testing::Test {};

TEST_F(LoggingTest, LoggersAvailableAfterInit) {
    EXPECT_NE(strata::log::logger(), nullptr);
    EXPECT_NE(strata::log::renderLogger(), nullptr);
    EXPECT_NE(strata::log::terrainLogger(), nullptr);
}

TEST_F(LoggingTest, LogInfoDoesNotCrash) {
    STRATA_LOG_INFO("Info message");
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, LogWarningDoesNotCrash) {
    STRATA_LOG_WARN("Warning message");
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, LogWithFormatArgs) {
    STRATA_LOG_INFO("Value: {}, Name: {}", 42, "test");
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, SubsystemMacros) {
    STRATA_LOG_RENDER_DEBUG("Pipeline {} specialized", "Forward");
    STRATA_LOG_RENDER_WARN("Draw rejected: {}", "count mismatch");
    STRATA_LOG_TERRAIN_DEBUG("Sampled {}x{} grid", 16, 16);
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, ApplyLevelsPerLogger) {
    const strata::log::LogLevels saved = strata::log::currentLevels();

    strata::log::LogLevels quiet;
    quiet.render = quill::LogLevel::Error;
    quiet.terrain = quill::LogLevel::Debug;
    strata::log::applyLevels(quiet);
    STRATA_LOG_RENDER_WARN("This should be filtered");

    const auto now = strata::log::currentLevels();
    EXPECT_EQ(now.root, quill::LogLevel::Info);
    EXPECT_EQ(now.render, quill::LogLevel::Error);
    EXPECT_EQ(now.terrain, quill::LogLevel::Debug);

    strata::log::applyLevels(saved);
    EXPECT_EQ(strata::log::currentLevels().render, saved.render);
}

TEST_F(LoggingTest, LevelFromName) {
    EXPECT_EQ(strata::log::levelFromName("trace").value_or(quill::LogLevel::None), quill::LogLevel::TraceL1);
    EXPECT_EQ(strata::log::levelFromName("debug").value_or(quill::LogLevel::None), quill::LogLevel::Debug);
    EXPECT_EQ(strata::log::levelFromName("warn").value_or(quill::LogLevel::None), quill::LogLevel::Warning);
    EXPECT_EQ(strata::log::levelFromName("warning").value_or(quill::LogLevel::None), quill::LogLevel::Warning);
    EXPECT_EQ(strata::log::levelFromName("critical").value_or(quill::LogLevel::None), quill::LogLevel::Critical);
    EXPECT_FALSE(strata::log::levelFromName("INFO").has_value());
    EXPECT_FALSE(strata::log::levelFromName("").has_value());
}

} // namespace Tests
} // namespace strata
