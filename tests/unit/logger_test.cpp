#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "test_utils/TestUtils.hpp"
#include "cipherbook/core/Logger.hpp"

namespace
{

using cipherbook::core::Logger;
using cipherbook::core::LogLevel;

} // namespace

TEST(LoggerTest, LevelsBelowThresholdAreDropped)
{
    cipherbook::test_utils::LogCapture capture{};
    auto log{ capture.logger("Component", LogLevel::Warn) };

    log.debug("d");
    log.info("i");
    log.warn("w");
    log.error("e");

    const auto lines{ capture.lines() };
    ASSERT_EQ(lines.size(), 2U);
    EXPECT_EQ(lines[0].level, LogLevel::Warn);
    EXPECT_EQ(lines[0].message, "w");
    EXPECT_EQ(lines[1].level, LogLevel::Error);
    EXPECT_EQ(lines[1].component, "Component");

    log.setMinLevel(LogLevel::Debug);
    log.debug("now visible");
    EXPECT_TRUE(capture.contains("now visible"));
}

TEST(LoggerTest, WithComponentSharesSinkAndThreshold)
{
    cipherbook::test_utils::LogCapture capture{};
    const auto root{ capture.logger("cipherbook", LogLevel::Info) };
    const auto child{ root.withComponent("SyncEngine") };

    EXPECT_EQ(child.component(), "SyncEngine");
    EXPECT_EQ(child.minLevel(), LogLevel::Info);

    child.debug("hidden");
    child.info("hello");
    const auto lines{ capture.lines() };
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_EQ(lines[0].component, "SyncEngine");
}

TEST(LoggerTest, ThrowingSinkNeverPropagates)
{
    const Logger log{ "Broken",
                      []([[maybe_unused]] LogLevel level, [[maybe_unused]] std::string_view component,
                         [[maybe_unused]] std::string_view message) { throw std::runtime_error("sink down"); },
                      LogLevel::Debug };
    EXPECT_NO_THROW(log.error("boom"));
}

TEST(LoggerTest, ConsoleSinkWritesTaggedLine)
{
    std::ostringstream captured{};
    auto* previous{ std::clog.rdbuf(captured.rdbuf()) };
    const Logger log{ "KeyManager", cipherbook::core::makeConsoleLogSink(), LogLevel::Info };
    log.warn("vault unlocked");
    std::clog.rdbuf(previous);

    const std::string out{ captured.str() };
    EXPECT_NE(out.find("[WARN] KeyManager: vault unlocked"), std::string::npos);
    EXPECT_EQ(out.back(), '\n');
}

TEST(LoggerTest, LevelNames)
{
    EXPECT_EQ(cipherbook::core::toString(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(cipherbook::core::toString(LogLevel::Info), "INFO");
    EXPECT_EQ(cipherbook::core::toString(LogLevel::Warn), "WARN");
    EXPECT_EQ(cipherbook::core::toString(LogLevel::Error), "ERROR");
}
