#include <gtest/gtest.h>
#include "common/log.hpp"

using namespace sightlink;

class LogTest : public ::testing::Test {
protected:
    void TearDown() override {
        log::shutdown();
        log::LogConfig quiet;
        quiet.level = log::Level::Warn;
        log::init(quiet);
    }
};

TEST(LogLevelTest, ParseAndName) {
    EXPECT_EQ(log::parse_level("DEBUG"), log::Level::Debug);
    EXPECT_EQ(log::parse_level("warning"), log::Level::Warn);
    EXPECT_EQ(log::parse_level("crit"), log::Level::Critical);
    EXPECT_EQ(log::parse_level("chatty"), log::Level::Info);
    EXPECT_EQ(log::level_name(log::Level::Error), "error");
    EXPECT_EQ(log::level_name(log::parse_level("off")), "off");
}

TEST_F(LogTest, ComponentOverridesApplyToNamedLoggers) {
    log::shutdown();
    log::LogConfig config;
    config.level = log::Level::Warn;
    config.component_levels[log::STREAM_LOGGER] = log::Level::Debug;
    log::init(config);

    EXPECT_EQ(log::get(log::STREAM_LOGGER)->level(), spdlog::level::debug);
    EXPECT_EQ(log::get(log::TRANSPORT_LOGGER)->level(), spdlog::level::warn);
    EXPECT_EQ(log::get("late-comer")->level(), spdlog::level::warn);
    EXPECT_TRUE(log::Logger(log::STREAM_LOGGER).enabled(log::Level::Debug));
    EXPECT_FALSE(log::Logger(log::DEVICE_LOGGER).enabled(log::Level::Info));
}

TEST_F(LogTest, LoggersShareSinks) {
    auto tunnel = log::get(log::TUNNEL_LOGGER);
    auto proxy = log::get(log::PROXY_LOGGER);
    ASSERT_FALSE(tunnel->sinks().empty());
    EXPECT_EQ(tunnel->sinks(), proxy->sinks());
}

TEST_F(LogTest, SetLevelAtRuntime) {
    log::set_level(log::DEVICE_LOGGER, log::Level::Trace);
    EXPECT_EQ(log::get_level(log::DEVICE_LOGGER), log::Level::Trace);
    EXPECT_EQ(log::get(log::DEVICE_LOGGER)->level(), spdlog::level::trace);

    // A global level clears component overrides
    log::set_level(log::Level::Error);
    EXPECT_EQ(log::get_level(log::DEVICE_LOGGER), log::Level::Error);
    EXPECT_EQ(log::get(log::CONFIG_LOGGER)->level(), spdlog::level::err);
}
