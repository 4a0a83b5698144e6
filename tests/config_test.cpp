/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <groundtrack/config.hpp>

#include <chrono>

namespace groundtrack {
namespace {

using namespace std::chrono_literals;

const time_point NOON = std::chrono::sys_days{std::chrono::year{2024} / 3 / 20} + 12h + 34min + 56s;

TEST(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.getCatalogId(), 0);
    EXPECT_FALSE(config.hasStartTime());
    EXPECT_DOUBLE_EQ(config.getForecastHours(), 1.5);
    EXPECT_DOUBLE_EQ(config.getInterval(), 30.0);
    EXPECT_EQ(config.getMarkerStride(), 20u);
    EXPECT_EQ(config.getThreads(), 1u);
    EXPECT_EQ(config.getOutPath(), "satellite_track.html");
    EXPECT_TRUE(config.getTitle().empty());
    EXPECT_FALSE(config.hasTLEFile());
    EXPECT_FALSE(config.getVerbose());
    EXPECT_FALSE(config.getInfo());
}

TEST(ConfigTest, ThreadsAreClamped) {
    Config config;
    config.setThreads(8);
    EXPECT_EQ(config.getThreads(), 8u);
    config.setThreads(0);
    EXPECT_EQ(config.getThreads(), 1u);
    config.setThreads(-4);
    EXPECT_EQ(config.getThreads(), 1u);
    config.setThreads(1000);
    EXPECT_EQ(config.getThreads(), MAX_THREADS);
}

TEST(ConfigTest, StartTime) {
    Config config;
    config.setStartTime(NOON);
    EXPECT_TRUE(config.hasStartTime());
    ASSERT_TRUE(config.getStartTime().has_value());
    EXPECT_EQ(*config.getStartTime(), NOON);
    config.clearStartTime();
    EXPECT_FALSE(config.hasStartTime());
}

TEST(ConfigTest, UnsetStartTimeIsEmpty) {
    Config config;
    EXPECT_FALSE(config.getStartTime().has_value());
    EXPECT_FALSE(config.toTrackRequest().start.has_value());
    config.setStartTime(NOON);
    ASSERT_TRUE(config.toTrackRequest().start.has_value());
    EXPECT_EQ(*config.toTrackRequest().start, NOON);
}

TEST(ConfigTest, TLEFile) {
    Config config;
    config.setTLEFile("~/.groundtrack.tle");
    EXPECT_TRUE(config.hasTLEFile());
    EXPECT_EQ(config.getTLEFile(), "~/.groundtrack.tle");
}

TEST(ConfigTest, TrackRequestWithDefaults) {
    Config config;
    TrackRequest request = config.toTrackRequest();
    EXPECT_FALSE(request.start.has_value());
    EXPECT_DOUBLE_EQ(request.forecastHours, DEFAULT_FORECAST_HOURS);
    EXPECT_DOUBLE_EQ(request.sampleIntervalSeconds, DEFAULT_SAMPLE_INTERVAL_SECONDS);
    EXPECT_EQ(request.threads, 1u);
}

TEST(ConfigTest, TrackRequestCarriesSettings) {
    Config config;
    config.setStartTime(NOON);
    config.setForecastHours(3.0);
    config.setInterval(10.0);
    config.setThreads(4);

    TrackRequest request = config.toTrackRequest();
    ASSERT_TRUE(request.start.has_value());
    EXPECT_EQ(*request.start, NOON);
    EXPECT_DOUBLE_EQ(request.forecastHours, 3.0);
    EXPECT_DOUBLE_EQ(request.sampleIntervalSeconds, 10.0);
    EXPECT_EQ(request.threads, 4u);
}

// ============================================================================
// Time Parsing Tests
// ============================================================================

TEST(ParseTimeTest, CompactFormat) {
    EXPECT_EQ(parseTime("20240320T123456"), NOON);
}

TEST(ParseTimeTest, ExtendedFormat) {
    EXPECT_EQ(parseTime("2024-03-20 12:34:56"), NOON);
}

TEST(ParseTimeTest, TrailingWhitespace) {
    EXPECT_EQ(parseTime("2024-03-20 12:34:56  "), NOON);
}

TEST(ParseTimeTest, RejectsGarbage) {
    EXPECT_THROW(parseTime(""), InvalidInputException);
    EXPECT_THROW(parseTime("yesterday"), InvalidInputException);
    EXPECT_THROW(parseTime("2024-03-20"), InvalidInputException);
    EXPECT_THROW(parseTime("20240320T123456Z"), InvalidInputException);
}

TEST(ParseTimeTest, RejectsInvalidDate) {
    EXPECT_THROW(parseTime("2024-13-40 12:34:56"), InvalidInputException);
}

} // namespace
} // namespace groundtrack
