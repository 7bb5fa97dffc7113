/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satlink/errors.hpp>
#include <satlink/time_util.hpp>

#include <chrono>
#include <cmath>
#include <limits>

namespace satlink {
namespace {

using namespace std::chrono;

const time_point NOON = sys_days{year{2025}/November/30} + hours(12);

TEST(ParseTimestampTest, IsoWithZ) {
    EXPECT_EQ(parseTimestamp("2025-11-30T12:00:00Z"), NOON);
}

TEST(ParseTimestampTest, IsoWithoutZ) {
    EXPECT_EQ(parseTimestamp("2025-11-30T12:00:00"), NOON);
}

TEST(ParseTimestampTest, SpaceSeparated) {
    EXPECT_EQ(parseTimestamp("2025-11-30 12:00:00"), NOON);
}

TEST(ParseTimestampTest, RejectsGarbage) {
    EXPECT_THROW(parseTimestamp("yesterday"), InvalidInputException);
    EXPECT_THROW(parseTimestamp(""), InvalidInputException);
}

TEST(ParseTimestampTest, RejectsTrailingText) {
    EXPECT_THROW(parseTimestamp("2025-11-30T12:00:00Zabc"), InvalidInputException);
}

TEST(FormatTimestampTest, SecondResolution) {
    EXPECT_EQ(formatTimestamp(NOON), "2025-11-30T12:00:00Z");
    EXPECT_EQ(formatTimestamp(NOON + milliseconds(999)), "2025-11-30T12:00:00Z");
}

TEST(FormatTimestampTest, ParsesBack) {
    auto tp = NOON + minutes(7) + seconds(3);
    EXPECT_EQ(parseTimestamp(formatTimestamp(tp)), tp);
}

TEST(DurationTest, SecondsBetween) {
    EXPECT_DOUBLE_EQ(secondsBetween(NOON, NOON + milliseconds(1500)), 1.5);
    EXPECT_DOUBLE_EQ(secondsBetween(NOON + seconds(2), NOON), -2.0);
}

TEST(DurationTest, ToDuration) {
    EXPECT_EQ(toDuration(0.25), milliseconds(250));
    EXPECT_EQ(toDuration(10.0), seconds(10));
}

TEST(DurationTest, ToDurationRange) {
    EXPECT_EQ(toDuration(9e9), seconds(9'000'000'000));
    EXPECT_EQ(toDuration(-9e9), seconds(-9'000'000'000));
    EXPECT_THROW(toDuration(1e10), InvalidInputException);
    EXPECT_THROW(toDuration(-1e10), InvalidInputException);
    EXPECT_THROW(toDuration(std::numeric_limits<double>::infinity()), InvalidInputException);
    EXPECT_THROW(toDuration(std::nan("")), InvalidInputException);
}

}
}
