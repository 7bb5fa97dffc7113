/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satlink/numeric.hpp>
#include <satlink/time_util.hpp>

#include <chrono>
#include <cmath>
#include <numbers>

namespace satlink {
namespace {

using namespace std::chrono;

class NumericTest : public ::testing::Test {
protected:
    time_point base = sys_days{year{2025}/June/1};

    double since(time_point t) const { return secondsBetween(base, t); }
};

TEST_F(NumericTest, BisectRisingCrossing) {
    int calls = 0;
    auto f = [&](time_point t) { calls++; return since(t) - 100.3; };

    auto result = bisectCrossing(f, 0.0, base, base + seconds(200), true, milliseconds(100));
    EXPECT_NEAR(since(result), 100.3, 0.1);
    // A rising search returns an instant that is already above
    EXPECT_GE(f(result), 0.0);
    EXPECT_LT(calls, 20);
}

TEST_F(NumericTest, BisectFallingCrossing) {
    auto f = [&](time_point t) { return 100.3 - since(t); };

    auto result = bisectCrossing(f, 0.0, base, base + seconds(200), false, milliseconds(100));
    EXPECT_NEAR(since(result), 100.3, 0.1);
    // A falling search returns an instant that is still above
    EXPECT_GE(f(result), 0.0);
}

TEST_F(NumericTest, BisectHonoursThreshold) {
    auto f = [&](time_point t) { return since(t); };

    auto result = bisectCrossing(f, 42.0, base, base + seconds(60), true, milliseconds(10));
    EXPECT_NEAR(since(result), 42.0, 0.01);
}

TEST_F(NumericTest, BisectNarrowBracketIsReturnedAsIs) {
    auto f = [&](time_point t) { return since(t) - 0.05; };

    auto result = bisectCrossing(f, 0.0, base, base + milliseconds(80), true, milliseconds(100));
    EXPECT_EQ(result, base + milliseconds(80));
}

TEST_F(NumericTest, GoldenSectionFindsMaximum) {
    auto f = [&](time_point t) {
        double s = since(t) - 42.7;
        return -s * s;
    };

    auto result = goldenSectionMax(f, base, base + seconds(100), milliseconds(100));
    EXPECT_NEAR(since(result), 42.7, 0.1);
}

TEST_F(NumericTest, GoldenSectionSinePeak) {
    // Peak of sin(2πs/600) is at s = 150
    auto f = [&](time_point t) { return std::sin(2.0 * std::numbers::pi * since(t) / 600.0); };

    auto result = goldenSectionMax(f, base + seconds(60), base + seconds(240), milliseconds(10));
    EXPECT_NEAR(since(result), 150.0, 0.01);
}

TEST_F(NumericTest, GoldenSectionMaximumAtEdge) {
    // Monotonically decreasing: the maximum is at the lower bound
    auto f = [&](time_point t) { return -since(t); };

    auto result = goldenSectionMax(f, base, base + seconds(60), milliseconds(100));
    EXPECT_NEAR(since(result), 0.0, 0.1);
}

TEST_F(NumericTest, ZeroToleranceTerminates) {
    auto f = [&](time_point t) { return since(t) - 1.0; };

    auto crossing = bisectCrossing(f, 0.0, base, base + seconds(2), true, nanoseconds(0));
    EXPECT_NEAR(since(crossing), 1.0, 1e-5);

    auto g = [&](time_point t) { double s = since(t) - 1.0; return -s * s; };
    auto peak = goldenSectionMax(g, base, base + seconds(2), nanoseconds(0));
    EXPECT_NEAR(since(peak), 1.0, 1e-3);
}

}
}
