/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satlink/errors.hpp>
#include <satlink/horizon_mask.hpp>

#include <sstream>
#include <vector>

namespace satlink {
namespace {

// A hill to the east: 20 degrees between azimuth 80 and 100, 2 degrees elsewhere
std::vector<double> hillToTheEast() {
    std::vector<double> values(HorizonMask::SIZE, 2.0);
    for (int az = 80; az <= 100; ++az) {
        values[az] = 20.0;
    }
    return values;
}

TEST(HorizonMaskTest, LooksUpByAzimuth) {
    HorizonMask mask(hillToTheEast());
    EXPECT_EQ(mask.elevationAt(90.0), 20.0);
    EXPECT_EQ(mask.elevationAt(180.0), 2.0);
    EXPECT_EQ(mask.maximumElevation(), 20.0);
}

TEST(HorizonMaskTest, RoundsToNearestDegree) {
    HorizonMask mask(hillToTheEast());
    EXPECT_EQ(mask.elevationAt(79.4), 2.0);
    EXPECT_EQ(mask.elevationAt(79.6), 20.0);
    EXPECT_EQ(mask.elevationAt(100.4), 20.0);
    EXPECT_EQ(mask.elevationAt(100.6), 2.0);
}

TEST(HorizonMaskTest, WrapsAround) {
    std::vector<double> values(HorizonMask::SIZE, 0.0);
    values[0] = 5.0;
    values[359] = 7.0;
    HorizonMask mask(values);
    EXPECT_EQ(mask.elevationAt(359.7), 5.0);
    EXPECT_EQ(mask.elevationAt(360.0), 5.0);
    EXPECT_EQ(mask.elevationAt(-1.0), 7.0);
    EXPECT_EQ(mask.elevationAt(719.0), 7.0);
}

TEST(HorizonMaskTest, RejectsWrongCount) {
    EXPECT_THROW(HorizonMask(std::vector<double>(359, 0.0)), InvalidInputException);
    EXPECT_THROW(HorizonMask(std::vector<double>(361, 0.0)), InvalidInputException);
}

TEST(HorizonMaskTest, RejectsOutOfRangeValues) {
    auto values = hillToTheEast();
    values[10] = -1.0;
    EXPECT_THROW(HorizonMask{values}, InvalidInputException);

    values = hillToTheEast();
    values[10] = 90.0;
    EXPECT_THROW(HorizonMask{values}, InvalidInputException);
}

TEST(HorizonMaskTest, LoadsFromStream) {
    std::stringstream s;
    s << "# Terrain survey\n";
    for (int az = 0; az < 360; ++az) {
        s << (az == 45 ? 12.5 : 1.0) << (az % 10 == 9 ? "\n" : ", ");
    }
    auto mask = HorizonMask::load(s);
    EXPECT_EQ(mask.elevationAt(45.0), 12.5);
    EXPECT_EQ(mask.elevationAt(46.0), 1.0);
}

TEST(HorizonMaskTest, LoadRejectsGarbage) {
    std::stringstream s;
    s << "1.0 2.0 three\n";
    EXPECT_THROW(HorizonMask::load(s), InvalidInputException);
}

TEST(HorizonMaskTest, LoadRejectsShortFile) {
    std::stringstream s;
    s << "1.0 2.0 3.0\n";
    EXPECT_THROW(HorizonMask::load(s), InvalidInputException);
}

}
}
