/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satlink/config.hpp>

namespace satlink {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    Config config;
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_EQ(config.getHours(), 24);
    EXPECT_EQ(config.getMask(), 10.0);
    EXPECT_EQ(config.getStep(), 10.0);
    EXPECT_EQ(config.getMaxPasses(), 20);
    EXPECT_FALSE(config.hasHorizonMaskFile());
    EXPECT_EQ(config.getHorizonMaskFile(), "");
    EXPECT_FALSE(config.getVisibleOnly());
    EXPECT_FALSE(config.getJSON());
    EXPECT_FALSE(config.getVerbose());
}

TEST_F(ConfigTest, HoursAreClamped) {
    config.setHours(48);
    EXPECT_EQ(config.getHours(), 48);
    config.setHours(0);
    EXPECT_EQ(config.getHours(), 1);
    config.setHours(-5);
    EXPECT_EQ(config.getHours(), 1);
    config.setHours(10000);
    EXPECT_EQ(config.getHours(), 720);
}

TEST_F(ConfigTest, MarginHoursHaveTheirOwnLimit) {
    config.setHours(200, MAX_MARGIN_HOURS);
    EXPECT_EQ(config.getHours(), 168);
    config.setHours(200);
    EXPECT_EQ(config.getHours(), 200);
}

TEST_F(ConfigTest, MaxPassesAreClamped) {
    config.setMaxPasses(5);
    EXPECT_EQ(config.getMaxPasses(), 5);
    config.setMaxPasses(0);
    EXPECT_EQ(config.getMaxPasses(), 1);
    config.setMaxPasses(500);
    EXPECT_EQ(config.getMaxPasses(), 100);
}

TEST_F(ConfigTest, GroundStationUsesKilometers) {
    config.setLatitude(38.9);
    config.setLongitude(-77.0);
    config.setAltitude(120.0);

    auto station = config.getGroundStation();
    EXPECT_EQ(station.latitudeInDegrees, 38.9);
    EXPECT_EQ(station.longitudeInDegrees, -77.0);
    EXPECT_DOUBLE_EQ(station.heightInKilometers, 0.12);
}

TEST_F(ConfigTest, RFConfigurationIsMutable) {
    config.getRFConfiguration().band = Band::S;
    config.getRFConfiguration().txPowerInDbw = 13.0;

    const Config &view = config;
    EXPECT_EQ(view.getRFConfiguration().band, Band::S);
    EXPECT_EQ(view.getRFConfiguration().txPowerInDbw, 13.0);
}

TEST_F(ConfigTest, HorizonMaskFile) {
    config.setHorizonMaskFile("/tmp/mask.txt");
    EXPECT_TRUE(config.hasHorizonMaskFile());
    EXPECT_EQ(config.getHorizonMaskFile(), "/tmp/mask.txt");
}

}
}
