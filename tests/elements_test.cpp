/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satlink/elements.hpp>
#include <satlink/errors.hpp>
#include <satlink/time_util.hpp>

#include <chrono>
#include <map>
#include <sstream>
#include <string>

namespace satlink {
namespace {

// ISS TLE data from Celestrak (real example)
constexpr const char* ISS_TLE =
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";

// NOAA 19 TLE from Celestrak
constexpr const char* NOAA19_TLE =
    "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999\n"
    "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318";

// TLE with name line (three-line format)
constexpr const char* TLE_WITH_NAME =
    "ISS (ZARYA)\n"
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";

class ElementsTest : public ::testing::Test {
protected:
    OrbitalElements iss = OrbitalElements::fromTLE(ISS_TLE, "celestrak");
};

TEST_F(ElementsTest, ParseCatalogNumber) {
    EXPECT_EQ(iss.getCatalogNumber(), 25544);
}

TEST_F(ElementsTest, NameDefaultsToCatalogNumber) {
    EXPECT_EQ(iss.getName(), "25544");
}

TEST_F(ElementsTest, ParseInclination) {
    EXPECT_NEAR(iss.getInclination(), 51.6312, 1e-10);
}

TEST_F(ElementsTest, ParseEccentricity) {
    // "0003723" has an implied leading decimal point
    EXPECT_NEAR(iss.getEccentricity(), 0.0003723, 1e-12);
}

TEST_F(ElementsTest, ParseMeanMotion) {
    EXPECT_NEAR(iss.getMeanMotion(), 15.49193835, 1e-10);
}

TEST_F(ElementsTest, ParseEpoch) {
    // Day 333.83453771 of 2025 is 2025-11-29 20:01:44.058 UTC
    EXPECT_EQ(formatTimestamp(iss.getEpoch()), "2025-11-29T20:01:44Z");
}

TEST_F(ElementsTest, KeepsRawLines) {
    EXPECT_EQ(iss.getLine1(), "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993");
    EXPECT_EQ(iss.getLine2(), "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850");
}

TEST_F(ElementsTest, KeepsSource) {
    ASSERT_TRUE(iss.getSource().has_value());
    EXPECT_EQ(*iss.getSource(), "celestrak");
}

TEST_F(ElementsTest, SourceIsOptional) {
    auto elements = OrbitalElements::fromTLE(ISS_TLE);
    EXPECT_FALSE(elements.getSource().has_value());
}

TEST_F(ElementsTest, OrbitalPeriod) {
    EXPECT_NEAR(iss.getOrbitalPeriodInSeconds(), 5577.094, 0.001);
}

TEST_F(ElementsTest, AgeInDays) {
    auto now = iss.getEpoch() + std::chrono::hours(48);
    EXPECT_NEAR(iss.ageInDays(now), 2.0, 1e-9);
}

TEST_F(ElementsTest, AgeIsNegativeBeforeEpoch) {
    auto now = iss.getEpoch() - std::chrono::hours(12);
    EXPECT_NEAR(iss.ageInDays(now), -0.5, 1e-9);
}

TEST_F(ElementsTest, DescribeElements) {
    auto now = iss.getEpoch() + std::chrono::hours(24);
    auto metadata = describeElements(iss, now);
    EXPECT_EQ(metadata.catalogNumber, 25544);
    EXPECT_EQ(metadata.epoch, iss.getEpoch());
    EXPECT_NEAR(metadata.ageInDays, 1.0, 1e-9);
    EXPECT_EQ(metadata.source, std::optional<std::string>("celestrak"));
}

TEST_F(ElementsTest, PrintInfo) {
    std::ostringstream os;
    iss.printInfo(os, iss.getEpoch());
    auto text = os.str();
    EXPECT_NE(text.find("Catalog Number: 25544"), std::string::npos);
    EXPECT_NE(text.find("2025-11-29T20:01:44Z"), std::string::npos);
}

TEST(ElementsParseTest, ThreeLineFormat) {
    auto elements = OrbitalElements::fromTLE(TLE_WITH_NAME);
    EXPECT_EQ(elements.getName(), "ISS (ZARYA)");
    EXPECT_EQ(elements.getCatalogNumber(), 25544);
}

TEST(ElementsParseTest, WindowsLineEndings) {
    std::string tle = "ISS (ZARYA)\r\n"
        "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\r\n"
        "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850\r\n";
    auto elements = OrbitalElements::fromTLE(tle);
    EXPECT_EQ(elements.getName(), "ISS (ZARYA)");
    EXPECT_NEAR(elements.getMeanMotion(), 15.49193835, 1e-10);
}

TEST(ElementsParseTest, NOAA19) {
    auto elements = OrbitalElements::fromTLE(NOAA19_TLE);
    EXPECT_EQ(elements.getCatalogNumber(), 33591);
    EXPECT_NEAR(elements.getInclination(), 98.9785, 1e-10);
    EXPECT_NEAR(elements.getMeanMotion(), 14.13431889, 1e-10);
}

TEST(ElementsParseTest, TwentiethCenturyEpoch) {
    // Two-digit years of 57 and above are 19xx
    auto elements = OrbitalElements::fromTLE(
        "1 25544U 98067A   98001.50000000  .00008010  00000+0  15237-3 0  9993\n"
        "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850");
    EXPECT_EQ(formatTimestamp(elements.getEpoch()), "1998-01-01T12:00:00Z");
}

TEST(ElementsParseTest, MissingSecondLine) {
    EXPECT_THROW(OrbitalElements::fromTLE(
        "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993"),
        InvalidInputException);
}

TEST(ElementsParseTest, EmptyText) {
    EXPECT_THROW(OrbitalElements::fromTLE(""), InvalidInputException);
}

TEST(ElementsParseTest, TruncatedLine) {
    EXPECT_THROW(OrbitalElements::fromTLE(
        "1 25544U 98067A   25333.83453771  .00008010\n"
        "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850"),
        InvalidInputException);
}

TEST(ElementsParseTest, MismatchedCatalogNumbers) {
    EXPECT_THROW(OrbitalElements::fromTLE(
        "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
        "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318"),
        InvalidInputException);
}

TEST(ElementsParseTest, GarbageInclination) {
    EXPECT_THROW(OrbitalElements::fromTLE(
        "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
        "2 25544  51.6x12 206.3646 0003723 184.1118 175.9840 15.49193835540850"),
        InvalidInputException);
}

TEST(ChecksumTest, KnownLines) {
    EXPECT_EQ(calculateChecksum("1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993"), 3);
    EXPECT_EQ(calculateChecksum("2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850"), 0);
    EXPECT_EQ(calculateChecksum("1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999"), 9);
}

TEST(ChecksumTest, MinusCountsAsOne) {
    EXPECT_EQ(calculateChecksum("-"), 1);
    EXPECT_EQ(calculateChecksum("--9"), 1);
}

TEST(LoadElementsTest, LoadsMultipleEntries) {
    std::stringstream s;
    s << TLE_WITH_NAME << "\n\n" << NOAA19_TLE << "\n";
    std::map<int, OrbitalElements> database;
    loadElements(s, database, "test");
    ASSERT_EQ(database.size(), 2u);
    EXPECT_EQ(database.at(25544).getName(), "ISS (ZARYA)");
    EXPECT_EQ(database.at(33591).getCatalogNumber(), 33591);
    EXPECT_EQ(database.at(33591).getSource(), std::optional<std::string>("test"));
}

TEST(LoadElementsTest, SkipsBadEntries) {
    std::stringstream s;
    s << "BROKEN\n"
      << "1 99999U 98067A   25333.83453771\n"
      << "2 99999  51.6312\n"
      << NOAA19_TLE << "\n";
    std::map<int, OrbitalElements> database;
    loadElements(s, database);
    ASSERT_EQ(database.size(), 1u);
    EXPECT_TRUE(database.contains(33591));
}

TEST(LoadElementsTest, MissingFile) {
    std::map<int, OrbitalElements> database;
    EXPECT_THROW(loadElements(std::string("/nonexistent/satlink.tle"), database), std::runtime_error);
}

}
}
