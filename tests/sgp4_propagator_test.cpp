/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satlink/elements.hpp>
#include <satlink/propagator.hpp>
#include <satlink/sampler.hpp>
#include <satlink/time_util.hpp>

#include <chrono>
#include <cmath>

namespace satlink {
namespace {

using namespace std::chrono;

constexpr const char* ISS_TLE =
    "ISS (ZARYA)\n"
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";

class Sgp4PropagatorTest : public ::testing::Test {
protected:
    OrbitalElements iss = OrbitalElements::fromTLE(ISS_TLE);
    Sgp4Propagator sgp4;
};

TEST_F(Sgp4PropagatorTest, LowEarthOrbitAtEpoch) {
    auto state = sgp4.propagate(iss, iss.getEpoch());
    EXPECT_EQ(state.timestamp, iss.getEpoch());
    // About 420 km above the surface
    EXPECT_GT(state.position.magnitude(), 6650.0);
    EXPECT_LT(state.position.magnitude(), 6850.0);
    EXPECT_NEAR(state.velocity.magnitude(), 7.66, 0.05);
}

TEST_F(Sgp4PropagatorTest, PositionStaysBelowInclination) {
    // |z| / |r| can never exceed sin(inclination)
    for (const auto &state : sampleStates(sgp4, iss,
            timeGrid(iss.getEpoch(), iss.getEpoch() + hours(3), minutes(5)))) {
        double latitude = std::asin(state.position.z / state.position.magnitude()) * RADIANS_TO_DEGREES;
        EXPECT_LE(std::abs(latitude), iss.getInclination() + 0.1);
    }
}

TEST_F(Sgp4PropagatorTest, IsDeterministic) {
    auto t = iss.getEpoch() + hours(6);
    auto a = sgp4.propagate(iss, t);
    auto b = sgp4.propagate(iss, t);
    EXPECT_EQ(a.position.x, b.position.x);
    EXPECT_EQ(a.position.y, b.position.y);
    EXPECT_EQ(a.position.z, b.position.z);
    EXPECT_EQ(a.velocity.x, b.velocity.x);
}

TEST_F(Sgp4PropagatorTest, PropagatesBeforeEpoch) {
    auto state = sgp4.propagate(iss, iss.getEpoch() - hours(12));
    EXPECT_GT(state.position.magnitude(), 6650.0);
    EXPECT_LT(state.position.magnitude(), 6850.0);
}

TEST_F(Sgp4PropagatorTest, ReturnsNearStartAfterOnePeriod) {
    auto period = toDuration(iss.getOrbitalPeriodInSeconds());
    auto a = sgp4.propagate(iss, iss.getEpoch());
    auto b = sgp4.propagate(iss, iss.getEpoch() + period);
    // Nodal regression and drag move the satellite a little each orbit
    EXPECT_LT((b.position - a.position).magnitude(), 150.0);
}

}
}
