/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_NUMERIC_HPP
#define __SATLINK_NUMERIC_HPP

#include <satlink/types.hpp>

#include <chrono>
#include <functional>

namespace satlink {

// A scalar function of time, such as elevation in degrees
using TimeFunction = std::function<double(time_point)>;

constexpr double PHI = 1.618033988749895;  // Golden ratio
constexpr double RESPHI = 2.0 - PHI;       // 1/phi²

/**
 * Find the instant where f crosses threshold inside [low, high] by
 * bisection. "Above" means f(t) >= threshold.
 *
 * For a rising crossing f(low) must be below and f(high) above; for a
 * falling crossing the opposite. The bracket is halved until it is no wider
 * than tolerance. A rising search returns the first instant known to be
 * above, a falling search the last instant known to be above.
 */
time_point bisectCrossing(const TimeFunction &f, double threshold, time_point low, time_point high,
                          bool rising, std::chrono::system_clock::duration tolerance);

/**
 * Find the instant of the maximum of a unimodal f on [low, high] by
 * golden-section search, narrowing the bracket to tolerance. Returns the
 * midpoint of the final bracket.
 */
time_point goldenSectionMax(const TimeFunction &f, time_point low, time_point high,
                            std::chrono::system_clock::duration tolerance);

}

#endif
