/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satlink/numeric.hpp>

#include <algorithm>

namespace satlink {

namespace {

// Smallest bracket either search will try to resolve
constexpr auto MINIMUM_TOLERANCE = std::chrono::microseconds(1);

}

time_point bisectCrossing(const TimeFunction &f, double threshold, time_point low, time_point high,
                          bool rising, std::chrono::system_clock::duration tolerance) {
    tolerance = std::max<std::chrono::system_clock::duration>(tolerance, MINIMUM_TOLERANCE);
    while (high - low > tolerance) {
        time_point mid = low + (high - low) / 2;
        bool aboveThreshold = f(mid) >= threshold;

        if (rising) {
            // Looking for rise: below threshold -> above threshold
            // If mid is above, the crossing is before mid
            if (aboveThreshold) {
                high = mid;
            } else {
                low = mid;
            }
        } else {
            // Looking for set: above threshold -> below threshold
            // If mid is above, the crossing is after mid
            if (aboveThreshold) {
                low = mid;
            } else {
                high = mid;
            }
        }
    }

    return rising ? high : low;
}

time_point goldenSectionMax(const TimeFunction &f, time_point low, time_point high,
                            std::chrono::system_clock::duration tolerance) {
    using namespace std::chrono;

    tolerance = std::max<system_clock::duration>(tolerance, MINIMUM_TOLERANCE);

    auto span = high - low;
    time_point x1 = low + duration_cast<system_clock::duration>(span * RESPHI);
    time_point x2 = high - duration_cast<system_clock::duration>(span * RESPHI);

    double f1 = f(x1);
    double f2 = f(x2);

    while (high - low > tolerance) {
        if (f1 > f2) {
            high = x2;
            x2 = x1;
            f2 = f1;
            span = high - low;
            x1 = low + duration_cast<system_clock::duration>(span * RESPHI);
            f1 = f(x1);
        } else {
            low = x1;
            x1 = x2;
            f1 = f2;
            span = high - low;
            x2 = high - duration_cast<system_clock::duration>(span * RESPHI);
            f2 = f(x2);
        }
    }

    return low + (high - low) / 2;
}

}
