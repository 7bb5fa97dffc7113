/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_PASS_DETECTOR_HPP
#define __SATLINK_PASS_DETECTOR_HPP

#include <satlink/numeric.hpp>
#include <satlink/types.hpp>

#include <chrono>
#include <functional>
#include <vector>

namespace satlink {

/**
 * Tunables for pass detection.
 */
struct PassDetectorOptions {
    // Width of the final bracket when refining rise and set
    std::chrono::milliseconds crossingTolerance{100};
    // Width of the final bracket when refining the maximum
    std::chrono::milliseconds peakTolerance{100};
    // Windows shorter than this are treated as grazing noise
    double minimumDurationInSeconds = 1.0;
    // Windows whose peak is less than this far above the mask are treated as grazing noise
    double minimumPeakAboveMaskInDegrees = 0.001;
    // Optional filter applied to each refined window; rejected windows do not count towards maxPasses
    std::function<bool(const PassWindow&)> accept;
};

/**
 * Find visibility windows of a satellite above an elevation mask.
 *
 * Elevation is evaluated on timeGrid(start, end, step). Each sign change of
 * (elevation - mask) between neighbouring grid points is refined by
 * bisection, and the peak is refined by golden-section search in
 * [max(rise, t* - step), min(set, t* + step)] around the grid maximum t*.
 *
 * A window that is already up at start is clipped to start, one still up at
 * end is clipped to end, and both are reported with truncated = true.
 *
 * Exceptions thrown by elevation propagate to the caller unchanged.
 *
 * @param elevation Elevation in degrees as a function of time
 * @param stepInSeconds Grid spacing, must be positive; shortened to the window length if longer
 * @param maskInDegrees Elevation threshold; "above" means elevation >= mask
 * @param maxPasses Stop after this many windows
 * @return Windows ordered by rise time
 */
std::vector<PassWindow> findPasses(const TimeFunction &elevation,
                                   time_point start,
                                   time_point end,
                                   double stepInSeconds,
                                   double maskInDegrees,
                                   int maxPasses,
                                   const PassDetectorOptions &options = {});

}

#endif
