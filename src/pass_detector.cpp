/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satlink/errors.hpp>
#include <satlink/pass_detector.hpp>
#include <satlink/sampler.hpp>
#include <satlink/time_util.hpp>

#include <algorithm>
#include <cmath>
#include <optional>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace satlink {

namespace {

// Keeps a refined peak strictly inside (rise, set)
constexpr auto PEAK_EDGE_OFFSET = std::chrono::milliseconds(1);

struct OpenWindow {
    time_point riseTime;
    bool clippedAtStart;
    time_point gridMaxTime;
    double gridMaxElevation;
};

std::optional<PassWindow> refineWindow(const TimeFunction &elevation,
                                       const OpenWindow &open,
                                       time_point setTime,
                                       bool clippedAtEnd,
                                       std::chrono::system_clock::duration step,
                                       double maskInDegrees,
                                       const PassDetectorOptions &options) {
    double duration = secondsBetween(open.riseTime, setTime);
    if (duration < options.minimumDurationInSeconds) {
        debug("Discarding {:.3f} s window at {}", duration, formatTimestamp(open.riseTime));
        return std::nullopt;
    }

    // Search for the peak around the best grid point
    time_point low = std::max(open.riseTime, open.gridMaxTime - step);
    time_point high = std::min(setTime, open.gridMaxTime + step);

    time_point maxTime = open.gridMaxTime;
    if (high - low > options.peakTolerance) {
        maxTime = goldenSectionMax(elevation, low, high, options.peakTolerance);
    }

    // A peak on the edge of a clipped window is nudged inside it
    if (setTime - open.riseTime > 2 * PEAK_EDGE_OFFSET) {
        maxTime = std::clamp(maxTime, open.riseTime + PEAK_EDGE_OFFSET, setTime - PEAK_EDGE_OFFSET);
    } else {
        maxTime = open.riseTime + (setTime - open.riseTime) / 2;
    }
    double maxElevation = elevation(maxTime);

    if (maxElevation < open.gridMaxElevation && open.gridMaxTime > open.riseTime && open.gridMaxTime < setTime) {
        maxTime = open.gridMaxTime;
        maxElevation = open.gridMaxElevation;
    }

    if (maxElevation - maskInDegrees < options.minimumPeakAboveMaskInDegrees) {
        debug("Discarding grazing window at {} (peak {:.4f} deg)", formatTimestamp(open.riseTime), maxElevation);
        return std::nullopt;
    }

    return PassWindow{
        .riseTime = open.riseTime,
        .setTime = setTime,
        .maxElevationTime = maxTime,
        .maxElevationInDegrees = maxElevation,
        .durationInSeconds = duration,
        .truncated = open.clippedAtStart || clippedAtEnd
    };
}

}

std::vector<PassWindow> findPasses(const TimeFunction &elevation,
                                   time_point start,
                                   time_point end,
                                   double stepInSeconds,
                                   double maskInDegrees,
                                   int maxPasses,
                                   const PassDetectorOptions &options) {
    auto step = gridStep(start, end, stepInSeconds);

    std::vector<PassWindow> passes;
    if (maxPasses < 1) {
        return passes;
    }

    auto grid = timeGrid(start, end, step);

    std::optional<OpenWindow> open;
    time_point previousTime = start;
    bool first = true;

    auto emit = [&](time_point setTime, bool clippedAtEnd) {
        auto window = refineWindow(elevation, *open, setTime, clippedAtEnd, step, maskInDegrees, options);
        open.reset();
        if (!window) {
            return;
        }
        if (options.accept && !options.accept(*window)) {
            debug("Window at {} rejected by filter", formatTimestamp(window->riseTime));
            return;
        }
        passes.push_back(*window);
    };

    for (time_point t : grid) {
        double e = elevation(t);
        bool above = e >= maskInDegrees;

        if (first) {
            first = false;
            if (above) {
                open = OpenWindow{t, true, t, e};
            }
        } else if (!open && above) {
            time_point rise = bisectCrossing(elevation, maskInDegrees, previousTime, t, true,
                                             options.crossingTolerance);
            open = OpenWindow{rise, false, t, e};
        } else if (open && above) {
            if (e > open->gridMaxElevation) {
                open->gridMaxTime = t;
                open->gridMaxElevation = e;
            }
        } else if (open && !above) {
            time_point set = bisectCrossing(elevation, maskInDegrees, previousTime, t, false,
                                            options.crossingTolerance);
            emit(set, false);
            if (static_cast<int>(passes.size()) >= maxPasses) {
                break;
            }
        }

        previousTime = t;
    }

    if (open && static_cast<int>(passes.size()) < maxPasses) {
        emit(end, true);
    }

    debug("Found {} passes between {} and {}", passes.size(), formatTimestamp(start), formatTimestamp(end));
    return passes;
}

}
