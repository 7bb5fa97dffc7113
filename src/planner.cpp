/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satlink/planner.hpp>
#include <satlink/sampler.hpp>
#include <satlink/time_util.hpp>
#include <satlink/topocentric.hpp>

#include <cmath>
#include <format>
#include <ranges>
#include <sstream>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace satlink {

namespace {

void validateMask(double maskInDegrees) {
    if (!std::isfinite(maskInDegrees) || maskInDegrees < 0.0 || maskInDegrees >= 90.0) {
        throw InvalidInputException(std::format("Elevation mask must be in [0, 90) degrees (got {})", maskInDegrees));
    }
}

std::string describe(PropagationErrorCode code) {
    std::ostringstream os;
    os << code;
    return os.str();
}

}

void validate(const GroundStation &station) {
    if (!std::isfinite(station.latitudeInDegrees) || station.latitudeInDegrees < -90.0 || station.latitudeInDegrees > 90.0) {
        throw InvalidInputException(std::format("Latitude must be in [-90, 90] degrees (got {})", station.latitudeInDegrees));
    }
    if (!std::isfinite(station.longitudeInDegrees) || station.longitudeInDegrees < -180.0 || station.longitudeInDegrees > 180.0) {
        throw InvalidInputException(std::format("Longitude must be in [-180, 180] degrees (got {})", station.longitudeInDegrees));
    }
    if (!std::isfinite(station.heightInKilometers)) {
        throw InvalidInputException("Station height must be a finite number");
    }
}

void validate(const TimeWindow &window, std::chrono::hours maximumLength) {
    if (window.start >= window.end) {
        throw InvalidInputException(std::format("Window start ({}) must be before its end ({})",
            formatTimestamp(window.start), formatTimestamp(window.end)));
    }
    if (window.end - window.start > maximumLength) {
        throw InvalidInputException(std::format("Window may not be longer than {} days",
            maximumLength.count() / 24.0));
    }
}

LinkPlanner::LinkPlanner(std::shared_ptr<const Propagator> propagator, PlannerLimits limits, Clock clock)
    : propagator(std::move(propagator)), limits(limits), clock(std::move(clock)) {
    if (!this->propagator) {
        throw InvalidInputException("A propagator is required");
    }
    if (!this->clock) {
        throw InvalidInputException("A clock is required");
    }
}

ElementMetadata LinkPlanner::checkElements(const OrbitalElements &elements) const {
    auto metadata = describeElements(elements, clock());
    if (std::abs(metadata.ageInDays) > limits.staleElementAgeInDays) {
        warn("Elements for satellite {} are {:.1f} days from epoch; results may be inaccurate",
            metadata.catalogNumber, metadata.ageInDays);
    }
    return metadata;
}

PassPrediction LinkPlanner::predictPasses(const OrbitalElements &elements,
                                          const GroundStation &station,
                                          const TimeWindow &window,
                                          double maskInDegrees,
                                          double stepInSeconds,
                                          int maxPasses,
                                          const std::optional<HorizonMask> &horizonMask) const {
    validate(station);
    validate(window, limits.maximumPassWindow);
    validateMask(maskInDegrees);
    auto step = gridStep(window.start, window.end, stepInSeconds);
    if (maxPasses < 1 || maxPasses > limits.maximumPasses) {
        throw InvalidInputException(std::format("Maximum passes must be between 1 and {} (got {})",
            limits.maximumPasses, maxPasses));
    }

    PassPrediction prediction{.passes = {}, .metadata = checkElements(elements)};

    auto observe = [&](time_point t) {
        auto states = sampleStates(*propagator, elements, std::views::single(t));
        return toTopocentric(*states.begin(), station, maskInDegrees);
    };

    debug("Predicting passes of {} from {} to {} ({} grid points)", elements.getCatalogNumber(),
        formatTimestamp(window.start), formatTimestamp(window.end),
        gridSize(window.start, window.end, step));

    PassDetectorOptions options;
    if (horizonMask) {
        options.accept = [&](const PassWindow &pass) {
            auto peak = observe(pass.maxElevationTime);
            double terrain = horizonMask->elevationAt(peak.azimuthInDegrees);
            if (pass.maxElevationInDegrees < terrain) {
                debug("Pass at {} peaks at {:.2f} deg behind terrain ({:.2f} deg at az {:.1f})",
                    formatTimestamp(pass.riseTime), pass.maxElevationInDegrees, terrain, peak.azimuthInDegrees);
                return false;
            }
            return true;
        };
    }

    auto windows = findPasses(
        [&](time_point t) { return observe(t).elevationInDegrees; },
        window.start, window.end, stepInSeconds, maskInDegrees, maxPasses, options);

    for (const auto &pass : windows) {
        prediction.passes.push_back(PassSummary{
            .window = pass,
            .atRise = observe(pass.riseTime),
            .atMax = observe(pass.maxElevationTime),
            .atSet = observe(pass.setTime)
        });
    }

    return prediction;
}

MarginSeries LinkPlanner::computeMarginSeries(const OrbitalElements &elements,
                                              const GroundStation &station,
                                              const TimeWindow &window,
                                              double stepInSeconds,
                                              const RFConfiguration &rfConfig,
                                              const MarginOptions &options) const {
    validate(station);
    validate(window, limits.maximumMarginWindow);
    auto step = gridStep(window.start, window.end, stepInSeconds);
    validateMask(options.maskInDegrees);
    validate(rfConfig);

    MarginSeries series{
        .samples = {},
        .skipped = {},
        .metadata = checkElements(elements),
        .rfConfig = rfConfig,
        .frequencyInGHz = rfConfig.frequencyInGHz()
    };

    auto states = sampleStates(*propagator, elements, timeGrid(window.start, window.end, step));
    for (auto it = states.begin(); it != states.end(); ++it) {
        time_point t = *it.base();
        StateVector state;
        try {
            state = *it;
        } catch (const PropagationException &err) {
            warn("Skipping margin sample at {}: {}", formatTimestamp(t), err.what());
            series.skipped.push_back(SkippedSample{
                .timestamp = t,
                .reason = err.reason(),
                .message = err.what()
            });
            continue;
        }

        auto view = toTopocentric(state, station, options.maskInDegrees);
        if (options.visibleOnly && !view.visible) {
            continue;
        }

        auto budget = computeMargin({view.rangeInKilometers, view.elevationInDegrees}, rfConfig);
        series.samples.push_back(MarginSample{
            .timestamp = t,
            .snrInDb = budget.snrInDb,
            .marginInDb = budget.marginInDb,
            .rangeInKilometers = view.rangeInKilometers,
            .elevationInDegrees = view.elevationInDegrees,
            .azimuthInDegrees = view.azimuthInDegrees
        });
    }

    debug("Computed {} margin samples ({} skipped) at {:.3f} GHz",
        series.samples.size(), series.skipped.size(), series.frequencyInGHz);
    if (!series.skipped.empty()) {
        warn("{} margin samples skipped ({})", series.skipped.size(), describe(series.skipped.front().reason));
    }

    return series;
}

}
