/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_PLANNER_HPP
#define __SATLINK_PLANNER_HPP

#include <satlink/elements.hpp>
#include <satlink/errors.hpp>
#include <satlink/horizon_mask.hpp>
#include <satlink/link_budget.hpp>
#include <satlink/pass_detector.hpp>
#include <satlink/propagator.hpp>
#include <satlink/types.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace satlink {

/**
 * Request-level limits.
 */
struct PlannerLimits {
    std::chrono::hours maximumPassWindow{24 * 30};
    std::chrono::hours maximumMarginWindow{24 * 7};
    int maximumPasses = 100;
    // Elements older than this are logged as stale
    double staleElementAgeInDays = 14.0;
};

/**
 * Search window; both ends are sampled.
 */
struct TimeWindow {
    time_point start;
    time_point end;
};

/**
 * A pass plus the observer's view of the satellite at rise, peak and set.
 */
struct PassSummary {
    PassWindow window;
    TopocentricSample atRise;
    TopocentricSample atMax;
    TopocentricSample atSet;
};

struct PassPrediction {
    std::vector<PassSummary> passes;
    ElementMetadata metadata;
};

struct MarginOptions {
    // Only keep samples at or above maskInDegrees
    bool visibleOnly = false;
    double maskInDegrees = 0.0;
};

/**
 * A margin series timestamp that could not be propagated.
 */
struct SkippedSample {
    time_point timestamp;
    PropagationErrorCode reason;
    std::string message;
};

struct MarginSeries {
    std::vector<MarginSample> samples;
    std::vector<SkippedSample> skipped;
    ElementMetadata metadata;
    RFConfiguration rfConfig;
    double frequencyInGHz;
};

/**
 * Pass prediction and link margin forecasting for one ground station.
 *
 * All inputs are validated before the propagator is called. Pass
 * prediction stops at the first propagation failure and rethrows it; a
 * margin series records the failing timestamp as a SkippedSample and
 * carries on with the next one.
 *
 * Usage:
 *   LinkPlanner planner;
 *   auto prediction = planner.predictPasses(elements, station, {start, end}, 10.0, 10.0, 20);
 *   auto series = planner.computeMarginSeries(elements, station, {start, end}, 5.0, RFConfiguration{});
 */
class LinkPlanner {
public:
    using Clock = std::function<time_point()>;

    explicit LinkPlanner(std::shared_ptr<const Propagator> propagator = std::make_shared<Sgp4Propagator>(),
                         PlannerLimits limits = {},
                         Clock clock = std::chrono::system_clock::now);

    /**
     * Predict passes above maskInDegrees.
     *
     * @param horizonMask If given, passes whose peak is below the terrain at
     *                    the peak azimuth are dropped
     * @throws InvalidInputException for a bad station, window, mask, step or maxPasses
     * @throws PropagationException if any sample cannot be propagated
     */
    PassPrediction predictPasses(const OrbitalElements &elements,
                                 const GroundStation &station,
                                 const TimeWindow &window,
                                 double maskInDegrees,
                                 double stepInSeconds,
                                 int maxPasses,
                                 const std::optional<HorizonMask> &horizonMask = std::nullopt) const;

    /**
     * Link margin at each step of the window.
     *
     * @throws InvalidInputException for a bad station, window, step, mask or RF configuration
     */
    MarginSeries computeMarginSeries(const OrbitalElements &elements,
                                     const GroundStation &station,
                                     const TimeWindow &window,
                                     double stepInSeconds,
                                     const RFConfiguration &rfConfig,
                                     const MarginOptions &options = {}) const;

    const PlannerLimits& getLimits() const { return limits; }

private:
    ElementMetadata checkElements(const OrbitalElements &elements) const;

    std::shared_ptr<const Propagator> propagator;
    PlannerLimits limits;
    Clock clock;
};

void validate(const GroundStation &station);
void validate(const TimeWindow &window, std::chrono::hours maximumLength);

}

#endif
