/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_SAMPLER_HPP
#define __SATLINK_SAMPLER_HPP

#include <satlink/elements.hpp>
#include <satlink/errors.hpp>
#include <satlink/propagator.hpp>
#include <satlink/time_util.hpp>
#include <satlink/types.hpp>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <format>
#include <ranges>
#include <utility>

namespace satlink {

/**
 * Number of points timeGrid(start, end, step) yields.
 */
inline std::int64_t gridSize(time_point start, time_point end, std::chrono::system_clock::duration step) {
    if (end <= start) {
        return 1;
    }
    auto span = end - start;
    return span / step + (span % step != std::chrono::system_clock::duration::zero() ? 1 : 0) + 1;
}

/**
 * Grid spacing for a step given in seconds. A step longer than the window
 * is shortened to the window length, so any positive step is accepted.
 *
 * @throws InvalidInputException if step is not a positive number or is
 *         below the clock resolution
 */
inline std::chrono::system_clock::duration gridStep(time_point start, time_point end, double stepInSeconds) {
    if (!std::isfinite(stepInSeconds) || stepInSeconds <= 0.0) {
        throw InvalidInputException(std::format("Step must be a positive number of seconds (got {})", stepInSeconds));
    }
    double span = secondsBetween(start, end);
    if (span > 0.0 && stepInSeconds > span) {
        stepInSeconds = span;
    }
    auto step = toDuration(stepInSeconds);
    if (step <= std::chrono::system_clock::duration::zero()) {
        throw InvalidInputException(std::format("Step is below the clock resolution ({} s)", stepInSeconds));
    }
    return step;
}

/**
 * Evenly spaced instants start, start+step, ... The last point is always
 * exactly end, so the final interval may be shorter than step.
 *
 * @throws InvalidInputException if step is not positive or end < start
 */
inline auto timeGrid(time_point start, time_point end, std::chrono::system_clock::duration step) {
    if (step <= std::chrono::system_clock::duration::zero()) {
        throw InvalidInputException("Time step must be positive");
    }
    if (end < start) {
        throw InvalidInputException("Time grid end is before its start");
    }
    // Every point before the last lies strictly inside the window
    auto last = gridSize(start, end, step) - 1;
    return std::views::iota(std::int64_t{0}, last + 1)
        | std::views::transform([start, end, step, last](std::int64_t i) {
              return i < last ? start + step * i : end;
          });
}

/**
 * Lazily propagate elements over a sequence of timestamps.
 *
 * Each element of the returned view is produced on dereference by calling
 * the propagator; nothing is cached. A propagation failure surfaces as a
 * PropagationException from the dereference that caused it. The propagator
 * and elements must outlive the view.
 *
 * Usage:
 *   Sgp4Propagator sgp4;
 *   for (const auto &state : sampleStates(sgp4, elements, timeGrid(start, end, 10s))) {
 *       ...
 *   }
 */
template <std::ranges::viewable_range R>
auto sampleStates(const Propagator &propagator, const OrbitalElements &elements, R &&timestamps) {
    return std::views::all(std::forward<R>(timestamps))
        | std::views::transform([&propagator, &elements](time_point t) {
              return propagator.propagate(elements, t);
          });
}

}

#endif
