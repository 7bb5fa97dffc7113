/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_ERRORS_HPP
#define __SATLINK_ERRORS_HPP

#include <satlink/types.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

namespace satlink {

// ============================================================================
// Exception Classes
// ============================================================================

/**
 * Base exception class for all SatLink errors.
 */
class SatlinkException : public std::runtime_error {
public:
    explicit SatlinkException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Thrown when a request is malformed (ground station, time window, mask,
 * step, RF configuration or element text). Always raised before any
 * propagation takes place.
 */
class InvalidInputException : public SatlinkException {
public:
    explicit InvalidInputException(const std::string& msg) : SatlinkException(msg) {}
};

/**
 * Why a set of orbital elements could not be propagated.
 */
enum class PropagationErrorCode {
    Decayed,            ///< The satellite has re-entered
    InvalidElements,    ///< The elements are numerically degenerate or unparseable
    NumericalFailure    ///< The propagator failed to converge at this time
};

std::ostream& operator<<(std::ostream &os, const PropagationErrorCode &code);

/**
 * Thrown when orbital elements cannot be propagated to a given instant.
 */
class PropagationException : public SatlinkException {
public:
    PropagationException(time_point timestamp, PropagationErrorCode reason, const std::string& msg)
        : SatlinkException(msg), timestamp_(timestamp), reason_(reason) {}

    time_point timestamp() const { return timestamp_; }
    PropagationErrorCode reason() const { return reason_; }

private:
    time_point timestamp_;
    PropagationErrorCode reason_;
};

}

#endif
