/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_PROPAGATOR_HPP
#define __SATLINK_PROPAGATOR_HPP

#include <satlink/elements.hpp>
#include <satlink/types.hpp>

namespace satlink {

/**
 * Source of inertial state vectors for a set of orbital elements.
 *
 * Implementations must be deterministic for a given (elements, time) pair
 * and must report failures by throwing PropagationException, never by
 * returning a placeholder state.
 */
class Propagator {
public:
    virtual ~Propagator() = default;

    /**
     * Inertial (TEME) position and velocity at the given instant.
     *
     * @throws PropagationException if the elements cannot be propagated to time
     */
    virtual StateVector propagate(const OrbitalElements &elements, time_point time) const = 0;
};

/**
 * SGP4/SDP4 propagation backed by libsgp4.
 *
 * The model is initialized on every call, so one instance can be shared
 * between threads.
 */
class Sgp4Propagator : public Propagator {
public:
    StateVector propagate(const OrbitalElements &elements, time_point time) const override;
};

}

#endif
