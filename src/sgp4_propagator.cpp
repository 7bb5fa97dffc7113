/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satlink/errors.hpp>
#include <satlink/propagator.hpp>
#include <satlink/time_util.hpp>

#include <cmath>
#include <format>

#include <DecayedException.h>
#include <Eci.h>
#include <SatelliteException.h>
#include <SGP4.h>
#include <Tle.h>
#include <TleException.h>

namespace satlink {

namespace {

bool isFinite(const Vec3 &v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

}

StateVector Sgp4Propagator::propagate(const OrbitalElements &elements, time_point time) const {
    // Minutes since the element epoch
    double tsince = secondsBetween(elements.getEpoch(), time) / 60.0;

    try {
        libsgp4::Tle tle(elements.getName(), elements.getLine1(), elements.getLine2());
        libsgp4::SGP4 model(tle);
        libsgp4::Eci eci = model.FindPosition(tsince);

        libsgp4::Vector pos = eci.Position();
        libsgp4::Vector vel = eci.Velocity();

        StateVector state{
            .timestamp = time,
            .position = {pos.x, pos.y, pos.z},
            .velocity = {vel.x, vel.y, vel.z}
        };

        if (!isFinite(state.position) || !isFinite(state.velocity)) {
            throw PropagationException(time, PropagationErrorCode::NumericalFailure,
                std::format("Non-finite state for satellite {} at {}",
                    elements.getCatalogNumber(), formatTimestamp(time)));
        }
        return state;
    } catch (const libsgp4::DecayedException &err) {
        throw PropagationException(time, PropagationErrorCode::Decayed,
            std::format("Satellite {} has decayed: {}", elements.getCatalogNumber(), err.what()));
    } catch (const libsgp4::TleException &err) {
        throw PropagationException(time, PropagationErrorCode::InvalidElements,
            std::format("Invalid elements for satellite {}: {}", elements.getCatalogNumber(), err.what()));
    } catch (const libsgp4::SatelliteException &err) {
        throw PropagationException(time, PropagationErrorCode::NumericalFailure,
            std::format("Propagation failed for satellite {} at {}: {}",
                elements.getCatalogNumber(), formatTimestamp(time), err.what()));
    }
}

}
