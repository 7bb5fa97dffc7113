/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_HORIZON_MASK_HPP
#define __SATLINK_HORIZON_MASK_HPP

#include <array>
#include <iostream>
#include <string>
#include <vector>

namespace satlink {

/**
 * Local terrain horizon: the obstructed elevation for each whole degree of
 * azimuth, 0 through 359.
 *
 * A mask file holds 360 values separated by whitespace or commas. Lines
 * starting with '#' are ignored.
 */
class HorizonMask {
public:
    static constexpr std::size_t SIZE = 360;

    /**
     * @throws InvalidInputException unless there are exactly 360 values in [0, 90)
     */
    explicit HorizonMask(const std::vector<double> &elevationsInDegrees);

    static HorizonMask load(std::istream &s);
    static HorizonMask load(const std::string &filepath);

    /**
     * Horizon elevation at an azimuth, rounded to the nearest degree (mod 360).
     */
    double elevationAt(double azimuthInDegrees) const;

    /**
     * Highest obstruction anywhere on the horizon.
     */
    double maximumElevation() const;

private:
    std::array<double, SIZE> elevations;
};

}

#endif
