/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATLINK_HPP
#define __SATLINK_HPP

#include <satlink/config.hpp>
#include <satlink/elements.hpp>
#include <satlink/errors.hpp>
#include <satlink/horizon_mask.hpp>
#include <satlink/link_budget.hpp>
#include <satlink/numeric.hpp>
#include <satlink/pass_detector.hpp>
#include <satlink/planner.hpp>
#include <satlink/propagator.hpp>
#include <satlink/sampler.hpp>
#include <satlink/time_util.hpp>
#include <satlink/topocentric.hpp>
#include <satlink/types.hpp>

#endif
