/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYFORGE_HPP
#define __SKYFORGE_HPP

#include <skyforge/config.hpp>
#include <skyforge/zodiac.hpp>
#include <skyforge/ephemeris.hpp>
#include <skyforge/positions.hpp>
#include <skyforge/solar.hpp>
#include <skyforge/house.hpp>
#include <skyforge/sky.hpp>
#include <skyforge/aspects.hpp>
#include <skyforge/gates.hpp>
#include <skyforge/snapshot.hpp>

#endif
