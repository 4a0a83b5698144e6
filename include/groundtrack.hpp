/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_HPP
#define __GROUNDTRACK_HPP

#include <groundtrack/errors.hpp>
#include <groundtrack/elements.hpp>
#include <groundtrack/propagator.hpp>
#include <groundtrack/source.hpp>
#include <groundtrack/celestrak.hpp>
#include <groundtrack/track.hpp>
#include <groundtrack/output.hpp>
#include <groundtrack/config.hpp>

#endif
