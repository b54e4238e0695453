/*
	This file is part of FlagSnag.
	Copyright (C) 2021-2022  FlagSnag Project

	FlagSnag is free software; you can redistribute it and/or modify
	it under the terms of the GNU General Public License as published by
	the Free Software Foundation; either version 2 of the License, or
	(at your option) any later version.

	FlagSnag is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
	GNU General Public License for more details.

	You should have received a copy of the GNU General Public License
	along with FlagSnag; if not, write to the Free Software
	Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA 02110-1301 USA
*/

/**
 * @file frame.h
 * @brief The framework library initialisation and shutdown routines
 */

#ifndef _frame_h
#define _frame_h

#include <cstdlib>
#include <string>

#include "debug.h"
#include "vector.h"

#define REALCONCAT(x, y) x ## y
#define CONCAT(x, y) REALCONCAT(x, y)

/// Maximum number of teams in a match
static constexpr auto MAX_TEAMS = 4;

/// Maximum number of squad members a single team may field
static constexpr auto MAX_SQUAD_SIZE = 9;

/// Frame cadence of the host loop, in milliseconds
static constexpr auto FRAME_TIME_MS = 16.0f;

/**
 * Initialise the framework library
 *
 * @return `true` when the framework library is successfully initialised, `false`
 *   when a part of the initialisation failed
 */
bool frameInitialise();

/// Shut down the framework library
void frameShutDown();

/// Call this each tick to advance the frame counter
void frameUpdate();

/// @return the current frame number
unsigned frameGetFrameNumber();

static inline __attribute__((__warn_unused_result__)) std::string bool2string(bool var)
{
  return var ? "true" : "false";
}

#endif
