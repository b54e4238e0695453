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
 * @file animation.h
 * Presentation-only interpolation of a position along tile waypoints
 */

#ifndef __INCLUDED_SRC_ANIMATION_H__
#define __INCLUDED_SRC_ANIMATION_H__

#include <deque>
#include <vector>

#include "lib/framework/vector.h"

/// Canvas units travelled per millisecond by a moving character
static constexpr auto CHARACTER_SPEED_PER_MS = 40 * 0.005f;

/// A waypoint counts as reached once this close, in canvas units
static constexpr auto WAYPOINT_ARRIVAL_DISTANCE = 40 * 0.1f;

class MovementAnimation
{
public:
	MovementAnimation() = default;
	explicit MovementAnimation(Vector2f position);

	/**
	 * Begin moving from the current position through each waypoint
	 * in turn. The final waypoint is where the animation settles
	 */
	void start(std::vector<Vector2f> waypoints);

	/// Advance by `elapsed_ms`. Does nothing when idle
	void update(float elapsed_ms);

	/// Snap to `position` and stop
	void jump_to(Vector2f position);

	[[nodiscard]] bool is_animating() const noexcept;

	[[nodiscard]] Vector2f position() const noexcept;

private:
	Vector2f current {0, 0};
	std::deque<Vector2f> remaining;
	float speed_per_ms = CHARACTER_SPEED_PER_MS;
};

#endif // __INCLUDED_SRC_ANIMATION_H__
