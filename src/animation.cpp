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
 * @file animation.cpp
 */

#include <algorithm>

#include "animation.h"

MovementAnimation::MovementAnimation(Vector2f position)
  : current{position}
{
}

void MovementAnimation::start(std::vector<Vector2f> waypoints)
{
	remaining.assign(waypoints.begin(), waypoints.end());
}

void MovementAnimation::update(float elapsed_ms)
{
	if (remaining.empty()) {
		return;
	}
	const auto target = remaining.front();
	const auto to_target = target - current;
	const auto step = std::min(speed_per_ms * elapsed_ms, glm::length(to_target));
	current += normalise(to_target) * step;

	if (glm::length(target - current) > WAYPOINT_ARRIVAL_DISTANCE) {
		return;
	}
	remaining.pop_front();
	if (remaining.empty()) {
		current = target;
	}
}

void MovementAnimation::jump_to(Vector2f position)
{
	remaining.clear();
	current = position;
}

bool MovementAnimation::is_animating() const noexcept
{
	return !remaining.empty();
}

Vector2f MovementAnimation::position() const noexcept
{
	return current;
}
