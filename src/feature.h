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
 * @file feature.h
 * Static map features: obstacles and team flags
 */

#ifndef __INCLUDED_SRC_FEATURE_H__
#define __INCLUDED_SRC_FEATURE_H__

#include <array>
#include <optional>

#include "lib/framework/vector.h"

#include "geometry.h"
#include "map.h"

/// Half the side of an obstacle's bounding box
static constexpr auto OBSTACLE_HALF_EXTENT = TILE_SIZE / 4.0f;

/// Blocks movement and line of sight
struct Obstacle
{
	Vector2i tile {0, 0};

	[[nodiscard]] std::array<LineSegment, 4> edges() const
	{
		return bounding_edges(world_center(tile), OBSTACLE_HALF_EXTENT);
	}
};

struct Flag
{
	int team = 0;

	/// Where the flag starts, and where its own team must return a captured flag
	Vector2i home_tile {0, 0};

	/// Current position; follows the carrier
	Vector2i tile {0, 0};

	/// Id of the character carrying the flag, if any
	std::optional<int> carrier_id;

	[[nodiscard]] bool is_carried() const noexcept
	{
		return carrier_id.has_value();
	}
};

#endif // __INCLUDED_SRC_FEATURE_H__
