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
 * @file astar.h
 * A* route search used to animate movement along legal tiles
 */

#ifndef __INCLUDED_SRC_ASTAR_H__
#define __INCLUDED_SRC_ASTAR_H__

#include <vector>

#include "pathfinding.h"

/// Represents a route node in the pathfinding table
struct PathNode
{
	PathNode() = default;
	PathNode(Vector2i coord, unsigned dist, unsigned est);

	/**
	 * Heap ordering. The best node compares greatest so that
	 * std::push_heap/std::pop_heap keep it at the front
	 */
	bool operator <(const PathNode& rhs) const;

	/// Current position in route
	Vector2i path_coordinate {0, 0};

	/// Distance traversed so far
	unsigned distance_from_start = 0;

	/// Distance so far plus remaining estimate
	unsigned estimated_distance_to_end = 0;
};

struct ExploredTile
{
	/// Previous point in route
	Vector2i came_from {0, 0};

	/// Shortest known distance to tile
	unsigned distance = 0;

	/// `true` once reached
	bool reached = false;

	/// `true` once expanded
	bool visited = false;
};

/// Main pathfinding data structure. Represents a candidate route
struct PathContext
{
	PathContext(const Grid& grid, const TilePredicate& can_go_through);

	/// @return `true` if the position is blocked for this route
	[[nodiscard]] bool is_blocked(Vector2i tile) const;

	const Grid& grid;
	const TilePredicate& can_go_through;

	/// Edge of the explored region
	std::vector<PathNode> nodes;

	/// Route history, indexed by tile
	std::vector<ExploredTile> map;
};

/// Finds the current best node, and removes it from the node heap
PathNode get_best_node(std::vector<PathNode>& nodes);

/// @return the Manhattan distance between two tiles
unsigned estimate_distance(Vector2i start, Vector2i finish);

/// Run A* from `start` to `end`; see `path_to`
std::vector<Vector2i> astar_route(PathContext& context, Vector2i start, Vector2i end);

#endif // __INCLUDED_SRC_ASTAR_H__
