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
 * @file pathfinding.h
 * Reachability and routing over the tile grid
 */

#ifndef __INCLUDED_SRC_PATHFINDING_H__
#define __INCLUDED_SRC_PATHFINDING_H__

#include <functional>
#include <vector>

#include "lib/framework/vector.h"

#include "map.h"

/// Returned by `path_length` when no route exists
static constexpr auto NO_ROUTE = 1 << 20;

using TilePredicate = std::function<bool (Vector2i)>;

/// Predicate accepting every tile; used for splash and "unrestricted" searches
[[nodiscard]] bool any_tile(Vector2i);

/**
 * Breadth-first search outwards from the orthogonal neighbours of
 * `start`, which sit at depth 1.
 *
 * A tile is part of the result if `is_available` holds for it. Its own
 * neighbours are only explored if `can_go_through` holds for it and its
 * depth is below `max_depth`, so nothing deeper than `max_depth` is ever
 * visited. `start` itself is never returned. Tiles are returned in the
 * order they are reached.
 */
[[nodiscard]] std::vector<Vector2i> bfs(const Grid& grid,
                                        Vector2i start,
                                        int max_depth,
                                        const TilePredicate& is_available,
                                        const TilePredicate& can_go_through);

/**
 * Shortest orthogonal route from `start` to `end` passing only through
 * tiles satisfying `can_go_through` (`end` included).
 *
 * @return the tiles after `start` up to and including `end`, or an
 *   empty list if `end` cannot be reached
 */
[[nodiscard]] std::vector<Vector2i> path_to(const Grid& grid,
                                            Vector2i start,
                                            Vector2i end,
                                            const TilePredicate& can_go_through);

/// Number of steps in `path_to`, 0 if `start == end`, NO_ROUTE if unreachable
[[nodiscard]] int path_length(const Grid& grid,
                              Vector2i start,
                              Vector2i end,
                              const TilePredicate& can_go_through);

#endif // __INCLUDED_SRC_PATHFINDING_H__
