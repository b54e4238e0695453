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
 * @file pathfinding.cpp
 * Breadth-first reachability and route lookup
 */

#include <deque>

#include "lib/framework/frame.h"

#include "astar.h"
#include "pathfinding.h"

namespace {

struct QueuedTile
{
	Vector2i coords;
	int depth;
};

}

bool any_tile(Vector2i)
{
	return true;
}

std::vector<Vector2i> bfs(const Grid& grid,
                          Vector2i start,
                          int max_depth,
                          const TilePredicate& is_available,
                          const TilePredicate& can_go_through)
{
	std::vector<Vector2i> available_tiles;
	if (max_depth <= 0) {
		return available_tiles;
	}

	std::vector<bool> enqueued(static_cast<std::size_t>(grid.tile_count()), false);
	std::deque<QueuedTile> queue;
	if (grid.in_bounds(start)) {
		enqueued[grid.tile_index(start)] = true;
	}
	for (const auto& tile : grid.adjacent_tiles(start))
	{
		enqueued[grid.tile_index(tile)] = true;
		queue.push_back({tile, 1});
	}

	while (!queue.empty())
	{
		const auto queued = queue.front();
		queue.pop_front();

		if (is_available(queued.coords)) {
			available_tiles.push_back(queued.coords);
		}
		if (queued.depth >= max_depth || !can_go_through(queued.coords)) {
			continue;
		}
		for (const auto& adjacent : grid.adjacent_tiles(queued.coords))
		{
			const auto index = grid.tile_index(adjacent);
			if (enqueued[index]) {
				continue;
			}
			enqueued[index] = true;
			queue.push_back({adjacent, queued.depth + 1});
		}
	}
	return available_tiles;
}

std::vector<Vector2i> path_to(const Grid& grid,
                              Vector2i start,
                              Vector2i end,
                              const TilePredicate& can_go_through)
{
	PathContext context {grid, can_go_through};
	auto route = astar_route(context, start, end);
	if (route.empty() && start != end) {
		debug(LOG_MOVEMENT, "No route from %s to %s", to_string(start).c_str(), to_string(end).c_str());
	}
	return route;
}

int path_length(const Grid& grid,
                Vector2i start,
                Vector2i end,
                const TilePredicate& can_go_through)
{
	if (start == end) {
		return 0;
	}
	const auto route = path_to(grid, start, end, can_go_through);
	return route.empty() ? NO_ROUTE : static_cast<int>(route.size());
}
