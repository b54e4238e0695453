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
 * @file astar.cpp
 * A* over the orthogonal tile graph. Every step costs one.
 */

#include <algorithm>

#include "lib/framework/frame.h"

#include "astar.h"

PathNode::PathNode(Vector2i coord, unsigned dist, unsigned est)
  : path_coordinate{coord}, distance_from_start{dist},
    estimated_distance_to_end{est}
{
}

bool PathNode::operator <(const PathNode& rhs) const
{
	if (estimated_distance_to_end != rhs.estimated_distance_to_end)
		return estimated_distance_to_end > rhs.estimated_distance_to_end;

	if (distance_from_start != rhs.distance_from_start)
		return distance_from_start < rhs.distance_from_start;

	if (path_coordinate.x != rhs.path_coordinate.x)
		return path_coordinate.x > rhs.path_coordinate.x;

	return path_coordinate.y > rhs.path_coordinate.y;
}

PathContext::PathContext(const Grid& grid, const TilePredicate& can_go_through)
  : grid{grid}, can_go_through{can_go_through}
{
}

bool PathContext::is_blocked(Vector2i tile) const
{
	return !grid.in_bounds(tile) || !can_go_through(tile);
}

PathNode get_best_node(std::vector<PathNode>& nodes)
{
	// find the node with the lowest estimate
	// if equal totals, give preference to node closer to target
	const auto best = nodes.front();
	// move the best node to the back, preserving the heap properties
	std::pop_heap(nodes.begin(), nodes.end());
	nodes.pop_back();
	return best;
}

unsigned estimate_distance(Vector2i start, Vector2i finish)
{
	return static_cast<unsigned>(manhattan_distance(start, finish));
}

std::vector<Vector2i> astar_route(PathContext& context, Vector2i start, Vector2i end)
{
	const auto& grid = context.grid;
	if (start == end || !grid.in_bounds(start) || context.is_blocked(end)) {
		return {};
	}

	context.map.assign(static_cast<std::size_t>(grid.tile_count()), ExploredTile{});
	context.nodes.clear();

	auto& origin = context.map[grid.tile_index(start)];
	origin.reached = true;
	context.nodes.emplace_back(start, 0, estimate_distance(start, end));

	while (!context.nodes.empty())
	{
		const auto node = get_best_node(context.nodes);
		auto& explored = context.map[grid.tile_index(node.path_coordinate)];
		if (explored.visited) {
			// already expanded via a shorter route
			continue;
		}
		explored.visited = true;
		if (node.path_coordinate == end) {
			break;
		}

		for (const auto& offset : orthogonal_offset)
		{
			const auto next = node.path_coordinate + offset;
			if (context.is_blocked(next)) {
				continue;
			}
			auto& candidate = context.map[grid.tile_index(next)];
			const auto dist = node.distance_from_start + 1;
			if (candidate.visited || (candidate.reached && candidate.distance <= dist)) {
				continue;
			}
			candidate.reached = true;
			candidate.distance = dist;
			candidate.came_from = node.path_coordinate;
			context.nodes.emplace_back(next, dist, dist + estimate_distance(next, end));
			std::push_heap(context.nodes.begin(), context.nodes.end());
		}
	}

	if (!context.map[grid.tile_index(end)].reached) {
		return {};
	}

	std::vector<Vector2i> route;
	for (auto tile = end; tile != start; tile = context.map[grid.tile_index(tile)].came_from)
	{
		route.push_back(tile);
	}
	std::reverse(route.begin(), route.end());
	return route;
}
