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
 * @file targeting.cpp
 * Shot path resolution.
 *
 * A ray is marched forward in steps of MARCH_STEP. At each step the
 * tile under the march point and its eight neighbours are examined,
 * closest centre first (lowest tile index on ties). Each occupant is
 * examined once per segment and tested against all four of its edges.
 * A hit is only accepted once the march has passed it, which guarantees
 * that everything which could be struck earlier has been examined.
 */

#include <algorithm>

#include "lib/framework/frame.h"

#include "targeting.h"

namespace {

struct Candidate
{
	Vector2i tile;
	float distance;
	int index;
};

struct Hit
{
	TARGET_KIND kind;
	Vector2i tile;
	Intersection intersection;
	Vector2f normal;
	std::optional<int> character_id;
};

}

/// The 3x3 block of in-bounds tiles around `point`, closest centre first
static std::vector<Candidate> tiles_around(const Grid& grid, Vector2f point)
{
	const auto center = grid.tile_from_canvas(point);
	std::vector<Candidate> result;
	result.reserve(9);
	for (int dy = -1; dy <= 1; ++dy)
	{
		for (int dx = -1; dx <= 1; ++dx)
		{
			const auto tile = center + Vector2i(dx, dy);
			if (!grid.in_bounds(tile)) {
				continue;
			}
			result.push_back({tile, glm::length(world_center(tile) - point), grid.tile_index(tile)});
		}
	}
	std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
		if (a.distance != b.distance) {
			return a.distance < b.distance;
		}
		return a.index < b.index;
	});
	return result;
}

/// Closest hit on the occupant of `tile`, ignoring friendly characters
static std::optional<Hit> hit_occupant(const TargetingWorld& world, const Ray& ray,
                                       Vector2i tile, int from_team)
{
	std::array<LineSegment, 4> edges;
	auto kind = TARGET_KIND::OBSTACLE;
	std::optional<int> character_id;

	if (const auto character = world.character_at(tile)) {
		if (character->get_team() == from_team) {
			return std::nullopt;
		}
		edges = character->edges();
		kind = TARGET_KIND::CHARACTER;
		character_id = character->get_id();
	} else if (const auto obstacle = world.obstacle_at(tile)) {
		edges = obstacle->edges();
	} else {
		return std::nullopt;
	}

	std::optional<Hit> best;
	for (const auto& edge : edges)
	{
		const auto intersection = ray_segment_intersection(ray, edge);
		if (intersection && (!best || intersection->distance < best->intersection.distance)) {
			best = Hit{kind, tile, *intersection, edge.normal, character_id};
		}
	}
	return best;
}

/**
 * March along `ray` until the closest hit is known.
 *
 * @return the hit, or `std::nullopt` if the ray leaves the grid first
 */
static std::optional<Hit> find_closest_hit(const TargetingWorld& world, const Ray& ray,
                                           int from_team, std::vector<bool>& examined)
{
	const auto& grid = world.get_grid();
	std::vector<Hit> pending;

	for (auto distance = MARCH_STEP; ; distance += MARCH_STEP)
	{
		const auto point = ray.point_at_distance(distance);
		const auto inside = grid.canvas_in_bounds(point);
		if (inside) {
			for (const auto& candidate : tiles_around(grid, point))
			{
				if (examined[candidate.index]) {
					continue;
				}
				examined[candidate.index] = true;
				if (auto hit = hit_occupant(world, ray, candidate.tile, from_team)) {
					pending.push_back(*hit);
				}
			}
		}

		const Hit* best = nullptr;
		for (const auto& hit : pending)
		{
			// strict, so the first examined wins a tie
			if (best == nullptr || hit.intersection.distance < best->intersection.distance) {
				best = &hit;
			}
		}
		if (best != nullptr && (best->intersection.distance <= distance || !inside)) {
			return *best;
		}
		if (!inside) {
			return std::nullopt;
		}
	}
}

static std::optional<Target> border_target(const Grid& grid, const Ray& ray)
{
	std::optional<Intersection> best;
	Vector2f normal {0, 0};
	for (const auto& edge : grid.border_edges())
	{
		const auto intersection = ray_segment_intersection(ray, edge);
		if (intersection && (!best || intersection->distance < best->distance)) {
			best = intersection;
			normal = edge.normal;
		}
	}
	if (!best) {
		return std::nullopt;
	}

	Target target;
	target.kind = TARGET_KIND::BORDER;
	target.tile = grid.clip_tile(grid.tile_from_canvas(best->point));
	target.point = best->point;
	target.ray = ray;
	target.normal = normal;
	target.segment_distance = best->distance;
	return target;
}

TargetingWorld::TargetingWorld(const Grid& grid,
                               const std::vector<Character>& characters,
                               const std::vector<Obstacle>& obstacles,
                               std::optional<int> ignored_character)
  : grid{grid}, characters{characters}, obstacles{obstacles},
    occupancy(static_cast<std::size_t>(grid.tile_count()))
{
	for (std::size_t i = 0; i < obstacles.size(); ++i)
	{
		const auto tile = obstacles[i].tile;
		if (grid.in_bounds(tile)) {
			occupancy[grid.tile_index(tile)] = {OCCUPANT::OBSTACLE, i};
		}
	}
	for (std::size_t i = 0; i < characters.size(); ++i)
	{
		const auto& character = characters[i];
		if (!character.is_alive() || character.get_id() == ignored_character) {
			continue;
		}
		const auto tile = character.get_tile();
		ASSERT(grid.in_bounds(tile), "Character %d off the grid at %s",
		       character.get_id(), to_string(tile).c_str());
		if (grid.in_bounds(tile)) {
			occupancy[grid.tile_index(tile)] = {OCCUPANT::CHARACTER, i};
		}
	}
}

const Grid& TargetingWorld::get_grid() const noexcept
{
	return grid;
}

const TargetingWorld::Occupant* TargetingWorld::occupant_at(Vector2i tile) const
{
	if (!grid.in_bounds(tile)) {
		return nullptr;
	}
	return &occupancy[grid.tile_index(tile)];
}

const Character* TargetingWorld::character_at(Vector2i tile) const
{
	const auto occupant = occupant_at(tile);
	if (occupant == nullptr || occupant->kind != OCCUPANT::CHARACTER) {
		return nullptr;
	}
	return &characters[occupant->index];
}

const Obstacle* TargetingWorld::obstacle_at(Vector2i tile) const
{
	const auto occupant = occupant_at(tile);
	if (occupant == nullptr || occupant->kind != OCCUPANT::OBSTACLE) {
		return nullptr;
	}
	return &obstacles[occupant->index];
}

Ray get_ray_for_shot(const ShotInfo& shot)
{
	return make_ray(shot.from_canvas, shot.aim_angle);
}

ShotPath resolve_shot(const TargetingWorld& world,
                      const Ray& ray,
                      Vector2i start_tile,
                      int from_team,
                      int max_ricochets)
{
	ShotPath path;
	const auto& grid = world.get_grid();
	ASSERT_OR_RETURN(path, glm::length(ray.direction) > 0.5f, "Degenerate ray direction");

	std::vector<bool> examined(static_cast<std::size_t>(grid.tile_count()), false);
	if (grid.in_bounds(start_tile)) {
		examined[grid.tile_index(start_tile)] = true;
	}

	auto current = ray;
	auto ricochets = std::max(0, max_ricochets);
	auto travelled = 0.0f;
	while (true)
	{
		const auto hit = find_closest_hit(world, current, from_team, examined);
		if (!hit) {
			auto border = border_target(grid, current);
			ASSERT(border.has_value(), "Ray from (%f, %f) never crossed the play-area border",
			       current.origin.x, current.origin.y);
			if (border) {
				travelled += border->segment_distance;
				border->cumulative_distance = travelled;
				border->ricochets_left = ricochets;
				path.push_back(*border);
			}
			return path;
		}

		travelled += hit->intersection.distance;

		Target target;
		target.kind = hit->kind;
		target.tile = hit->tile;
		target.point = hit->intersection.point;
		target.ray = current;
		target.normal = hit->normal;
		target.segment_distance = hit->intersection.distance;
		target.cumulative_distance = travelled;
		target.character_id = hit->character_id;

		if (hit->kind != TARGET_KIND::OBSTACLE || ricochets <= 0) {
			target.ricochets_left = ricochets;
			path.push_back(target);
			return path;
		}

		--ricochets;
		target.ricochets_left = ricochets;
		target.is_ricochet = true;
		target.outbound = Ray(target.point, reflect(current.direction, hit->normal));
		path.push_back(target);

		current = target.outbound;
		std::fill(examined.begin(), examined.end(), false);
		examined[grid.tile_index(hit->tile)] = true;
	}
}

bool has_clear_line(const TargetingWorld& world,
                    Vector2i from,
                    Vector2i to,
                    int from_team)
{
	if (from == to) {
		return true;
	}
	const auto from_center = world_center(from);
	const auto to_center = world_center(to);
	const auto path = resolve_shot(world, Ray(from_center, to_center - from_center), from, from_team, 0);
	ASSERT_OR_RETURN(false, !path.empty(), "Empty shot path from %s", to_string(from).c_str());

	const auto& first = path.front();
	if (first.kind != TARGET_KIND::BORDER && first.tile == to) {
		return true;
	}
	return first.cumulative_distance >= glm::length(to_center - from_center);
}
