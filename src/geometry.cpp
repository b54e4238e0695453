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
 * @file geometry.cpp
 * Holds the 2D vector maths used by targeting
 */

#include <algorithm>
#include <cmath>

#include "lib/framework/frame.h"

#include "geometry.h"

static float cross(Vector2f a, Vector2f b)
{
	return a.x * b.y - a.y * b.x;
}

Ray::Ray(Vector2f origin, Vector2f direction)
  : origin{origin}, direction{normalise(direction)}
{
}

Vector2f Ray::point_at_distance(float distance) const
{
	return origin + direction * distance;
}

Ray make_ray(Vector2f origin, float angle_radians)
{
	return {origin, Vector2f(std::cos(angle_radians), std::sin(angle_radians))};
}

float angle_of(Vector2f direction)
{
	return std::atan2(direction.y, direction.x);
}

float angle_between(Vector2f from, Vector2f to)
{
	return angle_of(to - from);
}

std::optional<Intersection> ray_segment_intersection(const Ray& ray, const LineSegment& segment)
{
	if (glm::dot(ray.direction, segment.normal) >= 0) {
		// approaching from behind, or grazing
		return std::nullopt;
	}

	const auto edge = segment.end - segment.start;
	const auto denominator = cross(ray.direction, edge);
	if (std::abs(denominator) < 1e-6f) {
		return std::nullopt;
	}

	const auto to_start = segment.start - ray.origin;
	const auto t = cross(to_start, edge) / denominator;
	const auto u = cross(to_start, ray.direction) / denominator;
	if (t <= INTERSECTION_EPSILON || u < 0 || u > 1) {
		return std::nullopt;
	}
	return Intersection{ray.point_at_distance(t), t};
}

Vector2f reflect(Vector2f direction, Vector2f normal)
{
	return direction - 2.0f * glm::dot(direction, normal) * normal;
}

std::array<LineSegment, 4> bounding_edges(Vector2f center, float half_extent)
{
	const auto top_left = center - Vector2f(half_extent, half_extent);
	const auto top_right = top_left + Vector2f(half_extent * 2, 0);
	const auto bottom_left = top_left + Vector2f(0, half_extent * 2);
	const auto bottom_right = top_left + Vector2f(half_extent * 2, half_extent * 2);

	return {
		LineSegment{top_left, top_right, {0, -1}},
		LineSegment{top_right, bottom_right, {1, 0}},
		LineSegment{bottom_left, bottom_right, {0, 1}},
		LineSegment{top_left, bottom_left, {-1, 0}},
	};
}

std::vector<Vector2i> tiles_on_line_between(Vector2i a, Vector2i b)
{
	std::vector<Vector2i> tiles;
	if (a == b) {
		return tiles;
	}

	// walk from centre to centre in quarter tile steps
	const auto start = Vector2f(a) + Vector2f(0.5f, 0.5f);
	const auto step = normalise(Vector2f(b - a)) * 0.25f;
	const auto max_iterations = manhattan_distance(a, b) * 4 + 4;

	auto current = start + step;
	for (auto i = 0; i < max_iterations; ++i)
	{
		const auto tile = Vector2i(static_cast<int>(std::floor(current.x)),
		                           static_cast<int>(std::floor(current.y)));
		if (tile == b) {
			break;
		}
		if (tile != a && std::find(tiles.begin(), tiles.end(), tile) == tiles.end()) {
			tiles.push_back(tile);
		}
		current += step;
	}
	return tiles;
}
