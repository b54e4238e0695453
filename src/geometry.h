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
 * @file geometry.h
 * Rays, line segments and the intersection test between them
 */

#ifndef __INCLUDED_SRC_GEOMETRY_H__
#define __INCLUDED_SRC_GEOMETRY_H__

#include <array>
#include <optional>
#include <vector>

#include "lib/framework/vector.h"

/// Rays starting this close to a segment do not collide with it
static constexpr auto INTERSECTION_EPSILON = 1e-3f;

/// A half-line in canvas space
struct Ray
{
	Ray() = default;
	Ray(Vector2f origin, Vector2f direction);

	/// @return the point `distance` canvas units along the ray
	[[nodiscard]] Vector2f point_at_distance(float distance) const;

	Vector2f origin {0, 0};

	/// Always unit length
	Vector2f direction {1, 0};
};

/// One edge of a bounding box. `normal` points away from the box
struct LineSegment
{
	Vector2f start {0, 0};
	Vector2f end {0, 0};
	Vector2f normal {0, 0};
};

struct Intersection
{
	Vector2f point {0, 0};

	/// Distance along the ray from its origin
	float distance = 0;
};

/**
 * Build a ray from `origin` pointing at `angle_radians`, measured
 * clockwise from the positive x axis (canvas y grows downwards)
 */
[[nodiscard]] Ray make_ray(Vector2f origin, float angle_radians);

/// @return the clockwise angle of `direction`, in (-pi, pi]
[[nodiscard]] float angle_of(Vector2f direction);

/// @return the clockwise angle from `from` towards `to`
[[nodiscard]] float angle_between(Vector2f from, Vector2f to);

/**
 * Intersect a ray with a line segment.
 *
 * Only the front face of the segment can be struck: a ray travelling
 * along or away from `segment.normal` never intersects. Hits closer
 * than INTERSECTION_EPSILON to the ray origin are ignored, so a ray that
 * starts on an edge cannot collide with it.
 */
[[nodiscard]] std::optional<Intersection> ray_segment_intersection(const Ray& ray, const LineSegment& segment);

/// Mirror `direction` about `normal`. `normal` must be unit length
[[nodiscard]] Vector2f reflect(Vector2f direction, Vector2f normal);

/**
 * The four edges of an axis-aligned square, ordered top, right,
 * bottom, left, each with an outward normal
 */
[[nodiscard]] std::array<LineSegment, 4> bounding_edges(Vector2f center, float half_extent);

/**
 * Tiles crossed by the line joining the centre of `a` to the centre
 * of `b`, excluding `a` and `b`. Adjacent tiles yield an empty list.
 */
[[nodiscard]] std::vector<Vector2i> tiles_on_line_between(Vector2i a, Vector2i b);

#endif // __INCLUDED_SRC_GEOMETRY_H__
