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

#include <cmath>
#include <numbers>

#include <doctest/doctest.h>

#include "lib/framework/frame.h"

#include "src/geometry.h"
#include "src/map.h"

TEST_CASE("Geometry/RayAnglesAreClockwise")
{
	const auto down = make_ray({0, 0}, std::numbers::pi_v<float> / 2);
	CHECK(down.direction.x == doctest::Approx(0).epsilon(1e-5));
	CHECK(down.direction.y == doctest::Approx(1));

	CHECK(angle_of({0, 1}) == doctest::Approx(std::numbers::pi_v<float> / 2));
	CHECK(angle_between(world_center({0, 0}), world_center({3, 0})) == doctest::Approx(0));
}

TEST_CASE("Geometry/FrontFaceOnly")
{
	const Ray ray({0, 0}, {1, 0});
	const LineSegment facing {{10, -5}, {10, 5}, {-1, 0}};
	const auto hit = ray_segment_intersection(ray, facing);
	REQUIRE(hit.has_value());
	CHECK(hit->distance == doctest::Approx(10));
	CHECK(hit->point.y == doctest::Approx(0));

	const LineSegment behind {{10, -5}, {10, 5}, {1, 0}};
	CHECK_FALSE(ray_segment_intersection(ray, behind).has_value());

	const LineSegment beside {{10, 6}, {10, 12}, {-1, 0}};
	CHECK_FALSE(ray_segment_intersection(ray, beside).has_value());
}

TEST_CASE("Geometry/RayStartingOnEdgeIgnoresIt")
{
	const Ray ray({10, 0}, {-1, 0});
	const LineSegment edge {{10, -5}, {10, 5}, {1, 0}};
	CHECK_FALSE(ray_segment_intersection(ray, edge).has_value());
}

TEST_CASE("Geometry/Reflect")
{
	const auto back = reflect({1, 0}, {-1, 0});
	CHECK(back.x == doctest::Approx(-1));
	CHECK(back.y == doctest::Approx(0));

	const auto glance = reflect(normalise({1, 1}), {0, -1});
	CHECK(glance.x == doctest::Approx(std::sqrt(0.5f)));
	CHECK(glance.y == doctest::Approx(-std::sqrt(0.5f)));
}

TEST_CASE("Geometry/BoundingEdgesFaceOutwards")
{
	const auto edges = bounding_edges({20, 20}, 10);
	for (const auto& edge : edges)
	{
		const auto midpoint = (edge.start + edge.end) * 0.5f;
		CHECK(glm::dot(midpoint - Vector2f(20, 20), edge.normal) > 0);
	}
}

TEST_CASE("Geometry/TilesOnLineBetween")
{
	const auto straight = tiles_on_line_between({0, 0}, {3, 0});
	REQUIRE(straight.size() == 2);
	CHECK(straight[0] == Vector2i(1, 0));
	CHECK(straight[1] == Vector2i(2, 0));

	CHECK(tiles_on_line_between({4, 4}, {4, 5}).empty());
	CHECK(tiles_on_line_between({4, 4}, {4, 4}).empty());
}
