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

#include <algorithm>

#include <doctest/doctest.h>

#include "lib/framework/frame.h"

#include "src/map.h"

TEST_CASE("Grid/CanvasConversion")
{
	const Grid grid;
	CHECK(grid.width == DEFAULT_TILES_WIDE);
	CHECK(grid.height == DEFAULT_TILES_TALL);

	CHECK(grid.canvas_from_tile({2, 3}) == Vector2f(80, 120));
	CHECK(grid.tile_center({2, 3}) == Vector2f(100, 140));
	CHECK(grid.tile_from_canvas({79.9f, 120}) == Vector2i(1, 3));
	CHECK(grid.tile_from_canvas({-0.5f, 0}) == Vector2i(-1, 0));
}

TEST_CASE("Grid/AdjacentTilesStayInBounds")
{
	const Grid grid(4, 3);
	const auto corner = grid.adjacent_tiles({0, 0});
	CHECK(corner.size() == 2);

	const auto middle = grid.adjacent_tiles({1, 1});
	REQUIRE(middle.size() == 4);
	CHECK(middle[0] == Vector2i(1, 0));
	CHECK(middle[1] == Vector2i(1, 2));
	CHECK(middle[2] == Vector2i(0, 1));
	CHECK(middle[3] == Vector2i(2, 1));
}

TEST_CASE("Grid/TileIndexRoundTrip")
{
	const Grid grid(5, 4);
	CHECK(grid.tile_count() == 20);
	CHECK(grid.tile_index({3, 2}) == 13);
	CHECK(grid.tile_at_index(13) == Vector2i(3, 2));
	CHECK(grid.clip_tile({-3, 9}) == Vector2i(0, 3));
}

TEST_CASE("Grid/BorderNormalsPointInwards")
{
	const Grid grid(5, 4);
	const Vector2f centre(grid.canvas_width() / 2, grid.canvas_height() / 2);
	for (const auto& edge : grid.border_edges())
	{
		const auto midpoint = (edge.start + edge.end) * 0.5f;
		CHECK(glm::dot(centre - midpoint, edge.normal) > 0);
	}
}
