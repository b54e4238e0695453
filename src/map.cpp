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
 * @file map.cpp
 * Tile/canvas coordinate conversion
 */

#include <algorithm>
#include <cmath>

#include "lib/framework/frame.h"

#include "map.h"

Vector2f world_coord(Vector2i tile)
{
	return Vector2f(tile) * static_cast<float>(TILE_SIZE);
}

Vector2f world_center(Vector2i tile)
{
	return world_coord(tile) + Vector2f(HALF_TILE, HALF_TILE);
}

Grid::Grid(int tiles_wide, int tiles_tall)
  : width{tiles_wide}, height{tiles_tall}
{
	ASSERT(width > 0 && height > 0, "Degenerate grid %dx%d", width, height);
}

Vector2f Grid::canvas_from_tile(Vector2i tile) const
{
	return world_coord(tile);
}

Vector2f Grid::tile_center(Vector2i tile) const
{
	return world_center(tile);
}

Vector2i Grid::tile_from_canvas(Vector2f canvas) const
{
	return {static_cast<int>(std::floor(canvas.x / TILE_SIZE)),
	        static_cast<int>(std::floor(canvas.y / TILE_SIZE))};
}

bool Grid::in_bounds(Vector2i tile) const noexcept
{
	return tile.x >= 0 && tile.x < width &&
	       tile.y >= 0 && tile.y < height;
}

bool Grid::canvas_in_bounds(Vector2f canvas) const noexcept
{
	return canvas.x >= 0 && canvas.x < canvas_width() &&
	       canvas.y >= 0 && canvas.y < canvas_height();
}

std::vector<Vector2i> Grid::adjacent_tiles(Vector2i tile) const
{
	std::vector<Vector2i> result;
	result.reserve(4);
	for (const auto& offset : orthogonal_offset)
	{
		const auto adjacent = tile + offset;
		if (in_bounds(adjacent)) {
			result.push_back(adjacent);
		}
	}
	return result;
}

int Grid::tile_index(Vector2i tile) const noexcept
{
	return tile.x + tile.y * width;
}

Vector2i Grid::tile_at_index(int index) const noexcept
{
	return {index % width, index / width};
}

int Grid::tile_count() const noexcept
{
	return width * height;
}

Vector2i Grid::clip_tile(Vector2i tile) const
{
	return {std::clamp(tile.x, 0, width - 1),
	        std::clamp(tile.y, 0, height - 1)};
}

std::array<LineSegment, 4> Grid::border_edges() const
{
	const auto w = canvas_width();
	const auto h = canvas_height();
	return {
		LineSegment{{0, 0}, {w, 0}, {0, 1}},
		LineSegment{{w, 0}, {w, h}, {-1, 0}},
		LineSegment{{0, h}, {w, h}, {0, -1}},
		LineSegment{{0, 0}, {0, h}, {1, 0}},
	};
}

float Grid::canvas_width() const noexcept
{
	return static_cast<float>(width * TILE_SIZE);
}

float Grid::canvas_height() const noexcept
{
	return static_cast<float>(height * TILE_SIZE);
}
