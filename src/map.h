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
 * @file map.h
 * Constants and utilities for the tile grid. Holds no map state.
 */

#ifndef __INCLUDED_SRC_MAP_H__
#define __INCLUDED_SRC_MAP_H__

#include <array>
#include <vector>

#include "lib/framework/vector.h"

#include "geometry.h"

/// Width of one tile in canvas units
static constexpr auto TILE_SIZE = 40;
static constexpr auto HALF_TILE = TILE_SIZE / 2.0f;

static constexpr auto DEFAULT_TILES_WIDE = 24;
static constexpr auto DEFAULT_TILES_TALL = 16;

/**
 * Conversion table from direction to offset.
 * Order is up, down, left, right
 */
constexpr Vector2i orthogonal_offset[] =
{
  Vector2i(0, -1),
  Vector2i(0, 1),
  Vector2i(-1, 0),
  Vector2i(1, 0),
};

/// @return the top-left canvas corner of `tile`. Grid size does not matter
[[nodiscard]] Vector2f world_coord(Vector2i tile);

/// @return the canvas position of the centre of `tile`
[[nodiscard]] Vector2f world_center(Vector2i tile);

struct Grid
{
	Grid() = default;
	Grid(int tiles_wide, int tiles_tall);

	/// @return the top-left canvas corner of `tile`
	[[nodiscard]] Vector2f canvas_from_tile(Vector2i tile) const;

	/// @return the canvas position of the centre of `tile`
	[[nodiscard]] Vector2f tile_center(Vector2i tile) const;

	/// @return the tile containing `canvas`. May be out of bounds
	[[nodiscard]] Vector2i tile_from_canvas(Vector2f canvas) const;

	/// @return `true` if `tile` exists on the grid
	[[nodiscard]] bool in_bounds(Vector2i tile) const noexcept;

	/// @return `true` if `canvas` lies inside the play area
	[[nodiscard]] bool canvas_in_bounds(Vector2f canvas) const noexcept;

	/// The in-bounds orthogonal neighbours of `tile`
	[[nodiscard]] std::vector<Vector2i> adjacent_tiles(Vector2i tile) const;

	/// Row-major index of `tile`; `tile` must be in bounds
	[[nodiscard]] int tile_index(Vector2i tile) const noexcept;

	[[nodiscard]] Vector2i tile_at_index(int index) const noexcept;

	[[nodiscard]] int tile_count() const noexcept;

	/// Clamp `tile` onto the grid
	[[nodiscard]] Vector2i clip_tile(Vector2i tile) const;

	/**
	 * The edges of the play area with normals pointing inwards, so that
	 * a ray leaving the grid strikes their front face
	 */
	[[nodiscard]] std::array<LineSegment, 4> border_edges() const;

	[[nodiscard]] float canvas_width() const noexcept;
	[[nodiscard]] float canvas_height() const noexcept;

	int width = DEFAULT_TILES_WIDE;
	int height = DEFAULT_TILES_TALL;
};

#endif // __INCLUDED_SRC_MAP_H__
