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
 * @file level.h
 * Static level data: obstacles and flag positions
 */

#ifndef __INCLUDED_SRC_LEVEL_H__
#define __INCLUDED_SRC_LEVEL_H__

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "lib/framework/vector.h"

#include "map.h"

struct LevelData
{
	std::string name;
	std::vector<Vector2i> obstacles;

	/// Starting flag tile per team, indexed by team
	std::vector<Vector2i> flags;
};

/**
 * Check a level against a grid and team count, logging every problem
 *
 * @return `false` if flags are missing, off the grid, shared or walled in
 */
[[nodiscard]] bool validate_level(const LevelData& level, const Grid& grid, int num_teams);

/// A symmetric level for `index` sized to `grid`; used by the campaign and as the default
[[nodiscard]] LevelData builtin_level(int index, const Grid& grid);

/**
 * Read a level from JSON:
 * `{"name": "...", "obstacles": [[x, y], ...], "flags": [[x, y], [x, y]]}`
 */
std::optional<LevelData> parse_level(const nlohmann::json& json);

std::optional<LevelData> load_level_file(const std::string& filename);

#endif // __INCLUDED_SRC_LEVEL_H__
