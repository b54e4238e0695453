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
 * @file level.cpp
 * Built-in levels and the level file reader
 */

#include <algorithm>

#include <nlohmann/json.hpp>

#include "lib/framework/frame.h"

#include "level.h"
#include "settings.h"

static bool contains(const std::vector<Vector2i>& tiles, Vector2i tile)
{
	return std::find(tiles.begin(), tiles.end(), tile) != tiles.end();
}

bool validate_level(const LevelData& level, const Grid& grid, int num_teams)
{
	auto valid = true;
	if (static_cast<int>(level.flags.size()) < num_teams) {
		debug(LOG_ERROR, "Level \"%s\" has %zu flags for %d teams", level.name.c_str(),
		      level.flags.size(), num_teams);
		return false;
	}
	for (const auto& obstacle : level.obstacles)
	{
		if (!grid.in_bounds(obstacle)) {
			debug(LOG_ERROR, "Obstacle at %s is off the grid", to_string(obstacle).c_str());
			valid = false;
		}
	}
	for (int team = 0; team < num_teams; ++team)
	{
		const auto flag = level.flags[team];
		if (!grid.in_bounds(flag)) {
			debug(LOG_ERROR, "Flag %d at %s is off the grid", team, to_string(flag).c_str());
			valid = false;
			continue;
		}
		if (contains(level.obstacles, flag)) {
			debug(LOG_ERROR, "Flag %d at %s sits on an obstacle", team, to_string(flag).c_str());
			valid = false;
		}
		if (std::count(level.flags.begin(), level.flags.begin() + num_teams, flag) > 1) {
			debug(LOG_ERROR, "Flag %d at %s is shared with another team", team, to_string(flag).c_str());
			valid = false;
		}
		const auto neighbours = grid.adjacent_tiles(flag);
		if (std::all_of(neighbours.begin(), neighbours.end(),
		                [&](const auto& tile) { return contains(level.obstacles, tile); })) {
			debug(LOG_ERROR, "Flag %d at %s is walled in", team, to_string(flag).c_str());
			valid = false;
		}
	}
	return valid;
}

LevelData builtin_level(int index, const Grid& grid)
{
	LevelData level;
	level.name = "Built-in " + std::to_string(index + 1);

	const auto w = grid.width;
	const auto h = grid.height;
	const auto mid_x = w / 2;
	const auto mid_y = h / 2;

	level.flags = {
		{1, mid_y},
		{w - 2, mid_y},
		{mid_x, 1},
		{mid_x, h - 2},
	};

	auto add_mirrored = [&](Vector2i tile) {
		const Vector2i mirror {w - 1 - tile.x, tile.y};
		for (const auto& t : {tile, mirror})
		{
			if (grid.in_bounds(t) && !contains(level.obstacles, t) && !contains(level.flags, t)) {
				level.obstacles.push_back(t);
			}
		}
	};

	// broken wall down the middle; later levels have fewer gaps
	const auto gap = 2 + index % 3;
	for (int y = 3; y <= h - 4; ++y)
	{
		if (y % gap != 0) {
			add_mirrored({mid_x, y});
		}
	}

	// cover in front of each flag
	add_mirrored({3, mid_y - 2});
	add_mirrored({3, mid_y + 2});

	if (index >= 4) {
		for (int y = 1; y < h - 1; y += 4)
		{
			add_mirrored({w / 4, y});
		}
	}
	if (index >= 8) {
		add_mirrored({mid_x - 3, mid_y});
		add_mirrored({2, mid_y - 1});
		add_mirrored({2, mid_y + 1});
	}
	return level;
}

static std::optional<Vector2i> parse_tile(const nlohmann::json& json)
{
	if (json.is_array() && json.size() == 2) {
		return Vector2i(json[0].get<int>(), json[1].get<int>());
	}
	if (json.is_object()) {
		return Vector2i(json.at("x").get<int>(), json.at("y").get<int>());
	}
	debug(LOG_ERROR, "Expected a tile as [x, y] or {\"x\": x, \"y\": y}");
	return std::nullopt;
}

static std::optional<std::vector<Vector2i>> parse_tiles(const nlohmann::json& json)
{
	std::vector<Vector2i> tiles;
	for (const auto& entry : json)
	{
		const auto tile = parse_tile(entry);
		if (!tile) {
			return std::nullopt;
		}
		tiles.push_back(*tile);
	}
	return tiles;
}

std::optional<LevelData> parse_level(const nlohmann::json& json)
{
	if (!json.is_object()) {
		debug(LOG_ERROR, "Level must be a JSON object");
		return std::nullopt;
	}
	LevelData level;
	try
	{
		level.name = json.value("name", std::string("Custom"));
		if (json.contains("obstacles")) {
			auto obstacles = parse_tiles(json.at("obstacles"));
			if (!obstacles) {
				return std::nullopt;
			}
			level.obstacles = std::move(*obstacles);
		}
		auto flags = parse_tiles(json.at("flags"));
		if (!flags) {
			return std::nullopt;
		}
		level.flags = std::move(*flags);
	}
	catch (const nlohmann::json::exception& e)
	{
		debug(LOG_ERROR, "Malformed level: %s", e.what());
		return std::nullopt;
	}
	debug(LOG_SAVE, "Level \"%s\": %zu obstacles, %zu flags", level.name.c_str(),
	      level.obstacles.size(), level.flags.size());
	return level;
}

std::optional<LevelData> load_level_file(const std::string& filename)
{
	const auto json = parse_json_file(filename);
	if (!json) {
		return std::nullopt;
	}
	return parse_level(*json);
}
