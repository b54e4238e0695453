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
 * @file settings.h
 * Match configuration, consumed once when a match is reset
 */

#ifndef __INCLUDED_SRC_SETTINGS_H__
#define __INCLUDED_SRC_SETTINGS_H__

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "map.h"
#include "stats.h"

enum class MATCH_TYPE
{
	PLAYER_VS_PLAYER_LOCAL,
	PLAYER_VS_AI,
	AI_VS_AI
};

enum class AI_DIFFICULTY
{
	WEAK,
	MEDIUM,
	STRONG
};

static constexpr auto DEFAULT_SQUAD_SIZE = 4;

struct GameSettings
{
	MATCH_TYPE match_type = MATCH_TYPE::PLAYER_VS_PLAYER_LOCAL;

	/// Squad size per team, indexed by team
	std::vector<int> team_squad_sizes {DEFAULT_SQUAD_SIZE, DEFAULT_SQUAD_SIZE};

	AI_DIFFICULTY ai_difficulty = AI_DIFFICULTY::WEAK;

	/// Manhattan distance from the flag at which squad members may be placed
	int max_spawn_distance_from_flag = 8;

	int num_teams = 2;
	bool has_fog_of_war = false;
	int grid_width = DEFAULT_TILES_WIDE;
	int grid_height = DEFAULT_TILES_TALL;

	/// Seeds the AI's random aim jitter
	unsigned seed = 0;

	/// Class used when a placement does not name one, indexed by team.
	/// Teams without an entry place assault troops
	std::vector<CLASS_TYPE> team_placement_classes;

	/// Replacements for the built-in class stats
	std::vector<CharacterClass> class_overrides;
};

/// @return `true` if `team` is played by the AI under `settings`
[[nodiscard]] bool is_ai_team(const GameSettings& settings, int team);

[[nodiscard]] int squad_size(const GameSettings& settings, int team);

/// @return the class table for `settings`, built-ins plus overrides
[[nodiscard]] ClassTable make_class_table(const GameSettings& settings);

/// Log every problem with `settings`
[[nodiscard]] bool validate_settings(const GameSettings& settings);

[[nodiscard]] const char* difficulty_name(AI_DIFFICULTY difficulty);
[[nodiscard]] std::optional<AI_DIFFICULTY> difficulty_from_name(const std::string& name);

/// Read a file into a JSON document. Logs and returns nothing on failure
std::optional<nlohmann::json> parse_json_file(const std::string& filename);

/**
 * Read settings from a JSON object. Missing keys keep their defaults.
 * Recognised keys: "match_type", "team_squad_sizes", "ai_difficulty",
 * "max_spawn_distance_from_flag", "num_teams", "fog_of_war",
 * "grid_width", "grid_height", "seed", "placement_classes", "classes"
 */
std::optional<GameSettings> parse_settings(const nlohmann::json& json);

std::optional<GameSettings> load_settings_file(const std::string& filename);

/// Read one class override: "type" is required, other keys default to the built-in stats
std::optional<CharacterClass> parse_character_class(const nlohmann::json& json);

#endif // __INCLUDED_SRC_SETTINGS_H__
