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

#include <nlohmann/json.hpp>

#include <doctest/doctest.h>

#include "lib/framework/frame.h"

#include "src/campaign.h"
#include "src/level.h"
#include "src/settings.h"

using nlohmann::json;

TEST_CASE("Settings/Defaults")
{
	const auto settings = parse_settings(json::object());
	REQUIRE(settings.has_value());
	CHECK(settings->match_type == MATCH_TYPE::PLAYER_VS_PLAYER_LOCAL);
	CHECK(settings->num_teams == 2);
	CHECK(settings->team_squad_sizes == std::vector<int>{DEFAULT_SQUAD_SIZE, DEFAULT_SQUAD_SIZE});
	CHECK(settings->grid_width == DEFAULT_TILES_WIDE);
	CHECK(settings->grid_height == DEFAULT_TILES_TALL);
	CHECK_FALSE(settings->has_fog_of_war);
}

TEST_CASE("Settings/ParseMatch")
{
	const auto document = json::parse(R"({
		"match_type": "Player_vs_AI",
		"ai_difficulty": "strong",
		"num_teams": 3,
		"team_squad_sizes": [2, 3, 1],
		"max_spawn_distance_from_flag": 5,
		"fog_of_war": true,
		"seed": 42,
		"placement_classes": ["sniper", "SCOUT"]
	})");
	const auto settings = parse_settings(document);
	REQUIRE(settings.has_value());
	CHECK(settings->match_type == MATCH_TYPE::PLAYER_VS_AI);
	CHECK(settings->ai_difficulty == AI_DIFFICULTY::STRONG);
	CHECK(settings->num_teams == 3);
	CHECK(squad_size(*settings, 1) == 3);
	CHECK(settings->max_spawn_distance_from_flag == 5);
	CHECK(settings->has_fog_of_war);
	CHECK(settings->seed == 42);
	REQUIRE(settings->team_placement_classes.size() == 2);
	CHECK(settings->team_placement_classes[1] == CLASS_TYPE::SCOUT);

	CHECK_FALSE(is_ai_team(*settings, 0));
	CHECK(is_ai_team(*settings, 1));
	CHECK(is_ai_team(*settings, 2));
}

TEST_CASE("Settings/RejectsBadInput")
{
	CHECK_FALSE(parse_settings(json::parse(R"({"match_type": "hotseat"})")).has_value());
	CHECK_FALSE(parse_settings(json::parse(R"({"ai_difficulty": "nightmare"})")).has_value());
	CHECK_FALSE(parse_settings(json::parse(R"({"num_teams": 1})")).has_value());
	CHECK_FALSE(parse_settings(json::parse(R"({"num_teams": 5})")).has_value());
	CHECK_FALSE(parse_settings(json::parse(R"({"team_squad_sizes": [0, 4]})")).has_value());
	CHECK_FALSE(parse_settings(json::parse(R"({"team_squad_sizes": [4, 10]})")).has_value());
	CHECK_FALSE(parse_settings(json::parse(R"({"seed": "abc"})")).has_value());
	CHECK_FALSE(parse_settings(json::parse(R"({"placement_classes": ["medic"]})")).has_value());
	CHECK_FALSE(parse_settings(json::array()).has_value());
}

TEST_CASE("Settings/ClassOverrides")
{
	const auto document = json::parse(R"({
		"classes": [
			{"type": "scout", "max_health": 12, "damage": 5},
			{"type": "demolition", "abilities": [{"type": "heal", "heal_amount": 2}]}
		]
	})");
	const auto settings = parse_settings(document);
	REQUIRE(settings.has_value());

	const auto classes = make_class_table(*settings);
	const auto& scout = classes.get(CLASS_TYPE::SCOUT);
	CHECK(scout.max_health == doctest::Approx(12));
	CHECK(base_damage(scout.gun.projectile) == doctest::Approx(5));
	CHECK(scout.max_moves_per_turn == 6);
	CHECK(scout.gun.spray.has_value());

	const auto& demolition = classes.get(CLASS_TYPE::DEMOLITION);
	REQUIRE(demolition.abilities.size() == 1);
	CHECK(ability_type(demolition.abilities[0]) == ABILITY_TYPE::HEAL);
	CHECK(demolition.abilities[0].is_free);

	CHECK(classes.get(CLASS_TYPE::SNIPER).max_health == doctest::Approx(6));

	CHECK_FALSE(parse_character_class(json::parse(R"({"max_health": 3})")).has_value());
	CHECK_FALSE(parse_character_class(json::parse(R"({"type": "sniper", "max_health": 0})")).has_value());
	CHECK_FALSE(parse_character_class(json::parse(R"({"type": "sniper", "abilities": [{"type": "jump"}]})"))
	                .has_value());
}

TEST_CASE("Settings/MissingFile")
{
	CHECK_FALSE(parse_json_file("no/such/settings.json").has_value());
	CHECK_FALSE(load_settings_file("no/such/settings.json").has_value());
	CHECK_FALSE(load_level_file("no/such/level.json").has_value());
}

TEST_CASE("Level/Parse")
{
	const auto document = json::parse(R"({
		"name": "Crossing",
		"obstacles": [[5, 5], {"x": 6, "y": 5}],
		"flags": [[1, 8], [22, 8]]
	})");
	const auto level = parse_level(document);
	REQUIRE(level.has_value());
	CHECK(level->name == "Crossing");
	REQUIRE(level->obstacles.size() == 2);
	CHECK(level->obstacles[1] == Vector2i(6, 5));
	REQUIRE(level->flags.size() == 2);
	CHECK(level->flags[1] == Vector2i(22, 8));
	CHECK(validate_level(*level, Grid(), 2));

	const auto unnamed = parse_level(json::parse(R"({"flags": [[0, 0], [1, 1]]})"));
	REQUIRE(unnamed.has_value());
	CHECK(unnamed->name == "Custom");
	CHECK(unnamed->obstacles.empty());

	CHECK_FALSE(parse_level(json::parse(R"({"obstacles": []})")).has_value());
	CHECK_FALSE(parse_level(json::parse(R"({"flags": [[1, 2, 3]]})")).has_value());
	CHECK_FALSE(parse_level(json::parse(R"({"flags": [["a", "b"]]})")).has_value());
}

TEST_CASE("Level/Validate")
{
	const Grid grid;
	LevelData level;
	level.flags = {{1, 1}, {5, 5}};
	CHECK(validate_level(level, grid, 2));
	CHECK_FALSE(validate_level(level, grid, 3));

	SUBCASE("Flag off the grid")
	{
		level.flags[1] = {24, 5};
		CHECK_FALSE(validate_level(level, grid, 2));
	}
	SUBCASE("Flag on an obstacle")
	{
		level.obstacles = {{5, 5}};
		CHECK_FALSE(validate_level(level, grid, 2));
	}
	SUBCASE("Shared flag")
	{
		level.flags[1] = {1, 1};
		CHECK_FALSE(validate_level(level, grid, 2));
	}
	SUBCASE("Walled in")
	{
		level.flags[0] = {0, 0};
		level.obstacles = {{1, 0}, {0, 1}};
		CHECK_FALSE(validate_level(level, grid, 2));
	}
	SUBCASE("Obstacle off the grid")
	{
		level.obstacles = {{-1, 3}};
		CHECK_FALSE(validate_level(level, grid, 2));
	}
}

TEST_CASE("Level/BuiltinLevelsAreMirrored")
{
	const Grid grid;
	for (int index = 0; index < 12; ++index)
	{
		CAPTURE(index);
		const auto level = builtin_level(index, grid);
		CHECK(validate_level(level, grid, 2));
		CHECK(validate_level(level, grid, MAX_TEAMS));
		for (const auto& tile : level.obstacles)
		{
			const Vector2i mirror {grid.width - 1 - tile.x, tile.y};
			CHECK(std::find(level.obstacles.begin(), level.obstacles.end(), mirror) != level.obstacles.end());
		}
	}
}

TEST_CASE("Campaign/Levels")
{
	const auto& levels = campaign_levels();
	REQUIRE(levels.size() == 12);
	CHECK(levels.front().is_unlocked);
	CHECK(levels[7].is_unlocked);
	CHECK_FALSE(levels[1].is_unlocked);
	CHECK(levels.back().ai_difficulty == AI_DIFFICULTY::STRONG);

	CHECK(campaign_level(-1) == nullptr);
	CHECK(campaign_level(12) == nullptr);
	REQUIRE(campaign_level(1) != nullptr);

	const auto settings = campaign_settings(*campaign_level(1), MATCH_TYPE::PLAYER_VS_AI);
	CHECK(settings.team_squad_sizes == std::vector<int>{3, 5});
	CHECK(settings.ai_difficulty == AI_DIFFICULTY::WEAK);
	CHECK(validate_settings(settings));

	const auto level = campaign_level_data(*campaign_level(1), Grid());
	CHECK(level.name == campaign_level(1)->name);
	CHECK(validate_level(level, Grid(), settings.num_teams));
}
