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
 * @file settings.cpp
 * Match configuration and its JSON reader
 */

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "lib/framework/frame.h"

#include "settings.h"

static std::string lowercase(std::string str)
{
	std::transform(str.begin(), str.end(), str.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return str;
}

bool is_ai_team(const GameSettings& settings, int team)
{
	switch (settings.match_type)
	{
		case MATCH_TYPE::PLAYER_VS_PLAYER_LOCAL: return false;
		case MATCH_TYPE::PLAYER_VS_AI: return team != 0;
		case MATCH_TYPE::AI_VS_AI: return true;
	}
	return false;
}

int squad_size(const GameSettings& settings, int team)
{
	if (team < 0 || team >= static_cast<int>(settings.team_squad_sizes.size())) {
		return DEFAULT_SQUAD_SIZE;
	}
	return settings.team_squad_sizes[team];
}

ClassTable make_class_table(const GameSettings& settings)
{
	ClassTable table;
	for (const auto& stats : settings.class_overrides)
	{
		table.set(stats);
	}
	return table;
}

bool validate_settings(const GameSettings& settings)
{
	auto valid = true;
	if (settings.num_teams < 2 || settings.num_teams > MAX_TEAMS) {
		debug(LOG_ERROR, "num_teams must be between 2 and %d, got %d", MAX_TEAMS, settings.num_teams);
		valid = false;
	}
	for (int team = 0; team < settings.num_teams; ++team)
	{
		const auto size = squad_size(settings, team);
		if (size < 1 || size > MAX_SQUAD_SIZE) {
			debug(LOG_ERROR, "Squad size for team %d must be between 1 and %d, got %d",
			      team, MAX_SQUAD_SIZE, size);
			valid = false;
		}
	}
	if (settings.max_spawn_distance_from_flag < 1) {
		debug(LOG_ERROR, "max_spawn_distance_from_flag must be positive, got %d",
		      settings.max_spawn_distance_from_flag);
		valid = false;
	}
	if (settings.grid_width < 2 || settings.grid_height < 2) {
		debug(LOG_ERROR, "Grid %dx%d is too small", settings.grid_width, settings.grid_height);
		valid = false;
	}
	return valid;
}

const char* difficulty_name(AI_DIFFICULTY difficulty)
{
	switch (difficulty)
	{
		case AI_DIFFICULTY::WEAK: return "weak";
		case AI_DIFFICULTY::MEDIUM: return "medium";
		case AI_DIFFICULTY::STRONG: return "strong";
	}
	return "unknown";
}

std::optional<AI_DIFFICULTY> difficulty_from_name(const std::string& name)
{
	const auto lower = lowercase(name);
	for (const auto difficulty : {AI_DIFFICULTY::WEAK, AI_DIFFICULTY::MEDIUM, AI_DIFFICULTY::STRONG})
	{
		if (lower == difficulty_name(difficulty)) {
			return difficulty;
		}
	}
	return std::nullopt;
}

static std::optional<MATCH_TYPE> match_type_from_name(const std::string& name)
{
	const auto lower = lowercase(name);
	if (lower == "player_vs_player") return MATCH_TYPE::PLAYER_VS_PLAYER_LOCAL;
	if (lower == "player_vs_ai") return MATCH_TYPE::PLAYER_VS_AI;
	if (lower == "ai_vs_ai") return MATCH_TYPE::AI_VS_AI;
	return std::nullopt;
}

std::optional<nlohmann::json> parse_json_file(const std::string& filename)
{
	std::ifstream file(filename);
	if (!file) {
		debug(LOG_ERROR, "Unable to open %s", filename.c_str());
		return std::nullopt;
	}
	std::stringstream contents;
	contents << file.rdbuf();
	debug(LOG_SAVE, "Parsing %s", filename.c_str());

	auto json = nlohmann::json::parse(contents.str(), nullptr, false);
	if (json.is_discarded()) {
		debug(LOG_ERROR, "%s is not valid JSON", filename.c_str());
		return std::nullopt;
	}
	return json;
}

static std::optional<Ability> parse_ability(const nlohmann::json& json)
{
	const auto type = lowercase(json.at("type").get<std::string>());
	Ability ability;
	if (type == "heal") {
		ability.effect = HealAbility{json.value("heal_amount", 3.0f)};
		ability.is_free = json.value("free", true);
	} else if (type == "grenade") {
		SplashDamage splash;
		splash.damage = json.value("damage", 8.0f);
		splash.blast_radius = json.value("blast_radius", 1);
		splash.falloff = json.value("falloff", 0.5f);
		ability.effect = GrenadeAbility{splash, json.value("max_range", 4)};
		ability.is_free = json.value("free", false);
	} else {
		debug(LOG_ERROR, "Unknown ability type \"%s\"", type.c_str());
		return std::nullopt;
	}
	ability.max_uses = json.value("max_uses", 0);
	ability.cooldown_turns = json.value("cooldown_turns", 0);
	return ability;
}

std::optional<CharacterClass> parse_character_class(const nlohmann::json& json)
{
	try
	{
		const auto name = json.at("type").get<std::string>();
		const auto type = class_type_from_name(name);
		if (!type) {
			debug(LOG_ERROR, "Unknown class \"%s\"", name.c_str());
			return std::nullopt;
		}

		auto stats = default_class(*type);
		stats.max_health = json.value("max_health", stats.max_health);
		stats.max_moves_per_turn = json.value("max_moves_per_turn", stats.max_moves_per_turn);

		auto& gun = stats.gun;
		gun.can_fire_after_moving = json.value("can_fire_after_moving", gun.can_fire_after_moving);
		gun.aim_indicator_length = json.value("aim_indicator_length", gun.aim_indicator_length);
		if (json.contains("splash")) {
			const auto& splash = json.at("splash");
			gun.projectile = SplashDamage{splash.value("damage", 0.0f),
			                              splash.value("blast_radius", 0),
			                              splash.value("falloff", 1.0f)};
		} else if (json.contains("damage") || json.contains("ricochets")) {
			gun.projectile = Bullet{json.value("damage", base_damage(gun.projectile)),
			                        json.value("ricochets", ricochet_budget(gun.projectile))};
		}
		if (json.contains("spray")) {
			const auto& spray = json.at("spray");
			gun.spray = Spray{spray.value("projectiles", 1), spray.value("offset_angle", 0.0f)};
		}
		if (json.contains("abilities")) {
			stats.abilities.clear();
			for (const auto& entry : json.at("abilities"))
			{
				auto ability = parse_ability(entry);
				if (!ability) {
					return std::nullopt;
				}
				stats.abilities.push_back(*ability);
			}
		}

		if (stats.max_health <= 0 || stats.max_moves_per_turn < 0) {
			debug(LOG_ERROR, "Class \"%s\" needs positive health and non-negative moves", name.c_str());
			return std::nullopt;
		}
		return stats;
	}
	catch (const nlohmann::json::exception& e)
	{
		debug(LOG_ERROR, "Malformed class definition: %s", e.what());
		return std::nullopt;
	}
}

std::optional<GameSettings> parse_settings(const nlohmann::json& json)
{
	if (!json.is_object()) {
		debug(LOG_ERROR, "Settings must be a JSON object");
		return std::nullopt;
	}

	GameSettings settings;
	try
	{
		if (json.contains("match_type")) {
			const auto name = json.at("match_type").get<std::string>();
			const auto type = match_type_from_name(name);
			if (!type) {
				debug(LOG_ERROR, "Unknown match type \"%s\"", name.c_str());
				return std::nullopt;
			}
			settings.match_type = *type;
		}
		if (json.contains("ai_difficulty")) {
			const auto name = json.at("ai_difficulty").get<std::string>();
			const auto difficulty = difficulty_from_name(name);
			if (!difficulty) {
				debug(LOG_ERROR, "Unknown AI difficulty \"%s\"", name.c_str());
				return std::nullopt;
			}
			settings.ai_difficulty = *difficulty;
		}
		settings.num_teams = json.value("num_teams", settings.num_teams);
		if (json.contains("team_squad_sizes")) {
			settings.team_squad_sizes = json.at("team_squad_sizes").get<std::vector<int>>();
		} else {
			settings.team_squad_sizes.assign(static_cast<std::size_t>(std::max(settings.num_teams, 0)),
			                                 DEFAULT_SQUAD_SIZE);
		}
		settings.max_spawn_distance_from_flag = json.value("max_spawn_distance_from_flag",
		                                                   settings.max_spawn_distance_from_flag);
		settings.has_fog_of_war = json.value("fog_of_war", settings.has_fog_of_war);
		settings.grid_width = json.value("grid_width", settings.grid_width);
		settings.grid_height = json.value("grid_height", settings.grid_height);
		settings.seed = json.value("seed", settings.seed);

		if (json.contains("placement_classes")) {
			for (const auto& name : json.at("placement_classes").get<std::vector<std::string>>())
			{
				const auto type = class_type_from_name(name);
				if (!type) {
					debug(LOG_ERROR, "Unknown class \"%s\"", name.c_str());
					return std::nullopt;
				}
				settings.team_placement_classes.push_back(*type);
			}
		}
		if (json.contains("classes")) {
			for (const auto& entry : json.at("classes"))
			{
				auto stats = parse_character_class(entry);
				if (!stats) {
					return std::nullopt;
				}
				settings.class_overrides.push_back(*stats);
			}
		}
	}
	catch (const nlohmann::json::exception& e)
	{
		debug(LOG_ERROR, "Malformed settings: %s", e.what());
		return std::nullopt;
	}

	if (!validate_settings(settings)) {
		return std::nullopt;
	}
	return settings;
}

std::optional<GameSettings> load_settings_file(const std::string& filename)
{
	const auto json = parse_json_file(filename);
	if (!json) {
		return std::nullopt;
	}
	return parse_settings(*json);
}
