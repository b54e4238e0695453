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
 * @file combat.cpp
 * Combat mechanics routines.
 */

#include <algorithm>
#include <cmath>

#include "lib/framework/frame.h"

#include "combat.h"
#include "pathfinding.h"

static Character* find_live_character(std::vector<Character>& characters, int id)
{
	for (auto& character : characters)
	{
		if (character.get_id() == id && character.is_alive()) {
			return &character;
		}
	}
	return nullptr;
}

static DamageReport damage_character(Character& character, float damage)
{
	const auto killed = character.take_damage(damage);
	debug(LOG_ATTACK, "character %d (team %d) takes %.2f damage, %.2f left",
	      character.get_id(), character.get_team(), damage, character.get_health());
	if (killed) {
		debug(LOG_DEATH, "character %d (team %d) killed at %s", character.get_id(),
		      character.get_team(), to_string(character.get_tile()).c_str());
	}
	return {character.get_id(), damage, killed};
}

std::optional<DamageReport> apply_direct_damage(std::vector<Character>& characters,
                                                const Target& target, float damage)
{
	if (target.kind != TARGET_KIND::CHARACTER) {
		return std::nullopt;
	}
	ASSERT_OR_RETURN(std::nullopt, target.character_id.has_value(), "Character target without an id at %s",
	                 to_string(target.tile).c_str());

	auto character = find_live_character(characters, *target.character_id);
	ASSERT_OR_RETURN(std::nullopt, character != nullptr && character->get_tile() == target.tile,
	                 "No live character %d at %s", *target.character_id, to_string(target.tile).c_str());
	return damage_character(*character, damage);
}

std::vector<Vector2i> splash_tiles(const Grid& grid, Vector2i centre, int radius)
{
	std::vector<Vector2i> tiles;
	if (grid.in_bounds(centre)) {
		tiles.push_back(centre);
	}
	const auto around = bfs(grid, centre, radius, any_tile, any_tile);
	tiles.insert(tiles.end(), around.begin(), around.end());
	return tiles;
}

float splash_damage_at(const SplashDamage& splash, int distance)
{
	if (distance > splash.blast_radius) {
		return 0;
	}
	return splash.damage * std::pow(splash.falloff, static_cast<float>(distance));
}

std::vector<DamageReport> apply_splash_damage(const Grid& grid, std::vector<Character>& characters,
                                              Vector2i centre, const SplashDamage& splash)
{
	std::vector<DamageReport> reports;
	const auto tiles = splash_tiles(grid, centre, splash.blast_radius);
	debug(LOG_ATTACK, "blast at %s covers %zu tiles", to_string(centre).c_str(), tiles.size());

	for (auto& character : characters)
	{
		if (!character.is_alive()) {
			continue;
		}
		const auto tile = character.get_tile();
		if (std::find(tiles.begin(), tiles.end(), tile) == tiles.end()) {
			continue;
		}
		const auto damage = splash_damage_at(splash, manhattan_distance(tile, centre));
		reports.push_back(damage_character(character, damage));
	}
	return reports;
}
