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
 * @file visibility.cpp
 */

#include "lib/framework/frame.h"

#include "visibility.h"

bool is_tile_visible(const TargetingWorld& world,
                     const std::vector<Character>& characters,
                     int team, Vector2i tile)
{
	for (const auto& spotter : characters)
	{
		if (!spotter.is_alive() || spotter.get_team() != team) {
			continue;
		}
		if (has_clear_line(world, spotter.get_tile(), tile, team)) {
			return true;
		}
	}
	return false;
}

std::vector<const Character*> live_enemies(const std::vector<Character>& characters, int team)
{
	std::vector<const Character*> enemies;
	for (const auto& character : characters)
	{
		if (character.is_alive() && character.get_team() != team) {
			enemies.push_back(&character);
		}
	}
	return enemies;
}

std::vector<const Character*> visible_enemies(const TargetingWorld& world,
                                              const std::vector<Character>& characters,
                                              int team)
{
	std::vector<const Character*> visible;
	for (const auto enemy : live_enemies(characters, team))
	{
		if (is_tile_visible(world, characters, team, enemy->get_tile())) {
			visible.push_back(enemy);
		}
	}
	debug(LOG_NEVER, "team %d sees %zu enemies", team, visible.size());
	return visible;
}
