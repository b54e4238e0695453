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
 * @file combat.h
 * Interface to the combat routines
 */

#ifndef __INCLUDED_SRC_COMBAT_H__
#define __INCLUDED_SRC_COMBAT_H__

#include <optional>
#include <vector>

#include "lib/framework/vector.h"

#include "character.h"
#include "map.h"
#include "targeting.h"
#include "weapon.h"

/// What one impact did to one character
struct DamageReport
{
	int character_id = 0;
	float amount = 0;
	bool killed = false;
};

/* Damage the live character struck by `target`. Does nothing for non-character targets */
std::optional<DamageReport> apply_direct_damage(std::vector<Character>& characters,
                                                const Target& target, float damage);

/* The tiles caught in a blast at `centre`: the centre plus everything within `radius` steps */
std::vector<Vector2i> splash_tiles(const Grid& grid, Vector2i centre, int radius);

/* Damage every live character caught in a blast, friend or foe */
std::vector<DamageReport> apply_splash_damage(const Grid& grid, std::vector<Character>& characters,
                                              Vector2i centre, const SplashDamage& splash);

/* Damage a character at `distance` steps from a blast centre would take */
float splash_damage_at(const SplashDamage& splash, int distance);

#endif // __INCLUDED_SRC_COMBAT_H__
