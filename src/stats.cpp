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
 * @file stats.cpp
 * Built-in character class stats
 */

#include <algorithm>
#include <cctype>
#include <numbers>

#include "lib/framework/frame.h"

#include "map.h"
#include "stats.h"

ABILITY_TYPE ability_type(const Ability& ability)
{
	using enum ABILITY_TYPE;
	return std::holds_alternative<HealAbility>(ability.effect) ? HEAL : THROW_GRENADE;
}

CharacterClass default_class(CLASS_TYPE type)
{
	CharacterClass stats;
	stats.type = type;
	switch (type)
	{
		case CLASS_TYPE::SCOUT:
			stats.max_health = 8;
			stats.max_moves_per_turn = 6;
			stats.gun.projectile = Bullet{3, 0};
			stats.gun.aim_indicator_length = TILE_SIZE * 2.0f;
			stats.gun.spray = Spray{3, std::numbers::pi_v<float> / 24};
			break;
		case CLASS_TYPE::ASSAULT:
			stats.max_health = 10;
			stats.max_moves_per_turn = 4;
			stats.gun.projectile = Bullet{4, 1};
			stats.gun.aim_indicator_length = TILE_SIZE * 3.0f;
			stats.abilities.push_back({HealAbility{3}, true, 2, 2});
			break;
		case CLASS_TYPE::SNIPER:
			stats.max_health = 6;
			stats.max_moves_per_turn = 3;
			stats.gun.projectile = Bullet{8, 2};
			stats.gun.can_fire_after_moving = false;
			stats.gun.aim_indicator_length = TILE_SIZE * 8.0f;
			break;
		case CLASS_TYPE::DEMOLITION:
			stats.max_health = 10;
			stats.max_moves_per_turn = 4;
			stats.gun.projectile = Bullet{3, 0};
			stats.gun.aim_indicator_length = TILE_SIZE * 2.0f;
			stats.abilities.push_back({GrenadeAbility{SplashDamage{8, 1, 0.5f}, 4}, false, 0, 2});
			break;
		case CLASS_TYPE::COUNT:
			ASSERT(false, "Invalid class type");
			break;
	}
	return stats;
}

ClassTable::ClassTable()
{
	for (std::size_t i = 0; i < NUM_CLASS_TYPES; ++i)
	{
		classes[i] = default_class(static_cast<CLASS_TYPE>(i));
	}
}

const CharacterClass& ClassTable::get(CLASS_TYPE type) const
{
	const auto index = static_cast<std::size_t>(type);
	ASSERT_OR_RETURN(classes[0], index < NUM_CLASS_TYPES, "Invalid class type %zu", index);
	return classes[index];
}

void ClassTable::set(const CharacterClass& stats)
{
	const auto index = static_cast<std::size_t>(stats.type);
	ASSERT_OR_RETURN(, index < NUM_CLASS_TYPES, "Invalid class type %zu", index);
	classes[index] = stats;
}

const char* class_type_name(CLASS_TYPE type)
{
	switch (type)
	{
		case CLASS_TYPE::SCOUT: return "scout";
		case CLASS_TYPE::ASSAULT: return "assault";
		case CLASS_TYPE::SNIPER: return "sniper";
		case CLASS_TYPE::DEMOLITION: return "demolition";
		case CLASS_TYPE::COUNT: break;
	}
	return "unknown";
}

std::optional<CLASS_TYPE> class_type_from_name(const std::string& name)
{
	std::string lower = name;
	std::transform(lower.begin(), lower.end(), lower.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	for (std::size_t i = 0; i < NUM_CLASS_TYPES; ++i)
	{
		const auto type = static_cast<CLASS_TYPE>(i);
		if (lower == class_type_name(type)) {
			return type;
		}
	}
	return std::nullopt;
}
