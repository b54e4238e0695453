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
 * @file stats.h
 * Character classes and their abilities
 */

#ifndef __INCLUDED_SRC_STATS_H__
#define __INCLUDED_SRC_STATS_H__

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "weapon.h"

enum class ABILITY_TYPE
{
	HEAL,
	THROW_GRENADE
};

struct HealAbility
{
	float heal_amount = 0;
};

struct GrenadeAbility
{
	SplashDamage splash;

	/// Furthest tile a grenade can be thrown to, in orthogonal steps
	int max_range = 0;
};

using AbilityEffect = std::variant<HealAbility, GrenadeAbility>;

struct Ability
{
	AbilityEffect effect;

	/**
	 * Free abilities may be used alongside shooting. Using a non-free
	 * ability counts as the character's shot for the turn
	 */
	bool is_free = false;

	/// 0 means unlimited
	int max_uses = 0;

	/// Turns to wait after use before the ability is offered again
	int cooldown_turns = 0;
};

[[nodiscard]] ABILITY_TYPE ability_type(const Ability& ability);

enum class CLASS_TYPE
{
	SCOUT,
	ASSAULT,
	SNIPER,
	DEMOLITION,
	COUNT // MUST BE LAST
};

static constexpr auto NUM_CLASS_TYPES = static_cast<std::size_t>(CLASS_TYPE::COUNT);

struct CharacterClass
{
	CLASS_TYPE type = CLASS_TYPE::ASSAULT;
	float max_health = 0;
	int max_moves_per_turn = 0;
	Gun gun;
	std::vector<Ability> abilities;
};

/// Class definitions for a match, indexed by CLASS_TYPE
class ClassTable
{
public:
	/// Fills the table with the built-in classes
	ClassTable();

	[[nodiscard]] const CharacterClass& get(CLASS_TYPE type) const;

	/// Replace the definition of `stats.type`
	void set(const CharacterClass& stats);

private:
	std::array<CharacterClass, NUM_CLASS_TYPES> classes;
};

[[nodiscard]] CharacterClass default_class(CLASS_TYPE type);

[[nodiscard]] const char* class_type_name(CLASS_TYPE type);

/// Case-insensitive reverse of class_type_name
[[nodiscard]] std::optional<CLASS_TYPE> class_type_from_name(const std::string& name);

#endif // __INCLUDED_SRC_STATS_H__
