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
 * @file action.h
 * The closed set of requests the game accepts from players and the AI
 */

#ifndef __INCLUDED_SRC_ACTION_H__
#define __INCLUDED_SRC_ACTION_H__

#include <optional>
#include <string>
#include <variant>

#include "lib/framework/vector.h"

#include "stats.h"

/// What the selected character is doing
enum class CHARACTER_STATE
{
	AWAITING,
	MOVING,
	AIMING,
	THROWING_GRENADE,
	COUNT // MUST BE LAST
};

/// Place a squad member during the placement phase
struct PlaceCharacter
{
	Vector2i tile {0, 0};

	/// Falls back to the team's placement class when empty
	std::optional<CLASS_TYPE> class_type;
};

/// Select a squad member of the active team by squad index
struct SelectCharacter
{
	int index = 0;
};

struct SelectCharacterState
{
	CHARACTER_STATE state = CHARACTER_STATE::AWAITING;
};

/// Pick a tile from the legal tile set: a move, a grenade target or a placement
struct SelectTile
{
	Vector2i tile {0, 0};
};

struct Aim
{
	/// Clockwise from the positive x axis
	float angle_radians = 0;
};

struct Shoot
{
};

struct Heal
{
};

/**
 * Use an ability. A grenade with a tile is thrown at once; without one
 * the character starts choosing a tile
 */
struct UseAbility
{
	ABILITY_TYPE ability = ABILITY_TYPE::HEAL;
	std::optional<Vector2i> tile;
};

/// End the selected character's turn
struct EndTurn
{
};

using Action = std::variant<PlaceCharacter,
                            SelectCharacter,
                            SelectCharacterState,
                            SelectTile,
                            Aim,
                            Shoot,
                            Heal,
                            UseAbility,
                            EndTurn>;

/// Helper for an exhaustive std::visit over a set of lambdas
template <typename... Ts>
struct overloaded : Ts...
{
	using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string characterStateToString(CHARACTER_STATE state);

/// Human readable description of `action`, for logs
std::string actionToString(const Action& action);

#endif // __INCLUDED_SRC_ACTION_H__
