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
 * @file action.cpp
 * Action descriptions
 */

#include <array>

#include <fmt/format.h>

#include "lib/framework/frame.h"

#include "action.h"

std::string characterStateToString(CHARACTER_STATE state)
{
	static std::array<std::string,
    static_cast<size_t>(CHARACTER_STATE::COUNT) + 1> name {
		"AWAITING",
		"MOVING",
		"AIMING",
		"THROWING_GRENADE",
		"COUNT"
	};
	return name[static_cast<size_t>(state)];
}

std::string actionToString(const Action& action)
{
	return std::visit(overloaded {
		[](const PlaceCharacter& a) {
			return fmt::format("PLACE_CHARACTER {} {}", to_string(a.tile),
			                   a.class_type ? class_type_name(*a.class_type) : "default");
		},
		[](const SelectCharacter& a) { return fmt::format("SELECT_CHARACTER {}", a.index); },
		[](const SelectCharacterState& a) {
			return "SELECT_CHARACTER_STATE " + characterStateToString(a.state);
		},
		[](const SelectTile& a) { return "SELECT_TILE " + to_string(a.tile); },
		[](const Aim& a) { return fmt::format("AIM {:.3f}", a.angle_radians); },
		[](const Shoot&) { return std::string("SHOOT"); },
		[](const Heal&) { return std::string("HEAL"); },
		[](const UseAbility& a) {
			return fmt::format("USE_ABILITY {} {}",
			                   a.ability == ABILITY_TYPE::HEAL ? "heal" : "grenade",
			                   a.tile ? to_string(*a.tile) : "-");
		},
		[](const EndTurn&) { return std::string("END_TURN"); },
	}, action);
}
