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
 * @file difficulty.cpp
 * Handles the difficulty level effects on the AI
 */

#include <numbers>

#include "difficulty.h"

DifficultyProfile difficulty_profile(AI_DIFFICULTY difficulty)
{
	using enum AI_DIFFICULTY;
	DifficultyProfile profile;
	switch (difficulty)
	{
		case WEAK:
			profile.aim_jitter_radians = std::numbers::pi_v<float> / 24;
			profile.honours_fog_of_war = true;
			profile.spawn_class = CLASS_TYPE::ASSAULT;
			break;
		case MEDIUM:
			profile.aim_jitter_radians = std::numbers::pi_v<float> / 64;
			profile.honours_fog_of_war = true;
			profile.spawn_class = CLASS_TYPE::DEMOLITION;
			break;
		case STRONG:
			profile.aim_jitter_radians = 0;
			profile.honours_fog_of_war = false;
			profile.spawn_class = CLASS_TYPE::SNIPER;
			break;
	}
	return profile;
}
