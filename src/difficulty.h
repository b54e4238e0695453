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
 * @file difficulty.h
 * How hard the AI plays
 */

#ifndef __INCLUDED_SRC_DIFFICULTY_H__
#define __INCLUDED_SRC_DIFFICULTY_H__

#include "settings.h"
#include "stats.h"

struct DifficultyProfile
{
	/// Largest random error added to an aim angle, either way
	float aim_jitter_radians = 0;

	/// Only shoot at and react to enemies the team can see when fog of war is on
	bool honours_fog_of_war = true;

	/// Class placed for every squad member
	CLASS_TYPE spawn_class = CLASS_TYPE::ASSAULT;
};

[[nodiscard]] DifficultyProfile difficulty_profile(AI_DIFFICULTY difficulty);

#endif // __INCLUDED_SRC_DIFFICULTY_H__
