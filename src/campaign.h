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
 * @file campaign.h
 * The fixed sequence of campaign levels
 */

#ifndef __INCLUDED_SRC_CAMPAIGN_H__
#define __INCLUDED_SRC_CAMPAIGN_H__

#include <optional>
#include <string>
#include <vector>

#include "level.h"
#include "map.h"
#include "settings.h"

struct CampaignLevel
{
	/// Index of the built-in level played
	int level_index = 0;
	std::string name;

	/// Squad size per team, indexed by team
	std::vector<int> squad_sizes;

	bool is_unlocked = false;
	AI_DIFFICULTY ai_difficulty = AI_DIFFICULTY::WEAK;
};

[[nodiscard]] const std::vector<CampaignLevel>& campaign_levels();

/// @return the campaign entry at `index`, or nothing if there is none
[[nodiscard]] const CampaignLevel* campaign_level(int index);

/**
 * Settings for playing campaign level `entry` as `match_type`. Team 0 is
 * the player's squad
 */
[[nodiscard]] GameSettings campaign_settings(const CampaignLevel& entry, MATCH_TYPE match_type);

[[nodiscard]] LevelData campaign_level_data(const CampaignLevel& entry, const Grid& grid);

#endif // __INCLUDED_SRC_CAMPAIGN_H__
