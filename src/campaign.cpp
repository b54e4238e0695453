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
 * @file campaign.cpp
 */

#include "lib/framework/frame.h"

#include "campaign.h"

/// Unlocks every level regardless of progress
static constexpr auto UNLOCK_ALL = false;

const std::vector<CampaignLevel>& campaign_levels()
{
	using enum AI_DIFFICULTY;
	static const std::vector<CampaignLevel> levels {
		{0, "Starting grounds", {4, 4}, true, WEAK},
		{1, "Getting tougher", {3, 5}, UNLOCK_ALL, WEAK},
		{2, "Protect it", {4, 8}, UNLOCK_ALL, WEAK},
		{3, "Snag it", {4, 8}, UNLOCK_ALL, WEAK},
		{4, "Familiar", {4, 8}, UNLOCK_ALL, MEDIUM},
		{5, "Snarls", {4, 8}, UNLOCK_ALL, MEDIUM},
		{6, "To snag...", {4, 8}, UNLOCK_ALL, MEDIUM},
		{7, "Or be snagged...", {4, 8}, true, STRONG},
		{8, "Snag and tag", {4, 8}, UNLOCK_ALL, STRONG},
		{9, "Flag of snag", {4, 8}, UNLOCK_ALL, STRONG},
		{10, "Frag and flag", {4, 8}, UNLOCK_ALL, STRONG},
		{11, "Final snag", {4, 8}, UNLOCK_ALL, STRONG},
	};
	return levels;
}

const CampaignLevel* campaign_level(int index)
{
	const auto& levels = campaign_levels();
	if (index < 0 || index >= static_cast<int>(levels.size())) {
		debug(LOG_ERROR, "No campaign level %d; there are %zu", index, levels.size());
		return nullptr;
	}
	return &levels[index];
}

GameSettings campaign_settings(const CampaignLevel& entry, MATCH_TYPE match_type)
{
	GameSettings settings;
	settings.match_type = match_type;
	settings.num_teams = static_cast<int>(entry.squad_sizes.size());
	settings.team_squad_sizes = entry.squad_sizes;
	settings.ai_difficulty = entry.ai_difficulty;
	return settings;
}

LevelData campaign_level_data(const CampaignLevel& entry, const Grid& grid)
{
	auto level = builtin_level(entry.level_index, grid);
	level.name = entry.name;
	return level;
}
