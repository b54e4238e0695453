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
 * @file visibility.h
 * Fog of war: which enemies a team can currently see
 */

#ifndef __INCLUDED_SRC_VISIBILITY_H__
#define __INCLUDED_SRC_VISIBILITY_H__

#include <vector>

#include "character.h"
#include "targeting.h"

/**
 * @return `true` if any live member of `team` has a clear line to `tile`.
 *   Members standing on `tile` count
 */
[[nodiscard]] bool is_tile_visible(const TargetingWorld& world,
                                   const std::vector<Character>& characters,
                                   int team, Vector2i tile);

/// Live enemies of `team` that at least one live team member can see
[[nodiscard]] std::vector<const Character*> visible_enemies(const TargetingWorld& world,
                                                            const std::vector<Character>& characters,
                                                            int team);

/// Every live enemy of `team`, seen or not
[[nodiscard]] std::vector<const Character*> live_enemies(const std::vector<Character>& characters,
                                                         int team);

#endif // __INCLUDED_SRC_VISIBILITY_H__
