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
 * @file ai.h
 * Computer player: picks one action at a time for its team
 */

#ifndef __INCLUDED_SRC_AI_H__
#define __INCLUDED_SRC_AI_H__

#include <deque>
#include <optional>
#include <random>
#include <vector>

#include "action.h"
#include "difficulty.h"
#include "game.h"

/// Cost of one enemy sightline on a tile, in steps of distance
static constexpr auto WEIGHT_EXPOSURE = 4;

class Ai
{
public:
	Ai(int team, AI_DIFFICULTY difficulty, unsigned seed);

	[[nodiscard]] int get_team() const noexcept;
	[[nodiscard]] const DifficultyProfile& get_profile() const noexcept;

	/**
	 * The next action for this team. Plans a short sequence for the
	 * selected character and hands it out one action per call; the plan
	 * is dropped when the selection or phase changes
	 */
	[[nodiscard]] Action next_action(const Game& game);

private:
	void plan(const Game& game);
	void plan_placement(const Game& game);
	void plan_combat(const Game& game, const Character& character);

	/// Enemies this team may react to, honouring fog of war where the profile does
	[[nodiscard]] std::vector<const Character*> scan_enemies(const Game& game) const;

	/// Tile the character should head for
	[[nodiscard]] Vector2i objective(const GameState& state, const Character& character) const;

	[[nodiscard]] const Character* pick_shot_target(const GameState& state,
	                                                const Character& shooter,
	                                                const std::vector<const Character*>& enemies) const;

	[[nodiscard]] std::optional<Vector2i> pick_grenade_tile(const GameState& state,
	                                                        const Character& thrower,
	                                                        const std::vector<const Character*>& enemies) const;

	float jitter();

	int team;
	DifficultyProfile profile;
	std::mt19937 rng;
	std::deque<Action> queue;

	/* What the queue was planned for */
	GAME_PHASE planned_phase = GAME_PHASE::CHARACTER_PLACEMENT;
	std::optional<int> planned_character;
};

/**
 * Number of `enemies` with a clear line to `tile`, looking through
 * `world`
 */
[[nodiscard]] int exposure(const TargetingWorld& world,
                           const std::vector<const Character*>& enemies,
                           Vector2i tile);

#endif // __INCLUDED_SRC_AI_H__
