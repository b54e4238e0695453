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
 * @file loop.h
 * Headless host loop: drives a match frame by frame and feeds AI actions
 */

#ifndef __INCLUDED_SRC_LOOP_H__
#define __INCLUDED_SRC_LOOP_H__

#include <cstddef>
#include <vector>

#include "ai.h"
#include "game.h"

enum class GAME_CODE
{
	CONTINUE,
	GAME_OVER,
	WAITING_FOR_INPUT, /**< a human team is to act */
	OUT_OF_TICKS,
	STALLED /**< the AI could not even end its turn */
};

/// Rejected AI actions tolerated in a row before the character's turn is ended for it
static constexpr auto MAX_REJECTED_ACTIONS = 8;

static constexpr std::size_t DEFAULT_MAX_TICKS = 200000;

std::string gameCodeToString(GAME_CODE code);

class GameLoop
{
public:
	/// Creates an AI for every team `game`'s settings hand to the computer
	GameLoop(Game& game, std::size_t max_ticks = DEFAULT_MAX_TICKS);

	/**
	 * Advance the match by `elapsed_ms`. When nothing is animating and the
	 * active team is computer controlled, asks its AI for exactly one action
	 */
	GAME_CODE tick(float elapsed_ms);

	/// Tick at FRAME_TIME_MS until something other than CONTINUE comes back
	GAME_CODE run();

	[[nodiscard]] std::size_t get_tick_count() const noexcept;
	[[nodiscard]] std::size_t get_action_count() const noexcept;

private:
	[[nodiscard]] Ai* ai_for(int team);

	Game& game;
	std::vector<Ai> ais;
	std::size_t max_ticks;
	std::size_t ticks = 0;
	std::size_t actions = 0;
	int rejections = 0;
};

#endif // __INCLUDED_SRC_LOOP_H__
