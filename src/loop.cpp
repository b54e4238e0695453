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
 * @file loop.cpp
 * The main game loop
 */

#include <array>

#include "lib/framework/frame.h"

#include "loop.h"

std::string gameCodeToString(GAME_CODE code)
{
	static std::array<std::string, 5> name {
		"CONTINUE",
		"GAME_OVER",
		"WAITING_FOR_INPUT",
		"OUT_OF_TICKS",
		"STALLED"
	};
	return name[static_cast<size_t>(code)];
}

GameLoop::GameLoop(Game& game, std::size_t max_ticks)
  : game{game}, max_ticks{max_ticks}
{
	const auto& settings = game.get_settings();
	for (int team = 0; team < settings.num_teams; ++team)
	{
		if (is_ai_team(settings, team)) {
			ais.emplace_back(team, settings.ai_difficulty, settings.seed + static_cast<unsigned>(team));
		}
	}
}

GAME_CODE GameLoop::tick(float elapsed_ms)
{
	if (game.is_game_over()) {
		return GAME_CODE::GAME_OVER;
	}
	if (ticks >= max_ticks) {
		debug(LOG_WARNING, "Giving up after %zu ticks", ticks);
		return GAME_CODE::OUT_OF_TICKS;
	}
	++ticks;
	frameUpdate();

	game.update(elapsed_ms);
	if (game.is_game_over()) {
		return GAME_CODE::GAME_OVER;
	}
	if (game.is_animating()) {
		return GAME_CODE::CONTINUE;
	}

	auto ai = ai_for(game.get_state().current_team);
	if (ai == nullptr) {
		return GAME_CODE::WAITING_FOR_INPUT;
	}

	++actions;
	if (game.on_action(ai->next_action(game))) {
		rejections = 0;
		return game.is_game_over() ? GAME_CODE::GAME_OVER : GAME_CODE::CONTINUE;
	}

	if (++rejections < MAX_REJECTED_ACTIONS) {
		return GAME_CODE::CONTINUE;
	}
	debug(LOG_WARNING, "Team %d had %d actions rejected; ending the turn", ai->get_team(), rejections);
	rejections = 0;
	if (!game.on_action(EndTurn{})) {
		debug(LOG_ERROR, "Team %d cannot end its turn", ai->get_team());
		return GAME_CODE::STALLED;
	}
	return GAME_CODE::CONTINUE;
}

GAME_CODE GameLoop::run()
{
	auto code = GAME_CODE::CONTINUE;
	while (code == GAME_CODE::CONTINUE)
	{
		code = tick(FRAME_TIME_MS);
	}
	debug(LOG_MAIN, "Loop stopped: %s after %zu ticks and %zu actions", gameCodeToString(code).c_str(),
	      ticks, actions);
	return code;
}

std::size_t GameLoop::get_tick_count() const noexcept
{
	return ticks;
}

std::size_t GameLoop::get_action_count() const noexcept
{
	return actions;
}

Ai* GameLoop::ai_for(int team)
{
	for (auto& ai : ais)
	{
		if (ai.get_team() == team) {
			return &ai;
		}
	}
	return nullptr;
}
