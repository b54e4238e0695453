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
 * @file main.cpp
 * Entry point: runs one computer versus computer match without a display
 */

#include <cstdlib>
#include <optional>
#include <utility>

#include "lib/framework/frame.h"

#include "campaign.h"
#include "command_line.h"
#include "game.h"
#include "level.h"
#include "loop.h"
#include "settings.h"

static std::optional<GameSettings> load_match_settings(const CommandLineOptions& options)
{
	GameSettings settings;
	if (options.campaign_level) {
		const auto entry = campaign_level(*options.campaign_level);
		if (entry == nullptr) {
			return std::nullopt;
		}
		settings = campaign_settings(*entry, MATCH_TYPE::AI_VS_AI);
	}
	if (options.config_file) {
		auto loaded = load_settings_file(*options.config_file);
		if (!loaded) {
			return std::nullopt;
		}
		settings = std::move(*loaded);
	}
	// nobody is at the keyboard
	settings.match_type = MATCH_TYPE::AI_VS_AI;
	if (options.seed) {
		settings.seed = *options.seed;
	}
	return settings;
}

static std::optional<LevelData> load_match_level(const CommandLineOptions& options, const GameSettings& settings)
{
	if (options.level_file) {
		return load_level_file(*options.level_file);
	}
	const Grid grid(settings.grid_width, settings.grid_height);
	if (options.campaign_level) {
		const auto entry = campaign_level(*options.campaign_level);
		if (entry == nullptr) {
			return std::nullopt;
		}
		return campaign_level_data(*entry, grid);
	}
	return builtin_level(0, grid);
}

static int run(const CommandLineOptions& options)
{
	const auto settings = load_match_settings(options);
	if (!settings) {
		return EXIT_FAILURE;
	}
	const auto level = load_match_level(options, *settings);
	if (!level) {
		return EXIT_FAILURE;
	}

	Game game(*settings, *level);
	if (game.is_game_over()) {
		debug(LOG_ERROR, "Unable to start the match");
		return EXIT_FAILURE;
	}

	GameLoop loop(game, options.max_ticks.value_or(DEFAULT_MAX_TICKS));
	const auto code = loop.run();

	const auto& state = game.get_state();
	if (code != GAME_CODE::GAME_OVER) {
		debug(LOG_INFO, "\"%s\" did not finish: %s", level->name.c_str(), gameCodeToString(code).c_str());
		return EXIT_FAILURE;
	}
	for (int team = 0; team < state.num_teams; ++team)
	{
		debug(LOG_INFO, "Team %d: %d of %zu standing", team, state.live_count(team), state.get_squad(team).size());
	}
	if (state.winner) {
		debug(LOG_INFO, "\"%s\": team %d wins after %zu frames", level->name.c_str(), *state.winner,
		      loop.get_tick_count());
	} else {
		debug(LOG_INFO, "\"%s\": no winner after %zu frames", level->name.c_str(), loop.get_tick_count());
	}
	return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
	if (!frameInitialise()) {
		return EXIT_FAILURE;
	}

	const auto options = parse_command_line(argc, argv);
	if (!options) {
		print_help_info();
		frameShutDown();
		return EXIT_FAILURE;
	}
	if (options->show_help) {
		print_help_info();
		frameShutDown();
		return EXIT_SUCCESS;
	}

	for (const auto& part : options->debug_parts)
	{
		if (!debug_enable_switch(part.c_str())) {
			debug(LOG_ERROR, "Debug part \"%s\" not found", part.c_str());
		}
	}
	if (options->debug_file && !debug_register_file(*options->debug_file)) {
		debug(LOG_ERROR, "Cannot log to %s", options->debug_file->c_str());
	}

	const auto result = run(*options);
	frameShutDown();
	return result;
}
