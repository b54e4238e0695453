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
 * @file command_line.cpp
 * Parses command line arguments
 */

#include <charconv>
#include <cstring>

#include <fmt/format.h>

#include "lib/framework/frame.h"

#include "command_line.h"

const std::vector<Command>& commands()
{
	using enum CLI_OPTIONS;
	static const std::vector<Command> list {
		{CONFIG, "--config", "FILE", "Read match settings from a JSON file"},
		{LEVEL, "--level", "FILE", "Read the level from a JSON file"},
		{CAMPAIGN, "--campaign", "N", "Play campaign level N (1-based)"},
		{SEED, "--seed", "N", "Seed the AI's aim"},
		{MAX_TICKS, "--max-ticks", "N", "Stop after N frames"},
		{DEBUG, "--debug", "PART", "Show debug for the given part (\"all\" for everything)"},
		{DEBUG_FILE, "--debugfile", "FILE", "Also log to FILE"},
		{HELP, "--help", "", "Show options and exit"},
	};
	return list;
}

void print_help_info()
{
	fmt::print("Usage: flagsnag [OPTIONS]\n");
	fmt::print("Runs a computer versus computer match and logs the outcome.\n\n");
	for (const auto& command : commands())
	{
		const auto usage = command.argument.empty() ? command.text : command.text + " " + command.argument;
		fmt::print("  {:<22}{}\n", usage, command.description);
	}
}

template <typename T>
static std::optional<T> parse_number(const char* text)
{
	T value {};
	const auto end = text + std::strlen(text);
	const auto [ptr, ec] = std::from_chars(text, end, value);
	if (ec != std::errc() || ptr != end) {
		return std::nullopt;
	}
	return value;
}

static const Command* find_command(const char* text)
{
	for (const auto& command : commands())
	{
		if (command.text == text) {
			return &command;
		}
	}
	return nullptr;
}

std::optional<CommandLineOptions> parse_command_line(int argc, const char* const* argv)
{
	CommandLineOptions options;
	for (int i = 1; i < argc; ++i)
	{
		const auto command = find_command(argv[i]);
		if (command == nullptr) {
			debug(LOG_ERROR, "Unrecognised option \"%s\"", argv[i]);
			return std::nullopt;
		}

		const char* value = nullptr;
		if (!command->argument.empty()) {
			if (i + 1 >= argc) {
				debug(LOG_ERROR, "%s expects %s", command->text.c_str(), command->argument.c_str());
				return std::nullopt;
			}
			value = argv[++i];
		}

		switch (command->option)
		{
			case CLI_OPTIONS::CONFIG:
				options.config_file = value;
				break;
			case CLI_OPTIONS::LEVEL:
				options.level_file = value;
				break;
			case CLI_OPTIONS::CAMPAIGN:
			{
				const auto level = parse_number<int>(value);
				if (!level || *level < 1) {
					debug(LOG_ERROR, "Bad campaign level \"%s\"", value);
					return std::nullopt;
				}
				options.campaign_level = *level - 1;
				break;
			}
			case CLI_OPTIONS::SEED:
				options.seed = parse_number<unsigned>(value);
				if (!options.seed) {
					debug(LOG_ERROR, "Bad seed \"%s\"", value);
					return std::nullopt;
				}
				break;
			case CLI_OPTIONS::MAX_TICKS:
				options.max_ticks = parse_number<std::size_t>(value);
				if (!options.max_ticks || *options.max_ticks == 0) {
					debug(LOG_ERROR, "Bad tick limit \"%s\"", value);
					return std::nullopt;
				}
				break;
			case CLI_OPTIONS::DEBUG:
				options.debug_parts.emplace_back(value);
				break;
			case CLI_OPTIONS::DEBUG_FILE:
				options.debug_file = value;
				break;
			case CLI_OPTIONS::HELP:
				options.show_help = true;
				break;
		}
	}
	return options;
}
