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
 * @file command_line.h
 * Options accepted by the headless host
 */

#ifndef __INCLUDED_SRC_COMMAND_LINE_H__
#define __INCLUDED_SRC_COMMAND_LINE_H__

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/// The type of command being executed
enum class CLI_OPTIONS
{
	CONFIG,
	LEVEL,
	CAMPAIGN,
	SEED,
	MAX_TICKS,
	DEBUG,
	DEBUG_FILE,
	HELP
};

struct Command
{
	CLI_OPTIONS option;

	/// The actual command text
	std::string text;

	/// Name of the value the command expects, empty for a plain switch
	std::string argument;

	/// A textual description of the command
	std::string description;
};

struct CommandLineOptions
{
	std::optional<std::string> config_file;
	std::optional<std::string> level_file;
	std::optional<int> campaign_level;
	std::optional<unsigned> seed;
	std::optional<std::size_t> max_ticks;
	std::vector<std::string> debug_parts;
	std::optional<std::string> debug_file;
	bool show_help = false;
};

[[nodiscard]] const std::vector<Command>& commands();

void print_help_info();

/**
 * Processes command text
 *
 * @return nothing if an option is unknown or its value is missing or malformed
 */
std::optional<CommandLineOptions> parse_command_line(int argc, const char* const* argv);

#endif // __INCLUDED_SRC_COMMAND_LINE_H__
