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
 * @file debug.cpp
 * Various debugging output functions.
 */

#include <array>
#include <cstdio>
#include <cstring>
#include <memory>
#include <vector>

#include <fmt/format.h>

#include "debug.h"

static std::array<bool, LOG_LAST> default_switches()
{
	std::array<bool, LOG_LAST> switches {};
	switches[LOG_ERROR] = true;
	switches[LOG_WARNING] = true;
	switches[LOG_INFO] = true;
	return switches;
}

static std::array<bool, LOG_LAST> enabled_debug = default_switches();
static std::vector<debug_callback_fn> callbacks;

static const char* code_part_names[] =
{
	"all",
	"main",
	"error",
	"warning",
	"info",
	"activity",
	"movement",
	"attack",
	"death",
	"ai",
	"save",
	"never",
	"last"
};

static_assert(sizeof(code_part_names) / sizeof(code_part_names[0]) == LOG_LAST + 1,
              "every code_part needs a name");

void debug_init()
{
	enabled_debug = default_switches();
	callbacks.clear();
	callbacks.emplace_back(debug_callback_stderr);
}

void debug_exit()
{
	callbacks.clear();
}

void debug_register_callback(debug_callback_fn callback)
{
	callbacks.push_back(std::move(callback));
}

bool debug_register_file(const std::string& path)
{
	auto file = std::shared_ptr<std::FILE>(std::fopen(path.c_str(), "a"), [](std::FILE* f) {
		if (f) {
			std::fclose(f);
		}
	});
	if (!file) {
		debug(LOG_ERROR, "Could not open %s for appending", path.c_str());
		return false;
	}
	callbacks.emplace_back([file](code_part, const std::string& message) {
		fmt::print(file.get(), "{}\n", message);
		std::fflush(file.get());
	});
	return true;
}

void debug_callback_stderr(code_part, const std::string& message)
{
	fmt::print(stderr, "{}\n", message);
}

bool debug_enable_switch(const char* str)
{
	for (auto i = 0; i < LOG_LAST; ++i)
	{
		if (std::strcmp(str, code_part_names[i]) != 0) {
			continue;
		}
		if (i == LOG_ALL) {
			for (auto j = 0; j < LOG_LAST; ++j)
			{
				enabled_debug[j] = j != LOG_NEVER;
			}
		}
		else {
			enabled_debug[i] = !enabled_debug[i];
		}
		return true;
	}
	return false;
}

void debug_set_enabled(code_part part, bool enabled)
{
	enabled_debug[part] = enabled;
}

bool debug_enabled(code_part part)
{
	return part < LOG_LAST && enabled_debug[part];
}

const char* debug_part_name(code_part part)
{
	return code_part_names[part];
}

void _debug_message(int line, code_part part, const char* function, const std::string& message)
{
	const auto output = fmt::format("{:<8}|{}:{}: {}", code_part_names[part], function, line, message);
	for (const auto& callback : callbacks)
	{
		callback(part, output);
	}
}

void _debug_assert_failed(const char* file, int line, const char* function,
                          const char* expression, const std::string& message)
{
	_debug_message(line, LOG_ERROR, function,
	               fmt::format("Assert in FlagSnag: {}:{} ({}) failed: {}", file, line, expression, message));
}
