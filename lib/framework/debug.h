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
 * @file debug.h
 * Debugging output and assertion macros.
 *
 * Output is split into channels (`code_part`) which can be switched on and
 * off at runtime. Every enabled message is handed to each registered
 * callback; by default this is a single callback printing to stderr.
 */

#ifndef _debug_h
#define _debug_h

#include <functional>
#include <string>

#include <fmt/printf.h>

/**
 * Debug output channels. New channels must also be given a name in
 * debug.cpp so that `debug_enable_switch` can find them.
 */
enum code_part
{
	LOG_ALL, /* special: sets all to on */
	LOG_MAIN,
	LOG_ERROR, /* special; on by default */
	LOG_WARNING, /* special; on by default */
	LOG_INFO, /* special; on by default */
	LOG_ACTIVITY, /* action and turn flow */
	LOG_MOVEMENT,
	LOG_ATTACK,
	LOG_DEATH,
	LOG_AI,
	LOG_SAVE, /* settings and level files */
	LOG_NEVER, /* if too verbose for anything but dedicated debugging... */
	LOG_LAST /**< _must_ be last! */
};

using debug_callback_fn = std::function<void (code_part part, const std::string& message)>;

/// Reset the channel switches and install the stderr callback
void debug_init();

/// Remove every registered callback
void debug_exit();

/// Add a callback that receives every enabled message
void debug_register_callback(debug_callback_fn callback);

/// Write every enabled message to `path`, appending
bool debug_register_file(const std::string& path);

/// Default callback; prints to stderr
void debug_callback_stderr(code_part part, const std::string& message);

/**
 * Toggle a debug channel by name, e.g. "ai" or "attack".
 * "all" enables every channel except LOG_NEVER.
 *
 * @return `true` if `str` named a channel
 */
bool debug_enable_switch(const char* str);

void debug_set_enabled(code_part part, bool enabled);

[[nodiscard]] bool debug_enabled(code_part part);

[[nodiscard]] const char* debug_part_name(code_part part);

void _debug_message(int line, code_part part, const char* function, const std::string& message);

void _debug_assert_failed(const char* file, int line, const char* function,
                          const char* expression, const std::string& message);

template <typename... Args>
void _debug(int line, code_part part, const char* function, const char* format, const Args&... args)
{
	_debug_message(line, part, function, fmt::sprintf(format, args...));
}

/**
 * Output printf style format str with additional arguments.
 *
 * Only outputs if debugging of part was formerly enabled with debug_enable_switch.
 */
#define debug(part, ...) \
	do { if (debug_enabled(part)) { _debug(__LINE__, part, __FUNCTION__, __VA_ARGS__); } } while (0)

/**
 * Logs an error if `expr` does not hold. Execution continues.
 */
#define ASSERT(expr, ...) \
	do { if (!(expr)) { _debug_assert_failed(__FILE__, __LINE__, __FUNCTION__, #expr, fmt::sprintf(__VA_ARGS__)); } } while (0)

/**
 * Logs an error and returns `retval` from the calling function if `expr`
 * does not hold. Pass an empty first argument from void functions.
 */
#define ASSERT_OR_RETURN(retval, expr, ...) \
	do { if (!(expr)) { _debug_assert_failed(__FILE__, __LINE__, __FUNCTION__, #expr, fmt::sprintf(__VA_ARGS__)); return retval; } } while (0)

#endif // _debug_h
