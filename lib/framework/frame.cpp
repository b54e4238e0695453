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
 * @file frame.cpp
 * Initialisation and shutdown for the framework library.
 */

#include "frame.h"

static unsigned current_frame = 0;

bool frameInitialise()
{
	debug_init();
	current_frame = 0;
	debug(LOG_MAIN, "Framework initialised");
	return true;
}

void frameShutDown()
{
	debug(LOG_MAIN, "Shutting down framework after %u frames", current_frame);
	debug_exit();
}

void frameUpdate()
{
	++current_frame;
}

unsigned frameGetFrameNumber()
{
	return current_frame;
}
