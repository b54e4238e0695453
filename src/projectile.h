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
 * @file projectile.h
 * A fired projectile following its shot path across frames
 */

#ifndef __INCLUDED_SRC_PROJECTILE_H__
#define __INCLUDED_SRC_PROJECTILE_H__

#include "lib/framework/vector.h"

#include "character.h"
#include "map.h"
#include "targeting.h"
#include "weapon.h"

/// Canvas units travelled per millisecond
static constexpr auto PROJECTILE_SPEED_PER_MS = TILE_SIZE / 80.0f;

/// Represents the current stage of a projectile's trajectory
enum class PROJECTILE_STATE
{
	IN_FLIGHT,
	IMPACT, /**< reached its final target; damage not yet applied */
	INACTIVE
};

class Projectile
{
public:
	using enum PROJECTILE_STATE;

	/// A projectile fired from a gun along `path`
	Projectile(const ShotInfo& shot, ShotPath path);

	/// A grenade lobbed over everything in between onto `tile`
	static Projectile lob(const ShotInfo& shot, Vector2i tile);

	/// Advance along the path. Moves the state to IMPACT on arrival
	void update(float elapsed_ms);

	/**
	 * Re-trace the remainder of the path against `world`. The current
	 * segment is traced again from its start, so the part already flown
	 * is unchanged. Lobbed projectiles are not affected
	 */
	void retarget(const TargetingWorld& world);

	/// Mark the impact as resolved
	void set_inactive() noexcept;

	[[nodiscard]] PROJECTILE_STATE get_state() const noexcept;
	[[nodiscard]] bool is_animating() const noexcept;
	[[nodiscard]] const Target& get_current_target() const;
	[[nodiscard]] const Target& get_final_target() const;
	[[nodiscard]] const ShotPath& get_path() const noexcept;
	[[nodiscard]] const ProjectileDetails& get_details() const noexcept;
	[[nodiscard]] int get_team() const noexcept;

	/// Current canvas position
	[[nodiscard]] Vector2f get_position() const;

private:
	Projectile() = default;

	/// Ricochets available when the current segment started
	[[nodiscard]] int ricochets_at_segment_start() const;

	/// Tile the current segment started from
	[[nodiscard]] Vector2i segment_origin_tile() const;

	PROJECTILE_STATE state = IN_FLIGHT;
	ShotInfo shot;
	ShotPath path;
	std::size_t segment = 0;

	/// Distance along the current segment
	float distance = 0;

	bool lobbed = false;
};

#endif // __INCLUDED_SRC_PROJECTILE_H__
