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
 * @file weapon.h
 * Projectile and gun definitions
 */

#ifndef __INCLUDED_SRC_WEAPON_H__
#define __INCLUDED_SRC_WEAPON_H__

#include <optional>
#include <variant>
#include <vector>

#include "lib/framework/vector.h"

/// A simple bullet. Ricochets off obstacles while its budget lasts
struct Bullet
{
	float damage = 0;
	int ricochets = 0;
};

/// Area damage. Never ricochets
struct SplashDamage
{
	float damage = 0;

	/// Manhattan radius, in tiles
	int blast_radius = 0;

	/// Damage multiplier applied once per tile away from the centre
	float falloff = 1;
};

using ProjectileDetails = std::variant<Bullet, SplashDamage>;

/// Extra pellets fired alternately either side of the aim angle
struct Spray
{
	int projectiles = 1;
	float offset_angle = 0;
};

struct Gun
{
	ProjectileDetails projectile = Bullet{};

	/// `false` if the gun cannot be fired on a turn the holder has moved
	bool can_fire_after_moving = true;

	/// Length of the aim line drawn by the renderer, in canvas units
	float aim_indicator_length = 0;

	std::optional<Spray> spray;
};

[[nodiscard]] float base_damage(const ProjectileDetails& details);

/// @return the ricochet budget; always 0 for splash projectiles
[[nodiscard]] int ricochet_budget(const ProjectileDetails& details);

[[nodiscard]] bool is_splash(const ProjectileDetails& details);

/**
 * The angles of every projectile released by one trigger pull: the aim
 * angle first, then spray pellets alternating -offset, +offset, -offset...
 */
[[nodiscard]] std::vector<float> firing_angles(const Gun& gun, float aim_angle);

#endif // __INCLUDED_SRC_WEAPON_H__
