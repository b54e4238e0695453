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
 * @file targeting.h
 * Ray marching over the tile grid: hit tests against characters and
 * obstacles, ricochets and the play-area border
 */

#ifndef __INCLUDED_SRC_TARGETING_H__
#define __INCLUDED_SRC_TARGETING_H__

#include <optional>
#include <vector>

#include "lib/framework/vector.h"

#include "character.h"
#include "feature.h"
#include "geometry.h"
#include "map.h"

/// Distance advanced per marching step, in canvas units
static constexpr auto MARCH_STEP = TILE_SIZE / 4.0f;

enum class TARGET_KIND
{
	CHARACTER,
	OBSTACLE,
	BORDER,
	GROUND /**< a lobbed projectile landing on a tile */
};

/// One hit along a shot path
struct Target
{
	TARGET_KIND kind = TARGET_KIND::BORDER;

	/// Tile of the struck occupant, or the last in-bounds tile for the border
	Vector2i tile {0, 0};

	/// Impact point
	Vector2f point {0, 0};

	/// The ray that travelled to this target
	Ray ray;

	/// Continuation after a ricochet; only meaningful if `is_ricochet`
	Ray outbound;

	/// Normal of the struck edge
	Vector2f normal {0, 0};

	/// Length of `ray` up to the impact point
	float segment_distance = 0;

	/// Distance travelled from the muzzle, including earlier segments
	float cumulative_distance = 0;

	/// Ricochets still available after this target
	int ricochets_left = 0;

	/// Set when a character was struck
	std::optional<int> character_id;

	/// `true` if the projectile bounces off this target
	bool is_ricochet = false;
};

using ShotPath = std::vector<Target>;

/**
 * Read-only view over the things a projectile can strike. Builds an
 * occupancy index once so that many queries can be answered cheaply.
 * The referenced containers must outlive the view and must not change
 * while it is in use.
 */
class TargetingWorld
{
public:
	/**
	 * @param ignored_character id of a character to treat as absent, for
	 *   example one whose hypothetical position is being evaluated
	 */
	TargetingWorld(const Grid& grid,
	               const std::vector<Character>& characters,
	               const std::vector<Obstacle>& obstacles,
	               std::optional<int> ignored_character = std::nullopt);

	[[nodiscard]] const Grid& get_grid() const noexcept;

	/// @return the live character on `tile`, or `nullptr`
	[[nodiscard]] const Character* character_at(Vector2i tile) const;

	[[nodiscard]] const Obstacle* obstacle_at(Vector2i tile) const;

private:
	enum class OCCUPANT
	{
		NONE,
		CHARACTER,
		OBSTACLE
	};

	struct Occupant
	{
		OCCUPANT kind = OCCUPANT::NONE;
		std::size_t index = 0;
	};

	[[nodiscard]] const Occupant* occupant_at(Vector2i tile) const;

	const Grid& grid;
	const std::vector<Character>& characters;
	const std::vector<Obstacle>& obstacles;
	std::vector<Occupant> occupancy;
};

/// @return the ray a projectile described by `shot` travels along
[[nodiscard]] Ray get_ray_for_shot(const ShotInfo& shot);

/**
 * Trace a projectile fired along `ray` from `start_tile` by `from_team`.
 *
 * Characters of `from_team` are transparent. An enemy character ends the
 * path. An obstacle reflects the projectile while ricochets remain and
 * ends the path otherwise. Leaving the grid ends the path at the border.
 *
 * @return the hits in order; the last one is always terminal
 */
[[nodiscard]] ShotPath resolve_shot(const TargetingWorld& world,
                                    const Ray& ray,
                                    Vector2i start_tile,
                                    int from_team,
                                    int max_ricochets);

/**
 * @return `true` if a projectile fired from the centre of `from` towards
 *   the centre of `to` by `from_team` strikes nothing before reaching
 *   `to`, or strikes whatever occupies `to`
 */
[[nodiscard]] bool has_clear_line(const TargetingWorld& world,
                                  Vector2i from,
                                  Vector2i to,
                                  int from_team);

#endif // __INCLUDED_SRC_TARGETING_H__
