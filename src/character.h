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
 * @file character.h
 * A single squad member and its per-turn rules
 */

#ifndef __INCLUDED_SRC_CHARACTER_H__
#define __INCLUDED_SRC_CHARACTER_H__

#include <array>
#include <optional>
#include <vector>

#include "lib/framework/vector.h"

#include "animation.h"
#include "geometry.h"
#include "map.h"
#include "stats.h"
#include "weapon.h"

/// Half the side of a character's bounding box
static constexpr auto CHARACTER_HALF_EXTENT = TILE_SIZE / 4.0f;

/// Everything needed to trace one projectile leaving a gun
struct ShotInfo
{
	int from_team = 0;
	Vector2i from_tile {0, 0};

	/// Shots leave from the centre of the tile
	Vector2f from_canvas {0, 0};

	float aim_angle = 0;
	ProjectileDetails projectile;
};

struct AbilityState
{
	ABILITY_TYPE type = ABILITY_TYPE::HEAL;

	/// Empty if the ability has unlimited uses
	std::optional<int> uses_left;

	int cooldown_turns_left = 0;
};

class Character
{
public:
	Character(int id, int team, int index, Vector2i tile, CharacterClass stats);

	/* Accessors */
	[[nodiscard]] int get_id() const noexcept;
	[[nodiscard]] int get_team() const noexcept;

	/// Position within the squad, used for selection
	[[nodiscard]] int get_index() const noexcept;

	[[nodiscard]] Vector2i get_tile() const noexcept;
	[[nodiscard]] float get_health() const noexcept;
	[[nodiscard]] const CharacterClass& get_stats() const noexcept;
	[[nodiscard]] bool is_alive() const noexcept;
	[[nodiscard]] bool has_moved() const noexcept;
	[[nodiscard]] bool has_shot() const noexcept;
	[[nodiscard]] bool is_turn_over() const noexcept;
	[[nodiscard]] bool has_flag() const noexcept;
	[[nodiscard]] bool is_aiming() const noexcept;
	[[nodiscard]] float get_aim_angle() const noexcept;

	/// @return the abilities that may be used this turn
	[[nodiscard]] const std::vector<Ability>& get_available_abilities() const noexcept;

	/// @return the ability of `type` if it may be used this turn, otherwise `nullptr`
	[[nodiscard]] const Ability* get_available_ability(ABILITY_TYPE type) const;

	[[nodiscard]] const std::vector<AbilityState>& get_ability_states() const noexcept;

	/// @return `true` if the character may still fire this turn
	[[nodiscard]] bool can_shoot() const;

	[[nodiscard]] bool can_move() const noexcept;

	/// Bounding box used for hit tests, centred on the logical tile
	[[nodiscard]] std::array<LineSegment, 4> edges() const;

	/// Animated canvas position; only meaningful to the renderer
	[[nodiscard]] Vector2f get_canvas_position() const noexcept;

	[[nodiscard]] bool is_animating() const noexcept;

	/* Mutators */

	/**
	 * Move to `tile` along `route` (the tiles after the current one,
	 * ending at `tile`). The logical position changes at once and the
	 * animation follows
	 *
	 * @return `false` if the character has already moved this turn
	 */
	bool move_to(Vector2i tile, const std::vector<Vector2i>& route);

	bool start_aiming();
	void cancel_aiming();
	void set_aim(float angle_radians);

	/**
	 * Fire the gun. Non-free abilities are lost for the rest of the turn
	 *
	 * @return one ShotInfo per projectile, or an empty list if the
	 *   character cannot shoot
	 */
	std::vector<ShotInfo> shoot();

	/// @return `false` if the ability is not available this turn
	bool use_ability(ABILITY_TYPE type);

	/// Heal up to max health. The dead stay dead
	void regen_health(float amount);

	/**
	 * Reduce health, clamping at 0
	 *
	 * @return `true` if this damage killed the character
	 */
	bool take_damage(float amount);

	void set_has_flag(bool carrying);
	void set_turn_over();
	void reset_turn_state();

	/// Advance the movement animation
	void update(float elapsed_ms);

private:
	/// Ends the turn once nothing useful is left to do
	void check_and_set_turn_over();

	void drop_non_free_abilities();

	[[nodiscard]] AbilityState* find_state(ABILITY_TYPE type);

	int id;
	int team;
	int index;
	Vector2i tile;
	CharacterClass stats;
	float health;

	bool moved = false;
	bool shot = false;
	bool turn_over = false;
	bool carrying_flag = false;
	bool aiming = false;
	float aim_angle_radians = 0;

	std::vector<Ability> available_abilities;
	std::vector<AbilityState> ability_states;
	MovementAnimation animation;
};

#endif // __INCLUDED_SRC_CHARACTER_H__
