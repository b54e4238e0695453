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
 * @file character.cpp
 * Turn rules for a single squad member
 */

#include <algorithm>

#include "lib/framework/frame.h"

#include "character.h"
#include "map.h"

Character::Character(int id, int team, int index, Vector2i tile, CharacterClass stats)
  : id{id}, team{team}, index{index}, tile{tile}, stats{std::move(stats)},
    animation{world_center(tile)}
{
	health = this->stats.max_health;
	for (const auto& ability : this->stats.abilities)
	{
		AbilityState state;
		state.type = ability_type(ability);
		if (ability.max_uses != 0) {
			state.uses_left = ability.max_uses;
		}
		ability_states.push_back(state);
	}
	reset_turn_state();
}

int Character::get_id() const noexcept
{
	return id;
}

int Character::get_team() const noexcept
{
	return team;
}

int Character::get_index() const noexcept
{
	return index;
}

Vector2i Character::get_tile() const noexcept
{
	return tile;
}

float Character::get_health() const noexcept
{
	return health;
}

const CharacterClass& Character::get_stats() const noexcept
{
	return stats;
}

bool Character::is_alive() const noexcept
{
	return health > 0;
}

bool Character::has_moved() const noexcept
{
	return moved;
}

bool Character::has_shot() const noexcept
{
	return shot;
}

bool Character::is_turn_over() const noexcept
{
	return turn_over;
}

bool Character::has_flag() const noexcept
{
	return carrying_flag;
}

bool Character::is_aiming() const noexcept
{
	return aiming;
}

float Character::get_aim_angle() const noexcept
{
	return aim_angle_radians;
}

const std::vector<Ability>& Character::get_available_abilities() const noexcept
{
	return available_abilities;
}

const Ability* Character::get_available_ability(ABILITY_TYPE type) const
{
	const auto it = std::find_if(available_abilities.begin(), available_abilities.end(),
	                             [type](const auto& ability) { return ability_type(ability) == type; });
	return it == available_abilities.end() ? nullptr : &*it;
}

const std::vector<AbilityState>& Character::get_ability_states() const noexcept
{
	return ability_states;
}

bool Character::can_shoot() const
{
	if (turn_over || !is_alive()) {
		return false;
	}
	if (!stats.gun.can_fire_after_moving && moved) {
		return false;
	}
	return !shot;
}

bool Character::can_move() const noexcept
{
	return !turn_over && !moved && is_alive();
}

std::array<LineSegment, 4> Character::edges() const
{
	return bounding_edges(world_center(tile), CHARACTER_HALF_EXTENT);
}

Vector2f Character::get_canvas_position() const noexcept
{
	return animation.position();
}

bool Character::is_animating() const noexcept
{
	return animation.is_animating();
}

bool Character::move_to(Vector2i destination, const std::vector<Vector2i>& route)
{
	ASSERT_OR_RETURN(false, can_move(), "Character %d has already moved", id);

	std::vector<Vector2f> waypoints;
	waypoints.reserve(route.size());
	for (const auto& step : route)
	{
		waypoints.push_back(world_center(step));
	}
	if (waypoints.empty() || waypoints.back() != world_center(destination)) {
		waypoints.push_back(world_center(destination));
	}

	animation.jump_to(world_center(tile));
	animation.start(std::move(waypoints));
	tile = destination;
	moved = true;
	check_and_set_turn_over();
	return true;
}

bool Character::start_aiming()
{
	if (!can_shoot()) {
		debug(LOG_ACTIVITY, "Character %d cannot shoot this turn", id);
		return false;
	}
	aiming = true;
	return true;
}

void Character::cancel_aiming()
{
	aiming = false;
}

void Character::set_aim(float angle_radians)
{
	aim_angle_radians = angle_radians;
}

std::vector<ShotInfo> Character::shoot()
{
	if (!can_shoot()) {
		debug(LOG_ACTIVITY, "Character %d has already shot or used a non-free ability", id);
		return {};
	}
	aiming = false;
	shot = true;
	drop_non_free_abilities();
	check_and_set_turn_over();

	std::vector<ShotInfo> shots;
	for (const auto angle : firing_angles(stats.gun, aim_angle_radians))
	{
		shots.push_back({team, tile, world_center(tile), angle, stats.gun.projectile});
	}
	return shots;
}

bool Character::use_ability(ABILITY_TYPE type)
{
	const auto ability = get_available_ability(type);
	if (ability == nullptr) {
		debug(LOG_ACTIVITY, "Character %d cannot use ability %d now", id, static_cast<int>(type));
		return false;
	}
	const auto is_free = ability->is_free;
	const auto cooldown = ability->cooldown_turns;

	// `ability` points into the list being filtered
	available_abilities.erase(std::remove_if(available_abilities.begin(), available_abilities.end(),
	                                         [type](const auto& a) { return ability_type(a) == type; }),
	                          available_abilities.end());

	auto state = find_state(type);
	ASSERT_OR_RETURN(false, state != nullptr, "No ability state for type %d", static_cast<int>(type));
	if (state->uses_left) {
		*state->uses_left -= 1;
	}
	state->cooldown_turns_left = cooldown;

	if (!is_free) {
		// cannot shoot and use a non-free ability in the same turn
		shot = true;
		aiming = false;
		drop_non_free_abilities();
	}
	check_and_set_turn_over();
	return true;
}

void Character::regen_health(float amount)
{
	if (!is_alive()) {
		return;
	}
	health = std::min(health + amount, stats.max_health);
}

bool Character::take_damage(float amount)
{
	if (!is_alive() || amount <= 0) {
		return false;
	}
	health = std::max(0.0f, health - amount);
	return !is_alive();
}

void Character::set_has_flag(bool carrying)
{
	carrying_flag = carrying;
}

void Character::set_turn_over()
{
	turn_over = true;
	aiming = false;
}

void Character::reset_turn_state()
{
	moved = false;
	shot = false;
	available_abilities.clear();
	for (const auto& ability : stats.abilities)
	{
		auto state = find_state(ability_type(ability));
		ASSERT_OR_RETURN(, state != nullptr, "Ability state missing for character %d", id);
		if (state->uses_left.value_or(1) != 0 && state->cooldown_turns_left <= 0) {
			available_abilities.push_back(ability);
		}
		state->cooldown_turns_left -= 1;
	}
	turn_over = false;
}

void Character::update(float elapsed_ms)
{
	animation.update(elapsed_ms);
}

void Character::check_and_set_turn_over()
{
	if (turn_over) {
		return;
	}
	if (std::any_of(available_abilities.begin(), available_abilities.end(),
	                [](const auto& ability) { return ability.is_free; })) {
		// free abilities left; the turn must be ended explicitly
		return;
	}
	if (moved && (shot || !stats.gun.can_fire_after_moving)) {
		set_turn_over();
		return;
	}
	if (shot && !stats.gun.can_fire_after_moving) {
		set_turn_over();
	}
}

void Character::drop_non_free_abilities()
{
	available_abilities.erase(std::remove_if(available_abilities.begin(), available_abilities.end(),
	                                         [](const auto& ability) { return !ability.is_free; }),
	                          available_abilities.end());
}

AbilityState* Character::find_state(ABILITY_TYPE type)
{
	const auto it = std::find_if(ability_states.begin(), ability_states.end(),
	                             [type](const auto& state) { return state.type == type; });
	return it == ability_states.end() ? nullptr : &*it;
}
