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
 * @file ai.cpp
 * Action planning for computer players
 */

#include <algorithm>

#include "lib/framework/frame.h"

#include "ai.h"
#include "combat.h"
#include "pathfinding.h"
#include "visibility.h"

int exposure(const TargetingWorld& world, const std::vector<const Character*>& enemies, Vector2i tile)
{
	return static_cast<int>(std::count_if(enemies.begin(), enemies.end(), [&](const auto enemy) {
		return has_clear_line(world, enemy->get_tile(), tile, enemy->get_team());
	}));
}

/// Steps from `from` to `to` around obstacles, or the straight distance if walled off
static int distance_to(const GameState& state, Vector2i from, Vector2i to)
{
	const auto steps = path_length(state.grid, from, to,
	                               [&](Vector2i tile) { return !state.has_obstacle(tile); });
	return steps == NO_ROUTE ? manhattan_distance(from, to) : steps;
}

static bool stands_on_enemy_flag(const GameState& state, const Character& character)
{
	return std::any_of(state.flags.begin(), state.flags.end(), [&](const auto& flag) {
		return flag.team != character.get_team() && flag.tile == character.get_tile();
	});
}

Ai::Ai(int team, AI_DIFFICULTY difficulty, unsigned seed)
  : team{team}, profile{difficulty_profile(difficulty)}, rng{seed}
{
	debug(LOG_AI, "AI for team %d plays %s", team, difficulty_name(difficulty));
}

int Ai::get_team() const noexcept
{
	return team;
}

const DifficultyProfile& Ai::get_profile() const noexcept
{
	return profile;
}

Action Ai::next_action(const Game& game)
{
	const auto& state = game.get_state();
	ASSERT(state.current_team == team, "AI for team %d asked to act for team %d", team, state.current_team);

	if (state.phase != planned_phase || state.selected_character != planned_character) {
		queue.clear();
	}
	if (queue.empty()) {
		plan(game);
		planned_phase = state.phase;
		planned_character = state.selected_character;
	}
	ASSERT_OR_RETURN(EndTurn{}, !queue.empty(), "AI for team %d has nothing to do", team);

	auto action = queue.front();
	queue.pop_front();
	debug(LOG_AI, "Team %d: %s", team, actionToString(action).c_str());
	return action;
}

void Ai::plan(const Game& game)
{
	const auto& state = game.get_state();
	switch (state.phase)
	{
		case GAME_PHASE::CHARACTER_PLACEMENT:
			plan_placement(game);
			return;
		case GAME_PHASE::COMBAT:
			if (const auto character = state.get_selected()) {
				plan_combat(game, *character);
				return;
			}
			break;
		case GAME_PHASE::GAME_OVER:
			break;
	}
	queue.push_back(EndTurn{});
}

void Ai::plan_placement(const Game& game)
{
	const auto& state = game.get_state();
	ASSERT_OR_RETURN(, !state.selectable_tiles.empty(), "Team %d has nowhere to place", team);

	const auto world = state.targeting_world();
	const auto enemies = scan_enemies(game);
	auto choice = state.selectable_tiles.front();
	for (const auto& tile : state.selectable_tiles)
	{
		if (exposure(world, enemies, tile) == 0) {
			choice = tile;
			break;
		}
	}
	queue.push_back(PlaceCharacter{choice, profile.spawn_class});
}

void Ai::plan_combat(const Game& game, const Character& character)
{
	const auto& state = game.get_state();
	const auto enemies = scan_enemies(game);
	const auto own_flag = state.get_flag(team).tile;

	// slip away with a freshly snagged flag
	if (character.can_move() && stands_on_enemy_flag(state, character)) {
		const auto tiles = movement_tiles(state, character);
		if (!tiles.empty()) {
			const auto world = state.targeting_world(character.get_id());
			auto best = tiles.front();
			auto best_exposure = exposure(world, enemies, best);
			auto best_distance = distance_to(state, best, own_flag);
			for (const auto& tile : tiles)
			{
				const auto seen = exposure(world, enemies, tile);
				const auto distance = distance_to(state, tile, own_flag);
				if (seen < best_exposure || (seen == best_exposure && distance < best_distance)) {
					best = tile;
					best_exposure = seen;
					best_distance = distance;
				}
			}
			debug(LOG_AI, "Character %d runs with the flag to %s", character.get_id(), to_string(best).c_str());
			queue.push_back(SelectCharacterState{CHARACTER_STATE::MOVING});
			queue.push_back(SelectTile{best});
			return;
		}
	}

	const auto heal = character.get_available_ability(ABILITY_TYPE::HEAL);
	if (heal != nullptr && heal->is_free && character.get_health() < character.get_stats().max_health) {
		queue.push_back(Heal{});
		return;
	}

	if (character.can_shoot()) {
		if (const auto target = pick_shot_target(state, character, enemies)) {
			const auto angle = angle_between(world_center(character.get_tile()), world_center(target->get_tile()));
			debug(LOG_AI, "Character %d shoots at %d", character.get_id(), target->get_id());
			queue.push_back(SelectCharacterState{CHARACTER_STATE::AIMING});
			queue.push_back(Aim{angle + jitter()});
			queue.push_back(Shoot{});
			return;
		}
		if (const auto tile = pick_grenade_tile(state, character, enemies)) {
			debug(LOG_AI, "Character %d throws a grenade at %s", character.get_id(), to_string(*tile).c_str());
			queue.push_back(UseAbility{ABILITY_TYPE::THROW_GRENADE, *tile});
			return;
		}
	}

	if (character.can_move()) {
		const auto tiles = movement_tiles(state, character);
		if (!tiles.empty()) {
			const auto world = state.targeting_world(character.get_id());
			const auto goal = objective(state, character);

			std::optional<Vector2i> single_sightline;
			auto single_distance = NO_ROUTE;
			auto best = tiles.front();
			auto best_cost = NO_ROUTE;
			for (const auto& tile : tiles)
			{
				const auto seen = exposure(world, enemies, tile);
				const auto distance = distance_to(state, tile, goal);
				if (seen == 1 && distance < single_distance) {
					single_sightline = tile;
					single_distance = distance;
				}
				const auto cost = seen * WEIGHT_EXPOSURE + distance;
				if (cost < best_cost) {
					best = tile;
					best_cost = cost;
				}
			}
			const auto destination = single_sightline.value_or(best);
			debug(LOG_AI, "Character %d heads for %s via %s", character.get_id(), to_string(goal).c_str(),
			      to_string(destination).c_str());
			queue.push_back(SelectCharacterState{CHARACTER_STATE::MOVING});
			queue.push_back(SelectTile{destination});
			return;
		}
	}

	queue.push_back(EndTurn{});
}

std::vector<const Character*> Ai::scan_enemies(const Game& game) const
{
	const auto& state = game.get_state();
	if (game.get_settings().has_fog_of_war && profile.honours_fog_of_war) {
		return visible_enemies(state.targeting_world(), state.characters, team);
	}
	return live_enemies(state.characters, team);
}

Vector2i Ai::objective(const GameState& state, const Character& character) const
{
	const auto& own_flag = state.get_flag(team);
	if (character.has_flag() || own_flag.is_carried()) {
		return own_flag.tile;
	}

	const Flag* nearest = nullptr;
	for (const auto& flag : state.flags)
	{
		if (flag.team == team) {
			continue;
		}
		if (flag.is_carried() && state.characters[*flag.carrier_id].get_team() == team) {
			continue;
		}
		if (nearest == nullptr || manhattan_distance(character.get_tile(), flag.tile)
		                          < manhattan_distance(character.get_tile(), nearest->tile)) {
			nearest = &flag;
		}
	}
	return nearest == nullptr ? own_flag.tile : nearest->tile;
}

const Character* Ai::pick_shot_target(const GameState& state,
                                      const Character& shooter,
                                      const std::vector<const Character*>& enemies) const
{
	const auto world = state.targeting_world();
	const auto own_flag = state.get_flag(team).tile;
	const auto from = shooter.get_tile();

	const Character* best = nullptr;
	for (const auto enemy : enemies)
	{
		if (!has_clear_line(world, from, enemy->get_tile(), team)) {
			continue;
		}
		if (best == nullptr) {
			best = enemy;
			continue;
		}
		const auto on_flag = enemy->get_tile() == own_flag;
		const auto best_on_flag = best->get_tile() == own_flag;
		if (on_flag != best_on_flag) {
			if (on_flag) {
				best = enemy;
			}
			continue;
		}
		if (enemy->get_health() != best->get_health()) {
			if (enemy->get_health() < best->get_health()) {
				best = enemy;
			}
			continue;
		}
		const auto distance = manhattan_distance(from, enemy->get_tile());
		const auto best_distance = manhattan_distance(from, best->get_tile());
		if (distance < best_distance || (distance == best_distance && enemy->get_id() < best->get_id())) {
			best = enemy;
		}
	}
	return best;
}

std::optional<Vector2i> Ai::pick_grenade_tile(const GameState& state,
                                              const Character& thrower,
                                              const std::vector<const Character*>& enemies) const
{
	const auto ability = thrower.get_available_ability(ABILITY_TYPE::THROW_GRENADE);
	if (ability == nullptr) {
		return std::nullopt;
	}
	const auto& grenade = std::get<GrenadeAbility>(ability->effect);
	const auto tiles = grenade_tiles(state, thrower, grenade.max_range);

	std::optional<Vector2i> best;
	auto best_value = 0.0f;
	for (const auto enemy : enemies)
	{
		const auto centre = enemy->get_tile();
		if (std::find(tiles.begin(), tiles.end(), centre) == tiles.end()) {
			continue;
		}
		// friends caught in the blast count against the throw
		auto value = 0.0f;
		for (const auto& tile : splash_tiles(state.grid, centre, grenade.splash.blast_radius))
		{
			const auto victim = state.live_character_at(tile);
			if (victim == nullptr) {
				continue;
			}
			const auto damage = std::min(splash_damage_at(grenade.splash, manhattan_distance(centre, tile)),
			                             victim->get_health());
			value += victim->get_team() == team ? -damage : damage;
		}
		if (value > best_value) {
			best = centre;
			best_value = value;
		}
	}
	return best;
}

float Ai::jitter()
{
	if (profile.aim_jitter_radians <= 0) {
		return 0;
	}
	std::uniform_real_distribution<float> spread(-profile.aim_jitter_radians, profile.aim_jitter_radians);
	return spread(rng);
}
