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
 * @file game.cpp
 * Turn and action handling for a match
 */

#include <algorithm>
#include <array>

#include "lib/framework/frame.h"

#include "combat.h"
#include "game.h"
#include "pathfinding.h"

std::string gamePhaseToString(GAME_PHASE phase)
{
	static std::array<std::string, 3> name {
		"CHARACTER_PLACEMENT",
		"COMBAT",
		"GAME_OVER"
	};
	return name[static_cast<size_t>(phase)];
}

const Character* GameState::get_selected() const
{
	if (!selected_character) {
		return nullptr;
	}
	return &characters[*selected_character];
}

std::vector<const Character*> GameState::get_squad(int team) const
{
	std::vector<const Character*> squad;
	for (const auto& character : characters)
	{
		if (character.get_team() == team) {
			squad.push_back(&character);
		}
	}
	return squad;
}

const Character* GameState::get_squad_member(int team, int index) const
{
	const auto it = std::find_if(characters.begin(), characters.end(), [=](const auto& c) {
		return c.get_team() == team && c.get_index() == index;
	});
	return it == characters.end() ? nullptr : &*it;
}

int GameState::live_count(int team) const
{
	return static_cast<int>(std::count_if(characters.begin(), characters.end(), [team](const auto& c) {
		return c.get_team() == team && c.is_alive();
	}));
}

const Flag& GameState::get_flag(int team) const
{
	return flags[team];
}

const Character* GameState::live_character_at(Vector2i tile) const
{
	const auto it = std::find_if(characters.begin(), characters.end(), [tile](const auto& c) {
		return c.is_alive() && c.get_tile() == tile;
	});
	return it == characters.end() ? nullptr : &*it;
}

bool GameState::has_obstacle(Vector2i tile) const
{
	return std::any_of(obstacles.begin(), obstacles.end(),
	                   [tile](const auto& obstacle) { return obstacle.tile == tile; });
}

bool GameState::is_occupied(Vector2i tile) const
{
	return has_obstacle(tile) || live_character_at(tile) != nullptr;
}

bool GameState::is_selectable(Vector2i tile) const
{
	return std::find(selectable_tiles.begin(), selectable_tiles.end(), tile) != selectable_tiles.end();
}

bool GameState::has_squad_mate_at(int team, Vector2i tile, std::optional<int> except_id) const
{
	const auto occupant = live_character_at(tile);
	return occupant != nullptr && occupant->get_team() == team && occupant->get_id() != except_id;
}

TargetingWorld GameState::targeting_world(std::optional<int> ignored_character) const
{
	return TargetingWorld(grid, characters, obstacles, ignored_character);
}

std::vector<Vector2i> placement_tiles(const GameState& state, int team, int max_distance)
{
	const auto flag_tile = state.get_flag(team).tile;
	return bfs(state.grid, flag_tile, max_distance,
	           [&](Vector2i tile) { return !state.is_occupied(tile) && tile != flag_tile; },
	           [&](Vector2i tile) { return !state.has_obstacle(tile); });
}

static bool can_stop_on(const GameState& state, const Character& character, Vector2i tile)
{
	const auto own_flag = state.get_flag(character.get_team()).tile;
	return !state.is_occupied(tile) && (tile != own_flag || character.has_flag());
}

static TilePredicate movement_through(const GameState& state, const Character& character)
{
	return [&state, &character](Vector2i tile) {
		return can_stop_on(state, character, tile)
		    || state.has_squad_mate_at(character.get_team(), tile, character.get_id());
	};
}

std::vector<Vector2i> movement_tiles(const GameState& state, const Character& character)
{
	return bfs(state.grid, character.get_tile(), character.get_stats().max_moves_per_turn,
	           [&](Vector2i tile) { return can_stop_on(state, character, tile); },
	           movement_through(state, character));
}

std::vector<Vector2i> movement_route(const GameState& state, const Character& character, Vector2i destination)
{
	return path_to(state.grid, character.get_tile(), destination, movement_through(state, character));
}

std::vector<Vector2i> grenade_tiles(const GameState& state, const Character& character, int max_range)
{
	const auto from = character.get_tile();
	return bfs(state.grid, from, max_range,
	           [&](Vector2i tile) {
		           return !state.has_obstacle(tile) && tile != from
		               && !state.has_squad_mate_at(character.get_team(), tile, character.get_id());
	           },
	           any_tile);
}

Game::Game(GameSettings settings, LevelData level)
  : settings{std::move(settings)}, level{std::move(level)}
{
	classes = make_class_table(this->settings);
	reset();
}

bool Game::reset()
{
	state = GameState();
	projectiles.clear();
	turn_check_pending = false;

	state.grid = Grid(settings.grid_width, settings.grid_height);
	state.num_teams = settings.num_teams;
	if (!validate_settings(settings) || !validate_level(level, state.grid, settings.num_teams)) {
		debug(LOG_ERROR, "Cannot start \"%s\" with these settings", level.name.c_str());
		state.phase = GAME_PHASE::GAME_OVER;
		return false;
	}

	for (const auto& tile : level.obstacles)
	{
		state.obstacles.push_back(Obstacle{tile});
	}
	for (int team = 0; team < state.num_teams; ++team)
	{
		Flag flag;
		flag.team = team;
		flag.home_tile = level.flags[team];
		flag.tile = level.flags[team];
		state.flags.push_back(flag);

		const auto has_class = team < static_cast<int>(settings.team_placement_classes.size());
		state.placement_classes.push_back(has_class ? settings.team_placement_classes[team]
		                                            : CLASS_TYPE::ASSAULT);
	}

	debug(LOG_MAIN, "Starting \"%s\": %d teams on a %dx%d grid", level.name.c_str(),
	      state.num_teams, state.grid.width, state.grid.height);
	state.phase = GAME_PHASE::CHARACTER_PLACEMENT;
	state.current_team = 0;
	start_placement_turn();
	return true;
}

bool Game::on_action(const Action& action)
{
	if (state.phase == GAME_PHASE::GAME_OVER) {
		debug(LOG_WARNING, "Ignoring %s: the game is over", actionToString(action).c_str());
		return false;
	}
	if (is_animating()) {
		debug(LOG_WARNING, "Ignoring %s while animating", actionToString(action).c_str());
		return false;
	}
	debug(LOG_ACTIVITY, "Team %d: %s", state.current_team, actionToString(action).c_str());

	return std::visit(overloaded {
		[this](const PlaceCharacter& a) { return place_character(a.tile, a.class_type); },
		[this](const SelectCharacter& a) { return select_character(a); },
		[this](const SelectCharacterState& a) { return select_character_state(a.state); },
		[this](const SelectTile& a) { return select_tile(a); },
		[this](const Aim& a) { return aim(a); },
		[this](const Shoot&) { return shoot(); },
		[this](const Heal&) { return heal(); },
		[this](const UseAbility& a) { return use_ability(a); },
		[this](const EndTurn&) { return end_turn(); },
	}, action);
}

void Game::update(float elapsed_ms)
{
	for (auto& character : state.characters)
	{
		character.update(elapsed_ms);
	}

	for (std::size_t i = 0; i < projectiles.size(); ++i)
	{
		projectiles[i].update(elapsed_ms);
		if (projectiles[i].get_state() == Projectile::IMPACT) {
			resolve_impact(projectiles[i]);
		}
	}
	projectiles.erase(std::remove_if(projectiles.begin(), projectiles.end(),
	                                 [](const auto& p) { return p.get_state() == Projectile::INACTIVE; }),
	                  projectiles.end());

	if (turn_check_pending && projectiles.empty()) {
		turn_check_pending = false;
		if (state.phase == GAME_PHASE::COMBAT) {
			check_character_turn_over();
		}
	}
}

bool Game::is_animating() const
{
	return std::any_of(state.characters.begin(), state.characters.end(),
	                   [](const auto& c) { return c.is_animating(); })
	    || std::any_of(projectiles.begin(), projectiles.end(),
	                   [](const auto& p) { return p.is_animating(); });
}

bool Game::is_game_over() const noexcept
{
	return state.phase == GAME_PHASE::GAME_OVER;
}

const GameState& Game::get_state() const noexcept
{
	return state;
}

const std::vector<Projectile>& Game::get_projectiles() const noexcept
{
	return projectiles;
}

const GameSettings& Game::get_settings() const noexcept
{
	return settings;
}

const ClassTable& Game::get_classes() const noexcept
{
	return classes;
}

bool Game::place_character(Vector2i tile, std::optional<CLASS_TYPE> class_type)
{
	if (state.phase != GAME_PHASE::CHARACTER_PLACEMENT) {
		debug(LOG_WARNING, "Characters can only be placed during placement");
		return false;
	}
	if (!state.is_selectable(tile)) {
		debug(LOG_WARNING, "Cannot place a character on %s", to_string(tile).c_str());
		return false;
	}

	const auto team = state.current_team;
	const auto id = static_cast<int>(state.characters.size());
	const auto index = static_cast<int>(state.get_squad(team).size());
	const auto type = class_type.value_or(state.placement_classes[team]);
	state.characters.emplace_back(id, team, index, tile, classes.get(type));
	debug(LOG_ACTIVITY, "Team %d placed %s %d on %s", team, class_type_name(type), index,
	      to_string(tile).c_str());

	state.selectable_tiles.erase(std::remove(state.selectable_tiles.begin(), state.selectable_tiles.end(), tile),
	                             state.selectable_tiles.end());
	if (index + 1 >= squad_size(settings, team)) {
		next_turn();
	} else if (state.selectable_tiles.empty()) {
		debug(LOG_WARNING, "No room left around the flag of team %d; placed %d of %d",
		      team, index + 1, squad_size(settings, team));
		next_turn();
	}
	return true;
}

bool Game::select_character(const SelectCharacter& action)
{
	if (state.phase != GAME_PHASE::COMBAT) {
		debug(LOG_WARNING, "Characters can only be selected during combat");
		return false;
	}
	const auto member = state.get_squad_member(state.current_team, action.index);
	if (member == nullptr || !member->is_alive() || member->is_turn_over()) {
		debug(LOG_WARNING, "Squad member %d of team %d cannot be selected", action.index, state.current_team);
		return false;
	}
	set_selected_character(state.characters[member->get_id()]);
	return true;
}

bool Game::select_character_state(CHARACTER_STATE next)
{
	auto character = selected_for_combat("SELECT_CHARACTER_STATE");
	if (character == nullptr) {
		return false;
	}

	switch (next)
	{
		case CHARACTER_STATE::AWAITING:
			break;
		case CHARACTER_STATE::MOVING:
			if (!character->can_move()) {
				debug(LOG_WARNING, "Character %d cannot move this turn", character->get_id());
				return false;
			}
			break;
		case CHARACTER_STATE::AIMING:
			if (!character->start_aiming()) {
				return false;
			}
			break;
		case CHARACTER_STATE::THROWING_GRENADE:
			if (character->get_available_ability(ABILITY_TYPE::THROW_GRENADE) == nullptr) {
				debug(LOG_WARNING, "Character %d has no grenade to throw", character->get_id());
				return false;
			}
			break;
		case CHARACTER_STATE::COUNT:
			debug(LOG_WARNING, "Invalid character state");
			return false;
	}
	set_selected_state(next);
	return true;
}

bool Game::select_tile(const SelectTile& action)
{
	if (state.phase == GAME_PHASE::CHARACTER_PLACEMENT) {
		return place_character(action.tile, std::nullopt);
	}
	if (selected_for_combat("SELECT_TILE") == nullptr) {
		return false;
	}
	if (!state.is_selectable(action.tile)) {
		debug(LOG_WARNING, "Tile %s is not selectable", to_string(action.tile).c_str());
		return false;
	}
	switch (state.selected_state)
	{
		case CHARACTER_STATE::MOVING:
			return move_selected(action.tile);
		case CHARACTER_STATE::THROWING_GRENADE:
			return throw_grenade(action.tile);
		default:
			debug(LOG_WARNING, "No tile can be chosen while %s",
			      characterStateToString(state.selected_state).c_str());
			return false;
	}
}

bool Game::aim(const Aim& action)
{
	auto character = selected_for_combat("AIM");
	if (character == nullptr) {
		return false;
	}
	if (state.selected_state != CHARACTER_STATE::AIMING) {
		debug(LOG_WARNING, "Character %d is not aiming", character->get_id());
		return false;
	}
	character->set_aim(action.angle_radians);
	return true;
}

bool Game::shoot()
{
	auto character = selected_for_combat("SHOOT");
	if (character == nullptr) {
		return false;
	}
	if (state.selected_state != CHARACTER_STATE::AIMING || !character->can_shoot()) {
		debug(LOG_WARNING, "Character %d is not ready to fire", character->get_id());
		return false;
	}

	const auto shots = character->shoot();
	ASSERT_OR_RETURN(false, !shots.empty(), "Character %d fired nothing", character->get_id());

	const auto world = state.targeting_world();
	for (const auto& shot : shots)
	{
		auto path = resolve_shot(world, get_ray_for_shot(shot), shot.from_tile, shot.from_team,
		                         ricochet_budget(shot.projectile));
		debug(LOG_ATTACK, "Shot from %s at %.3f rad: %zu targets", to_string(shot.from_tile).c_str(),
		      shot.aim_angle, path.size());
		projectiles.emplace_back(shot, std::move(path));
	}
	set_selected_state(CHARACTER_STATE::AWAITING);
	turn_check_pending = true;
	return true;
}

bool Game::heal()
{
	auto character = selected_for_combat("HEAL");
	if (character == nullptr) {
		return false;
	}
	const auto ability = character->get_available_ability(ABILITY_TYPE::HEAL);
	if (ability == nullptr) {
		debug(LOG_WARNING, "Character %d cannot heal now", character->get_id());
		return false;
	}
	const auto amount = std::get<HealAbility>(ability->effect).heal_amount;
	if (!character->use_ability(ABILITY_TYPE::HEAL)) {
		return false;
	}
	character->regen_health(amount);
	debug(LOG_ACTIVITY, "Character %d healed to %.1f", character->get_id(), character->get_health());
	check_character_turn_over();
	return true;
}

bool Game::use_ability(const UseAbility& action)
{
	if (action.ability == ABILITY_TYPE::HEAL) {
		return heal();
	}
	if (!action.tile) {
		return select_character_state(CHARACTER_STATE::THROWING_GRENADE);
	}

	auto character = selected_for_combat("USE_ABILITY");
	if (character == nullptr) {
		return false;
	}
	const auto ability = character->get_available_ability(ABILITY_TYPE::THROW_GRENADE);
	if (ability == nullptr) {
		debug(LOG_WARNING, "Character %d has no grenade to throw", character->get_id());
		return false;
	}
	const auto range = std::get<GrenadeAbility>(ability->effect).max_range;
	const auto tiles = grenade_tiles(state, *character, range);
	if (std::find(tiles.begin(), tiles.end(), *action.tile) == tiles.end()) {
		debug(LOG_WARNING, "Cannot throw a grenade onto %s", to_string(*action.tile).c_str());
		return false;
	}
	return throw_grenade(*action.tile);
}

bool Game::end_turn()
{
	auto character = selected_for_combat("END_TURN");
	if (character == nullptr) {
		return false;
	}
	character->set_turn_over();
	on_character_turn_over();
	return true;
}

bool Game::move_selected(Vector2i tile)
{
	auto character = selected();
	ASSERT_OR_RETURN(false, character != nullptr, "Moving without a selected character");

	const auto distance = manhattan_distance(character->get_tile(), tile);
	if (distance > character->get_stats().max_moves_per_turn) {
		debug(LOG_WARNING, "Cannot move %d tiles from %s to %s; the limit is %d", distance,
		      to_string(character->get_tile()).c_str(), to_string(tile).c_str(),
		      character->get_stats().max_moves_per_turn);
		return false;
	}
	const auto route = movement_route(state, *character, tile);
	if (route.empty()) {
		debug(LOG_WARNING, "No route from %s to %s", to_string(character->get_tile()).c_str(),
		      to_string(tile).c_str());
		return false;
	}
	if (!character->move_to(tile, route)) {
		return false;
	}
	debug(LOG_MOVEMENT, "Character %d moved to %s in %zu steps", character->get_id(),
	      to_string(tile).c_str(), route.size());

	pick_up_or_capture(*character);
	if (state.phase == GAME_PHASE::GAME_OVER) {
		return true;
	}
	check_character_turn_over();
	return true;
}

bool Game::throw_grenade(Vector2i tile)
{
	auto character = selected();
	ASSERT_OR_RETURN(false, character != nullptr, "Throwing without a selected character");
	const auto ability = character->get_available_ability(ABILITY_TYPE::THROW_GRENADE);
	ASSERT_OR_RETURN(false, ability != nullptr, "Character %d has no grenade", character->get_id());

	const auto splash = std::get<GrenadeAbility>(ability->effect).splash;
	if (!character->use_ability(ABILITY_TYPE::THROW_GRENADE)) {
		return false;
	}

	const auto from = world_center(character->get_tile());
	ShotInfo shot;
	shot.from_team = character->get_team();
	shot.from_tile = character->get_tile();
	shot.from_canvas = from;
	shot.aim_angle = angle_between(from, world_center(tile));
	shot.projectile = splash;
	projectiles.push_back(Projectile::lob(shot, tile));
	debug(LOG_ATTACK, "Character %d lobbed a grenade onto %s", character->get_id(), to_string(tile).c_str());

	set_selected_state(CHARACTER_STATE::AWAITING);
	turn_check_pending = true;
	return true;
}

Character* Game::selected()
{
	if (!state.selected_character) {
		return nullptr;
	}
	return &state.characters[*state.selected_character];
}

Character* Game::selected_for_combat(const char* action_name)
{
	if (state.phase != GAME_PHASE::COMBAT) {
		debug(LOG_WARNING, "%s is only allowed during combat", action_name);
		return nullptr;
	}
	auto character = selected();
	if (character == nullptr || !character->is_alive() || character->is_turn_over()) {
		debug(LOG_WARNING, "%s needs a selected character whose turn is not over", action_name);
		return nullptr;
	}
	return character;
}

void Game::set_selected_character(Character& character)
{
	if (auto previous = selected()) {
		previous->cancel_aiming();
	}
	state.selected_character = character.get_id();
	set_selected_state(CHARACTER_STATE::AWAITING);
}

void Game::set_selected_state(CHARACTER_STATE next)
{
	auto character = selected();
	ASSERT_OR_RETURN(, character != nullptr, "No selected character for state %s",
	                 characterStateToString(next).c_str());

	state.selected_state = next;
	if (next != CHARACTER_STATE::AIMING) {
		character->cancel_aiming();
	}
	switch (next)
	{
		case CHARACTER_STATE::MOVING:
			state.selectable_tiles = movement_tiles(state, *character);
			break;
		case CHARACTER_STATE::THROWING_GRENADE:
		{
			const auto ability = character->get_available_ability(ABILITY_TYPE::THROW_GRENADE);
			ASSERT_OR_RETURN(, ability != nullptr, "Character %d has no grenade", character->get_id());
			state.selectable_tiles = grenade_tiles(state, *character,
			                                       std::get<GrenadeAbility>(ability->effect).max_range);
			break;
		}
		default:
			state.selectable_tiles.clear();
			break;
	}
}

void Game::pick_up_or_capture(Character& character)
{
	const auto team = character.get_team();
	const auto tile = character.get_tile();

	for (auto& flag : state.flags)
	{
		if (flag.carrier_id == character.get_id()) {
			flag.tile = tile;
		}
	}

	if (character.has_flag()) {
		if (tile == state.flags[team].tile) {
			debug(LOG_MAIN, "Team %d captured a flag", team);
			end_game(team);
		}
		return;
	}

	for (auto& flag : state.flags)
	{
		if (flag.team != team && !flag.is_carried() && flag.tile == tile) {
			flag.carrier_id = character.get_id();
			character.set_has_flag(true);
			debug(LOG_ACTIVITY, "Character %d picked up the flag of team %d", character.get_id(), flag.team);
			return;
		}
	}
}

void Game::drop_flag(Character& carrier)
{
	for (auto& flag : state.flags)
	{
		if (flag.carrier_id == carrier.get_id()) {
			flag.carrier_id.reset();
			flag.tile = carrier.get_tile();
			debug(LOG_ACTIVITY, "Flag of team %d dropped on %s", flag.team, to_string(flag.tile).c_str());
		}
	}
	carrier.set_has_flag(false);
}

void Game::check_character_turn_over()
{
	auto character = selected();
	if (character == nullptr) {
		return;
	}
	if (character->is_turn_over() || !character->is_alive()) {
		on_character_turn_over();
	} else {
		set_selected_state(CHARACTER_STATE::AWAITING);
	}
}

void Game::on_character_turn_over()
{
	for (const auto member : state.get_squad(state.current_team))
	{
		if (member->is_alive() && !member->is_turn_over()) {
			set_selected_character(state.characters[member->get_id()]);
			return;
		}
	}
	next_turn();
}

void Game::next_turn()
{
	if (state.phase == GAME_PHASE::CHARACTER_PLACEMENT) {
		if (state.current_team + 1 < state.num_teams) {
			++state.current_team;
			start_placement_turn();
		} else {
			debug(LOG_MAIN, "Placement complete, combat begins");
			state.phase = GAME_PHASE::COMBAT;
			state.current_team = state.num_teams - 1;
			advance_combat_turn();
		}
		return;
	}
	advance_combat_turn();
}

void Game::start_placement_turn()
{
	state.selected_character.reset();
	state.selected_state = CHARACTER_STATE::AWAITING;
	state.selectable_tiles = placement_tiles(state, state.current_team, settings.max_spawn_distance_from_flag);
	debug(LOG_ACTIVITY, "Team %d places %d characters", state.current_team,
	      squad_size(settings, state.current_team));
	if (state.selectable_tiles.empty()) {
		debug(LOG_WARNING, "Team %d has nowhere to place its squad", state.current_team);
		next_turn();
	}
}

void Game::advance_combat_turn()
{
	check_victory();
	if (state.phase == GAME_PHASE::GAME_OVER) {
		return;
	}

	if (auto previous = selected()) {
		previous->cancel_aiming();
	}
	state.selected_character.reset();
	state.selectable_tiles.clear();

	for (int i = 0; i < state.num_teams; ++i)
	{
		state.current_team = (state.current_team + 1) % state.num_teams;
		if (state.live_count(state.current_team) > 0) {
			break;
		}
		debug(LOG_ACTIVITY, "Team %d has no survivors and is skipped", state.current_team);
	}

	for (auto& character : state.characters)
	{
		if (character.get_team() == state.current_team && character.is_alive()) {
			character.reset_turn_state();
		}
	}
	debug(LOG_ACTIVITY, "Team %d to move", state.current_team);
	on_character_turn_over();
}

void Game::resolve_impact(Projectile& projectile)
{
	const auto& target = projectile.get_final_target();
	std::vector<DamageReport> reports;
	if (const auto splash = std::get_if<SplashDamage>(&projectile.get_details())) {
		reports = apply_splash_damage(state.grid, state.characters, target.tile, *splash);
	} else if (const auto report = apply_direct_damage(state.characters, target,
	                                                   base_damage(projectile.get_details()))) {
		reports.push_back(*report);
	}
	projectile.set_inactive();

	for (const auto& report : reports)
	{
		if (report.killed) {
			drop_flag(state.characters[report.character_id]);
		}
	}

	// everything still flying may now have a clearer or different path
	const auto world = state.targeting_world();
	for (auto& other : projectiles)
	{
		if (other.get_state() == Projectile::IN_FLIGHT) {
			other.retarget(world);
		}
	}
	check_victory();
}

void Game::check_victory()
{
	if (state.phase != GAME_PHASE::COMBAT) {
		return;
	}
	std::vector<int> surviving;
	for (int team = 0; team < state.num_teams; ++team)
	{
		if (state.live_count(team) > 0) {
			surviving.push_back(team);
		}
	}
	if (surviving.size() == 1) {
		end_game(surviving.front());
	} else if (surviving.empty()) {
		end_game(std::nullopt);
	}
}

void Game::end_game(std::optional<int> winner)
{
	state.phase = GAME_PHASE::GAME_OVER;
	state.winner = winner;
	state.selectable_tiles.clear();
	turn_check_pending = false;
	if (winner) {
		debug(LOG_MAIN, "Team %d wins", *winner);
	} else {
		debug(LOG_MAIN, "No team survived");
	}
}
