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
 * @file game.h
 * The match state machine: placement, combat turns and victory
 */

#ifndef __INCLUDED_SRC_GAME_H__
#define __INCLUDED_SRC_GAME_H__

#include <optional>
#include <string>
#include <vector>

#include "lib/framework/vector.h"

#include "action.h"
#include "character.h"
#include "feature.h"
#include "level.h"
#include "map.h"
#include "projectile.h"
#include "settings.h"
#include "stats.h"
#include "targeting.h"

enum class GAME_PHASE
{
	CHARACTER_PLACEMENT,
	COMBAT,
	GAME_OVER
};

std::string gamePhaseToString(GAME_PHASE phase);

/// Snapshot of a match, read by the renderer and the AI
struct GameState
{
	GAME_PHASE phase = GAME_PHASE::CHARACTER_PLACEMENT;
	int current_team = 0;
	int num_teams = 2;
	Grid grid;

	/// Every character ever placed, indexed by id. The dead stay
	std::vector<Character> characters;

	std::vector<Obstacle> obstacles;

	/// One flag per team, indexed by team
	std::vector<Flag> flags;

	/// Tiles the current selection may pick with SelectTile
	std::vector<Vector2i> selectable_tiles;

	/// Id of the selected character, if any
	std::optional<int> selected_character;

	CHARACTER_STATE selected_state = CHARACTER_STATE::AWAITING;

	/// Class placed when a placement does not name one, indexed by team
	std::vector<CLASS_TYPE> placement_classes;

	/// Set once the game is over and a team has won
	std::optional<int> winner;

	/* Queries */
	[[nodiscard]] const Character* get_selected() const;

	/// Members of `team` in squad order, the dead included
	[[nodiscard]] std::vector<const Character*> get_squad(int team) const;

	[[nodiscard]] const Character* get_squad_member(int team, int index) const;

	[[nodiscard]] int live_count(int team) const;

	[[nodiscard]] const Flag& get_flag(int team) const;

	[[nodiscard]] const Character* live_character_at(Vector2i tile) const;

	[[nodiscard]] bool has_obstacle(Vector2i tile) const;

	/// An obstacle or a live character. Flags do not occupy tiles
	[[nodiscard]] bool is_occupied(Vector2i tile) const;

	[[nodiscard]] bool is_selectable(Vector2i tile) const;

	/// @return a live member of `team` other than `except_id` stands on `tile`
	[[nodiscard]] bool has_squad_mate_at(int team, Vector2i tile, std::optional<int> except_id) const;

	/// Targeting view over this state; valid while the state is unchanged
	[[nodiscard]] TargetingWorld targeting_world(std::optional<int> ignored_character = std::nullopt) const;
};

/* Legal tile sets */

/// Free tiles within `max_distance` steps of the flag of `team`, obstacles blocking
[[nodiscard]] std::vector<Vector2i> placement_tiles(const GameState& state, int team, int max_distance);

/**
 * Tiles `character` may move to this turn. It may pass through squad
 * mates but not stop on them, and may only stop on its own flag while
 * carrying an enemy flag
 */
[[nodiscard]] std::vector<Vector2i> movement_tiles(const GameState& state, const Character& character);

/// Route for a move accepted by movement_tiles, excluding the start tile
[[nodiscard]] std::vector<Vector2i> movement_route(const GameState& state,
                                                   const Character& character,
                                                   Vector2i destination);

/// Tiles a grenade can be lobbed onto from the tile of `character`
[[nodiscard]] std::vector<Vector2i> grenade_tiles(const GameState& state,
                                                  const Character& character,
                                                  int max_range);

class Game
{
public:
	Game(GameSettings settings, LevelData level);

	/**
	 * Start the match again from the placement phase
	 *
	 * @return `false` if the settings or level are unusable; the game is
	 *   then over without a winner
	 */
	bool reset();

	/**
	 * Apply one action for the active team.
	 *
	 * @return `false` if the action is illegal right now. Nothing changes
	 *   in that case
	 */
	bool on_action(const Action& action);

	/// Advance animations and projectiles, resolving impacts
	void update(float elapsed_ms);

	[[nodiscard]] bool is_animating() const;
	[[nodiscard]] bool is_game_over() const noexcept;

	[[nodiscard]] const GameState& get_state() const noexcept;
	[[nodiscard]] const std::vector<Projectile>& get_projectiles() const noexcept;
	[[nodiscard]] const GameSettings& get_settings() const noexcept;
	[[nodiscard]] const ClassTable& get_classes() const noexcept;

private:
	bool place_character(Vector2i tile, std::optional<CLASS_TYPE> class_type);
	bool select_character(const SelectCharacter& action);
	bool select_character_state(CHARACTER_STATE next);
	bool select_tile(const SelectTile& action);
	bool aim(const Aim& action);
	bool shoot();
	bool heal();
	bool use_ability(const UseAbility& action);
	bool end_turn();

	bool move_selected(Vector2i tile);
	bool throw_grenade(Vector2i tile);

	[[nodiscard]] Character* selected();

	/// Selected character, or `nullptr` after logging why the action is refused
	[[nodiscard]] Character* selected_for_combat(const char* action_name);

	void set_selected_character(Character& character);
	void set_selected_state(CHARACTER_STATE next);

	void pick_up_or_capture(Character& character);
	void drop_flag(Character& carrier);

	void check_character_turn_over();
	void on_character_turn_over();
	void next_turn();
	void start_placement_turn();
	void advance_combat_turn();

	void resolve_impact(Projectile& projectile);
	void check_victory();
	void end_game(std::optional<int> winner);

	GameSettings settings;
	LevelData level;
	ClassTable classes;
	GameState state;
	std::vector<Projectile> projectiles;

	/// A shot or throw is resolving; check the shooter's turn once it lands
	bool turn_check_pending = false;
};

#endif // __INCLUDED_SRC_GAME_H__
