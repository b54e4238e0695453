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

#include <numbers>
#include <utility>
#include <variant>

#include <doctest/doctest.h>

#include "src/ai.h"
#include "src/difficulty.h"
#include "src/stats.h"
#include "src/visibility.h"

#include "test_helpers.h"

using namespace test;

namespace {

/// Take the next AI action, apply it and hand it back for inspection
Action step(Ai& ai, Game& game)
{
	const auto action = ai.next_action(game);
	REQUIRE(game.on_action(action));
	return action;
}

/// Assault troops limited to a single step, so every choice is a neighbour
GameSettings one_step_settings(std::vector<int> squad_sizes = {1, 1})
{
	auto settings = open_settings(std::move(squad_sizes));
	auto assault = default_class(CLASS_TYPE::ASSAULT);
	assault.max_moves_per_turn = 1;
	settings.class_overrides.push_back(assault);
	return settings;
}

/// Fire the selected character's gun at nothing so only movement is left
void spend_shot(Game& game, float angle)
{
	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::AIMING}));
	REQUIRE(game.on_action(Aim{angle}));
	REQUIRE(game.on_action(Shoot{}));
	settle(game);
	REQUIRE_FALSE(game.get_state().get_selected()->can_shoot());
}

/// Step the first character onto an enemy flag and play the round out to its next turn
void snatch_flag(Game& game, Vector2i flag_tile)
{
	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::MOVING}));
	REQUIRE(game.on_action(SelectTile{flag_tile}));
	settle(game);
	REQUIRE(character(game, 0).has_flag());
	REQUIRE(game.on_action(EndTurn{}));
	REQUIRE(game.on_action(EndTurn{}));
	REQUIRE(game.get_state().current_team == 0);
}

Vector2i expect_move(Ai& ai, Game& game)
{
	const auto select = step(ai, game);
	REQUIRE(std::holds_alternative<SelectCharacterState>(select));
	CHECK(std::get<SelectCharacterState>(select).state == CHARACTER_STATE::MOVING);

	const auto move = step(ai, game);
	REQUIRE(std::holds_alternative<SelectTile>(move));
	settle(game);
	return std::get<SelectTile>(move).tile;
}

float expect_aimed_shot(Ai& ai, Game& game)
{
	const auto select = step(ai, game);
	REQUIRE(std::holds_alternative<SelectCharacterState>(select));
	CHECK(std::get<SelectCharacterState>(select).state == CHARACTER_STATE::AIMING);

	const auto aim = step(ai, game);
	REQUIRE(std::holds_alternative<Aim>(aim));

	CHECK(std::holds_alternative<Shoot>(step(ai, game)));
	return std::get<Aim>(aim).angle_radians;
}

}

TEST_CASE("Ai/ShootsTheCloserEnemy")
{
	Game game(open_settings({1, 2}), open_level());
	place_all(game, {{{2, 2}, CLASS_TYPE::SNIPER},
	                 {{5, 2}, CLASS_TYPE::ASSAULT},
	                 {{2, 7}, CLASS_TYPE::ASSAULT}});

	Ai ai(0, AI_DIFFICULTY::STRONG, 1);
	CHECK(expect_aimed_shot(ai, game) == doctest::Approx(0).epsilon(1e-4));
	settle(game);
	CHECK(character(game, 1).get_health() == doctest::Approx(2));
	CHECK(character(game, 2).get_health() == doctest::Approx(10));
}

TEST_CASE("Ai/ShootsTheWeakerEnemy")
{
	Game game(open_settings({1, 2}), open_level());
	place_all(game, {{{2, 2}, CLASS_TYPE::SNIPER},
	                 {{5, 2}, CLASS_TYPE::ASSAULT},
	                 {{2, 7}, CLASS_TYPE::SNIPER}});

	Ai ai(0, AI_DIFFICULTY::STRONG, 1);
	CHECK(expect_aimed_shot(ai, game) == doctest::Approx(std::numbers::pi_v<float> / 2).epsilon(1e-4));
}

TEST_CASE("Ai/DefendsItsFlagFirst")
{
	Game game(open_settings({1, 2}), open_level({{2, 0}, {23, 15}}));
	place_all(game, {{{2, 2}, CLASS_TYPE::SNIPER},
	                 {{3, 2}, CLASS_TYPE::ASSAULT},
	                 {{2, 0}, CLASS_TYPE::ASSAULT}});

	Ai ai(0, AI_DIFFICULTY::STRONG, 1);
	CHECK(expect_aimed_shot(ai, game) == doctest::Approx(-std::numbers::pi_v<float> / 2).epsilon(1e-4));
}

TEST_CASE("Ai/PlacesOutOfSight")
{
	auto settings = open_settings();
	settings.max_spawn_distance_from_flag = 1;
	Game game(settings, open_level({{23, 4}, {23, 15}}, {{22, 14}}));
	REQUIRE(game.on_action(PlaceCharacter{{23, 5}, CLASS_TYPE::SNIPER}));

	const auto& state = game.get_state();
	REQUIRE(state.current_team == 1);
	REQUIRE(state.selectable_tiles.size() == 2);
	CHECK(state.selectable_tiles.front() == Vector2i(23, 14));

	const auto world = state.targeting_world();
	const auto enemies = live_enemies(state.characters, 1);
	CHECK(exposure(world, enemies, {23, 14}) == 1);
	CHECK(exposure(world, enemies, {22, 15}) == 0);

	Ai ai(1, AI_DIFFICULTY::STRONG, 1);
	const auto action = ai.next_action(game);
	REQUIRE(std::holds_alternative<PlaceCharacter>(action));
	const auto& placement = std::get<PlaceCharacter>(action);
	CHECK(placement.tile == Vector2i(22, 15));
	CHECK(placement.class_type == CLASS_TYPE::SNIPER);
	CHECK(game.on_action(action));
	CHECK(state.phase == GAME_PHASE::COMBAT);
}

TEST_CASE("Ai/PlacementHonoursFog")
{
	auto settings = open_settings();
	settings.max_spawn_distance_from_flag = 1;
	settings.has_fog_of_war = true;
	Game game(settings, open_level({{23, 4}, {23, 15}}, {{22, 14}}));
	REQUIRE(game.on_action(PlaceCharacter{{23, 5}, CLASS_TYPE::SNIPER}));
	REQUIRE(game.get_state().selectable_tiles.front() == Vector2i(23, 14));

	// nobody of team 1 is on the field yet to spot the sniper
	Ai weak(1, AI_DIFFICULTY::WEAK, 1);
	const auto blind = weak.next_action(game);
	REQUIRE(std::holds_alternative<PlaceCharacter>(blind));
	CHECK(std::get<PlaceCharacter>(blind).tile == Vector2i(23, 14));

	Ai strong(1, AI_DIFFICULTY::STRONG, 1);
	const auto informed = strong.next_action(game);
	REQUIRE(std::holds_alternative<PlaceCharacter>(informed));
	CHECK(std::get<PlaceCharacter>(informed).tile == Vector2i(22, 15));
}

TEST_CASE("Ai/HealsWhenWounded")
{
	Game game(open_settings(), open_level());
	place_all(game, {{{0, 0}, CLASS_TYPE::SNIPER}, {{3, 0}, CLASS_TYPE::ASSAULT}});
	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::AIMING}));
	REQUIRE(game.on_action(Shoot{}));
	settle(game);
	REQUIRE(game.get_state().current_team == 1);

	Ai ai(1, AI_DIFFICULTY::WEAK, 7);
	CHECK(std::holds_alternative<Heal>(step(ai, game)));
	CHECK(character(game, 1).get_health() == doctest::Approx(5));
}

TEST_CASE("Ai/ThrowsGrenadeWhenNoShotIsClear")
{
	// a pillar between the two squads hides the enemy from the gun only
	Game game(open_settings(), open_level({{0, 15}, {23, 15}}, {{7, 5}}));
	place_all(game, {{{5, 5}, CLASS_TYPE::DEMOLITION}, {{9, 5}, CLASS_TYPE::ASSAULT}});

	Ai ai(0, AI_DIFFICULTY::STRONG, 1);
	const auto action = step(ai, game);
	REQUIRE(std::holds_alternative<UseAbility>(action));
	const auto& ability = std::get<UseAbility>(action);
	CHECK(ability.ability == ABILITY_TYPE::THROW_GRENADE);
	CHECK(ability.tile == Vector2i(9, 5));

	settle(game);
	CHECK(character(game, 1).get_health() == doctest::Approx(2));
}

TEST_CASE("Ai/DifficultyProfiles")
{
	const auto weak = difficulty_profile(AI_DIFFICULTY::WEAK);
	const auto medium = difficulty_profile(AI_DIFFICULTY::MEDIUM);
	const auto strong = difficulty_profile(AI_DIFFICULTY::STRONG);

	CHECK(weak.aim_jitter_radians > medium.aim_jitter_radians);
	CHECK(medium.aim_jitter_radians > strong.aim_jitter_radians);
	CHECK(strong.aim_jitter_radians == 0);
	CHECK(weak.honours_fog_of_war);
	CHECK_FALSE(strong.honours_fog_of_war);
	CHECK(strong.spawn_class == CLASS_TYPE::SNIPER);
}

TEST_CASE("Ai/RunsWithTheFlag")
{
	SUBCASE("into cover")
	{
		// the pillar at (11, 4) hides (11, 5) from the sniper
		Game game(one_step_settings(), open_level({{2, 5}, {10, 5}}, {{11, 4}}));
		place_all(game, {{{9, 5}, CLASS_TYPE::ASSAULT}, {{11, 1}, CLASS_TYPE::SNIPER}});
		snatch_flag(game, {10, 5});

		const auto& state = game.get_state();
		const auto world = state.targeting_world(0);
		const auto enemies = live_enemies(state.characters, 0);
		REQUIRE(exposure(world, enemies, {10, 4}) == 1);
		REQUIRE(exposure(world, enemies, {10, 6}) == 1);
		REQUIRE(exposure(world, enemies, {9, 5}) == 1);
		REQUIRE(exposure(world, enemies, {11, 5}) == 0);

		Ai ai(0, AI_DIFFICULTY::STRONG, 1);
		CHECK(expect_move(ai, game) == Vector2i(11, 5));
		CHECK(character(game, 0).has_flag());
		CHECK(state.get_flag(1).tile == Vector2i(11, 5));
	}

	SUBCASE("towards home when every tile is seen")
	{
		Game game(one_step_settings(), open_level({{2, 5}, {10, 5}}));
		place_all(game, {{{9, 5}, CLASS_TYPE::ASSAULT}, {{20, 12}, CLASS_TYPE::SCOUT}});
		snatch_flag(game, {10, 5});

		Ai ai(0, AI_DIFFICULTY::STRONG, 1);
		CHECK(expect_move(ai, game) == Vector2i(9, 5));
	}
}

TEST_CASE("Ai/MovesToSingleSightline")
{
	// (4, 8) is hidden from both scouts by the pillar and would be the cheapest
	// step, but (5, 9) is watched by exactly one of them
	Game game(one_step_settings({1, 2}), open_level({{0, 0}, {12, 8}}, {{3, 6}}));
	place_all(game, {{{5, 8}, CLASS_TYPE::ASSAULT},
	                 {{2, 3}, CLASS_TYPE::SCOUT},
	                 {{2, 4}, CLASS_TYPE::SCOUT}});
	spend_shot(game, -std::numbers::pi_v<float> / 2);

	const auto& state = game.get_state();
	const auto world = state.targeting_world(0);
	const auto enemies = live_enemies(state.characters, 0);
	REQUIRE(exposure(world, enemies, {5, 7}) == 2);
	REQUIRE(exposure(world, enemies, {5, 9}) == 1);
	REQUIRE(exposure(world, enemies, {4, 8}) == 0);
	REQUIRE(exposure(world, enemies, {6, 8}) == 2);

	Ai ai(0, AI_DIFFICULTY::STRONG, 1);
	CHECK(expect_move(ai, game) == Vector2i(5, 9));
}

TEST_CASE("Ai/HeadsForObjective")
{
	Game game(one_step_settings(), open_level({{8, 5}, {0, 5}}));
	place_all(game, {{{5, 5}, CLASS_TYPE::ASSAULT}, {{8, 11}, CLASS_TYPE::SCOUT}});
	const auto& state = game.get_state();

	// out for the enemy flag
	spend_shot(game, std::numbers::pi_v<float>);
	{
		Ai ai(0, AI_DIFFICULTY::STRONG, 1);
		CHECK(expect_move(ai, game) == Vector2i(4, 5));
	}
	REQUIRE(game.on_action(EndTurn{}));

	// the scout snatches the flag of team 0
	REQUIRE(state.current_team == 1);
	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::MOVING}));
	REQUIRE(game.on_action(SelectTile{{8, 5}}));
	settle(game);
	REQUIRE(state.get_flag(0).is_carried());
	REQUIRE(game.on_action(EndTurn{}));

	// back to chase the carrier
	REQUIRE(state.current_team == 0);
	spend_shot(game, std::numbers::pi_v<float>);
	{
		Ai ai(0, AI_DIFFICULTY::STRONG, 1);
		CHECK(expect_move(ai, game) == Vector2i(5, 5));
	}
}
