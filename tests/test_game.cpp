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

#include <doctest/doctest.h>

#include "test_helpers.h"

using namespace test;

TEST_CASE("Game/PlacementFlow")
{
	Game game(open_settings({2, 1}), open_level());
	const auto& state = game.get_state();
	REQUIRE(state.phase == GAME_PHASE::CHARACTER_PLACEMENT);
	CHECK(state.current_team == 0);
	CHECK_FALSE(state.is_selectable({0, 15}));

	CHECK(game.on_action(SelectTile{{1, 15}}));
	CHECK(character(game, 0).get_stats().type == CLASS_TYPE::ASSAULT);
	CHECK_FALSE(game.on_action(PlaceCharacter{{1, 15}, CLASS_TYPE::SCOUT}));
	CHECK_FALSE(game.on_action(EndTurn{}));
	CHECK(state.current_team == 0);

	CHECK(game.on_action(PlaceCharacter{{2, 15}, CLASS_TYPE::SCOUT}));
	CHECK(state.current_team == 1);
	CHECK(state.phase == GAME_PHASE::CHARACTER_PLACEMENT);

	CHECK(game.on_action(PlaceCharacter{{22, 15}, CLASS_TYPE::SNIPER}));
	CHECK(state.phase == GAME_PHASE::COMBAT);
	CHECK(state.current_team == 0);
	REQUIRE(state.selected_character.has_value());
	CHECK(*state.selected_character == 0);
	CHECK(state.selected_state == CHARACTER_STATE::AWAITING);

	CHECK(state.get_squad(0).size() == 2);
	CHECK(character(game, 1).get_index() == 1);
	CHECK(character(game, 2).get_team() == 1);
	CHECK_FALSE(game.on_action(PlaceCharacter{{5, 5}, CLASS_TYPE::SCOUT}));
}

TEST_CASE("Game/SelectingSquadMembers")
{
	Game game(open_settings({2, 1}), open_level());
	place_all(game, {{{1, 15}, CLASS_TYPE::ASSAULT}, {{2, 15}, CLASS_TYPE::SCOUT}, {{22, 15}, CLASS_TYPE::SNIPER}});
	const auto& state = game.get_state();

	CHECK(game.on_action(SelectCharacter{1}));
	CHECK(state.selected_character == 1);
	CHECK_FALSE(game.on_action(SelectCharacter{2}));

	CHECK(game.on_action(EndTurn{}));
	CHECK(state.current_team == 0);
	CHECK(state.selected_character == 0);
	CHECK_FALSE(game.on_action(SelectCharacter{1}));

	CHECK(game.on_action(EndTurn{}));
	CHECK(state.current_team == 1);
	CHECK(state.selected_character == 2);
}

TEST_CASE("Game/MovementBudget")
{
	Game game(open_settings(), open_level());
	place_all(game, {{{5, 5}, CLASS_TYPE::ASSAULT}, {{20, 10}, CLASS_TYPE::ASSAULT}});
	const auto& state = game.get_state();

	CHECK_FALSE(game.on_action(SelectTile{{9, 5}}));
	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::MOVING}));
	CHECK(state.is_selectable({9, 5}));
	CHECK_FALSE(state.is_selectable({10, 5}));
	CHECK_FALSE(state.is_selectable({5, 5}));

	CHECK_FALSE(game.on_action(SelectTile{{10, 5}}));
	CHECK(character(game, 0).get_tile() == Vector2i(5, 5));

	REQUIRE(game.on_action(SelectTile{{9, 5}}));
	CHECK(character(game, 0).get_tile() == Vector2i(9, 5));
	CHECK(character(game, 0).has_moved());
	CHECK(game.is_animating());
	CHECK_FALSE(game.on_action(EndTurn{}));

	settle(game);
	CHECK_FALSE(game.is_animating());
	CHECK(state.selected_state == CHARACTER_STATE::AWAITING);
	CHECK_FALSE(game.on_action(SelectCharacterState{CHARACTER_STATE::MOVING}));
	CHECK(game.on_action(EndTurn{}));
	CHECK(state.current_team == 1);
}

TEST_CASE("Game/MovementAvoidsObstacles")
{
	Game game(open_settings(), open_level({{0, 15}, {23, 15}}, {{6, 5}, {6, 4}, {6, 6}}));
	place_all(game, {{{5, 5}, CLASS_TYPE::ASSAULT}, {{20, 10}, CLASS_TYPE::ASSAULT}});
	const auto& state = game.get_state();

	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::MOVING}));
	CHECK_FALSE(state.is_selectable({6, 5}));
	// the wall forces a detour longer than four steps
	CHECK_FALSE(state.is_selectable({7, 5}));
	CHECK(state.is_selectable({7, 7}));
}

TEST_CASE("Game/ShotDamagesEnemy")
{
	Game game(open_settings(), open_level());
	place_all(game, {{{0, 0}, CLASS_TYPE::ASSAULT}, {{3, 0}, CLASS_TYPE::ASSAULT}});
	const auto& state = game.get_state();

	CHECK_FALSE(game.on_action(Shoot{}));
	CHECK_FALSE(game.on_action(Aim{0}));
	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::AIMING}));
	REQUIRE(game.on_action(Aim{0}));
	REQUIRE(game.on_action(Shoot{}));
	CHECK(game.get_projectiles().size() == 1);
	CHECK(game.is_animating());

	settle(game);
	CHECK(game.get_projectiles().empty());
	CHECK(character(game, 1).get_health() == doctest::Approx(6));
	CHECK(character(game, 0).has_shot());

	// the free heal keeps the turn open
	CHECK(state.current_team == 0);
	CHECK(state.selected_character == 0);
	CHECK_FALSE(game.on_action(SelectCharacterState{CHARACTER_STATE::AIMING}));
	CHECK(game.on_action(SelectCharacterState{CHARACTER_STATE::MOVING}));
}

TEST_CASE("Game/SniperShotEndsTurn")
{
	Game game(open_settings(), open_level());
	place_all(game, {{{0, 0}, CLASS_TYPE::SNIPER}, {{0, 5}, CLASS_TYPE::ASSAULT}});
	const auto& state = game.get_state();

	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::AIMING}));
	REQUIRE(game.on_action(Aim{0}));
	REQUIRE(game.on_action(Shoot{}));
	CHECK(state.current_team == 0);
	settle(game);
	CHECK(state.current_team == 1);
	CHECK(state.selected_character == 1);
}

TEST_CASE("Game/HealRestoresHealth")
{
	Game game(open_settings(), open_level());
	place_all(game, {{{0, 0}, CLASS_TYPE::SNIPER}, {{3, 0}, CLASS_TYPE::ASSAULT}});

	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::AIMING}));
	REQUIRE(game.on_action(Shoot{}));
	settle(game);
	REQUIRE(character(game, 1).get_health() == doctest::Approx(2));

	REQUIRE(game.on_action(Heal{}));
	CHECK(character(game, 1).get_health() == doctest::Approx(5));
	CHECK_FALSE(game.on_action(Heal{}));
	CHECK_FALSE(game.on_action(UseAbility{ABILITY_TYPE::HEAL, std::nullopt}));
}

TEST_CASE("Game/GrenadeSplash")
{
	Game game(open_settings({1, 2}), open_level());
	place_all(game, {{{5, 5}, CLASS_TYPE::DEMOLITION},
	                 {{8, 5}, CLASS_TYPE::ASSAULT},
	                 {{9, 5}, CLASS_TYPE::ASSAULT}});
	const auto& state = game.get_state();

	CHECK_FALSE(game.on_action(UseAbility{ABILITY_TYPE::THROW_GRENADE, Vector2i(12, 5)}));
	REQUIRE(game.on_action(UseAbility{ABILITY_TYPE::THROW_GRENADE, std::nullopt}));
	CHECK(state.selected_state == CHARACTER_STATE::THROWING_GRENADE);
	CHECK(state.is_selectable({8, 5}));
	CHECK_FALSE(state.is_selectable({10, 5}));

	REQUIRE(game.on_action(SelectTile{{8, 5}}));
	CHECK(character(game, 0).has_shot());
	settle(game);

	CHECK(character(game, 1).get_health() == doctest::Approx(2));
	CHECK(character(game, 2).get_health() == doctest::Approx(6));
	CHECK(character(game, 0).get_health() == doctest::Approx(10));
	CHECK(state.current_team == 0);
	CHECK(game.on_action(SelectCharacterState{CHARACTER_STATE::MOVING}));
}

TEST_CASE("Game/FlagCaptureWins")
{
	Game game(open_settings(), open_level({{1, 1}, {4, 1}}));
	place_all(game, {{{3, 1}, CLASS_TYPE::ASSAULT}, {{20, 12}, CLASS_TYPE::ASSAULT}});
	const auto& state = game.get_state();

	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::MOVING}));
	REQUIRE(game.on_action(SelectTile{{4, 1}}));
	settle(game);
	CHECK(character(game, 0).has_flag());
	REQUIRE(state.get_flag(1).carrier_id.has_value());
	CHECK(*state.get_flag(1).carrier_id == 0);

	REQUIRE(game.on_action(EndTurn{}));
	REQUIRE(state.current_team == 1);
	REQUIRE(game.on_action(EndTurn{}));
	REQUIRE(state.current_team == 0);

	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::MOVING}));
	CHECK(state.is_selectable({1, 1}));
	REQUIRE(game.on_action(SelectTile{{1, 1}}));
	CHECK(state.get_flag(1).tile == Vector2i(1, 1));
	CHECK(game.is_game_over());
	REQUIRE(state.winner.has_value());
	CHECK(*state.winner == 0);
}

TEST_CASE("Game/OwnFlagTileIsOffLimitsWithoutAFlag")
{
	Game game(open_settings(), open_level({{1, 1}, {20, 1}}));
	place_all(game, {{{3, 1}, CLASS_TYPE::ASSAULT}, {{20, 12}, CLASS_TYPE::ASSAULT}});
	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::MOVING}));
	CHECK_FALSE(game.get_state().is_selectable({1, 1}));
	CHECK(game.get_state().is_selectable({0, 1}));
}

TEST_CASE("Game/DeadCarrierDropsFlag")
{
	Game game(open_settings({1, 2}), open_level({{1, 1}, {4, 1}}));
	place_all(game, {{{3, 1}, CLASS_TYPE::SNIPER}, {{4, 4}, CLASS_TYPE::SNIPER}, {{20, 12}, CLASS_TYPE::ASSAULT}});
	const auto& state = game.get_state();

	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::MOVING}));
	REQUIRE(game.on_action(SelectTile{{4, 1}}));
	settle(game);
	REQUIRE(character(game, 0).has_flag());
	REQUIRE(state.current_team == 1);
	REQUIRE(state.selected_character == 1);

	// straight up from (4, 4) onto the carrier
	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::AIMING}));
	REQUIRE(game.on_action(Aim{-std::numbers::pi_v<float> / 2}));
	REQUIRE(game.on_action(Shoot{}));
	settle(game);

	CHECK_FALSE(character(game, 0).is_alive());
	CHECK_FALSE(state.get_flag(1).is_carried());
	CHECK(state.get_flag(1).tile == Vector2i(4, 1));
	CHECK(game.is_game_over());
	CHECK(state.winner == 1);
}

TEST_CASE("Game/EliminationWins")
{
	Game game(open_settings(), open_level());
	place_all(game, {{{0, 0}, CLASS_TYPE::SNIPER}, {{3, 0}, CLASS_TYPE::SCOUT}});

	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::AIMING}));
	REQUIRE(game.on_action(Aim{0}));
	REQUIRE(game.on_action(Shoot{}));
	settle(game);

	const auto& state = game.get_state();
	CHECK_FALSE(character(game, 1).is_alive());
	CHECK(game.is_game_over());
	REQUIRE(state.winner.has_value());
	CHECK(*state.winner == 0);
	CHECK_FALSE(game.on_action(EndTurn{}));
	CHECK_FALSE(game.on_action(SelectCharacter{0}));
}

TEST_CASE("Game/InvalidLevelEndsAtOnce")
{
	Game game(open_settings(), open_level({{0, 15}}));
	CHECK(game.is_game_over());
	CHECK_FALSE(game.get_state().winner.has_value());
	CHECK_FALSE(game.on_action(PlaceCharacter{{1, 1}, CLASS_TYPE::SCOUT}));
	CHECK_FALSE(game.reset());
}

TEST_CASE("Game/TurnOrderSkipsEliminatedTeam")
{
	Game game(open_settings({1, 1, 1}), open_level({{0, 15}, {23, 15}, {12, 0}}));
	place_all(game, {{{2, 2}, CLASS_TYPE::SNIPER},
	                 {{5, 2}, CLASS_TYPE::SCOUT},
	                 {{20, 12}, CLASS_TYPE::ASSAULT}});
	const auto& state = game.get_state();

	REQUIRE(state.current_team == 0);
	REQUIRE(game.on_action(EndTurn{}));
	CHECK(state.current_team == 1);
	REQUIRE(game.on_action(EndTurn{}));
	CHECK(state.current_team == 2);
	REQUIRE(game.on_action(EndTurn{}));
	CHECK(state.current_team == 0);

	// the sniper takes out the whole of team 1
	REQUIRE(game.on_action(SelectCharacterState{CHARACTER_STATE::AIMING}));
	REQUIRE(game.on_action(Aim{0}));
	REQUIRE(game.on_action(Shoot{}));
	settle(game);
	REQUIRE_FALSE(character(game, 1).is_alive());
	REQUIRE_FALSE(game.is_game_over());

	CHECK(state.current_team == 2);
	CHECK(state.selected_character == 2);
	REQUIRE(game.on_action(EndTurn{}));
	CHECK(state.current_team == 0);
	CHECK(state.selected_character == 0);
	REQUIRE(game.on_action(EndTurn{}));
	CHECK(state.current_team == 2);
}

TEST_CASE("Game/CooldownCountsOwnTurns")
{
	Game game(open_settings({1, 1, 1}), open_level({{0, 15}, {23, 15}, {12, 0}}));
	place_all(game, {{{5, 5}, CLASS_TYPE::DEMOLITION},
	                 {{20, 2}, CLASS_TYPE::ASSAULT},
	                 {{20, 12}, CLASS_TYPE::ASSAULT}});
	const auto& state = game.get_state();
	const auto& thrower = character(game, 0);
	const auto cooldown = [&] {
		REQUIRE(thrower.get_ability_states().size() == 1);
		return thrower.get_ability_states()[0].cooldown_turns_left;
	};
	const auto full_round = [&] {
		for (int team = 0; team < 3; ++team)
		{
			REQUIRE(state.current_team == team);
			REQUIRE(game.on_action(EndTurn{}));
		}
		REQUIRE(state.current_team == 0);
	};

	REQUIRE(game.on_action(UseAbility{ABILITY_TYPE::THROW_GRENADE, Vector2i(8, 5)}));
	settle(game);
	CHECK(cooldown() == 2);

	// the other teams' turns leave it alone
	REQUIRE(game.on_action(EndTurn{}));
	CHECK(cooldown() == 2);
	REQUIRE(game.on_action(EndTurn{}));
	CHECK(cooldown() == 2);
	REQUIRE(game.on_action(EndTurn{}));
	REQUIRE(state.current_team == 0);
	CHECK(cooldown() == 1);
	CHECK(thrower.get_available_ability(ABILITY_TYPE::THROW_GRENADE) == nullptr);

	full_round();
	CHECK(cooldown() == 0);
	CHECK(thrower.get_available_ability(ABILITY_TYPE::THROW_GRENADE) == nullptr);

	full_round();
	CHECK(thrower.get_available_ability(ABILITY_TYPE::THROW_GRENADE) != nullptr);
}
