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

#include <vector>

#include <doctest/doctest.h>

#include "src/character.h"
#include "src/combat.h"

TEST_CASE("Combat/SplashFallsOffWithDistance")
{
	const SplashDamage splash {10, 1, 0.5f};
	CHECK(splash_damage_at(splash, 0) == doctest::Approx(10));
	CHECK(splash_damage_at(splash, 1) == doctest::Approx(5));
	CHECK(splash_damage_at(splash, 2) == doctest::Approx(0));

	const SplashDamage wide {8, 3, 0.5f};
	CHECK(splash_damage_at(wide, 3) == doctest::Approx(1));
}

TEST_CASE("Combat/SplashTilesIncludeCentre")
{
	const Grid grid;
	const auto tiles = splash_tiles(grid, {5, 5}, 1);
	REQUIRE(tiles.size() == 5);
	CHECK(tiles.front() == Vector2i(5, 5));

	const auto corner = splash_tiles(grid, {0, 0}, 1);
	CHECK(corner.size() == 3);
	CHECK(splash_tiles(grid, {5, 5}, 0).size() == 1);
}

TEST_CASE("Combat/SplashHitsFriendAndFoe")
{
	const Grid grid;
	std::vector<Character> characters;
	characters.emplace_back(0, 0, 0, Vector2i(5, 5), default_class(CLASS_TYPE::ASSAULT));
	characters.emplace_back(1, 1, 0, Vector2i(6, 5), default_class(CLASS_TYPE::ASSAULT));
	characters.emplace_back(2, 1, 1, Vector2i(7, 5), default_class(CLASS_TYPE::ASSAULT));

	const auto reports = apply_splash_damage(grid, characters, {5, 5}, SplashDamage{10, 1, 0.5f});
	REQUIRE(reports.size() == 2);
	CHECK(reports[0].character_id == 0);
	CHECK(reports[0].killed);
	CHECK(reports[1].character_id == 1);
	CHECK(reports[1].amount == doctest::Approx(5));
	CHECK_FALSE(reports[1].killed);

	CHECK(characters[0].get_health() == doctest::Approx(0));
	CHECK(characters[1].get_health() == doctest::Approx(5));
	CHECK(characters[2].get_health() == doctest::Approx(10));

	SUBCASE("The dead are not hit again")
	{
		const auto again = apply_splash_damage(grid, characters, {5, 5}, SplashDamage{10, 1, 0.5f});
		REQUIRE(again.size() == 1);
		CHECK(again[0].character_id == 1);
		CHECK(again[0].killed);
	}
}

TEST_CASE("Combat/DirectDamageIgnoresScenery")
{
	std::vector<Character> characters;
	characters.emplace_back(0, 0, 0, Vector2i(2, 2), default_class(CLASS_TYPE::SNIPER));

	Target obstacle;
	obstacle.kind = TARGET_KIND::OBSTACLE;
	obstacle.tile = {2, 2};
	CHECK_FALSE(apply_direct_damage(characters, obstacle, 5).has_value());
	CHECK(characters[0].get_health() == doctest::Approx(6));

	Target hit;
	hit.kind = TARGET_KIND::CHARACTER;
	hit.tile = {2, 2};
	hit.character_id = 0;
	const auto report = apply_direct_damage(characters, hit, 8);
	REQUIRE(report.has_value());
	CHECK(report->killed);
	CHECK_FALSE(characters[0].is_alive());
}
