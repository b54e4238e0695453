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
 * @file projectile.cpp
 */

#include <algorithm>

#include "lib/framework/frame.h"

#include "projectile.h"

Projectile::Projectile(const ShotInfo& shot, ShotPath path)
  : shot{shot}, path{std::move(path)}
{
	if (this->path.empty()) {
		debug(LOG_ATTACK, "Projectile from %s has nothing to hit", to_string(shot.from_tile).c_str());
		state = INACTIVE;
	}
}

Projectile Projectile::lob(const ShotInfo& shot, Vector2i tile)
{
	const auto landing = world_center(tile);

	Target target;
	target.kind = TARGET_KIND::GROUND;
	target.tile = tile;
	target.point = landing;
	target.ray = Ray(shot.from_canvas, landing - shot.from_canvas);
	target.segment_distance = glm::length(landing - shot.from_canvas);
	target.cumulative_distance = target.segment_distance;

	Projectile projectile;
	projectile.shot = shot;
	projectile.path.push_back(target);
	projectile.lobbed = true;
	return projectile;
}

void Projectile::update(float elapsed_ms)
{
	if (state != IN_FLIGHT) {
		return;
	}
	distance += PROJECTILE_SPEED_PER_MS * elapsed_ms;
	while (distance >= path[segment].segment_distance)
	{
		if (segment + 1 >= path.size()) {
			distance = path[segment].segment_distance;
			state = IMPACT;
			return;
		}
		distance -= path[segment].segment_distance;
		++segment;
	}
}

void Projectile::retarget(const TargetingWorld& world)
{
	if (lobbed || state != IN_FLIGHT) {
		return;
	}
	auto remainder = resolve_shot(world, path[segment].ray, segment_origin_tile(),
	                              shot.from_team, ricochets_at_segment_start());
	ASSERT_OR_RETURN(, !remainder.empty(), "Re-traced projectile has an empty path");

	const auto travelled_before = segment == 0 ? 0.0f : path[segment - 1].cumulative_distance;
	for (auto& target : remainder)
	{
		target.cumulative_distance += travelled_before;
	}
	path.resize(segment);
	path.insert(path.end(), remainder.begin(), remainder.end());

	// the new segment may be shorter than the distance already flown
	if (distance >= path[segment].segment_distance && segment + 1 >= path.size()) {
		distance = path[segment].segment_distance;
		state = IMPACT;
	}
}

void Projectile::set_inactive() noexcept
{
	state = INACTIVE;
}

PROJECTILE_STATE Projectile::get_state() const noexcept
{
	return state;
}

bool Projectile::is_animating() const noexcept
{
	return state != INACTIVE;
}

const Target& Projectile::get_current_target() const
{
	return path[std::min(segment, path.size() - 1)];
}

const Target& Projectile::get_final_target() const
{
	return path.back();
}

const ShotPath& Projectile::get_path() const noexcept
{
	return path;
}

const ProjectileDetails& Projectile::get_details() const noexcept
{
	return shot.projectile;
}

int Projectile::get_team() const noexcept
{
	return shot.from_team;
}

Vector2f Projectile::get_position() const
{
	if (path.empty()) {
		return shot.from_canvas;
	}
	const auto& current = get_current_target();
	return current.ray.point_at_distance(std::min(distance, current.segment_distance));
}

int Projectile::ricochets_at_segment_start() const
{
	if (segment == 0) {
		return ricochet_budget(shot.projectile);
	}
	return path[segment - 1].ricochets_left;
}

Vector2i Projectile::segment_origin_tile() const
{
	if (segment == 0) {
		return shot.from_tile;
	}
	return path[segment - 1].tile;
}
