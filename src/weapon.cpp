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

#include "weapon.h"

float base_damage(const ProjectileDetails& details)
{
	return std::visit([](const auto& projectile) { return projectile.damage; }, details);
}

int ricochet_budget(const ProjectileDetails& details)
{
	if (const auto bullet = std::get_if<Bullet>(&details)) {
		return bullet->ricochets;
	}
	return 0;
}

bool is_splash(const ProjectileDetails& details)
{
	return std::holds_alternative<SplashDamage>(details);
}

std::vector<float> firing_angles(const Gun& gun, float aim_angle)
{
	std::vector<float> angles {aim_angle};
	if (!gun.spray) {
		return angles;
	}
	while (static_cast<int>(angles.size()) < gun.spray->projectiles)
	{
		// extra pellets alternate one offset either side, anticlockwise first
		const auto direction = angles.size() % 2 == 0 ? 1.0f : -1.0f;
		angles.push_back(aim_angle + direction * gun.spray->offset_angle);
	}
	return angles;
}
