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
 * @file vector.h
 * Integer and floating point 2D vectors, backed by glm
 */

#ifndef _vector_h
#define _vector_h

#include <cstdlib>
#include <string>

#include <glm/vec2.hpp>
#include <glm/geometric.hpp>

/// Tile coordinate
using Vector2i = glm::ivec2;

/// Canvas (continuous space) coordinate
using Vector2f = glm::vec2;

static inline int manhattan_distance(const Vector2i& a, const Vector2i& b)
{
  return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

/// @return `v` scaled to unit length, or the zero vector if `v` is zero
static inline Vector2f normalise(const Vector2f& v)
{
  const auto len = glm::length(v);
  if (len == 0.0f) {
    return {0.0f, 0.0f};
  }
  return v / len;
}

static inline std::string to_string(const Vector2i& v)
{
  return "(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ")";
}

#endif // _vector_h
