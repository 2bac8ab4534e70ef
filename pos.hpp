/*
 * Copyright (c) 2017 Florian Jung
 *
 * This file is part of farmsim.
 *
 * farmsim is free software: you can redistribute it and/or
 * modify it under the terms of the GNU General Public License,
 * version 3, as published by the Free Software Foundation.
 *
 * farmsim is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with farmsim. If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once
#include <string>
#include <cstdlib>
#include <boost/functional/hash.hpp>

struct Pos
{
	int x,y;
	Pos(int x_, int y_) : x(x_), y(y_) {}
	Pos() : x(0), y(0) {}

	Pos operator+(const Pos& b) const { return Pos(x+b.x, y+b.y); }
	Pos operator-(const Pos& b) const { return Pos(x-b.x, y-b.y); }

	bool operator==(const Pos& that) const { return this->x == that.x && this->y == that.y; }
	bool operator!=(const Pos& that) const { return !operator==(that); }

	/** the distance when walking along the grid lines only */
	int manhattan(const Pos& that) const { return std::abs(x-that.x) + std::abs(y-that.y); }

	std::string str() const { return std::to_string(x) + "," + std::to_string(y); }
};

namespace std {
	template <> struct hash<Pos>
	{
		typedef Pos argument_type;
		typedef std::size_t result_type;
		result_type operator()(argument_type const& p) const
		{
			result_type seed = 0;
			boost::hash_combine(seed, p.x);
			boost::hash_combine(seed, p.y);
			return seed;
		}
	};
}
