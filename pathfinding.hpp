/*
 * Copyright (c) 2017, 2018 Florian Jung
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
#include <vector>
#include <unordered_set>
#include <boost/heap/binomial_heap.hpp>
#include "pos.hpp"

namespace pathfinding
{
	struct Entry
	{
		Pos pos;
		int f; // this is (exact best-known-yet distance to pos) + (estimated distance to target)
		unsigned long seq; // insertion order, breaks ties between equal f

		Entry(const Pos& p, int f_, unsigned long seq_) : pos(p), f(f_), seq(seq_) {}

		// boost's heaps are max-heaps, so "less" means "expanded later"
		bool operator<(const Entry& other) const
		{
			if (f != other.f)
				return f > other.f;
			return seq > other.seq;
		}
	};

	typedef boost::heap::binomial_heap<Entry>::handle_type openlist_handle_t;

	struct node_t
	{
		int g_val = 0;
		Pos predecessor;
		openlist_handle_t openlist_handle;
		bool in_openlist = false;
		bool in_closedlist = false;
	};

	using obstacles_t = std::unordered_set<Pos>;
}

/** calculates the shortest 4-connected path from start to goal on a width*height grid,
  * never entering a position contained in `obstacles`.
  *
  * The result includes both start and goal. It is exactly {start} if start == goal,
  * and empty if start or goal is obstructed or outside the grid, or if goal is
  * unreachable. Equal inputs always give equal paths. */
std::vector<Pos> find_path(const Pos& start, const Pos& goal, int width, int height, const pathfinding::obstacles_t& obstacles = {});

/** returns whether find_path would find a path */
bool is_path_clear(const Pos& start, const Pos& goal, int width, int height, const pathfinding::obstacles_t& obstacles = {});
