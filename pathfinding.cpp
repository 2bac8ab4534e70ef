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

#include <vector>
#include <algorithm>
#ifdef DEBUG_PATHFINDING
#include <iostream>
#endif

#include <boost/heap/binomial_heap.hpp>

#include "pathfinding.hpp"
#include "gridmap.hpp"
#include "util.hpp"
#include "pos.hpp"

using namespace std;
using namespace pathfinding;

// the manhattan distance never overestimates on a 4-connected grid with unit costs,
// so the first time the goal is popped, its path is optimal.
static int heuristic(const Pos& p, const Pos& goal)
{
	return p.manhattan(goal);
}

bool is_path_clear(const Pos& start, const Pos& goal, int width, int height, const obstacles_t& obstacles)
{
	return !find_path(start, goal, width, height, obstacles).empty();
}

vector<Pos> find_path(const Pos& start, const Pos& goal, int width, int height, const obstacles_t& obstacles)
{
	vector<Pos> result;

	if (width <= 0 || height <= 0)
		return result;

	GridMap<node_t> map(width, height);

	if (!map.contains(start) || !map.contains(goal))
		return result;
	if (contains(obstacles, start) || contains(obstacles, goal))
		return result;

	if (start == goal)
	{
		result.push_back(start);
		return result;
	}

	boost::heap::binomial_heap<Entry> openlist;
	unsigned long seq = 0;

	map.at(start).openlist_handle = openlist.push(Entry(start, heuristic(start, goal), seq++));
	map.at(start).in_openlist = true;

	int n_iterations = 0;
	while (!openlist.empty())
	{
		Entry current = openlist.top();
		openlist.pop();
		n_iterations++;

		node_t& cur = map.at(current.pos);
		cur.in_openlist = false;

		if (current.pos == goal)
		{
			// found goal.
			Pos p = current.pos;
			result.push_back(p);

			while (p != start)
			{
				p = map.at(p).predecessor;
				result.push_back(p);
			}

			reverse(result.begin(), result.end());

			#ifdef DEBUG_PATHFINDING
			cout << "took " << n_iterations << " iterations for a path of length " << result.size() << endl;
			#endif
			return result;
		}

		cur.in_closedlist = true;

		// expand node
		const Pos steps[] = {Pos(0,1), Pos(0,-1), Pos(1,0), Pos(-1,0)};
		for (const Pos& step : steps)
		{
			Pos successor = current.pos + step;
			if (!map.contains(successor) || contains(obstacles, successor))
				continue;

			node_t& succ = map.at(successor);
			if (succ.in_closedlist)
				continue;

			int new_g = cur.g_val + 1;

			if (succ.in_openlist && succ.g_val <= new_g) // ignore this successor, when a way at least as good is already known
				continue;

			int f = new_g + heuristic(successor, goal);
			succ.predecessor = current.pos;
			succ.g_val = new_g;

			if (succ.in_openlist)
			{
				openlist.update(succ.openlist_handle, Entry(successor, f, seq++));
			}
			else
			{
				succ.openlist_handle = openlist.push(Entry(successor, f, seq++));
				succ.in_openlist = true;
			}
		}
	}

	#ifdef DEBUG_PATHFINDING
	cout << "no path from " << start.str() << " to " << goal.str() << " after " << n_iterations << " iterations" << endl;
	#endif

	return result;
}
