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

#include <cassert>
#include <vector>
#include <stdexcept>

#include "pos.hpp"

/** dense storage of one T per coordinate of a width*height grid.
  *
  * const reads outside the grid yield a default-constructed dummy entry,
  * mutable access outside the grid is a programming error and throws
  * std::out_of_range. */
template <class T>
class GridMap
{
	public:
		GridMap(int width_, int height_) : width(width_), height(height_)
		{
			if (width <= 0 || height <= 0)
				throw std::invalid_argument("GridMap needs a positive size, got " + std::to_string(width) + "x" + std::to_string(height));
			storage.resize(size_t(width) * size_t(height));
		}

		bool contains(int x, int y) const { return 0 <= x && x < width && 0 <= y && y < height; }
		bool contains(const Pos& pos) const { return contains(pos.x, pos.y); }

		const T& at(int x, int y) const
		{
			if (!contains(x,y))
				return dummy;
			return storage[index(x,y)];
		}
		T& at(int x, int y)
		{
			if (!contains(x,y))
				throw std::out_of_range("position " + Pos(x,y).str() + " is outside of the " + std::to_string(width) + "x" + std::to_string(height) + " grid");
			return storage[index(x,y)];
		}
		const T& at(const Pos& pos) const { return at(pos.x, pos.y); }
		T& at(const Pos& pos) { return at(pos.x, pos.y); }

		int get_width() const { return width; }
		int get_height() const { return height; }
		size_t size() const { return storage.size(); }

		/** all positions in x-major order: (0,0), (0,1), ..., (0,h-1), (1,0), ... */
		std::vector<Pos> positions() const
		{
			std::vector<Pos> result;
			result.reserve(storage.size());
			for (int x = 0; x < width; x++)
				for (int y = 0; y < height; y++)
					result.emplace_back(x,y);
			return result;
		}

		typename std::vector<T>::iterator begin() { return storage.begin(); }
		typename std::vector<T>::iterator end() { return storage.end(); }
		typename std::vector<T>::const_iterator begin() const { return storage.begin(); }
		typename std::vector<T>::const_iterator end() const { return storage.end(); }

	private:
		size_t index(int x, int y) const
		{
			assert(contains(x,y));
			return size_t(x) * size_t(height) + size_t(y);
		}

		int width, height;
		std::vector<T> storage;
		T dummy;
};
