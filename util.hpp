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
#include <vector>
#include <algorithm>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-function"

template <typename Container, typename Func>
std::string join_string (const Container& container, Func function)
{
	std::string result;
	bool first = true;
	for (const auto& x : container)
	{
		if (!first) result += ",";
		first = false;
		result += function(x);
	}
	return result;
}

static std::string strpad(std::string s, size_t n)
{
	if (s.length() >= n) return s;
	else return s + std::string(n-s.length(),' ');
}

template <typename MapContainer> typename MapContainer::mapped_type get_or(const MapContainer& container, typename MapContainer::key_type key, typename MapContainer::mapped_type default_value = typename MapContainer::mapped_type())
{
	if (auto iter = container.find(key); iter != container.end())
		return iter->second;
	else
		return default_value;
}

template <typename Container, typename T> bool contains(const Container& container, const T& search_for)
{
	return container.find(search_for) != container.end();
}
template <typename Container, typename T> bool contains_vec(const Container& container, const T& search_for)
{
	return std::find(container.begin(), container.end(), search_for) != container.end();
}

/** removes the first occurrence of `what` from the vector, if any. returns whether something was removed. */
template <typename T> bool erase_first(std::vector<T>& container, const T& what)
{
	auto iter = std::find(container.begin(), container.end(), what);
	if (iter == container.end())
		return false;
	container.erase(iter);
	return true;
}

#pragma GCC diagnostic pop
