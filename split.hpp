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

#include <string>
#include <stdexcept>
#include <type_traits>
#include <utility>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-function"

static std::string trim(const std::string& s)
{
	const char* ws = " \t\r\n";
	size_t begin = s.find_first_not_of(ws);
	if (begin == std::string::npos)
		return "";
	size_t end = s.find_last_not_of(ws);
	return s.substr(begin, end - begin + 1);
}

/** splits at the first occurrence of any of `delims`. both halves are trimmed.
  * if there is no delimiter, the second half is empty. */
static std::pair<std::string, std::string> split_once(const std::string& data, const char* delims)
{
	size_t pos = data.find_first_of(delims);
	if (pos == std::string::npos)
		return {trim(data), ""};
	return {trim(data.substr(0, pos)), trim(data.substr(pos + 1))};
}

/** parses all of `s` as a T. throws std::invalid_argument if s is empty, or has trailing garbage. */
template <typename T> T convert(std::string const& s)
{
	size_t n_parsed = 0;
	T result;

	try
	{
		if constexpr (std::is_same_v<T, bool>)
		{
			if (s == "true" || s == "1") return true;
			if (s == "false" || s == "0") return false;
			throw std::invalid_argument("not a boolean");
		}
		else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>)
		{
			if (!s.empty() && s[0] == '-')
				throw std::invalid_argument("negative");
			result = T(std::stoul(s, &n_parsed));
		}
		else if constexpr (std::is_integral_v<T>)
			result = T(std::stoi(s, &n_parsed));
		else if constexpr (std::is_floating_point_v<T>)
			result = T(std::stod(s, &n_parsed));
		else
			return T(s);
	}
	catch (const std::logic_error&) // invalid_argument and out_of_range
	{
		throw std::invalid_argument("cannot parse '" + s + "'");
	}

	if (n_parsed != s.size())
		throw std::invalid_argument("cannot parse '" + s + "'");
	return result;
}

#pragma GCC diagnostic pop
