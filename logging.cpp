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

#include "logging.hpp"
#include <stdexcept>

using namespace std;

vector<string> Logger::stack;
Logger::level_t Logger::max_level = Logger::INFO;

Logger::level_t Logger::parse_level(const string& name)
{
	if (name == "error") return ERROR;
	if (name == "info") return INFO;
	if (name == "detail") return DETAIL;
	throw invalid_argument("unknown log level '" + name + "'");
}

const char* Logger::level_name(level_t level)
{
	switch (level)
	{
		case ERROR: return "error";
		case INFO: return "info";
		case DETAIL: return "detail";
	}
	return "?";
}
