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

#include "config.hpp"
#include "split.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace std;

void SimConfig::load(const string& path)
{
	ifstream file(path);
	if (!file)
		throw runtime_error("cannot read config file '" + path + "'");

	string line;
	int lineno = 0;
	while (getline(file, line))
	{
		lineno++;

		if (size_t hash = line.find('#'); hash != string::npos)
			line.erase(hash);
		line = trim(line);
		if (line.empty())
			continue;

		auto [key, value] = split_once(line, line.find('=') != string::npos ? "=" : " \t");

		try
		{
			set(key, value);
		}
		catch (const invalid_argument& e)
		{
			throw invalid_argument(path + ":" + to_string(lineno) + ": " + e.what());
		}
		catch (const runtime_error& e)
		{
			throw runtime_error(path + ":" + to_string(lineno) + ": " + e.what());
		}
	}
}

void SimConfig::apply_override(const string& assignment)
{
	if (assignment.find('=') == string::npos)
		throw invalid_argument("expected key=value, got '" + assignment + "'");

	auto [key, value] = split_once(assignment, "=");
	set(key, value);
}

void SimConfig::set(const string& key, const string& value)
{
	if (value.empty())
		throw invalid_argument("no value given for '" + key + "'");

	// only take the new value if the result is still valid
	SimConfig next = *this;

	if (key == "width") next.width = convert<int>(value);
	else if (key == "height") next.height = convert<int>(value);
	else if (key == "seed") next.seed = convert<unsigned>(value);
	else if (key == "max_tasks_per_type") next.max_tasks_per_type = convert<int>(value);
	else if (key == "assign_burst") next.assign_burst = convert<int>(value);
	else if (key == "move_burst") next.move_burst = convert<int>(value);
	else if (key == "scan_interval") next.scan_interval = convert<int>(value);
	else if (key == "disease_threshold") next.disease_threshold = convert<double>(value);
	else if (key == "weather_interval") next.weather_interval = convert<int>(value);
	else if (key == "rain_chance") next.rain_chance = convert<double>(value);
	else if (key == "workers_per_type") next.workers_per_type = convert<int>(value);
	else if (key == "log_level") next.log_level = Logger::parse_level(value);
	else
		throw runtime_error("unknown config key '" + key + "'");

	next.validate();
	*this = next;
}

void SimConfig::validate() const
{
	if (width <= 0 || height <= 0)
		throw invalid_argument("width and height must be positive");
	if (max_tasks_per_type < 0 || assign_burst < 0)
		throw invalid_argument("max_tasks_per_type and assign_burst must not be negative");
	if (move_burst <= 0)
		throw invalid_argument("move_burst must be positive");
	if (scan_interval <= 0 || weather_interval <= 0)
		throw invalid_argument("scan_interval and weather_interval must be positive");
	if (disease_threshold < 0. || disease_threshold > 1.)
		throw invalid_argument("disease_threshold must be within [0,1]");
	if (rain_chance < 0. || rain_chance > 1.)
		throw invalid_argument("rain_chance must be within [0,1]");
	if (workers_per_type < 0)
		throw invalid_argument("workers_per_type must not be negative");
}

string SimConfig::str() const
{
	ostringstream s;
	s << "width " << width << "\n"
	  << "height " << height << "\n"
	  << "seed " << seed << "\n"
	  << "max_tasks_per_type " << max_tasks_per_type << "\n"
	  << "assign_burst " << assign_burst << "\n"
	  << "move_burst " << move_burst << "\n"
	  << "scan_interval " << scan_interval << "\n"
	  << "disease_threshold " << disease_threshold << "\n"
	  << "weather_interval " << weather_interval << "\n"
	  << "rain_chance " << rain_chance << "\n"
	  << "workers_per_type " << workers_per_type << "\n"
	  << "log_level " << Logger::level_name(log_level) << "\n";
	return s.str();
}
