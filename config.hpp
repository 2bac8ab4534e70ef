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

#include "logging.hpp"

/** all tunables of a simulation run.
  *
  * config files consist of "key value" or "key=value" lines. everything
  * after a '#' is ignored, as are empty lines. */
struct SimConfig
{
	int width = 20;
	int height = 20;
	unsigned seed = 42;

	int max_tasks_per_type = 10; // outstanding tasks per type the planner creates while scoring
	int assign_burst = 20;       // tasks the planner hands out per tick
	int move_burst = 3;          // path steps a worker walks per tick
	int scan_interval = 15;      // ticks between two disease scans
	double disease_threshold = 0.85;
	int weather_interval = 5;    // ticks between weather changes
	double rain_chance = 0.1;
	int workers_per_type = 1;

	Logger::level_t log_level = Logger::INFO;

	/** applies every line of `path` via set(). throws std::runtime_error if the
	  * file can't be read, and rethrows errors from set() with file and line. */
	void load(const std::string& path);

	/** sets one value. throws std::runtime_error for unknown keys and
	  * std::invalid_argument for values that don't parse or are out of range. */
	void set(const std::string& key, const std::string& value);

	/** parses "key=value" and calls set() */
	void apply_override(const std::string& assignment);

	/** throws std::invalid_argument unless all values are sane */
	void validate() const;

	std::string str() const;
};
