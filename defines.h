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
#include <unordered_map>

enum cell_state_t
{
	CELL_INITIAL=0,
	CELL_PLOUGHED,
	CELL_SOWN,
	CELL_GROWING,
	CELL_NEED_WATER,
	CELL_HEALTHY,
	CELL_DISEASED,
	CELL_READY_TO_HARVEST,

	N_CELL_STATES
};

enum task_type_t
{
	TASK_PLOUGH=0,
	TASK_SOW,
	TASK_WATER,
	TASK_HARVEST,
	TASK_MONITOR,

	N_TASK_TYPES
};

enum agent_type_t
{
	AGENT_PLOUGHING=0,
	AGENT_SOWING,
	AGENT_WATERING,
	AGENT_HARVESTING,
	AGENT_MONITORING,

	N_AGENT_TYPES
};

enum agent_status_t
{
	AGENT_IDLE=0,
	AGENT_MOVING,
	AGENT_WORKING,
	AGENT_COMPLETED
};

extern std::string cell_state_names[];
extern std::string task_type_names[];
extern std::string agent_type_names[];
extern std::string agent_status_names[];

extern const std::unordered_map<std::string, task_type_t> task_types;
extern const std::unordered_map<std::string, agent_type_t> agent_types;

/** every task type is executed by exactly one worker type and vice versa */
agent_type_t agent_type_for(task_type_t type);
task_type_t task_type_for(agent_type_t type);
