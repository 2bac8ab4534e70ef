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

#include "defines.h"
#include <string>

using namespace std;

string cell_state_names[] = {
	"initial",
	"ploughed",
	"sown",
	"growing",
	"need_water",
	"healthy",
	"diseased",
	"ready_to_harvest"
};

string task_type_names[] = {
	"plough",
	"sow",
	"water",
	"harvest",
	"monitor"
};

string agent_type_names[] = {
	"ploughing",
	"sowing",
	"watering",
	"harvesting",
	"monitoring"
};

string agent_status_names[] = {
	"idle",
	"moving",
	"working",
	"completed"
};

const unordered_map<string, task_type_t> task_types {
	{"plough", TASK_PLOUGH},
	{"sow", TASK_SOW},
	{"water", TASK_WATER},
	{"harvest", TASK_HARVEST},
	{"monitor", TASK_MONITOR}
};

const unordered_map<string, agent_type_t> agent_types {
	{"ploughing", AGENT_PLOUGHING},
	{"sowing", AGENT_SOWING},
	{"watering", AGENT_WATERING},
	{"harvesting", AGENT_HARVESTING},
	{"monitoring", AGENT_MONITORING}
};

agent_type_t agent_type_for(task_type_t type)
{
	switch (type)
	{
		case TASK_PLOUGH: return AGENT_PLOUGHING;
		case TASK_SOW: return AGENT_SOWING;
		case TASK_WATER: return AGENT_WATERING;
		case TASK_HARVEST: return AGENT_HARVESTING;
		case TASK_MONITOR: return AGENT_MONITORING;
		case N_TASK_TYPES: break;
	}
	return N_AGENT_TYPES;
}

task_type_t task_type_for(agent_type_t type)
{
	switch (type)
	{
		case AGENT_PLOUGHING: return TASK_PLOUGH;
		case AGENT_SOWING: return TASK_SOW;
		case AGENT_WATERING: return TASK_WATER;
		case AGENT_HARVESTING: return TASK_HARVEST;
		case AGENT_MONITORING: return TASK_MONITOR;
		case N_AGENT_TYPES: break;
	}
	return N_TASK_TYPES;
}
