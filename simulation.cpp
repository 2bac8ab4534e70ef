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

#include "simulation.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cassert>
#include <sstream>
#include <stdexcept>

using namespace std;

string Telemetry::str() const
{
	ostringstream s;
	s << "tick " << tick << ":";
	for (int i = 0; i < N_CELL_STATES; i++)
		if (cell_counts[i] > 0)
			s << " " << cell_state_names[i] << "=" << cell_counts[i];
	s << " | harvested " << harvested
	  << " | tasks: " << active_tasks << " active, " << queued_tasks << " queued, "
	  << tasks_completed << " done, " << tasks_failed << " failed"
	  << " | " << weather.str();
	return s.str();
}

static WeatherSettings weather_settings(const SimConfig& config)
{
	WeatherSettings result;
	result.interval = config.weather_interval;
	result.rain_chance = config.rain_chance;
	return result;
}

static const SimConfig& validated(const SimConfig& config)
{
	config.validate();
	return config;
}

FarmSimulation::FarmSimulation(const SimConfig& config) :
	config_(validated(config)),
	world_(config_.width, config_.height, config_.seed, weather_settings(config_)),
	planner_(world_, channel_, config_.max_tasks_per_type, config_.assign_burst)
{
	Logger log("sim");

	int next_id = MasterPlanner::PLANNER_ID + 1;
	for (int t = 0; t < N_AGENT_TYPES; t++)
	{
		agent_type_t type = agent_type_t(t);
		Pos home = home_position(type, world_.width(), world_.height());

		for (int k = 0; k < config_.workers_per_type; k++)
		{
			Pos start(home.x, clamp(home.y + k, 0, world_.height() - 1));
			workers_.push_back(make_worker(type, next_id, start));
			planner_.register_worker(type, next_id);
			log << "spawned " << workers_.back()->str() << endl;
			next_id++;
		}
	}
}

Pos FarmSimulation::home_position(agent_type_t type, int width, int height)
{
	Pos result;
	switch (type)
	{
		case AGENT_PLOUGHING: result = Pos(2, 2); break;
		case AGENT_SOWING: result = Pos(width-3, 2); break;
		case AGENT_WATERING: result = Pos(2, height-3); break;
		case AGENT_HARVESTING: result = Pos(width-3, height-3); break;
		case AGENT_MONITORING: result = Pos(width/2, 2); break;
		case N_AGENT_TYPES: break;
	}
	// small farms
	return Pos(clamp(result.x, 0, width-1), clamp(result.y, 0, height-1));
}

unique_ptr<Worker> FarmSimulation::make_worker(agent_type_t type, int id, const Pos& position)
{
	switch (type)
	{
		case AGENT_PLOUGHING:
			return make_unique<PloughingWorker>(id, position, world_, channel_, config_.move_burst);
		case AGENT_SOWING:
			return make_unique<SowingWorker>(id, position, world_, channel_, config_.move_burst);
		case AGENT_WATERING:
			return make_unique<WateringWorker>(id, position, world_, channel_, config_.move_burst);
		case AGENT_HARVESTING:
			return make_unique<HarvestingWorker>(id, position, world_, channel_, config_.move_burst);
		case AGENT_MONITORING:
			return make_unique<MonitoringWorker>(id, position, world_, channel_, config_.scan_interval, config_.disease_threshold);
		case N_AGENT_TYPES:
			break;
	}
	throw invalid_argument("invalid agent type " + to_string(type));
}

void FarmSimulation::step()
{
	world_.refresh();
	planner_.step();
	channel_.flush();

	for (auto& worker : workers_)
		worker->tick();

	channel_.flush();
	invariant();
}

Telemetry FarmSimulation::telemetry() const
{
	Telemetry result;
	result.tick = world_.step_count();
	result.cell_counts = world_.count_cells();
	result.harvested = world_.harvested_count();
	result.active_tasks = planner_.n_active();
	result.queued_tasks = planner_.n_queued();
	result.tasks_completed = planner_.tasks_completed();
	result.tasks_failed = planner_.tasks_failed();

	for (const auto& worker : workers_)
	{
		optional<Task::id_t> task_id;
		if (worker->current_task())
			task_id = worker->current_task()->id;
		result.workers.push_back(WorkerTelemetry{worker->id(), worker->type(), worker->status(), worker->position(), task_id});
	}

	result.weather = world_.weather();
	result.yield = world_.yield_prediction();
	result.stress = world_.stress_indicators();
	return result;
}

void FarmSimulation::invariant() const
{
#ifndef NDEBUG
	world_.invariant();
	planner_.invariant();
	for (const auto& worker : workers_)
		worker->invariant();

	auto counts = world_.count_cells();
	int total = 0;
	for (int n : counts)
		total += n;
	assert(total == world_.width() * world_.height());
#endif
}
