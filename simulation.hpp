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

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "world.hpp"
#include "channel.hpp"
#include "planner.hpp"
#include "worker.hpp"

struct WorkerTelemetry
{
	int id;
	agent_type_t type;
	agent_status_t status;
	Pos position;
	std::optional<Task::id_t> task_id;
};

/** a read-only snapshot of one simulation state. nothing needs to read it. */
struct Telemetry
{
	int tick = 0;
	std::array<int, N_CELL_STATES> cell_counts{};
	int harvested = 0;
	size_t active_tasks = 0;
	size_t queued_tasks = 0;
	int tasks_completed = 0;
	int tasks_failed = 0;
	std::vector<WorkerTelemetry> workers;
	Weather weather;
	YieldPrediction yield;
	StressIndicators stress;

	/** one line: tick, cell counts, harvest and task counters */
	std::string str() const;
};

/** owns the farm, the channel, the planner and all workers, and advances them
  * tick by tick:
  *
  *   1. the world refreshes (weather, growth)
  *   2. the planner updates its knowledge, plans and offers tasks
  *   3. the channel delivers the offers
  *   4. every worker advances its state machine
  *   5. the channel delivers the workers' reports
  */
class FarmSimulation
{
	public:
		explicit FarmSimulation(const SimConfig& config);

		FarmSimulation(const FarmSimulation&) = delete;
		FarmSimulation& operator=(const FarmSimulation&) = delete;

		/** advances exactly one tick */
		void step();

		Telemetry telemetry() const;

		FarmWorld& world() { return world_; }
		const FarmWorld& world() const { return world_; }
		Channel& channel() { return channel_; }
		MasterPlanner& planner() { return planner_; }
		const MasterPlanner& planner() const { return planner_; }
		const std::vector< std::unique_ptr<Worker> >& workers() const { return workers_; }
		const SimConfig& config() const { return config_; }

		/** where the first worker of `type` starts on a width*height farm */
		static Pos home_position(agent_type_t type, int width, int height);

		void invariant() const;

	private:
		std::unique_ptr<Worker> make_worker(agent_type_t type, int id, const Pos& position);

		SimConfig config_;
		FarmWorld world_;
		Channel channel_;
		MasterPlanner planner_;
		// declared last, so they unsubscribe before the channel goes away
		std::vector< std::unique_ptr<Worker> > workers_;
};
