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

#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>

#include "pos.hpp"
#include "defines.h"
#include "task.hpp"

// batch scheduling of tasks onto agents and time slots, independent of the
// tick loop.
namespace sched
{

enum resource_type_t
{
	RES_WATER=0,
	RES_FUEL,
	RES_TOOLS,
	RES_TIME,

	N_RESOURCE_TYPES
};
extern const std::string resource_type_names[];

/** a depletable pool. consumption is all or nothing. */
struct Resource
{
	resource_type_t type;
	double available;
	double max_capacity;

	Resource(resource_type_t type_, double capacity) : type(type_), available(capacity), max_capacity(capacity) {}

	/** takes `amount` and returns true if there is enough, else changes nothing and returns false */
	bool consume(double amount);
	/** adds `amount`, but never beyond max_capacity */
	void replenish(double amount);

	double consumed() const { return max_capacity - available; }
};

using requirements_t = boost::container::flat_map<resource_type_t, double>;

struct SchedTask
{
	std::string id;
	task_type_t type;
	Pos target;
	Task::priority_t priority = 50;
	int duration = 1; // in slots
	requirements_t resources;
};

/** `agent_id` executes `task_id` during slots [slot, slot+duration) */
struct Assignment
{
	std::string task_id;
	int agent_id;
	agent_type_t agent_type;
	int slot;
	int duration;
	Pos target;
	requirements_t resources;
	Task::priority_t priority;

	int end() const { return slot + duration; }
	std::string str() const;
};

/** agent ids per agent type, tried in this order */
using roster_t = boost::container::flat_map< agent_type_t, std::vector<int> >;

struct Metrics
{
	size_t total_tasks = 0;
	int makespan = 0; // latest end() of all assignments
	boost::container::flat_map<resource_type_t, double> resource_utilization; // consumed / capacity
	boost::container::flat_map<int, double> agent_utilization; // reserved slots / horizon
};

class SchedulerInterface
{
	public:
		virtual ~SchedulerInterface() = default;

		/** schedules as many of `tasks` as possible on the agents in `agents`.
		  * returns the assignments made by this call. Tasks that fit nowhere are
		  * left out. */
		virtual std::vector<Assignment> schedule_tasks(const std::vector<SchedTask>& tasks, const roster_t& agents) = 0;
		virtual Metrics metrics() const = 0;
		/** forgets all assignments and refills all pools */
		virtual void reset() = 0;
};

/** Greedy first-fit scheduler: tasks are taken by descending priority (equal
  * priorities in submission order), each is put on the first agent of its type
  * and the earliest slot where the agent is free and all required resources
  * are available. Nothing is ever moved again once placed.
  *
  * Resource pools only shrink, unless they are replenished explicitly or the
  * scheduler is reset(). */
class ConstraintScheduler : public SchedulerInterface
{
	public:
		static constexpr int DEFAULT_HORIZON = 100;

		explicit ConstraintScheduler(int horizon = DEFAULT_HORIZON);

		/** creates or replaces the pool for `type`, filled to `capacity` */
		void add_resource(resource_type_t type, double capacity);
		/** returns false if there is no pool for `type` */
		bool replenish(resource_type_t type, double amount);
		/** nullptr if there is no pool for `type` */
		const Resource* get_resource(resource_type_t type) const;

		/** whether `agent_id` has no reservation in [slot, slot+duration) */
		bool is_agent_available(int agent_id, int slot, int duration) const;
		/** whether every requirement can be served. requirements without pool can't. */
		bool check_resource_availability(const requirements_t& requirements) const;

		/** reserves the agent's slots and debits all resources of `task`, either
		  * completely or not at all. fails if the slot range is outside the
		  * horizon, the agent is busy, or resources are missing. */
		bool assign_task(const SchedTask& task, int agent_id, int slot);

		std::vector<Assignment> schedule_tasks(const std::vector<SchedTask>& tasks, const roster_t& agents) override;
		Metrics metrics() const override;
		void reset() override;

		const std::vector<Assignment>& assignments() const { return assignments_; }
		int horizon() const { return horizon_; }

		/** logs the schedule ordered by slot, and the metrics */
		void dump() const;

		void invariant() const;

	private:
		int horizon_;
		boost::container::flat_map<resource_type_t, Resource> resources;
		std::vector<Assignment> assignments_;
		boost::container::flat_map< int, boost::container::flat_set<int> > agent_schedules; // agent id -> occupied slots
};

}
