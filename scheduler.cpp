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

#include "scheduler.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <algorithm>
#include <cassert>
#include <stdexcept>

using namespace std;

namespace sched
{

const string resource_type_names[] = { "water", "fuel", "tools", "time" };

bool Resource::consume(double amount)
{
	if (available < amount)
		return false;
	available -= amount;
	return true;
}

void Resource::replenish(double amount)
{
	available = min(max_capacity, available + amount);
}

string Assignment::str() const
{
	string result = "slot " + to_string(slot) + "-" + to_string(end()) + ": "
		+ agent_type_names[agent_type] + " #" + to_string(agent_id)
		+ " -> " + task_id + " @" + target.str() + " (prio " + to_string(priority) + ")";
	if (!resources.empty())
		result += " using " + join_string(resources, [](const auto& req) { return to_string(req.second) + " " + resource_type_names[req.first]; });
	return result;
}

ConstraintScheduler::ConstraintScheduler(int horizon) : horizon_(horizon)
{
	if (horizon_ <= 0)
		throw invalid_argument("the scheduling horizon must be positive");

	add_resource(RES_WATER, 1000.);
	add_resource(RES_FUEL, 500.);
	add_resource(RES_TOOLS, 5.);
}

void ConstraintScheduler::add_resource(resource_type_t type, double capacity)
{
	if (capacity < 0.)
		throw invalid_argument("resource capacity must not be negative");
	resources.insert_or_assign(type, Resource(type, capacity));
}

bool ConstraintScheduler::replenish(resource_type_t type, double amount)
{
	auto iter = resources.find(type);
	if (iter == resources.end())
		return false;
	iter->second.replenish(amount);
	return true;
}

const Resource* ConstraintScheduler::get_resource(resource_type_t type) const
{
	auto iter = resources.find(type);
	return iter == resources.end() ? nullptr : &iter->second;
}

bool ConstraintScheduler::is_agent_available(int agent_id, int slot, int duration) const
{
	auto iter = agent_schedules.find(agent_id);
	if (iter == agent_schedules.end())
		return true;

	const auto& occupied = iter->second;
	// the first occupied slot not before `slot` must be past the window
	auto first = occupied.lower_bound(slot);
	return first == occupied.end() || (long long)(*first) >= (long long)(slot) + duration;
}

bool ConstraintScheduler::check_resource_availability(const requirements_t& requirements) const
{
	for (const auto& [type, amount] : requirements)
	{
		auto iter = resources.find(type);
		if (iter == resources.end())
			return false;
		if (amount < 0. || iter->second.available < amount)
			return false;
	}
	return true;
}

bool ConstraintScheduler::assign_task(const SchedTask& task, int agent_id, int slot)
{
	if (task.duration <= 0 || slot < 0 || task.duration > horizon_ - slot)
		return false;

	if (!is_agent_available(agent_id, slot, task.duration))
		return false;

	if (!check_resource_availability(task.resources))
		return false;

	auto& occupied = agent_schedules[agent_id];
	for (int i = slot; i < slot + task.duration; i++)
		occupied.insert(i);

	for (const auto& [type, amount] : task.resources)
	{
		bool ok = resources.at(type).consume(amount);
		assert(ok);
		(void) ok;
	}

	assignments_.push_back(Assignment{task.id, agent_id, agent_type_for(task.type), slot, task.duration, task.target, task.resources, task.priority});
	return true;
}

vector<Assignment> ConstraintScheduler::schedule_tasks(const vector<SchedTask>& tasks, const roster_t& agents)
{
	Logger log("sched", Logger::DETAIL);

	vector<const SchedTask*> order;
	order.reserve(tasks.size());
	for (const SchedTask& task : tasks)
		order.push_back(&task);
	stable_sort(order.begin(), order.end(), [](const SchedTask* a, const SchedTask* b) { return a->priority > b->priority; });

	vector<Assignment> result;
	for (const SchedTask* task : order)
	{
		auto roster = agents.find(agent_type_for(task->type));
		if (roster == agents.end())
		{
			log << "no " << task_type_names[task->type] << " agents for " << task->id << endl;
			continue;
		}

		bool assigned = false;
		for (int agent_id : roster->second)
		{
			for (int slot = 0; slot < horizon_ && task->duration <= horizon_ - slot; slot++)
				if (assign_task(*task, agent_id, slot))
				{
					assigned = true;
					break;
				}

			if (assigned)
				break;
		}

		if (assigned)
			result.push_back(assignments_.back());
		else
			log << "could not place " << task->id << endl;
	}

	invariant();
	return result;
}

Metrics ConstraintScheduler::metrics() const
{
	Metrics result;
	result.total_tasks = assignments_.size();

	for (const Assignment& a : assignments_)
		result.makespan = max(result.makespan, a.end());

	if (assignments_.empty())
		return result;

	for (const auto& [type, resource] : resources)
		result.resource_utilization[type] = resource.max_capacity > 0. ? resource.consumed() / resource.max_capacity : 0.;

	for (const auto& [agent_id, slots] : agent_schedules)
		result.agent_utilization[agent_id] = double(slots.size()) / horizon_;

	return result;
}

void ConstraintScheduler::reset()
{
	assignments_.clear();
	agent_schedules.clear();
	for (auto& [type, resource] : resources)
		resource.available = resource.max_capacity;
}

void ConstraintScheduler::dump() const
{
	Logger log("sched");

	vector<const Assignment*> by_slot;
	for (const Assignment& a : assignments_)
		by_slot.push_back(&a);
	stable_sort(by_slot.begin(), by_slot.end(), [](const Assignment* a, const Assignment* b) { return a->slot < b->slot; });

	log << "schedule over " << horizon_ << " slots:" << endl;
	for (const Assignment* a : by_slot)
		log << "  " << a->str() << endl;

	Metrics m = metrics();
	log << "total tasks: " << m.total_tasks << ", makespan: " << m.makespan << endl;
	for (const auto& [type, util] : m.resource_utilization)
		log << "  " << strpad(resource_type_names[type], 6) << " " << util * 100. << "%" << endl;
	for (const auto& [agent_id, util] : m.agent_utilization)
		log << "  agent #" << agent_id << " " << util * 100. << "%" << endl;
}

void ConstraintScheduler::invariant() const
{
#ifndef NDEBUG
	for (const auto& [type, resource] : resources)
	{
		assert(resource.type == type);
		assert(resource.available >= 0. && resource.available <= resource.max_capacity);
	}

	for (const auto& [agent_id, slots] : agent_schedules)
	{
		size_t n_reserved = 0;
		for (const Assignment& a : assignments_)
			if (a.agent_id == agent_id)
				n_reserved += size_t(a.duration);
		assert(n_reserved == slots.size());
		for (int slot : slots)
			assert(slot >= 0 && slot < horizon_);
	}
#endif
}

}
