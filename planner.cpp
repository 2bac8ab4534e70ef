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

#include "planner.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <algorithm>
#include <cassert>
#include <stdexcept>

using namespace std;

MasterPlanner::MasterPlanner(const FarmWorld& world_, Channel& channel_, int max_tasks_per_type_, int assign_burst_) :
	world(world_), channel(channel_), max_tasks_per_type(max_tasks_per_type_), assign_burst(assign_burst_),
	knowledge_(world_.width(), world_.height())
{
	if (max_tasks_per_type < 0 || assign_burst < 0)
		throw invalid_argument("max_tasks_per_type and assign_burst must not be negative");

	channel.subscribe(topic::TASK_COMPLETED, this);
	channel.subscribe(topic::TASK_FAILED, this);
	channel.subscribe(topic::ALERT_DISEASE, this);
	channel.subscribe(topic::STATUS_UPDATE, this);
}

MasterPlanner::~MasterPlanner()
{
	channel.unsubscribe_all(this);
}

void MasterPlanner::register_worker(agent_type_t type, int worker_id)
{
	if (type < 0 || type >= N_AGENT_TYPES)
		throw invalid_argument("invalid agent type " + to_string(type));

	if (!contains_vec(workers[type], worker_id))
		workers[type].push_back(worker_id);
}

void MasterPlanner::step()
{
	update_knowledge();
	plan_tasks();
	assign_pending_tasks();
	invariant();
}

void MasterPlanner::update_knowledge()
{
	for (const Pos& pos : knowledge_.positions())
	{
		CellKnowledge& k = knowledge_.at(pos);
		k.state = world.get_cell_state(pos);
		k.attributes = world.get_cell_attributes(pos);
		k.last_updated = world.step_count();
	}
	cached_weather = world.weather();
}

optional< pair<task_type_t, Task::priority_t> > MasterPlanner::score_cell(const CellKnowledge& knowledge, const Weather& weather)
{
	switch (knowledge.state)
	{
		case CELL_DISEASED:
			return pair(TASK_WATER, PRIO_DISEASED);

		case CELL_NEED_WATER:
			// the rain will do it, unless the heat can't wait that long
			if (weather.rain_forecast_24h && !weather.heat_stress())
				return nullopt;
			return pair(TASK_WATER, weather.heat_stress() ? PRIO_NEED_WATER_HEAT : PRIO_NEED_WATER);

		case CELL_READY_TO_HARVEST:
			return pair(TASK_HARVEST, PRIO_HARVEST);

		case CELL_SOWN:
			return pair(TASK_WATER, weather.rain_forecast_24h ? PRIO_SOWN_RAIN : PRIO_SOWN);

		case CELL_PLOUGHED:
			return pair(TASK_SOW, PRIO_SOW);

		case CELL_INITIAL:
			return pair(TASK_PLOUGH, PRIO_PLOUGH);

		default:
			return nullopt;
	}
}

int MasterPlanner::n_outstanding(task_type_t type) const
{
	return int(count_if(tasks.begin(), tasks.end(), [type](const auto& entry) { return entry.second->type == type; }));
}

size_t MasterPlanner::n_active() const
{
	return busy_workers.size();
}

int MasterPlanner::plan_tasks()
{
	array<int, N_TASK_TYPES> task_counts{};
	for (const auto& [id, task] : tasks)
		task_counts[task->type]++;

	int n_created = 0;
	for (const Pos& pos : knowledge_.positions())
	{
		const CellKnowledge& k = knowledge_.at(pos);
		if (!k.pending_tasks.empty())
			continue;

		auto need = score_cell(k, cached_weather);
		if (!need.has_value())
			continue;

		auto [type, priority] = *need;
		if (task_counts[type] >= max_tasks_per_type)
			continue;

		create_task(type, pos, priority);
		task_counts[type]++;
		n_created++;
	}

	if (n_created > 0)
	{
		Logger log("planner", Logger::DETAIL);
		log << "tick " << world.step_count() << ": created " << n_created << " tasks, " << queue.size() << " queued" << endl;
	}
	return n_created;
}

shared_ptr<Task> MasterPlanner::create_task(task_type_t type, const Pos& target, Task::priority_t priority)
{
	auto task = make_shared<Task>(next_task_id++, type, target, priority, world.step_count());

	queue.push(QueuedTask{task, next_seq++});
	tasks[task->id] = task;
	if (knowledge_.contains(target))
		knowledge_.at(target).pending_tasks.push_back(task->id);

	return task;
}

optional<int> MasterPlanner::find_free_worker(agent_type_t type) const
{
	if (type < 0 || type >= N_AGENT_TYPES)
		return nullopt;

	for (int id : workers[type])
		if (!contains(busy_workers, id))
			return id;
	return nullopt;
}

int MasterPlanner::assign_pending_tasks()
{
	vector<QueuedTask> unassignable;
	int n_offered = 0;

	// tasks waiting for a busy worker type don't use up the burst, so they can't
	// starve lower priorities of other types
	while (n_offered < assign_burst && !queue.empty())
	{
		QueuedTask entry = queue.top();
		queue.pop();

		auto worker_id = find_free_worker(agent_type_for(entry.task->type));
		if (!worker_id.has_value())
		{
			unassignable.push_back(entry);
			continue;
		}

		offer(entry.task, *worker_id);
		n_offered++;
	}

	// they keep their seq, so they don't lose their place among equal priorities
	for (auto& entry : unassignable)
		queue.push(entry);

	return n_offered;
}

void MasterPlanner::offer(const shared_ptr<Task>& task, int worker_id)
{
	task->status = Task::ASSIGNED;
	task->assigned_to = worker_id;
	busy_workers[worker_id] = task->id;

	Logger log("planner", Logger::DETAIL);
	log << "offering " << task->str() << endl;

	AssignmentPayload payload{task, agent_type_for(task->type), worker_id};
	channel.publish(topic::TASK_ASSIGNED, Message(PLANNER_ID, world.step_count(), payload));
}

void MasterPlanner::finish_task(Task::id_t id, Task::status_t status)
{
	auto iter = tasks.find(id);
	if (iter == tasks.end())
	{
		Logger log("planner", Logger::DETAIL);
		log << "ignoring report about unknown task_" << id << endl;
		return;
	}

	shared_ptr<Task> task = iter->second;
	if (task->status != Task::ASSIGNED)
	{
		Logger log("planner");
		log << "ignoring report about " << task->str() << ", which was never assigned" << endl;
		return;
	}

	task->status = status;
	task->completed_at = world.step_count();

	if (knowledge_.contains(task->target))
		erase_first(knowledge_.at(task->target).pending_tasks, task->id);

	if (task->assigned_to.has_value())
	{
		auto busy = busy_workers.find(*task->assigned_to);
		if (busy != busy_workers.end() && busy->second == task->id)
			busy_workers.erase(busy);
	}

	tasks.erase(iter);

	if (status == Task::COMPLETED)
		n_completed++;
	else
		n_failed++;
}

void MasterPlanner::on_message(const Message& message)
{
	if (const auto* done = get_if<CompletionPayload>(&message.payload))
	{
		{
			Logger log("planner", Logger::DETAIL);
			log << "task_" << done->task_id << " " << CompletionPayload::action_names[done->action] << " " << done->cell.str() << endl;
		}
		finish_task(done->task_id, Task::COMPLETED);
	}
	else if (const auto* failure = get_if<FailurePayload>(&message.payload))
	{
		{
			Logger log("planner");
			log << "task_" << failure->task_id << " at " << failure->cell.str() << " failed: " << FailurePayload::reason_names[failure->reason] << endl;
		}
		finish_task(failure->task_id, Task::FAILED);
	}
	else if (const auto* alert = get_if<AlertPayload>(&message.payload))
	{
		Logger log("planner");
		log << "disease alert at " << alert->cell.str() << " (p=" << alert->disease_probability << ")" << endl;

		if (!world.contains(alert->cell))
			return;

		// only one water task per cell at a time
		for (Task::id_t id : knowledge_.at(alert->cell).pending_tasks)
			if (tasks.at(id)->type == TASK_WATER)
				return;

		create_task(TASK_WATER, alert->cell, PRIO_DISEASE_ALERT);
	}
	else if (const auto* status = get_if<StatusPayload>(&message.payload))
	{
		worker_status.insert_or_assign(status->agent_id, *status);
	}
}

shared_ptr<const Task> MasterPlanner::get_task(Task::id_t id) const
{
	return get_or(tasks, id, nullptr);
}

optional<StatusPayload> MasterPlanner::last_status(int worker_id) const
{
	auto iter = worker_status.find(worker_id);
	if (iter == worker_status.end())
		return nullopt;
	return iter->second;
}

void MasterPlanner::invariant() const
{
#ifndef NDEBUG
	size_t n_pending = 0;
	for (const CellKnowledge& k : knowledge_)
	{
		n_pending += k.pending_tasks.size();
		for (Task::id_t id : k.pending_tasks)
			assert(contains(tasks, id));
	}
	assert(n_pending == tasks.size());

	size_t n_assigned = 0;
	for (const auto& [id, task] : tasks)
	{
		assert(task->id == id);
		assert(task->status == Task::PENDING || task->status == Task::ASSIGNED);
		if (task->status == Task::ASSIGNED)
			n_assigned++;
	}
	assert(n_assigned == busy_workers.size());
	assert(tasks.size() == n_assigned + queue.size());
#endif
}
