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

#include "worker.hpp"
#include "pathfinding.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <algorithm>
#include <cassert>
#include <stdexcept>

using namespace std;

Worker::Worker(int id, agent_type_t type, Pos position, FarmWorld& world_, Channel& channel_, int move_burst_) :
	world(world_), channel(channel_), id_(id), type_(type), position_(position), move_burst(move_burst_)
{
	if (move_burst <= 0)
		throw invalid_argument("move_burst must be positive");

	channel.subscribe(topic::TASK_ASSIGNED, this);
}

Worker::~Worker()
{
	channel.unsubscribe_all(this);
}

void Worker::publish(const string& topic_, payload_t payload)
{
	channel.publish(topic_, Message(id_, world.step_count(), std::move(payload)));
}

void Worker::on_message(const Message& message)
{
	const auto* offer = get_if<AssignmentPayload>(&message.payload);
	if (offer == nullptr || !offer->task)
		return;

	if (!accepts_offers() || offer->worker_type != type_)
		return;
	if (offer->worker_id.has_value() && *offer->worker_id != id_)
		return;

	if (status_ != AGENT_IDLE)
	{
		Logger log("worker", Logger::DETAIL);
		log << str() << " is busy, ignoring " << offer->task->name() << endl;
		return;
	}

	accept(offer->task);
}

void Worker::accept(const shared_ptr<const Task>& task)
{
	current_task_ = task;
	vector<Pos> route = find_path(position_, task->target, world.width(), world.height());

	if (route.empty())
	{
		Logger log("worker");
		log << agent_type_names[type_] << " #" << id_ << " found no path from " << position_.str() << " to " << task->target.str() << ", aborting " << task->name() << endl;
		fail(FailurePayload::NO_PATH);
		return;
	}

	path_.assign(route.begin(), route.end());
	if (path_.front() == position_)
		path_.pop_front();

	status_ = AGENT_MOVING;
	Logger log("worker", Logger::DETAIL);
	log << str() << " accepted " << task->str() << endl;
	invariant();
}

void Worker::walk()
{
	for (int i = 0; i < move_burst && !path_.empty(); i++)
	{
		position_ = path_.front();
		path_.pop_front();

		if (position_ == current_task_->target)
			break;
	}

	if (path_.empty() || position_ == current_task_->target)
	{
		path_.clear();
		status_ = AGENT_WORKING;
	}
}

void Worker::tick()
{
	switch (status_)
	{
		case AGENT_IDLE:
			break;

		case AGENT_MOVING:
			walk();
			break;

		case AGENT_WORKING:
			result = execute(*current_task_);
			status_ = AGENT_COMPLETED;
			[[fallthrough]]; // reporting does not take an extra tick

		case AGENT_COMPLETED:
			report();
			break;
	}

	invariant();
}

void Worker::report()
{
	const Task& task = *current_task_;

	if (result.has_value())
	{
		CompletionPayload done{task.id, task.target, *result};
		if (*result == CompletionPayload::HARVESTED)
			done.yield = 1;
		publish(topic::TASK_COMPLETED, done);
	}
	else
	{
		Logger log("worker");
		log << agent_type_names[type_] << " #" << id_ << " found " << task.target.str() << " in state " << cell_state_names[world.get_cell_state(task.target)] << ", abandoning " << task.name() << endl;
		publish(topic::TASK_FAILED, FailurePayload{task.id, task.target, FailurePayload::PRECONDITION});
	}

	publish(topic::STATUS_UPDATE, StatusPayload{id_, type_, position_, status_, task.id,
		result.has_value() ? CompletionPayload::action_names[*result] + " " + task.target.str() : string("skipped ") + task.target.str()});

	clear_task();
}

void Worker::fail(FailurePayload::reason_t reason)
{
	publish(topic::TASK_FAILED, FailurePayload{current_task_->id, current_task_->target, reason});
	clear_task();
}

void Worker::clear_task()
{
	current_task_.reset();
	path_.clear();
	result.reset();
	status_ = AGENT_IDLE;
}

string Worker::str() const
{
	string s = agent_type_names[type_] + " #" + to_string(id_) + " @" + position_.str() + " " + agent_status_names[status_];
	if (current_task_)
		s += " on " + current_task_->name();
	if (!path_.empty())
		s += " via [" + join_string(path_, [](const Pos& p) { return p.str(); }) + "]";
	return s;
}

void Worker::invariant() const
{
#ifndef NDEBUG
	assert((current_task_ != nullptr) == (status_ != AGENT_IDLE));
	assert(!result.has_value() || status_ == AGENT_COMPLETED);
	if (status_ == AGENT_IDLE)
		assert(path_.empty());
#endif
}


optional<CompletionPayload::action_t> PloughingWorker::execute(const Task& task)
{
	if (world.get_cell_state(task.target) != CELL_INITIAL)
		return nullopt;

	world.set_cell_state(task.target, CELL_PLOUGHED);
	return CompletionPayload::PLOUGHED;
}

optional<CompletionPayload::action_t> SowingWorker::execute(const Task& task)
{
	if (world.get_cell_state(task.target) != CELL_PLOUGHED)
		return nullopt;

	AttributeUpdate update;
	update.growth_progress = 0;
	update.water_level = 0.5;
	update.disease_probability = 0.;
	world.update_cell_attributes(task.target, update);
	world.set_cell_state(task.target, CELL_SOWN);
	return CompletionPayload::SOWN;
}

optional<CompletionPayload::action_t> WateringWorker::execute(const Task& task)
{
	if (world.weather().rain_forecast_24h)
		return CompletionPayload::WATERING_DELAYED;

	const Pos& cell = task.target;
	cell_state_t state = world.get_cell_state(cell);
	if (state != CELL_SOWN && state != CELL_NEED_WATER && state != CELL_DISEASED)
		return nullopt;

	const CellAttributes& attrs = world.get_cell_attributes(cell);
	double new_water = min(1., attrs.water_level + WATER_AMOUNT);

	AttributeUpdate update;
	update.water_level = new_water;
	update.last_watered = world.step_count();

	cell_state_t new_state = state;
	switch (state)
	{
		case CELL_SOWN:
			new_state = CELL_GROWING;
			break;
		case CELL_NEED_WATER:
			new_state = (attrs.growth_progress > 50 && new_water > 0.5) ? CELL_HEALTHY : CELL_GROWING;
			break;
		case CELL_DISEASED:
			update.disease_probability = max(0., attrs.disease_probability - DISEASE_TREATMENT);
			if (new_water > 0.6)
				new_state = CELL_GROWING;
			break;
		default:
			break;
	}

	world.update_cell_attributes(cell, update);
	world.set_cell_state(cell, new_state);
	return CompletionPayload::WATERED;
}

optional<CompletionPayload::action_t> HarvestingWorker::execute(const Task& task)
{
	if (world.get_cell_state(task.target) != CELL_READY_TO_HARVEST)
		return nullopt;

	AttributeUpdate update;
	update.water_level = 0.;
	update.growth_progress = 0;
	update.disease_probability = 0.;
	update.last_watered = 0;
	world.update_cell_attributes(task.target, update);
	world.set_cell_state(task.target, CELL_INITIAL);
	world.record_harvest();
	return CompletionPayload::HARVESTED;
}


void MonitoringWorker::tick()
{
	if (world.step_count() - last_scan_step >= scan_interval)
	{
		scan_farm();
		last_scan_step = world.step_count();
	}
	Worker::tick();
}

int MonitoringWorker::scan_farm()
{
	Logger log("monitor", Logger::DETAIL);

	int n_diseased = 0;
	for (const Pos& pos : world.positions())
		if (scan_cell(pos))
			n_diseased++;

	log << "scan at tick " << world.step_count() << " found " << n_diseased << " new diseased cells" << endl;
	return n_diseased;
}

bool MonitoringWorker::scan_cell(const Pos& pos)
{
	cell_state_t state = world.get_cell_state(pos);
	if (state != CELL_SOWN && state != CELL_GROWING && state != CELL_HEALTHY)
		return false;

	const CellAttributes& attrs = world.get_cell_attributes(pos);
	uniform_real_distribution<double> noise(0., 1.);

	double p = 0.02
		+ (1. - attrs.water_level) * 0.15
		+ attrs.growth_progress / 100. * 0.1
		+ noise(world.rng()) * 0.1;
	p = min(1., p);

	AttributeUpdate update;
	update.disease_probability = p;
	world.update_cell_attributes(pos, update);

	if (p <= disease_threshold)
		return false;

	world.set_cell_state(pos, CELL_DISEASED);
	const CellAttributes& after = world.get_cell_attributes(pos);
	publish(topic::ALERT_DISEASE, AlertPayload{pos, after.disease_probability, after.water_level});
	return true;
}
