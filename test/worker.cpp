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

#include "../worker.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <vector>

using namespace std;

// keeps every report the workers send
struct Reports : public Subscriber
{
	Channel& channel;
	vector<CompletionPayload> completed;
	vector<FailurePayload> failed;
	vector<AlertPayload> alerts;
	vector<StatusPayload> status;

	Reports(Channel& channel_) : channel(channel_)
	{
		channel.subscribe(topic::TASK_COMPLETED, this);
		channel.subscribe(topic::TASK_FAILED, this);
		channel.subscribe(topic::ALERT_DISEASE, this);
		channel.subscribe(topic::STATUS_UPDATE, this);
	}
	~Reports() { channel.unsubscribe_all(this); }

	void on_message(const Message& message) override
	{
		if (auto done = get_if<CompletionPayload>(&message.payload)) completed.push_back(*done);
		else if (auto failure = get_if<FailurePayload>(&message.payload)) failed.push_back(*failure);
		else if (auto alert = get_if<AlertPayload>(&message.payload)) alerts.push_back(*alert);
		else if (auto report = get_if<StatusPayload>(&message.payload)) status.push_back(*report);
	}
};

static bool near(double a, double b)
{
	return fabs(a - b) < 1e-9;
}

static int next_task_id = 1;

static shared_ptr<const Task> offer(Channel& channel, task_type_t type, Pos target, optional<int> worker_id = nullopt)
{
	auto task = make_shared<Task>(next_task_id++, type, target, 50, 0);
	channel.publish(topic::TASK_ASSIGNED, Message(0, 0, AssignmentPayload{task, agent_type_for(type), worker_id}));
	channel.flush();
	return task;
}

static void set_cell(FarmWorld& world, const Pos& pos, cell_state_t state, double water, int growth, double disease = 0.)
{
	AttributeUpdate update;
	update.water_level = water;
	update.growth_progress = growth;
	update.disease_probability = disease;
	world.update_cell_attributes(pos, update);
	world.set_cell_state(pos, state);
}

// ticks until the worker is idle again, at most `limit` times. returns the number of ticks.
static int run_until_idle(Worker& worker, int limit = 100)
{
	int n = 0;
	while (worker.status() != AGENT_IDLE && n < limit)
	{
		worker.tick();
		n++;
		assert((worker.current_task() != nullptr) == (worker.status() != AGENT_IDLE));
	}
	return n;
}

static void test_plough_adjacent()
{
	cout << "a ploughing worker next to an initial cell ploughs it" << endl;

	FarmWorld world(5, 5);
	Channel channel;
	Reports reports(channel);
	PloughingWorker worker(1, Pos(1,2), world, channel);

	assert(worker.status() == AGENT_IDLE);
	assert(worker.current_task() == nullptr);

	auto task = offer(channel, TASK_PLOUGH, Pos(2,2));
	cout << "\t" << worker.str() << endl;
	assert(worker.status() == AGENT_MOVING);
	assert(worker.current_task() == task);
	assert(worker.path().size() == 1);

	worker.tick();
	assert(worker.position() == Pos(2,2));
	assert(worker.status() == AGENT_WORKING);
	assert(world.get_cell_state(Pos(2,2)) == CELL_INITIAL);

	worker.tick();
	assert(world.get_cell_state(Pos(2,2)) == CELL_PLOUGHED);
	assert(worker.status() == AGENT_IDLE);
	assert(worker.current_task() == nullptr);

	channel.flush();
	assert(reports.completed.size() == 1);
	assert(reports.completed[0].task_id == task->id);
	assert(reports.completed[0].action == CompletionPayload::PLOUGHED);
	assert(reports.completed[0].cell == Pos(2,2));
	assert(reports.failed.empty());
	assert(reports.status.size() == 1);
	assert(reports.status[0].agent_id == 1);
	assert(reports.status[0].task_id == task->id);
}

static void test_ignored_offers()
{
	cout << "offers for other types, other workers, or busy workers are ignored" << endl;

	FarmWorld world(5, 5);
	Channel channel;
	PloughingWorker worker(1, Pos(0,0), world, channel);

	offer(channel, TASK_SOW, Pos(3,3));
	assert(worker.status() == AGENT_IDLE);

	offer(channel, TASK_PLOUGH, Pos(3,3), 2);
	assert(worker.status() == AGENT_IDLE);

	auto mine = offer(channel, TASK_PLOUGH, Pos(3,3), 1);
	assert(worker.current_task() == mine);

	offer(channel, TASK_PLOUGH, Pos(4,4));
	assert(worker.current_task() == mine);
}

static void test_move_burst()
{
	cout << "workers walk at most move_burst steps per tick" << endl;

	FarmWorld world(5, 5);
	Channel channel;
	PloughingWorker worker(1, Pos(0,0), world, channel, 3);

	offer(channel, TASK_PLOUGH, Pos(4,4));
	assert(worker.path().size() == 8);

	worker.tick();
	assert(worker.position().manhattan(Pos(0,0)) == 3);
	assert(worker.status() == AGENT_MOVING);
	worker.tick();
	assert(worker.position().manhattan(Pos(0,0)) == 6);
	worker.tick();
	assert(worker.position() == Pos(4,4));
	assert(worker.status() == AGENT_WORKING);
	worker.tick();
	assert(worker.status() == AGENT_IDLE);
	assert(world.get_cell_state(Pos(4,4)) == CELL_PLOUGHED);
}

static void test_precondition()
{
	cout << "a cell in the wrong state is left alone and the task fails" << endl;

	FarmWorld world(3, 3);
	Channel channel;
	Reports reports(channel);
	SowingWorker worker(1, Pos(1,1), world, channel);

	// not ploughed
	auto task = offer(channel, TASK_SOW, Pos(1,1));
	assert(worker.path().empty());
	run_until_idle(worker);
	channel.flush();

	assert(world.get_cell_state(Pos(1,1)) == CELL_INITIAL);
	assert(reports.completed.empty());
	assert(reports.failed.size() == 1);
	assert(reports.failed[0].task_id == task->id);
	assert(reports.failed[0].reason == FailurePayload::PRECONDITION);
	assert(worker.current_task() == nullptr);
}

static void test_no_path()
{
	cout << "a worker without a path gives up immediately" << endl;

	FarmWorld world(3, 3);
	Channel channel;
	Reports reports(channel);
	PloughingWorker worker(1, Pos(0,0), world, channel);

	auto task = offer(channel, TASK_PLOUGH, Pos(7,7));
	assert(worker.status() == AGENT_IDLE);
	assert(worker.current_task() == nullptr);

	channel.flush();
	assert(reports.failed.size() == 1);
	assert(reports.failed[0].task_id == task->id);
	assert(reports.failed[0].reason == FailurePayload::NO_PATH);
}

static void test_sow_and_harvest()
{
	cout << "sowing and harvesting" << endl;

	FarmWorld world(3, 3);
	Channel channel;
	Reports reports(channel);
	SowingWorker sower(1, Pos(0,0), world, channel);
	HarvestingWorker harvester(2, Pos(2,2), world, channel);

	set_cell(world, Pos(0,1), CELL_PLOUGHED, 0.1, 30, 0.4);
	offer(channel, TASK_SOW, Pos(0,1));
	run_until_idle(sower);
	assert(world.get_cell_state(Pos(0,1)) == CELL_SOWN);
	assert(near(world.get_cell_attributes(Pos(0,1)).water_level, 0.5));
	assert(world.get_cell_attributes(Pos(0,1)).growth_progress == 0);
	assert(near(world.get_cell_attributes(Pos(0,1)).disease_probability, 0.));

	set_cell(world, Pos(2,1), CELL_READY_TO_HARVEST, 0.7, 100, 0.1);
	offer(channel, TASK_HARVEST, Pos(2,1));
	run_until_idle(harvester);
	assert(world.get_cell_state(Pos(2,1)) == CELL_INITIAL);
	assert(world.harvested_count() == 1);
	const CellAttributes& attrs = world.get_cell_attributes(Pos(2,1));
	assert(near(attrs.water_level, 0.) && attrs.growth_progress == 0 && near(attrs.disease_probability, 0.));

	channel.flush();
	assert(reports.completed.size() == 2);
	assert(reports.completed[0].action == CompletionPayload::SOWN);
	assert(reports.completed[1].action == CompletionPayload::HARVESTED);
	assert(reports.completed[1].yield == 1);
}

static void test_watering()
{
	cout << "watering" << endl;

	FarmWorld world(4, 4);
	Channel channel;
	Reports reports(channel);
	WateringWorker worker(1, Pos(0,0), world, channel);

	set_cell(world, Pos(1,0), CELL_SOWN, 0.5, 0);
	set_cell(world, Pos(2,0), CELL_NEED_WATER, 0.25, 60);
	set_cell(world, Pos(3,0), CELL_NEED_WATER, 0.25, 20);
	set_cell(world, Pos(3,3), CELL_DISEASED, 0.4, 30, 0.5);
	set_cell(world, Pos(0,3), CELL_DISEASED, 0.1, 30, 0.1);

	offer(channel, TASK_WATER, Pos(1,0));
	run_until_idle(worker);
	assert(world.get_cell_state(Pos(1,0)) == CELL_GROWING);
	assert(near(world.get_cell_attributes(Pos(1,0)).water_level, 0.8));

	offer(channel, TASK_WATER, Pos(2,0));
	run_until_idle(worker);
	assert(world.get_cell_state(Pos(2,0)) == CELL_HEALTHY);
	assert(near(world.get_cell_attributes(Pos(2,0)).water_level, 0.55));

	offer(channel, TASK_WATER, Pos(3,0));
	run_until_idle(worker);
	assert(world.get_cell_state(Pos(3,0)) == CELL_GROWING);

	offer(channel, TASK_WATER, Pos(3,3));
	run_until_idle(worker);
	assert(world.get_cell_state(Pos(3,3)) == CELL_GROWING);
	assert(near(world.get_cell_attributes(Pos(3,3)).disease_probability, 0.3));

	offer(channel, TASK_WATER, Pos(0,3));
	run_until_idle(worker);
	assert(world.get_cell_state(Pos(0,3)) == CELL_DISEASED);
	assert(near(world.get_cell_attributes(Pos(0,3)).water_level, 0.4));
	assert(near(world.get_cell_attributes(Pos(0,3)).disease_probability, 0.));

	channel.flush();
	assert(reports.completed.size() == 5);
	for (auto& done : reports.completed)
		assert(done.action == CompletionPayload::WATERED);

	cout << "\twhile rain is forecast, watering is only delayed" << endl;
	Weather rainy;
	rainy.rain_forecast_24h = true;
	world.set_weather(rainy);

	set_cell(world, Pos(2,2), CELL_NEED_WATER, 0.1, 40);
	offer(channel, TASK_WATER, Pos(2,2));
	run_until_idle(worker);
	assert(world.get_cell_state(Pos(2,2)) == CELL_NEED_WATER);
	assert(near(world.get_cell_attributes(Pos(2,2)).water_level, 0.1));

	channel.flush();
	assert(reports.completed.back().action == CompletionPayload::WATERING_DELAYED);
}

static void test_monitoring()
{
	cout << "the monitoring worker scans periodically and raises alerts" << endl;

	FarmWorld world(3, 3);
	Channel channel;
	Reports reports(channel);

	set_cell(world, Pos(1,1), CELL_GROWING, 0.9, 40);
	set_cell(world, Pos(2,2), CELL_PLOUGHED, 0.0, 0);

	// a threshold nothing can stay below
	MonitoringWorker drone(1, Pos(0,0), world, channel, 4, 0.0);

	offer(channel, TASK_MONITOR, Pos(1,1));
	assert(drone.status() == AGENT_IDLE);

	for (int i = 0; i < 3; i++)
	{
		world.refresh();
		drone.tick();
	}
	assert(world.get_cell_state(Pos(1,1)) == CELL_GROWING);
	assert(drone.last_scan() == 0);

	world.refresh();
	drone.tick();
	assert(drone.last_scan() == 4);
	assert(world.get_cell_state(Pos(1,1)) == CELL_DISEASED);
	assert(world.get_cell_state(Pos(2,2)) == CELL_PLOUGHED);

	channel.flush();
	assert(reports.alerts.size() == 1);
	assert(reports.alerts[0].cell == Pos(1,1));
	double p = world.get_cell_attributes(Pos(1,1)).disease_probability;
	assert(near(reports.alerts[0].disease_probability, p));
	// dried out to 0.7 and grown to 48 by now: 0.02 + 0.3*0.15 + 0.48*0.1 + [0,0.1)
	assert(p >= 0.02 + 0.045 + 0.048 - 1e-9 && p < 0.02 + 0.045 + 0.048 + 0.1 + 1e-9);

	cout << "\tand with the default threshold, healthy crops stay healthy" << endl;
	FarmWorld farm(3, 3);
	Channel quiet;
	MonitoringWorker careful(1, Pos(0,0), farm, quiet);
	set_cell(farm, Pos(0,1), CELL_HEALTHY, 0.9, 70);
	assert(careful.scan_farm() == 0);
	assert(farm.get_cell_state(Pos(0,1)) == CELL_HEALTHY);
	assert(farm.get_cell_attributes(Pos(0,1)).disease_probability > 0.);
}

int main()
{
	test_plough_adjacent();
	test_ignored_offers();
	test_move_burst();
	test_precondition();
	test_no_path();
	test_sow_and_harvest();
	test_watering();
	test_monitoring();

	cout << "all worker tests passed" << endl;
	return 0;
}
