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

#include "../scheduler.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>

using namespace std;
using namespace sched;

static bool near(double a, double b)
{
	return fabs(a - b) < 1e-9;
}

static SchedTask make_task(string id, Task::priority_t priority, task_type_t type = TASK_PLOUGH, int duration = 1, requirements_t resources = {})
{
	SchedTask task;
	task.id = id;
	task.type = type;
	task.target = Pos(0,0);
	task.priority = priority;
	task.duration = duration;
	task.resources = resources;
	return task;
}

static void show(const vector<Assignment>& assignments)
{
	for (const Assignment& a : assignments)
		cout << "\t" << a.str() << endl;
}

static void test_priority_order()
{
	cout << "higher priorities get the earlier slots, ties keep their order" << endl;

	ConstraintScheduler scheduler;
	roster_t agents;
	agents[AGENT_PLOUGHING] = {1};

	auto result = scheduler.schedule_tasks({make_task("a", 30), make_task("b", 90), make_task("c", 90), make_task("d", 10)}, agents);
	show(result);

	assert(result.size() == 4);
	assert(result[0].task_id == "b" && result[0].slot == 0);
	assert(result[1].task_id == "c" && result[1].slot == 1);
	assert(result[2].task_id == "a" && result[2].slot == 2);
	assert(result[3].task_id == "d" && result[3].slot == 3);
	for (const Assignment& a : result)
	{
		assert(a.agent_id == 1);
		assert(a.agent_type == AGENT_PLOUGHING);
	}

	cout << "\tmetrics" << endl;
	Metrics m = scheduler.metrics();
	assert(m.total_tasks == 4);
	assert(m.makespan == 4);
	assert(near(m.agent_utilization.at(1), 0.04));
	assert(near(m.resource_utilization.at(RES_WATER), 0.));
	scheduler.dump();

	cout << "\tavailability" << endl;
	assert(!scheduler.is_agent_available(1, 3, 1));
	assert(!scheduler.is_agent_available(1, 0, 10));
	assert(scheduler.is_agent_available(1, 4, 2));
	assert(scheduler.is_agent_available(2, 0, 100));

	cout << "\treset" << endl;
	scheduler.reset();
	assert(scheduler.assignments().empty());
	m = scheduler.metrics();
	assert(m.total_tasks == 0);
	assert(m.makespan == 0);
	assert(m.resource_utilization.empty());
	assert(m.agent_utilization.empty());
	assert(scheduler.is_agent_available(1, 0, 100));
}

static void test_resources()
{
	cout << "resources are debited all or nothing" << endl;

	ConstraintScheduler scheduler(10);
	scheduler.add_resource(RES_WATER, 10.);

	roster_t agents;
	agents[AGENT_WATERING] = {3};

	requirements_t water;
	water[RES_WATER] = 8.;
	water[RES_TOOLS] = 1.;

	auto result = scheduler.schedule_tasks({make_task("w1", 50, TASK_WATER, 1, water), make_task("w2", 50, TASK_WATER, 1, water)}, agents);
	show(result);
	assert(result.size() == 1);
	assert(result[0].task_id == "w1");
	assert(near(scheduler.get_resource(RES_WATER)->available, 2.));
	assert(near(scheduler.get_resource(RES_TOOLS)->available, 4.));

	for (int slot = 0; slot < 10; slot++)
		assert(!scheduler.assign_task(make_task("w2", 50, TASK_WATER, 1, water), 3, slot));
	// nothing was taken by the failed attempts
	assert(near(scheduler.get_resource(RES_TOOLS)->available, 4.));

	Metrics m = scheduler.metrics();
	assert(near(m.resource_utilization.at(RES_WATER), 0.8));
	assert(near(m.resource_utilization.at(RES_TOOLS), 0.2));

	cout << "\treplenishing is capped at the capacity" << endl;
	assert(scheduler.replenish(RES_WATER, 100.));
	assert(near(scheduler.get_resource(RES_WATER)->available, 10.));
	assert(!scheduler.replenish(RES_TIME, 1.));

	cout << "\trequirements without a pool can't be met" << endl;
	requirements_t time_slot;
	time_slot[RES_TIME] = 1.;
	assert(scheduler.get_resource(RES_TIME) == nullptr);
	assert(!scheduler.check_resource_availability(time_slot));
	assert(!scheduler.assign_task(make_task("t", 50, TASK_WATER, 1, time_slot), 3, 5));

	scheduler.add_resource(RES_TIME, 3.);
	assert(scheduler.check_resource_availability(time_slot));
	assert(scheduler.assign_task(make_task("t", 50, TASK_WATER, 1, time_slot), 3, 5));

	requirements_t negative;
	negative[RES_FUEL] = -1.;
	assert(!scheduler.check_resource_availability(negative));

	bool thrown = false;
	try { scheduler.add_resource(RES_FUEL, -5.); }
	catch (const invalid_argument&) { thrown = true; }
	assert(thrown);

	scheduler.invariant();
}

static void test_slots()
{
	cout << "reservations must fit the horizon and must not overlap" << endl;

	ConstraintScheduler scheduler(10);
	SchedTask task = make_task("long", 50, TASK_HARVEST, 3);

	assert(!scheduler.assign_task(task, 1, -1));
	assert(!scheduler.assign_task(task, 1, 8));
	assert(scheduler.assign_task(task, 1, 7));
	assert(scheduler.assignments().back().end() == 10);

	assert(!scheduler.assign_task(task, 1, 5));  // overlaps 7
	assert(scheduler.assign_task(task, 1, 4));   // 4, 5, 6
	assert(!scheduler.assign_task(make_task("short", 50, TASK_HARVEST, 1), 1, 6));
	assert(scheduler.assign_task(make_task("short", 50, TASK_HARVEST, 1), 1, 3));
	assert(scheduler.assign_task(task, 2, 5));   // other agent

	assert(!scheduler.assign_task(make_task("empty", 50, TASK_HARVEST, 0), 3, 0));

	// durations far beyond the horizon never fit, wherever they start
	SchedTask endless = make_task("endless", 50, TASK_HARVEST, numeric_limits<int>::max());
	assert(!scheduler.assign_task(endless, 3, 0));
	assert(!scheduler.assign_task(endless, 3, 5));
	assert(!scheduler.assign_task(endless, 3, numeric_limits<int>::max()));
	assert(scheduler.is_agent_available(3, 5, numeric_limits<int>::max()));
	assert(!scheduler.is_agent_available(1, 5, numeric_limits<int>::max()));

	roster_t harvesters;
	harvesters[AGENT_HARVESTING] = {3};
	assert(scheduler.schedule_tasks({endless, make_task("negative", 50, TASK_HARVEST, -5)}, harvesters).empty());

	assert(scheduler.metrics().makespan == 10);
	assert(near(scheduler.metrics().agent_utilization.at(1), 0.7));
	scheduler.invariant();

	bool thrown = false;
	try { ConstraintScheduler broken(0); }
	catch (const invalid_argument&) { thrown = true; }
	assert(thrown);
}

static void test_agents()
{
	cout << "full agents overflow into the next one of the same type" << endl;

	unique_ptr<SchedulerInterface> scheduler = make_unique<ConstraintScheduler>(2);
	roster_t agents;
	agents[AGENT_SOWING] = {1, 2};

	auto result = scheduler->schedule_tasks({
		make_task("s1", 50, TASK_SOW),
		make_task("s2", 50, TASK_SOW),
		make_task("s3", 50, TASK_SOW),
		make_task("h1", 99, TASK_HARVEST) // nobody harvests
	}, agents);
	show(result);

	assert(result.size() == 3);
	assert(result[0].agent_id == 1 && result[0].slot == 0);
	assert(result[1].agent_id == 1 && result[1].slot == 1);
	assert(result[2].agent_id == 2 && result[2].slot == 0);

	// one more fits, the next one does not
	result = scheduler->schedule_tasks({make_task("s4", 50, TASK_SOW), make_task("s5", 50, TASK_SOW)}, agents);
	assert(result.size() == 1);
	assert(result[0].agent_id == 2 && result[0].slot == 1);

	Metrics m = scheduler->metrics();
	assert(m.total_tasks == 4);
	assert(m.makespan == 2);
	assert(near(m.agent_utilization.at(1), 1.));
	assert(near(m.agent_utilization.at(2), 1.));

	scheduler->reset();
	assert(scheduler->metrics().total_tasks == 0);
}

int main()
{
	test_priority_order();
	test_resources();
	test_slots();
	test_agents();

	cout << "all scheduler tests passed" << endl;
	return 0;
}
