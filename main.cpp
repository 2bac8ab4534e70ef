/*
 * Copyright (c) 2017, 2018 Florian Jung
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

#include <iostream>
#include <stdexcept>
#include <string>

#include "config.hpp"
#include "simulation.hpp"
#include "split.hpp"
#include "util.hpp"
#include "logging.hpp"

using namespace std;

static void usage(const char* argv0)
{
	cout << "Usage: " << argv0 << " ticks [config-file] [key=value ...]" << endl;
	cout << "       ticks: the number of ticks to simulate" << endl;
	cout << "       config-file: lines of 'key value', see below for the keys and their defaults" << endl;
	cout << "       key=value: overrides a single setting, after the config file was read" << endl;
	cout << endl;
	cout << SimConfig().str();
}

static void print_summary(const FarmSimulation& sim)
{
	Telemetry t = sim.telemetry();

	cout << endl << "after " << t.tick << " ticks:" << endl;
	for (int i = 0; i < N_CELL_STATES; i++)
		cout << "\t" << strpad(cell_state_names[i], 18) << t.cell_counts[i] << endl;

	cout << "harvested: " << t.harvested << endl;
	cout << "tasks: " << t.tasks_completed << " completed, " << t.tasks_failed << " failed, "
		<< t.active_tasks << " active, " << t.queued_tasks << " queued" << endl;

	cout << "yield: " << t.yield.estimated_yield << " expected from the field, "
		<< t.yield.potential_yield << " potential in total, "
		<< t.yield.steps_to_harvest << " ticks to harvest (avg growth " << t.yield.average_growth_progress << "%)" << endl;
	cout << "stress: " << t.stress.water_stress_percentage << "% dry, "
		<< t.stress.temperature_stress_percentage << "% heat, health score " << t.stress.overall_health_score << endl;
	cout << "weather: " << t.weather.str() << endl;

	cout << "workers:" << endl;
	for (const auto& worker : sim.workers())
		cout << "\t" << worker->str() << endl;
}

int main(int argc, const char** argv)
{
	if (argc < 2)
	{
		usage(argv[0]);
		return 1;
	}

	int ticks;
	SimConfig config;
	try
	{
		ticks = convert<int>(argv[1]);
		if (ticks < 0)
			throw invalid_argument("ticks must not be negative");

		for (int i = 2; i < argc; i++)
		{
			string arg(argv[i]);
			if (arg.find('=') != string::npos)
				config.apply_override(arg);
			else if (i == 2)
				config.load(arg);
			else
				throw invalid_argument("expected key=value, got '" + arg + "'");
		}
	}
	catch (const exception& e)
	{
		cout << argv[0] << ": " << e.what() << endl << endl;
		usage(argv[0]);
		return 1;
	}

	Logger::max_level = config.log_level;

	FarmSimulation sim(config);
	cout << "simulating a " << config.width << "x" << config.height << " farm for " << ticks << " ticks (seed " << config.seed << ")" << endl;

	for (int i = 0; i < ticks; i++)
	{
		sim.step();
		if (sim.world().step_count() % 10 == 0)
			cout << sim.telemetry().str() << endl;
	}

	print_summary(sim);
	return 0;
}
