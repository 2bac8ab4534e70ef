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

#include "../config.hpp"
#include "../split.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace std;

static const char* const CONFIG_FILE = "farmsim_test_config.txt";

static void write_file(const string& content)
{
	ofstream file(CONFIG_FILE);
	file << content;
}

// returns the message of the exception E thrown by f, or "" if none was thrown
template <typename E, typename F> static string error_of(F f)
{
	try { f(); }
	catch (const E& e) { return e.what(); }
	return "";
}

static void test_defaults()
{
	cout << "defaults" << endl;

	SimConfig config;
	assert(config.width == 20 && config.height == 20);
	assert(config.seed == 42);
	assert(config.max_tasks_per_type == 10);
	assert(config.assign_burst == 20);
	assert(config.move_burst == 3);
	assert(config.scan_interval == 15);
	assert(config.weather_interval == 5);
	assert(config.workers_per_type == 1);
	assert(config.log_level == Logger::INFO);
	config.validate();

	cout << config.str();
}

static void test_set()
{
	cout << "set() only takes valid values" << endl;

	SimConfig config;
	config.set("width", "30");
	config.set("log_level", "detail");
	config.set("disease_threshold", "0.5");
	config.set("seed", "4000000000");
	assert(config.width == 30);
	assert(config.log_level == Logger::DETAIL);
	assert(config.disease_threshold == 0.5);
	assert(config.seed == 4000000000u);

	assert(error_of<runtime_error>([&] { config.set("colour", "green"); }) != "");
	assert(error_of<invalid_argument>([&] { config.set("width", "abc"); }) != "");
	assert(error_of<invalid_argument>([&] { config.set("width", "12abc"); }) != "");
	assert(error_of<invalid_argument>([&] { config.set("width", ""); }) != "");
	assert(error_of<invalid_argument>([&] { config.set("seed", "-1"); }) != "");
	assert(error_of<invalid_argument>([&] { config.set("log_level", "loud"); }) != "");

	// parses, but is out of range
	assert(error_of<invalid_argument>([&] { config.set("width", "0"); }) != "");
	assert(error_of<invalid_argument>([&] { config.set("rain_chance", "1.5"); }) != "");
	assert(error_of<invalid_argument>([&] { config.set("move_burst", "-2"); }) != "");
	assert(config.width == 30);
	assert(config.rain_chance == 0.1);
	assert(config.move_burst == 3);

	cout << "\toverrides" << endl;
	config.apply_override("move_burst=5");
	config.apply_override("workers_per_type = 0");
	assert(config.move_burst == 5);
	assert(config.workers_per_type == 0);
	assert(error_of<invalid_argument>([&] { config.apply_override("move_burst"); }) != "");
	assert(error_of<invalid_argument>([&] { config.apply_override("move_burst="); }) != "");
}

static void test_load()
{
	cout << "config files" << endl;

	write_file(
		"# farm setup\n"
		"width = 12\n"
		"height 8   # not that high\n"
		"\n"
		"   \n"
		"seed=7\n"
		"rain_chance\t0.25\n"
		"log_level error\n");

	SimConfig config;
	config.load(CONFIG_FILE);
	assert(config.width == 12);
	assert(config.height == 8);
	assert(config.seed == 7);
	assert(config.rain_chance == 0.25);
	assert(config.log_level == Logger::ERROR);
	assert(config.move_burst == 3);
	assert(config.str().find("width 12\n") != string::npos);

	cout << "\terrors name the line" << endl;
	write_file("width 10\nbogus 3\n");
	string message = error_of<runtime_error>([&] { config.load(CONFIG_FILE); });
	cout << "\t" << message << endl;
	assert(message.find(":2:") != string::npos);
	assert(message.find("bogus") != string::npos);

	write_file("height x\n");
	message = error_of<invalid_argument>([&] { config.load(CONFIG_FILE); });
	cout << "\t" << message << endl;
	assert(message.find(":1:") != string::npos);

	remove(CONFIG_FILE);
	assert(error_of<runtime_error>([&] { config.load(CONFIG_FILE); }) != "");
}

static void test_convert()
{
	cout << "value conversion" << endl;

	assert(convert<int>("-17") == -17);
	assert(convert<unsigned>("17") == 17u);
	assert(convert<double>("0.125") == 0.125);
	assert(convert<bool>("true"));
	assert(!convert<bool>("0"));
	assert(convert<string>("hello") == "hello");

	assert(error_of<invalid_argument>([] { convert<int>(""); }) != "");
	assert(error_of<invalid_argument>([] { convert<int>("99999999999999"); }) != "");
	assert(error_of<invalid_argument>([] { convert<double>("1.0.0"); }) != "");
	assert(error_of<invalid_argument>([] { convert<bool>("yes"); }) != "");

	auto [key, value] = split_once("  a = b = c ", "=");
	assert(key == "a");
	assert(value == "b = c");
	assert(trim("\t x \r\n") == "x");
}

int main()
{
	test_defaults();
	test_set();
	test_load();
	test_convert();

	cout << "all config tests passed" << endl;
	return 0;
}
