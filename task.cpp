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

#include "task.hpp"

using namespace std;

const string Task::status_names[] = { "pending", "assigned", "completed", "failed" };

string Task::str() const
{
	string result = name() + "(" + task_type_names[type] + "@" + target.str() + ", prio " + to_string(priority) + ", " + status_names[status];
	if (assigned_to.has_value())
		result += " -> worker " + to_string(*assigned_to);
	return result + ")";
}
