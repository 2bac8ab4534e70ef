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
#include <optional>

#include "pos.hpp"
#include "defines.h"

// task lifecycle:
//   PENDING   created by the planner, waiting in its queue
//   ASSIGNED  offered to exactly one worker, recorded in the active assignments
//   COMPLETED the worker reported task.completed
//   FAILED    the worker reported task.failed (no path, or the cell changed under it)
//
// the planner owns all tasks. workers hold a reference to the one they execute.

struct Task
{
	using priority_t = int; // higher is more urgent
	using id_t = int;

	enum status_t { PENDING, ASSIGNED, COMPLETED, FAILED };
	static const std::string status_names[];

	id_t id;
	task_type_t type;
	Pos target;
	priority_t priority;

	status_t status = PENDING;
	std::optional<int> assigned_to; // worker id
	int created_at = 0;
	std::optional<int> completed_at;

	Task(id_t id_, task_type_t type_, Pos target_, priority_t priority_, int created_at_) :
		id(id_), type(type_), target(target_), priority(priority_), created_at(created_at_) {}

	std::string name() const { return "task_" + std::to_string(id); }
	std::string str() const;
};
