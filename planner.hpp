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

#include <array>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/heap/binomial_heap.hpp>

#include "pos.hpp"
#include "defines.h"
#include "gridmap.hpp"
#include "task.hpp"
#include "channel.hpp"
#include "world.hpp"

/** the planner's belief about one cell, as of last_updated */
struct CellKnowledge
{
	cell_state_t state = CELL_INITIAL;
	CellAttributes attributes;
	int last_updated = 0;
	std::vector<Task::id_t> pending_tasks; // outstanding tasks targeting this cell
};

/** Scores the farm, creates tasks and hands them out to the workers.
  *
  * The planner reads the world only in update_knowledge(); scoring and
  * assignment work on the cached CellKnowledge and weather. A cell with a
  * pending task is not scored again until that task completed or failed.
  *
  * Tasks are owned by the planner from creation until a worker reports
  * task.completed or task.failed for them. */
class MasterPlanner : public Subscriber
{
	public:
		static constexpr int PLANNER_ID = 0;
		static constexpr int DEFAULT_MAX_TASKS_PER_TYPE = 10;
		static constexpr int DEFAULT_ASSIGN_BURST = 20;

		static constexpr Task::priority_t PRIO_DISEASED = 100;
		static constexpr Task::priority_t PRIO_NEED_WATER = 90;
		static constexpr Task::priority_t PRIO_NEED_WATER_HEAT = 95;
		static constexpr Task::priority_t PRIO_HARVEST = 80;
		static constexpr Task::priority_t PRIO_SOWN = 70;
		static constexpr Task::priority_t PRIO_SOWN_RAIN = 50;
		static constexpr Task::priority_t PRIO_SOW = 60;
		static constexpr Task::priority_t PRIO_PLOUGH = 50;
		static constexpr Task::priority_t PRIO_DISEASE_ALERT = 95;

		MasterPlanner(const FarmWorld& world, Channel& channel,
			int max_tasks_per_type = DEFAULT_MAX_TASKS_PER_TYPE, int assign_burst = DEFAULT_ASSIGN_BURST);
		~MasterPlanner();

		MasterPlanner(const MasterPlanner&) = delete;
		MasterPlanner& operator=(const MasterPlanner&) = delete;

		/** makes `worker_id` eligible for tasks of `type`. registering twice does nothing. */
		void register_worker(agent_type_t type, int worker_id);

		/** one planning round: update_knowledge(), plan_tasks(), assign_pending_tasks() */
		void step();

		void update_knowledge();
		/** scores every cell without pending task. returns the number of tasks created. */
		int plan_tasks();
		/** offers queued tasks to free workers, in queue order, until assign_burst
		  * offers were made. tasks whose workers are all busy are skipped and stay
		  * queued. returns the number offered. */
		int assign_pending_tasks();

		/** handles task.completed, task.failed, alert.disease and status.update */
		void on_message(const Message& message) override;

		/** the task a cell in `knowledge` needs, and how urgently, or nullopt if none */
		static std::optional< std::pair<task_type_t, Task::priority_t> > score_cell(const CellKnowledge& knowledge, const Weather& weather);

		const CellKnowledge& knowledge(const Pos& pos) const { return knowledge_.at(pos); }

		size_t n_queued() const { return queue.size(); }
		size_t n_active() const;
		/** queued plus assigned tasks of `type` */
		int n_outstanding(task_type_t type) const;
		int tasks_created() const { return next_task_id - 1; }
		int tasks_completed() const { return n_completed; }
		int tasks_failed() const { return n_failed; }

		/** nullptr if the task is not outstanding */
		std::shared_ptr<const Task> get_task(Task::id_t id) const;
		/** the last status.update of `worker_id`, if any was received */
		std::optional<StatusPayload> last_status(int worker_id) const;

		void invariant() const;

	private:
		struct QueuedTask
		{
			std::shared_ptr<Task> task;
			unsigned long seq; // insertion order, breaks ties between equal priorities

			// boost's heaps are max-heaps: higher priority first, then lower seq first
			bool operator<(const QueuedTask& other) const
			{
				if (task->priority != other.task->priority)
					return task->priority < other.task->priority;
				return seq > other.seq;
			}
		};

		std::shared_ptr<Task> create_task(task_type_t type, const Pos& target, Task::priority_t priority);
		std::optional<int> find_free_worker(agent_type_t type) const;
		void offer(const std::shared_ptr<Task>& task, int worker_id);
		/** forgets an outstanding task after the worker reported back */
		void finish_task(Task::id_t id, Task::status_t status);

		const FarmWorld& world;
		Channel& channel;
		int max_tasks_per_type;
		int assign_burst;

		GridMap<CellKnowledge> knowledge_;
		Weather cached_weather; // cached in update_knowledge()

		boost::heap::binomial_heap<QueuedTask> queue;
		std::unordered_map< Task::id_t, std::shared_ptr<Task> > tasks; // all queued and assigned tasks

		std::array< std::vector<int>, N_AGENT_TYPES > workers;
		std::unordered_map<int, Task::id_t> busy_workers; // worker id -> the task it was offered
		std::unordered_map<int, StatusPayload> worker_status;

		Task::id_t next_task_id = 1;
		unsigned long next_seq = 0;
		int n_completed = 0;
		int n_failed = 0;
};
