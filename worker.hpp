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

#include <deque>
#include <memory>
#include <optional>
#include <string>

#include "pos.hpp"
#include "defines.h"
#include "task.hpp"
#include "channel.hpp"
#include "world.hpp"

/** A worker executes one task at a time, driven by tick():
  *
  *   IDLE      waits for a task.assigned offer for its type (handled in on_message)
  *   MOVING    walks up to move_burst steps of its path per tick
  *   WORKING   applies its effect to the target cell, exactly once
  *   COMPLETED reports task.completed (or task.failed) and status.update, then is IDLE again
  *
  * current_task() is set exactly while the worker is not IDLE. */
class Worker : public Subscriber
{
	public:
		static constexpr int DEFAULT_MOVE_BURST = 3;

		Worker(int id, agent_type_t type, Pos position, FarmWorld& world_, Channel& channel_, int move_burst_ = DEFAULT_MOVE_BURST);
		virtual ~Worker();

		Worker(const Worker&) = delete;
		Worker& operator=(const Worker&) = delete;

		/** handles task.assigned offers */
		void on_message(const Message& message) override;

		/** advances the state machine by one tick */
		virtual void tick();

		int id() const { return id_; }
		agent_type_t type() const { return type_; }
		agent_status_t status() const { return status_; }
		const Pos& position() const { return position_; }
		const std::shared_ptr<const Task>& current_task() const { return current_task_; }
		const std::deque<Pos>& path() const { return path_; }

		std::string str() const;
		void invariant() const;

	protected:
		/** applies the type-specific effect of `task` to the world. The cell's
		  * *current* state is checked again; if it does not allow the effect,
		  * nothing is changed and nullopt is returned. */
		virtual std::optional<CompletionPayload::action_t> execute(const Task& task) = 0;

		/** whether this worker takes task offers at all */
		virtual bool accepts_offers() const { return true; }

		void publish(const std::string& topic_, payload_t payload);

		FarmWorld& world;
		Channel& channel;

	private:
		void accept(const std::shared_ptr<const Task>& task);
		void walk();
		void report();
		void fail(FailurePayload::reason_t reason);
		void clear_task();

		int id_;
		agent_type_t type_;
		agent_status_t status_ = AGENT_IDLE;
		Pos position_;
		int move_burst;

		std::shared_ptr<const Task> current_task_;
		std::deque<Pos> path_;
		// set in WORKING, consumed in COMPLETED. nullopt means the precondition check failed.
		std::optional<CompletionPayload::action_t> result;
};

struct PloughingWorker : public Worker
{
	PloughingWorker(int id, Pos position, FarmWorld& world_, Channel& channel_, int move_burst_ = DEFAULT_MOVE_BURST) :
		Worker(id, AGENT_PLOUGHING, position, world_, channel_, move_burst_) {}

	protected:
		std::optional<CompletionPayload::action_t> execute(const Task& task) override;
};

struct SowingWorker : public Worker
{
	SowingWorker(int id, Pos position, FarmWorld& world_, Channel& channel_, int move_burst_ = DEFAULT_MOVE_BURST) :
		Worker(id, AGENT_SOWING, position, world_, channel_, move_burst_) {}

	protected:
		std::optional<CompletionPayload::action_t> execute(const Task& task) override;
};

struct WateringWorker : public Worker
{
	static constexpr double WATER_AMOUNT = 0.3;
	static constexpr double DISEASE_TREATMENT = 0.2;

	WateringWorker(int id, Pos position, FarmWorld& world_, Channel& channel_, int move_burst_ = DEFAULT_MOVE_BURST) :
		Worker(id, AGENT_WATERING, position, world_, channel_, move_burst_) {}

	protected:
		/** does nothing but report a delay while rain is forecast */
		std::optional<CompletionPayload::action_t> execute(const Task& task) override;
};

struct HarvestingWorker : public Worker
{
	HarvestingWorker(int id, Pos position, FarmWorld& world_, Channel& channel_, int move_burst_ = DEFAULT_MOVE_BURST) :
		Worker(id, AGENT_HARVESTING, position, world_, channel_, move_burst_) {}

	protected:
		std::optional<CompletionPayload::action_t> execute(const Task& task) override;
};

/** Scans the whole farm for disease every scan_interval ticks instead of
  * taking tasks. Cells whose disease probability exceeds the threshold
  * become Diseased and are reported via alert.disease. */
class MonitoringWorker : public Worker
{
	public:
		static constexpr int DEFAULT_SCAN_INTERVAL = 15;
		static constexpr double DEFAULT_DISEASE_THRESHOLD = 0.85;

		MonitoringWorker(int id, Pos position, FarmWorld& world_, Channel& channel_,
			int scan_interval_ = DEFAULT_SCAN_INTERVAL, double disease_threshold_ = DEFAULT_DISEASE_THRESHOLD) :
			Worker(id, AGENT_MONITORING, position, world_, channel_), scan_interval(scan_interval_), disease_threshold(disease_threshold_) {}

		void tick() override;

		/** scans every cell once. returns the number of newly diseased cells. */
		int scan_farm();

		int last_scan() const { return last_scan_step; }

	protected:
		std::optional<CompletionPayload::action_t> execute(const Task&) override { return std::nullopt; }
		bool accepts_offers() const override { return false; }

	private:
		bool scan_cell(const Pos& pos);

		int scan_interval;
		double disease_threshold;
		int last_scan_step = 0;
};
