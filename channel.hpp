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
#include <vector>
#include <deque>
#include <memory>
#include <optional>
#include <variant>
#include <unordered_map>

#include "pos.hpp"
#include "defines.h"
#include "task.hpp"

namespace topic
{
	extern const std::string TASK_ASSIGNED;
	extern const std::string TASK_COMPLETED;
	extern const std::string TASK_FAILED;
	extern const std::string ALERT_DISEASE;
	extern const std::string STATUS_UPDATE;
}

/** offers `task` to the worker of type `worker_type`, and if set, to `worker_id` only */
struct AssignmentPayload
{
	std::shared_ptr<const Task> task;
	agent_type_t worker_type;
	std::optional<int> worker_id;
};

struct CompletionPayload
{
	enum action_t { PLOUGHED, SOWN, WATERED, WATERING_DELAYED, HARVESTED };
	static const std::string action_names[];

	Task::id_t task_id;
	Pos cell;
	action_t action;
	int yield = 0;
};

struct FailurePayload
{
	enum reason_t {
		NO_PATH,     // the worker could not find a way to the target
		PRECONDITION // the target cell was in the wrong state upon arrival
	};
	static const std::string reason_names[];

	Task::id_t task_id;
	Pos cell;
	reason_t reason;
};

struct AlertPayload
{
	Pos cell;
	double disease_probability;
	double water_level;
};

struct StatusPayload
{
	int agent_id;
	agent_type_t agent_type;
	Pos position;
	agent_status_t status;
	std::optional<Task::id_t> task_id;
	std::string text;
};

using payload_t = std::variant<AssignmentPayload, CompletionPayload, FailurePayload, AlertPayload, StatusPayload>;

/** immutable once published */
struct Message
{
	std::string topic;
	int sender_id;
	int timestamp;
	payload_t payload;

	Message(int sender_id_, int timestamp_, payload_t payload_) : sender_id(sender_id_), timestamp(timestamp_), payload(std::move(payload_)) {}
};

struct Subscriber
{
	/** called once per delivered message on each subscribed topic. exceptions
	  * derived from std::exception are logged by the Channel and do not stop
	  * the delivery of other messages. */
	virtual void on_message(const Message& message) = 0;
	virtual ~Subscriber() = default;
};

/** topic-addressed publish/subscribe queue.
  *
  * publish() only enqueues. flush() delivers everything that was queued when
  * it was called, in publish order, to the subscribers of the message's topic
  * in subscription order. Messages published while flushing are kept for the
  * next flush(). A subscriber that is unsubscribed during a flush receives
  * nothing from that point on.
  *
  * The Channel does not own its subscribers; they must unsubscribe before
  * they die. */
class Channel
{
	public:
		void publish(const std::string& topic, Message message);

		/** subscribing the same subscriber to the same topic twice does nothing */
		void subscribe(const std::string& topic, Subscriber* subscriber);
		void unsubscribe(const std::string& topic, Subscriber* subscriber);
		/** removes `subscriber` from all topics */
		void unsubscribe_all(Subscriber* subscriber);

		/** returns the number of messages taken from the queue */
		size_t flush();

		size_t pending() const { return queue.size(); }
		size_t n_subscribers(const std::string& topic) const;
		bool is_subscribed(const std::string& topic, Subscriber* subscriber) const;

		/** drops all subscriptions and all queued messages */
		void clear();

	private:
		std::unordered_map< std::string, std::vector<Subscriber*> > subscribers;
		std::deque<Message> queue;
};
