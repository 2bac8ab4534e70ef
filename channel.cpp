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

#include "channel.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <stdexcept>

using namespace std;

namespace topic
{
	const string TASK_ASSIGNED = "task.assigned";
	const string TASK_COMPLETED = "task.completed";
	const string TASK_FAILED = "task.failed";
	const string ALERT_DISEASE = "alert.disease";
	const string STATUS_UPDATE = "status.update";
}

const string CompletionPayload::action_names[] = { "ploughed", "sown", "watered", "watering_delayed", "harvested" };
const string FailurePayload::reason_names[] = { "no_path", "precondition" };

void Channel::publish(const string& topic_, Message message)
{
	message.topic = topic_;
	queue.push_back(move(message));
}

void Channel::subscribe(const string& topic_, Subscriber* subscriber)
{
	auto& list = subscribers[topic_];
	if (!contains_vec(list, subscriber))
		list.push_back(subscriber);
}

void Channel::unsubscribe(const string& topic_, Subscriber* subscriber)
{
	auto iter = subscribers.find(topic_);
	if (iter != subscribers.end())
		erase_first(iter->second, subscriber);
}

void Channel::unsubscribe_all(Subscriber* subscriber)
{
	for (auto& [name, list] : subscribers)
		erase_first(list, subscriber);
}

bool Channel::is_subscribed(const string& topic_, Subscriber* subscriber) const
{
	auto iter = subscribers.find(topic_);
	return iter != subscribers.end() && contains_vec(iter->second, subscriber);
}

size_t Channel::n_subscribers(const string& topic_) const
{
	auto iter = subscribers.find(topic_);
	return iter == subscribers.end() ? 0 : iter->second.size();
}

size_t Channel::flush()
{
	// everything published from now on (i.e. by the handlers) waits for the next flush
	deque<Message> batch;
	batch.swap(queue);

	for (const Message& message : batch)
	{
		auto iter = subscribers.find(message.topic);
		if (iter == subscribers.end())
			continue;

		// handlers may (un)subscribe while we're iterating. late subscribers wait
		// for the next message, and unsubscribed ones get nothing more.
		vector<Subscriber*> receivers = iter->second;
		for (Subscriber* receiver : receivers)
		{
			if (!is_subscribed(message.topic, receiver))
				continue;

			try
			{
				receiver->on_message(message);
			}
			catch (const exception& e)
			{
				Logger log("channel", Logger::ERROR);
				log << "error delivering " << message.topic << " from #" << message.sender_id << " at tick " << message.timestamp << ": " << e.what() << endl;
			}
		}
	}

	return batch.size();
}

void Channel::clear()
{
	subscribers.clear();
	queue.clear();
}
