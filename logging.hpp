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

#include <iostream>
#include <streambuf>
#include <string>
#include <vector>


class prefixbuf : public std::streambuf
{
	std::string prefix;
	std::streambuf* sbuf; // nullptr swallows everything
	bool need_prefix;

	int sync() {
		return this->sbuf ? this->sbuf->pubsync() : 0;
	}
	int overflow(int c) {
		if (!this->sbuf)
			return std::char_traits<char>::not_eof(c);

		if (c != std::char_traits<char>::eof()) {
			if (this->need_prefix
					&& !this->prefix.empty()
					&& std::streamsize(this->prefix.size()) != this->sbuf->sputn(&this->prefix[0], this->prefix.size())) {
				return std::char_traits<char>::eof();
			}
			this->need_prefix = c == '\n';
		}
		return this->sbuf->sputc(c);
	}

	public:
		prefixbuf(std::string const& prefix_, std::streambuf* sbuf_) : prefix(prefix_), sbuf(sbuf_), need_prefix(true) {}
};

class Logger : private virtual prefixbuf, public std::ostream
{
	public:
		enum level_t { ERROR=0, INFO, DETAIL };

		/** loggers with a level above this one print nothing */
		static level_t max_level;

		Logger(std::string const& topic, level_t level = INFO)
			: prefixbuf(get_prefix(topic) + ": ", level <= max_level ? std::cout.rdbuf() : nullptr)
			 , std::ios(static_cast<std::streambuf*>(this))
			 , std::ostream(static_cast<std::streambuf*>(this))
		{
			stack.push_back(topic);
		}
		~Logger()
		{
			stack.pop_back();
		}

		/** parses "error", "info" or "detail". throws std::invalid_argument otherwise */
		static level_t parse_level(const std::string& name);
		static const char* level_name(level_t level);

	private:
		static std::string get_prefix(std::string tail)
		{
			if (stack.empty()) return tail;
			std::string result = stack[0];
			for (size_t i=1; i < stack.size(); i++)
				result += "." + stack[i];
			return result + "." + tail;
		}

		static std::vector<std::string> stack;
};
