/*
	Filestreamer is a HTTP server streaming local files with byte-range support
	Copyright (C) 2026 Filestreamer contributors

	This program is free software; you can redistribute it and/or
	modify it under the terms of the GNU General Public License
	as published by the Free Software Foundation; either version 2
	of the License, or (at your option) any later version.

	This program is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
	GNU General Public License for more details.

	You should have received a copy of the GNU General Public License
	along with this program; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#ifndef FILESTREAMER__SRC__TIMER__HPP
#define FILESTREAMER__SRC__TIMER__HPP

#include <boost/lexical_cast.hpp>

#include <chrono>
#include <string>

namespace filestreamer {
namespace util {

class timer_t {
public:
	typedef std::chrono::steady_clock clock_type;

	timer_t()
		: time_point(clock_type::now())
	{}

	template <typename Duration>
	typename Duration::rep
	get() const {
		return std::chrono::duration_cast<Duration>(clock_type::now() - time_point).count();
	}

	std::string
	str_ms() const {
		return boost::lexical_cast<std::string>(get<std::chrono::milliseconds>()) + "ms";
	}

private:
	clock_type::time_point time_point;
};

} // namespace util
} // namespace filestreamer

#endif /* FILESTREAMER__SRC__TIMER__HPP */
