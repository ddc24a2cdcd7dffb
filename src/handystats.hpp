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

#ifndef FILESTREAMER__SRC__HANDYSTATS__HPP
#define FILESTREAMER__SRC__HANDYSTATS__HPP

#include <cstdint>
#include <string>

#include <handystats/measuring_points.hpp>

// fs.HANDLER (counter)
//    - total number of requests
// fs.HANDLER.time (timer)
//    - time spent on processing of a request, from start to close
// fs.HANDLER.reply.CODE (counter)
//    - response codes (e.g., 206) and groups (e.g., 2xx)
// fs.HANDLER.reply.time (timer)
//    - time spent between request and sent headers
// fs.HANDLER.aborted (counter)
//    - streams cut short after headers were sent


namespace filestreamer {

inline void FS_REQUEST_START(const std::string& handler, const uint64_t& instance_id) {
	HANDY_COUNTER_INCREMENT(("fs.%s", handler.c_str()));

	HANDY_TIMER_START(("fs.%s.time", handler.c_str()), instance_id);

	HANDY_TIMER_START(("fs.%s.reply.time", handler.c_str()), instance_id);
}

inline void FS_REQUEST_SEND_HEADERS(const std::string& handler, const int& code, const uint64_t& instance_id) {
	HANDY_COUNTER_INCREMENT(("fs.%s.reply.%d", handler.c_str(), code));
	HANDY_COUNTER_INCREMENT(("fs.%s.reply.%dxx", handler.c_str(), code / 100));

	if (code / 100 != 2) {
		HANDY_TIMER_DISCARD(("fs.%s.reply.time", handler.c_str()), instance_id);
	} else {
		HANDY_TIMER_STOP(("fs.%s.reply.time", handler.c_str()), instance_id);
	}
}

inline void FS_REQUEST_ABORTED(const std::string& handler) {
	HANDY_COUNTER_INCREMENT(("fs.%s.aborted", handler.c_str()));
}

inline void FS_REQUEST_CLOSE(const std::string& handler, const uint64_t& instance_id) {
	HANDY_TIMER_STOP(("fs.%s.time", handler.c_str()), instance_id);
}

} // namespace filestreamer

#endif // FILESTREAMER__SRC__HANDYSTATS__HPP
