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

#ifndef FILESTREAMER__SRC__SINK__HPP
#define FILESTREAMER__SRC__SINK__HPP

#include <thevoid/http_response.hpp>

#include <cstddef>
#include <system_error>

namespace filestreamer {

/*
 * Destination of one response. Headers are sent once, before any data.
 * All calls are blocking and are made from the thread running the request.
 */
class output_sink_t {
public:
	virtual ~output_sink_t() {}

	virtual
	void
	send_headers(ioremap::thevoid::http_response http_response) = 0;

	virtual
	void
	send_data(const char *data, size_t size) = 0;

	virtual
	void
	flush() = 0;

	// Polled before every chunk; false cancels the stream.
	virtual
	bool
	is_peer_alive() = 0;

	virtual
	std::error_code
	disable_compression() {
		return std::error_code();
	}

	virtual
	void
	disable_time_limit() {
	}
};

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__SINK__HPP */
