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

#ifndef FILESTREAMER__SRC__GET__HPP
#define FILESTREAMER__SRC__GET__HPP

#include "file_streamer.hpp"
#include "handler.hpp"
#include "server.hpp"

#include <boost/optional.hpp>

#include <string>

namespace filestreamer {

struct req_get
	: public handler<ioremap::thevoid::simple_request_stream>
{
	req_get();

	void
	on_request(const ioremap::thevoid::http_request &http_request
			, const boost::asio::const_buffer &const_buffer);

private:
	void
	stream_file(const std::string &path, const boost::optional<std::string> &range_header
			, bool inline_disposition);

	void
	on_streamed(const file_streamer_t::result_t &result);
};

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__GET__HPP */
