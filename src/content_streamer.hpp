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

#ifndef FILESTREAMER__SRC__CONTENT_STREAMER__HPP
#define FILESTREAMER__SRC__CONTENT_STREAMER__HPP

#include "file.hpp"
#include "loggers.hpp"
#include "ranges.hpp"
#include "sink.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace filestreamer {

class content_streamer_t {
public:
	content_streamer_t(ioremap::swarm::logger bh_logger_, file_t &file_, output_sink_t &sink_
			, size_t chunk_size_, std::chrono::microseconds delay_);

	/*
	 * Copies bytes [range.start, range.end] of the file to the sink in chunks
	 * of at most chunk_size bytes, flushing and sleeping delay after each one.
	 * Throws streamer_errc::peer_disconnected when the sink reports the peer gone
	 * before a chunk and streamer_errc::read_failure on I/O errors or if the file
	 * ends before the range does.
	 */
	void
	stream_range(const range_t &range);

	void
	send_text(const std::string &text);

	uint64_t
	bytes_sent() const;

private:
	ioremap::swarm::logger &
	logger();

	void
	check_peer();

	ioremap::swarm::logger bh_logger;

	file_t &file;
	output_sink_t &sink;

	std::chrono::microseconds delay;
	std::vector<char> buffer;

	uint64_t total_sent;
};

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__CONTENT_STREAMER__HPP */
