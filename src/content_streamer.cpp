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

#include "content_streamer.hpp"
#include "error.hpp"

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <sstream>
#include <thread>

namespace filestreamer {

content_streamer_t::content_streamer_t(ioremap::swarm::logger bh_logger_, file_t &file_
		, output_sink_t &sink_, size_t chunk_size_, std::chrono::microseconds delay_)
	: bh_logger(std::move(bh_logger_))
	, file(file_)
	, sink(sink_)
	, delay(delay_)
	, buffer(chunk_size_ ? chunk_size_ : 1)
	, total_sent(0)
{
}

void
content_streamer_t::stream_range(const range_t &range) {
	FS_LOG_DEBUG("stream range: first=%llu; last=%llu"
			, static_cast<unsigned long long>(range.start)
			, static_cast<unsigned long long>(range.end));

	file.seek(range.start);

	uint64_t pos = range.start;

	while (pos <= range.end) {
		check_peer();

		auto left = range.end - pos + 1;
		auto size = static_cast<size_t>(std::min<uint64_t>(buffer.size(), left));
		auto read = file.read(buffer.data(), size);

		if (read == 0) {
			std::ostringstream oss;
			oss << "unexpected end of file: position=" << pos << "; expected-last=" << range.end;
			throw streamer_error(streamer_errc::read_failure, oss.str());
		}

		sink.send_data(buffer.data(), read);
		sink.flush();

		pos += read;
		total_sent += read;

		if (delay.count() > 0) {
			std::this_thread::sleep_for(delay);
		}
	}
}

void
content_streamer_t::send_text(const std::string &text) {
	sink.send_data(text.data(), text.size());
	total_sent += text.size();
}

uint64_t
content_streamer_t::bytes_sent() const {
	return total_sent;
}

ioremap::swarm::logger &
content_streamer_t::logger() {
	return bh_logger;
}

void
content_streamer_t::check_peer() {
	if (!sink.is_peer_alive()) {
		throw streamer_error(streamer_errc::peer_disconnected
				, "peer closed the connection after "
					+ boost::lexical_cast<std::string>(total_sent) + " bytes");
	}
}

} // namespace filestreamer
