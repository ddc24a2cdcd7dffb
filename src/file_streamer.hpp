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

#ifndef FILESTREAMER__SRC__FILE_STREAMER__HPP
#define FILESTREAMER__SRC__FILE_STREAMER__HPP

#include "file.hpp"
#include "loggers.hpp"
#include "magic_provider.hpp"
#include "ranges.hpp"
#include "response_headers.hpp"
#include "sink.hpp"

#include <boost/optional.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <system_error>

namespace filestreamer {

struct streamer_config_t {
	streamer_config_t()
		: chunk_size(1024)
		, delay(0)
		, inline_disposition(false)
	{}

	size_t chunk_size;
	std::chrono::microseconds delay;
	bool inline_disposition;
};

/*
 * Serves one local file for one request.
 *
 * run() opens and locks the file, parses the Range header, sends headers and
 * body to the sink and closes the file. It never throws for request failures:
 * the outcome is returned, and handed to the completion callback if one is
 * given, exactly once.
 *
 * An instance serves a single request.
 */
class file_streamer_t {
public:
	enum class state_tag {
		  idle
		, opened
		, no_range
		, single_range
		, multi_range
		, closed
		, aborted
	};

	struct result_t {
		result_t()
			: state(state_tag::idle)
		{}

		bool
		is_success() const {
			return state == state_tag::closed;
		}

		state_tag state;
		std::error_code error_code;
		std::string message;
	};

	typedef std::function<void (const result_t &)> completion_t;

	file_streamer_t(ioremap::swarm::logger bh_logger_, const std::string &path_
			, streamer_config_t config_ = streamer_config_t());

	void
	set_inline(bool inline_disposition = true);

	// An explicit type wins over the resolver.
	void
	set_mime_type(boost::optional<std::string> mime_type_);

	void
	set_mime_resolver(mime_resolver_t mime_resolver_);

	result_t
	run(const boost::optional<std::string> &range_header, output_sink_t &sink
			, const completion_t &on_complete = completion_t());

	state_tag
	state() const;

	// Ranges parsed by the last run(), in request order.
	const ranges_t &
	ranges() const;

	const std::string &
	path() const;

	static
	const char *
	state_name(state_tag state);

private:
	ioremap::swarm::logger &
	logger();

	void
	open();

	void
	disable_compression(output_sink_t &sink);

	std::string
	resolve_content_type();

	void
	send_whole_file(const response_header_builder_t &builder, output_sink_t &sink);

	void
	send_single_range(const response_header_builder_t &builder, output_sink_t &sink);

	void
	send_multiple_ranges(const response_header_builder_t &builder, output_sink_t &sink);

	void
	close_file();

	result_t
	finish(state_tag state, std::error_code error_code, std::string message);

	ioremap::swarm::logger bh_logger;

	std::string m_path;
	std::string m_filename;
	streamer_config_t m_config;

	boost::optional<std::string> m_mime_type;
	mime_resolver_t m_mime_resolver;

	state_tag m_state;
	std::unique_ptr<file_t> m_file;
	ranges_t m_ranges;
};

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__FILE_STREAMER__HPP */
