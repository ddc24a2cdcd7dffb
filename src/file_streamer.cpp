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

#include "file_streamer.hpp"

#include "content_streamer.hpp"
#include "error.hpp"
#include "multipart.hpp"
#include "timer.hpp"

#include <stdexcept>

namespace {

std::string
normalize_path(const std::string &path) {
	auto end = path.find_last_not_of(" \t\r\n");

	if (end == std::string::npos) {
		return std::string();
	}

	auto result = path.substr(0, end + 1);

	while (result.size() > 1 && result.back() == '/') {
		result.pop_back();
	}

	return result;
}

std::string
get_filename(const std::string &path) {
	auto slash = path.rfind('/');

	if (slash == std::string::npos) {
		return path;
	}

	return path.substr(slash + 1);
}

} // namespace

namespace filestreamer {

file_streamer_t::file_streamer_t(ioremap::swarm::logger bh_logger_, const std::string &path_
		, streamer_config_t config_)
	: bh_logger(std::move(bh_logger_))
	, m_path(normalize_path(path_))
	, m_filename(get_filename(m_path))
	, m_config(std::move(config_))
	, m_state(state_tag::idle)
{
}

void
file_streamer_t::set_inline(bool inline_disposition) {
	m_config.inline_disposition = inline_disposition;
}

void
file_streamer_t::set_mime_type(boost::optional<std::string> mime_type_) {
	m_mime_type = std::move(mime_type_);
}

void
file_streamer_t::set_mime_resolver(mime_resolver_t mime_resolver_) {
	m_mime_resolver = std::move(mime_resolver_);
}

file_streamer_t::result_t
file_streamer_t::run(const boost::optional<std::string> &range_header, output_sink_t &sink
		, const completion_t &on_complete) {
	if (m_state != state_tag::idle) {
		throw std::logic_error("file streamer serves a single request");
	}

	util::timer_t timer;
	result_t result;

	FS_LOG_INFO("start serving file: path=\"%s\"; range=\"%s\""
			, m_path.c_str(), range_header ? range_header->c_str() : "<none>");

	try {
		open();
		disable_compression(sink);
		sink.disable_time_limit();

		try {
			m_ranges = parse_range_header(range_header, m_file->size());
		} catch (const streamer_error &ex) {
			FS_LOG_ERROR("cannot parse range header: %s", ex.what());
			sink.send_headers(response_header_builder_t::range_not_satisfiable());
			throw;
		}

		file_info_t file_info;
		file_info.filename = m_filename;
		file_info.content_type = resolve_content_type();
		file_info.size = m_file->size();

		response_header_builder_t builder(std::move(file_info), m_config.inline_disposition);

		switch (m_ranges.size()) {
		case 0:
			send_whole_file(builder, sink);
			break;
		case 1:
			send_single_range(builder, sink);
			break;
		default:
			send_multiple_ranges(builder, sink);
		}

		close_file();

		FS_LOG_INFO("file served: path=\"%s\"; spent-time=%s"
				, m_path.c_str(), timer.str_ms().c_str());
		result = finish(state_tag::closed, std::error_code(), "file served");
	} catch (const streamer_error &ex) {
		FS_LOG_ERROR("cannot serve file \"%s\": %s; state=%s"
				, m_path.c_str(), ex.what(), state_name(m_state));
		close_file();
		result = finish(state_tag::aborted, ex.code(), ex.what());
	} catch (const std::exception &ex) {
		FS_LOG_ERROR("cannot serve file \"%s\": %s; state=%s"
				, m_path.c_str(), ex.what(), state_name(m_state));
		close_file();
		result = finish(state_tag::aborted, std::make_error_code(std::errc::io_error), ex.what());
	}

	if (on_complete) {
		on_complete(result);
	}

	return result;
}

file_streamer_t::state_tag
file_streamer_t::state() const {
	return m_state;
}

const ranges_t &
file_streamer_t::ranges() const {
	return m_ranges;
}

const std::string &
file_streamer_t::path() const {
	return m_path;
}

const char *
file_streamer_t::state_name(state_tag state) {
	switch (state) {
	case state_tag::idle:
		return "idle";
	case state_tag::opened:
		return "opened";
	case state_tag::no_range:
		return "no-range";
	case state_tag::single_range:
		return "single-range";
	case state_tag::multi_range:
		return "multi-range";
	case state_tag::closed:
		return "closed";
	case state_tag::aborted:
		return "aborted";
	default:
		return "unknown";
	}
}

ioremap::swarm::logger &
file_streamer_t::logger() {
	return bh_logger;
}

void
file_streamer_t::open() {
	m_file.reset(new file_t(m_path));
	m_state = state_tag::opened;

	FS_LOG_INFO("file is opened: path=\"%s\"; size=%llu"
			, m_path.c_str(), static_cast<unsigned long long>(m_file->size()));
}

void
file_streamer_t::disable_compression(output_sink_t &sink) {
	auto error_code = sink.disable_compression();

	if (error_code) {
		FS_LOG_WARNING("%s: %s"
				, make_error_code(streamer_errc::compression_disable_failure).message().c_str()
				, error_code.message().c_str());
	}
}

std::string
file_streamer_t::resolve_content_type() {
	if (m_mime_type && !m_mime_type->empty()) {
		return *m_mime_type;
	}

	if (m_mime_resolver) {
		try {
			auto content_type = m_mime_resolver(m_path);

			if (content_type && !content_type->empty()) {
				FS_LOG_INFO("content-type was detected: type=\"%s\"", content_type->c_str());
				return *content_type;
			}
		} catch (const std::exception &ex) {
			FS_LOG_WARNING("cannot detect content-type: %s", ex.what());
		}
	}

	return default_content_type;
}

void
file_streamer_t::send_whole_file(const response_header_builder_t &builder
		, output_sink_t &sink) {
	m_state = state_tag::no_range;
	FS_LOG_INFO("send whole file");

	sink.send_headers(builder.whole_file());

	if (m_file->size() == 0) {
		return;
	}

	content_streamer_t content_streamer(copy_logger(bh_logger), *m_file, sink
			, m_config.chunk_size, m_config.delay);

	range_t range;
	range.start = 0;
	range.end = m_file->size() - 1;

	content_streamer.stream_range(range);
}

void
file_streamer_t::send_single_range(const response_header_builder_t &builder
		, output_sink_t &sink) {
	m_state = state_tag::single_range;
	FS_LOG_INFO("send a range of file");

	const auto &range = m_ranges.front();

	sink.send_headers(builder.single_range(range));

	content_streamer_t content_streamer(copy_logger(bh_logger), *m_file, sink
			, m_config.chunk_size, m_config.delay);

	content_streamer.stream_range(range);
}

void
file_streamer_t::send_multiple_ranges(const response_header_builder_t &builder
		, output_sink_t &sink) {
	m_state = state_tag::multi_range;
	FS_LOG_INFO("send multi-range of file: ranges=%llu"
			, static_cast<unsigned long long>(m_ranges.size()));

	multipart_encoder_t encoder(multipart_encoder_t::make_boundary(m_path)
			, builder.file_info().content_type, m_file->size());

	FS_LOG_DEBUG("multipart boundary: %s", encoder.boundary().c_str());

	sink.send_headers(builder.multiple_ranges(m_ranges, encoder));

	content_streamer_t content_streamer(copy_logger(bh_logger), *m_file, sink
			, m_config.chunk_size, m_config.delay);

	for (auto it = m_ranges.begin(), end = m_ranges.end(); it != end; ++it) {
		content_streamer.send_text(encoder.part_header(*it));
		content_streamer.stream_range(*it);
	}

	content_streamer.send_text(encoder.closing_boundary());
	sink.flush();
}

void
file_streamer_t::close_file() {
	if (!m_file || !m_file->is_open()) {
		return;
	}

	auto error_code = m_file->close();

	if (error_code) {
		FS_LOG_WARNING("%s: path=\"%s\"", error_code.message().c_str(), m_path.c_str());
	}
}

file_streamer_t::result_t
file_streamer_t::finish(state_tag state, std::error_code error_code, std::string message) {
	m_state = state;

	result_t result;
	result.state = state;
	result.error_code = std::move(error_code);
	result.message = std::move(message);

	return result;
}

} // namespace filestreamer
