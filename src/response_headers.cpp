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

#include "response_headers.hpp"

#include <boost/lexical_cast.hpp>

namespace {

std::string
quote(const std::string &string) {
	std::string result;
	result.reserve(string.size() + 2);

	result.push_back('\"');
	for (auto it = string.begin(), end = string.end(); it != end; ++it) {
		if (*it == '\"' || *it == '\\') {
			result.push_back('\\');
		}
		result.push_back(*it);
	}
	result.push_back('\"');

	return result;
}

ioremap::thevoid::http_response
make_http_response(int code, ioremap::swarm::http_headers http_headers) {
	ioremap::thevoid::http_response http_response;

	http_response.set_code(code);
	http_response.set_headers(std::move(http_headers));

	return http_response;
}

} // namespace

namespace filestreamer {

const char *const default_content_type = "application/octet-stream";

response_header_builder_t::response_header_builder_t(file_info_t file_info_
		, bool inline_disposition_)
	: m_file_info(std::move(file_info_))
	, m_inline_disposition(inline_disposition_)
{
	if (m_file_info.content_type.empty()) {
		m_file_info.content_type = default_content_type;
	}
}

ioremap::thevoid::http_response
response_header_builder_t::whole_file() const {
	return make_http_response(200, make_headers(m_file_info.content_type, m_file_info.size));
}

ioremap::thevoid::http_response
response_header_builder_t::single_range(const range_t &range) const {
	auto headers = make_headers(m_file_info.content_type, range.size());
	headers.add("Content-Range", make_content_range(range, m_file_info.size));

	return make_http_response(206, std::move(headers));
}

ioremap::thevoid::http_response
response_header_builder_t::multiple_ranges(const ranges_t &ranges
		, const multipart_encoder_t &encoder) const {
	return make_http_response(206
			, make_headers(encoder.content_type(), encoder.content_length(ranges)));
}

ioremap::thevoid::http_response
response_header_builder_t::range_not_satisfiable() {
	return make_http_response(416, ioremap::swarm::http_headers());
}

const file_info_t &
response_header_builder_t::file_info() const {
	return m_file_info;
}

ioremap::swarm::http_headers
response_header_builder_t::make_headers(const std::string &content_type
		, uint64_t content_length) const {
	ioremap::swarm::http_headers headers;

	headers.add("Pragma", "public");
	headers.add("Expires", "-1");
	headers.add("Cache-Control", "public, must-revalidate, post-check=0, pre-check=0");
	headers.add("Accept-Ranges", "bytes");
	headers.add("Content-Type", content_type);
	headers.add("Content-Transfer-Encoding", "binary");
	headers.add("Content-Disposition", content_disposition());
	headers.add("Content-Length", boost::lexical_cast<std::string>(content_length));

	return headers;
}

std::string
response_header_builder_t::content_disposition() const {
	if (m_inline_disposition) {
		return "inline";
	}

	return "attachment; filename=" + quote(m_file_info.filename);
}

} // namespace filestreamer
