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

#ifndef FILESTREAMER__SRC__RESPONSE_HEADERS__HPP
#define FILESTREAMER__SRC__RESPONSE_HEADERS__HPP

#include "multipart.hpp"
#include "ranges.hpp"

#include <thevoid/http_response.hpp>

#include <cstdint>
#include <string>

namespace filestreamer {

extern const char *const default_content_type;

struct file_info_t {
	std::string filename;
	std::string content_type;
	uint64_t size;
};

class response_header_builder_t {
public:
	response_header_builder_t(file_info_t file_info_, bool inline_disposition_);

	ioremap::thevoid::http_response
	whole_file() const;

	ioremap::thevoid::http_response
	single_range(const range_t &range) const;

	ioremap::thevoid::http_response
	multiple_ranges(const ranges_t &ranges, const multipart_encoder_t &encoder) const;

	// Bare 416: no header at all.
	static
	ioremap::thevoid::http_response
	range_not_satisfiable();

	const file_info_t &
	file_info() const;

private:
	ioremap::swarm::http_headers
	make_headers(const std::string &content_type, uint64_t content_length) const;

	std::string
	content_disposition() const;

	file_info_t m_file_info;
	bool m_inline_disposition;
};

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__RESPONSE_HEADERS__HPP */
