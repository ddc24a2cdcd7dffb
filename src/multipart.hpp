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

#ifndef FILESTREAMER__SRC__MULTIPART__HPP
#define FILESTREAMER__SRC__MULTIPART__HPP

#include "ranges.hpp"

#include <cstdint>
#include <string>

namespace filestreamer {

/*
 * Text framing of a multipart/byteranges body. For every range the body carries
 *   "\r\n--BOUNDARY\r\n"
 *   "Content-Type: TYPE\r\n"
 *   "Content-range: bytes FIRST-LAST/TOTAL\r\n\r\n"
 * followed by the range payload, and ends with "\r\n--BOUNDARY--\r\n".
 * content_length() is computed from the very strings part_header() and
 * closing_boundary() return, so the advertised length matches the wire.
 */
class multipart_encoder_t {
public:
	multipart_encoder_t(std::string boundary_, std::string content_type_, uint64_t total_size_);

	// Lowercase hex md5 of the path: stable across requests for the same file.
	static
	std::string
	make_boundary(const std::string &path);

	const std::string &
	boundary() const;

	std::string
	content_type() const;

	std::string
	part_header(const range_t &range) const;

	std::string
	closing_boundary() const;

	uint64_t
	content_length(const ranges_t &ranges) const;

private:
	std::string m_boundary;
	std::string m_content_type;
	uint64_t m_total_size;
};

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__MULTIPART__HPP */
