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

#include "multipart.hpp"

#define CRYPTOPP_ENABLE_NAMESPACE_WEAK 1
#include <crypto++/md5.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace filestreamer {

multipart_encoder_t::multipart_encoder_t(std::string boundary_, std::string content_type_
		, uint64_t total_size_)
	: m_boundary(std::move(boundary_))
	, m_content_type(std::move(content_type_))
	, m_total_size(total_size_)
{
}

std::string
multipart_encoder_t::make_boundary(const std::string &path) {
	using namespace CryptoPP;

	Weak::MD5 hash;

	hash.Update((const byte *)path.data(), path.size());

	std::vector<byte> result(hash.DigestSize());
	hash.Final(result.data());

	std::ostringstream oss;
	oss << std::hex;
	for (auto it = result.begin(), end = result.end(); it != end; ++it) {
		oss << std::setfill('0') << std::setw(2) << static_cast<int>(*it);
	}

	return oss.str();
}

const std::string &
multipart_encoder_t::boundary() const {
	return m_boundary;
}

std::string
multipart_encoder_t::content_type() const {
	return "multipart/byteranges; boundary=" + m_boundary;
}

std::string
multipart_encoder_t::part_header(const range_t &range) const {
	std::ostringstream oss;

	oss
		<< "\r\n--" << m_boundary << "\r\n"
		<< "Content-Type: " << m_content_type << "\r\n"
		<< "Content-range: " << make_content_range(range, m_total_size) << "\r\n"
		<< "\r\n";

	return oss.str();
}

std::string
multipart_encoder_t::closing_boundary() const {
	return "\r\n--" + m_boundary + "--\r\n";
}

uint64_t
multipart_encoder_t::content_length(const ranges_t &ranges) const {
	uint64_t content_length = 0;

	for (auto it = ranges.begin(), end = ranges.end(); it != end; ++it) {
		content_length += part_header(*it).size();
		content_length += it->size();
	}

	content_length += closing_boundary().size();

	return content_length;
}

} // namespace filestreamer
