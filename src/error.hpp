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

#ifndef FILESTREAMER__SRC__ERROR__HPP
#define FILESTREAMER__SRC__ERROR__HPP

#include <stdexcept>
#include <string>
#include <system_error>

namespace filestreamer {

enum class streamer_errc {
	  success
	, file_unavailable
	, range_unit_unsupported
	, range_unsatisfiable
	, peer_disconnected
	, read_failure
	, close_failure
	, compression_disable_failure
};

const std::error_category &
streamer_category();

std::error_code
make_error_code(streamer_errc e);

std::error_condition
make_error_condition(streamer_errc e);

class streamer_error : public std::system_error
{
public:
	streamer_error(streamer_errc e, const std::string &message = "");
};

// Both range errors are answered with 416.
bool
is_range_error(const std::error_code &error_code);

class http_error : public std::runtime_error
{
public:
	http_error(int http_status_, const std::string &message)
		: std::runtime_error(message)
		, m_http_status(http_status_)
	{}

	int
	http_status() const {
		return m_http_status;
	}

private:
	int m_http_status;
};

} // namespace filestreamer

namespace std {

template <>
struct is_error_code_enum<filestreamer::streamer_errc>
	: public true_type
{};

} // namespace std

#endif /* FILESTREAMER__SRC__ERROR__HPP */
