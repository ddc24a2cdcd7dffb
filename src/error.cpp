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

#include "error.hpp"

class error_category_t
	: public std::error_category
{
public:
	const char *
	name() const noexcept {
		return "file streamer error category";
	}

	std::string
	message(int ev) const {
		switch (static_cast<filestreamer::streamer_errc>(ev)) {
		case filestreamer::streamer_errc::success:
			return "success";
		case filestreamer::streamer_errc::file_unavailable:
			return "file is currently not available";
		case filestreamer::streamer_errc::range_unit_unsupported:
			return "range unit is not supported";
		case filestreamer::streamer_errc::range_unsatisfiable:
			return "requested range not satisfiable";
		case filestreamer::streamer_errc::peer_disconnected:
			return "peer disconnected";
		case filestreamer::streamer_errc::read_failure:
			return "cannot read file";
		case filestreamer::streamer_errc::close_failure:
			return "cannot close file";
		case filestreamer::streamer_errc::compression_disable_failure:
			return "cannot disable output compression";
		default:
			return "unknown error";
		}
	}
};

const std::error_category &
filestreamer::streamer_category() {
	const static error_category_t instance;
	return instance;
}

std::error_code
filestreamer::make_error_code(streamer_errc e) {
	return std::error_code(static_cast<int>(e), streamer_category());
}

std::error_condition
filestreamer::make_error_condition(streamer_errc e) {
	return std::error_condition(static_cast<int>(e), streamer_category());
}

filestreamer::streamer_error::streamer_error(streamer_errc e, const std::string &message)
	: std::system_error(make_error_code(e), message)
{
}

bool
filestreamer::is_range_error(const std::error_code &error_code) {
	return error_code == streamer_errc::range_unit_unsupported
		|| error_code == streamer_errc::range_unsatisfiable;
}
