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

#include "path.hpp"
#include "error.hpp"

#include <vector>

namespace {

std::vector<std::string> split_path(const std::string &path) {
	std::vector<std::string> result;
	std::string::size_type pos = 0;

	while (pos != std::string::npos) {
		auto new_pos = path.find('/', pos);
		auto size = new_pos == std::string::npos ? std::string::npos : new_pos - pos;

		result.push_back(path.substr(pos, size));

		pos = new_pos == std::string::npos ? std::string::npos : new_pos + 1;
	}

	return result;
}

} // namespace

std::string
filestreamer::resolve_path(const std::string &root, const std::string &url_path
		, const std::string &handler_prefix) {
	if (url_path.compare(0, handler_prefix.size(), handler_prefix) != 0) {
		throw http_error(404, "unexpected url: \"" + url_path + "\"");
	}

	auto relative_path = url_path.substr(handler_prefix.size());

	if (relative_path.empty() || relative_path == "/") {
		throw http_error(404, "file name is missed");
	}

	if (relative_path[0] != '/') {
		throw http_error(404, "unexpected url: \"" + url_path + "\"");
	}

	auto components = split_path(relative_path.substr(1));

	for (auto it = components.begin(), end = components.end(); it != end; ++it) {
		if (it->empty() || *it == "." || *it == "..") {
			throw http_error(403, "path escapes the root: \"" + relative_path + "\"");
		}
	}

	return root + relative_path;
}
