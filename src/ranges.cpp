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

#include "ranges.hpp"
#include "error.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace {

struct range_spec_t {
	boost::optional<uint64_t> first;
	boost::optional<uint64_t> last;
};

// Saturates instead of wrapping: a huge position is clamped later anyway.
bool
parse_pos(const std::string &str, uint64_t &res) {
	const uint64_t max_pos = std::numeric_limits<uint64_t>::max();

	if (str.empty()) {
		return false;
	}

	res = 0;

	for (auto it = str.begin(), end = str.end(); it != end; ++it) {
		if (!isdigit(static_cast<unsigned char>(*it))) {
			return false;
		}

		uint64_t digit = *it - '0';

		if (res > (max_pos - digit) / 10) {
			res = max_pos;
		} else {
			res = res * 10 + digit;
		}
	}

	return true;
}

std::string
trim(const std::string &str) {
	const char *spaces = " \t";
	auto begin = str.find_first_not_of(spaces);

	if (begin == std::string::npos) {
		return std::string();
	}

	auto end = str.find_last_not_of(spaces);
	return str.substr(begin, end - begin + 1);
}

range_spec_t
parse_range_spec(const std::string &spec) {
	auto dash = spec.find('-');

	if (dash == std::string::npos) {
		throw filestreamer::streamer_error(filestreamer::streamer_errc::range_unsatisfiable
				, "range spec has no dash: \"" + spec + "\"");
	}

	auto first_str = spec.substr(0, dash);
	auto last_str = spec.substr(dash + 1);

	if (first_str.empty() && last_str.empty()) {
		throw filestreamer::streamer_error(filestreamer::streamer_errc::range_unsatisfiable
				, "range spec has no bounds: \"" + spec + "\"");
	}

	range_spec_t range_spec;
	uint64_t pos = 0;

	if (!first_str.empty()) {
		if (!parse_pos(first_str, pos)) {
			throw filestreamer::streamer_error(filestreamer::streamer_errc::range_unsatisfiable
					, "range spec is malformed: \"" + spec + "\"");
		}
		range_spec.first = pos;
	}

	if (!last_str.empty()) {
		if (!parse_pos(last_str, pos)) {
			throw filestreamer::streamer_error(filestreamer::streamer_errc::range_unsatisfiable
					, "range spec is malformed: \"" + spec + "\"");
		}
		range_spec.last = pos;
	}

	return range_spec;
}

filestreamer::range_t
resolve_range_spec(const range_spec_t &range_spec, uint64_t total_size) {
	if (total_size == 0) {
		throw filestreamer::streamer_error(filestreamer::streamer_errc::range_unsatisfiable
				, "file is empty");
	}

	uint64_t last_byte = total_size - 1;
	uint64_t start = 0;
	uint64_t end = last_byte;

	if (!range_spec.first) {
		// "-500" is the last 500 bytes, not 0-500
		uint64_t suffix_length = *range_spec.last;
		start = suffix_length >= total_size ? 0 : total_size - suffix_length;
	} else {
		start = *range_spec.first;

		if (range_spec.last) {
			end = std::min(*range_spec.last, last_byte);
		}
	}

	if (start > end) {
		std::ostringstream oss;
		oss << "range is empty after clamping: first=" << start << "; last=" << end
			<< "; total-size=" << total_size;
		throw filestreamer::streamer_error(filestreamer::streamer_errc::range_unsatisfiable
				, oss.str());
	}

	filestreamer::range_t range;
	range.start = start;
	range.end = end;
	return range;
}

} // namespace

namespace filestreamer {

ranges_t
parse_range_header(const boost::optional<std::string> &header, uint64_t total_size) {
	ranges_t ranges;

	if (!header) {
		return ranges;
	}

	const auto &value = *header;
	auto eq = value.find('=');

	if (eq == std::string::npos || value.compare(0, eq, "bytes") != 0) {
		throw streamer_error(streamer_errc::range_unit_unsupported
				, "unsupported range unit: \"" + value.substr(0, eq) + "\"");
	}

	std::string::size_type pos = eq + 1;

	do {
		auto comma = value.find(',', pos);
		auto size = comma == std::string::npos ? std::string::npos : comma - pos;
		auto spec = trim(value.substr(pos, size));

		if (spec.empty()) {
			throw streamer_error(streamer_errc::range_unsatisfiable, "range spec is empty");
		}

		ranges.push_back(resolve_range_spec(parse_range_spec(spec), total_size));

		pos = comma == std::string::npos ? std::string::npos : comma + 1;
	} while (pos != std::string::npos);

	return ranges;
}

std::string
make_content_range(const range_t &range, uint64_t total_size) {
	std::ostringstream oss;
	oss << "bytes " << range.start << '-' << range.end << '/' << total_size;
	return oss.str();
}

} // namespace filestreamer
