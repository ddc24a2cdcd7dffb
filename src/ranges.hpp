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

#ifndef FILESTREAMER__SRC__RANGES__HPP
#define FILESTREAMER__SRC__RANGES__HPP

#include <boost/optional.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace filestreamer {

// Inclusive byte span, start <= end < total size.
struct range_t {
	uint64_t start;
	uint64_t end;

	uint64_t
	size() const {
		return end - start + 1;
	}
};

inline
bool
operator == (const range_t &lhs, const range_t &rhs) {
	return lhs.start == rhs.start && lhs.end == rhs.end;
}

// Kept in request order: never sorted, merged or deduplicated.
typedef std::vector<range_t> ranges_t;

/*
 * Parses the value of a Range header against a file of total_size bytes.
 * Accepted specs are "first-last", "first-" and "-suffix_length".
 * An absent header gives an empty set.
 * Throws streamer_error with range_unit_unsupported if the unit is not "bytes"
 * and with range_unsatisfiable if any spec is malformed or empty after clamping;
 * in both cases no range is returned.
 */
ranges_t
parse_range_header(const boost::optional<std::string> &header, uint64_t total_size);

std::string
make_content_range(const range_t &range, uint64_t total_size);

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__RANGES__HPP */
