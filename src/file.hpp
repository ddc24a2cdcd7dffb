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

#ifndef FILESTREAMER__SRC__FILE__HPP
#define FILESTREAMER__SRC__FILE__HPP

#include <boost/noncopyable.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

namespace filestreamer {

/*
 * Regular file opened read-only under a shared flock(2).
 * The lock is taken without waiting: if somebody holds an exclusive lock
 * the constructor fails with streamer_errc::file_unavailable.
 * Size is sampled once at open time.
 */
class file_t : private boost::noncopyable {
public:
	explicit file_t(const std::string &path_);
	~file_t();

	const std::string &
	path() const;

	uint64_t
	size() const;

	bool
	is_open() const;

	// Throws streamer_errc::read_failure.
	void
	seek(uint64_t offset);

	// Returns 0 at the end of file. Throws streamer_errc::read_failure.
	size_t
	read(char *buffer, size_t size);

	// Releases the lock and the descriptor; a failure is reported, not thrown.
	std::error_code
	close();

private:
	std::string m_path;
	int m_fd;
	uint64_t m_size;
};

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__FILE__HPP */
