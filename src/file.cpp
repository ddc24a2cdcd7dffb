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

#include "file.hpp"
#include "error.hpp"

#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace {

std::string
describe(const std::string &action, const std::string &path, int err) {
	return action + " \"" + path + "\": " + strerror(err);
}

} // namespace

namespace filestreamer {

file_t::file_t(const std::string &path_)
	: m_path(path_)
	, m_fd(-1)
	, m_size(0)
{
	int fd = ::open(m_path.c_str(), O_RDONLY | O_CLOEXEC);

	if (fd == -1) {
		throw streamer_error(streamer_errc::file_unavailable
				, describe("cannot open", m_path, errno));
	}

	if (::flock(fd, LOCK_SH | LOCK_NB) == -1) {
		int err = errno;
		::close(fd);
		throw streamer_error(streamer_errc::file_unavailable
				, describe("cannot lock", m_path, err));
	}

	struct stat st;

	if (::fstat(fd, &st) == -1) {
		int err = errno;
		::close(fd);
		throw streamer_error(streamer_errc::file_unavailable
				, describe("cannot stat", m_path, err));
	}

	if (!S_ISREG(st.st_mode)) {
		::close(fd);
		throw streamer_error(streamer_errc::file_unavailable
				, "not a regular file: \"" + m_path + "\"");
	}

	m_fd = fd;
	m_size = st.st_size;
}

file_t::~file_t() {
	if (m_fd != -1) {
		::close(m_fd);
	}
}

const std::string &
file_t::path() const {
	return m_path;
}

uint64_t
file_t::size() const {
	return m_size;
}

bool
file_t::is_open() const {
	return m_fd != -1;
}

void
file_t::seek(uint64_t offset) {
	if (::lseek(m_fd, static_cast<off_t>(offset), SEEK_SET) == static_cast<off_t>(-1)) {
		throw streamer_error(streamer_errc::read_failure
				, describe("cannot seek", m_path, errno));
	}
}

size_t
file_t::read(char *buffer, size_t size) {
	for (;;) {
		auto res = ::read(m_fd, buffer, size);

		if (res >= 0) {
			return static_cast<size_t>(res);
		}

		if (errno != EINTR) {
			throw streamer_error(streamer_errc::read_failure
					, describe("cannot read", m_path, errno));
		}
	}
}

std::error_code
file_t::close() {
	if (m_fd == -1) {
		return std::error_code();
	}

	int fd = m_fd;
	m_fd = -1;

	if (::close(fd) == -1) {
		return make_error_code(streamer_errc::close_failure);
	}

	return std::error_code();
}

} // namespace filestreamer
