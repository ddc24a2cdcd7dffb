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

#ifndef FILESTREAMER__SRC__MAGIC_PROVIDER__HPP
#define FILESTREAMER__SRC__MAGIC_PROVIDER__HPP

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include <magic.h>

#include <functional>
#include <stdexcept>
#include <string>

namespace filestreamer {

// Maps a file path to its mime type, none if the type cannot be told.
typedef std::function<boost::optional<std::string> (const std::string &)> mime_resolver_t;

// libmagic cookies are not thread safe: keep one provider per thread.
class magic_provider : private boost::noncopyable {

public:
	magic_provider ()
		: magic_(magic_open(MAGIC_MIME_TYPE))
		, loaded_(false)
	{
		if (!magic_) {
			throw std::runtime_error("cannot open magic cookie");
		}

		loaded_ = magic_load(magic_, 0) == 0;
	}

	~magic_provider() {
		magic_close(magic_);
	}

public:
	boost::optional<std::string>
	type(const std::string &path) {
		if (!loaded_) {
			return boost::none;
		}

		const char *result(magic_file(magic_, path.c_str()));

		if (result) {
			return std::string(result);
		}

		return boost::none;
	}

private:
	magic_t magic_;
	bool loaded_;

};

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__MAGIC_PROVIDER__HPP */
