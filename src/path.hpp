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

#ifndef FILESTREAMER__SRC__PATH__HPP
#define FILESTREAMER__SRC__PATH__HPP

#include <string>

namespace filestreamer {

/*
 * Maps an url path like "/get/a/b" served by handler_prefix "/get" to "<root>/a/b".
 * Throws http_error with 404 if the url does not belong to the handler or names
 * no file, and with 403 if a component is empty, "." or "..".
 */
std::string
resolve_path(const std::string &root, const std::string &url_path
		, const std::string &handler_prefix);

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__PATH__HPP */
