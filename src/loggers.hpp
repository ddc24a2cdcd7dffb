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

#ifndef FILESTREAMER__SRC__LOGGERS__HPP
#define FILESTREAMER__SRC__LOGGERS__HPP

#include <swarm/logger.hpp>

#include <string>

#define FS_LOG(verb, ...) BH_LOG(logger(), verb, __VA_ARGS__)
#define FS_LOG_ERROR(...) FS_LOG(SWARM_LOG_ERROR, __VA_ARGS__)
#define FS_LOG_WARNING(...) FS_LOG(SWARM_LOG_WARNING, __VA_ARGS__)
#define FS_LOG_INFO(...) FS_LOG(SWARM_LOG_INFO, __VA_ARGS__)
#define FS_LOG_NOTICE(...) FS_LOG(SWARM_LOG_NOTICE, __VA_ARGS__)
#define FS_LOG_DEBUG(...) FS_LOG(SWARM_LOG_DEBUG, __VA_ARGS__)

namespace filestreamer {

ioremap::swarm::logger
copy_logger(const ioremap::swarm::logger &logger);

// The returned logger tags every record with component=<component>.
ioremap::swarm::logger
make_component_logger(const ioremap::swarm::logger &logger, const std::string &component);

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__LOGGERS__HPP */
