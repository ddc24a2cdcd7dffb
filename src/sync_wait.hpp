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

#ifndef FILESTREAMER__SRC__SYNC_WAIT__HPP
#define FILESTREAMER__SRC__SYNC_WAIT__HPP

#include <boost/system/error_code.hpp>

#include <atomic>
#include <chrono>
#include <future>

namespace filestreamer {

/*
 * Blocks until the network thread reports the result of a send.
 * Once stopping is raised the network threads may be gone together with the
 * pending completion, so the wait gives up with operation_canceled.
 */
inline
boost::system::error_code
wait_sent(std::future<boost::system::error_code> &future, const std::atomic<bool> &stopping
		, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100)) {
	while (future.wait_for(poll_interval) != std::future_status::ready) {
		if (stopping) {
			return boost::system::errc::make_error_code(boost::system::errc::operation_canceled);
		}
	}

	return future.get();
}

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__SYNC_WAIT__HPP */
