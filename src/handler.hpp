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

#ifndef FILESTREAMER__SRC__HANDLER__HPP
#define FILESTREAMER__SRC__HANDLER__HPP

#include "error.hpp"
#include "handystats.hpp"
#include "server.hpp"
#include "sync_wait.hpp"

#include <thevoid/http_response.hpp>

#include <boost/system/error_code.hpp>

#include <atomic>
#include <future>
#include <memory>
#include <string>

namespace filestreamer {

/*
 * Base of the request handlers. Besides the asynchronous thevoid interface it
 * offers blocking send_headers_sync()/send_data_sync() for code running on the
 * worker pool: they wait until the network thread has written the data, or
 * until the server stops. Those must never be called from a network thread.
 */
template <template <typename> class BaseStream>
class handler
	: public BaseStream<server_t>
	, public std::enable_shared_from_this<handler<BaseStream>> {
public:
	typedef BaseStream<server_t> stream_type;
	typedef handler<BaseStream> self_type;

	handler(std::string handler_name_)
		: handler_name(std::move(handler_name_))
		, m_headers_were_sent(false)
		, m_peer_is_alive(true)
	{
	}

	void
	start_request() {
		FS_REQUEST_START(handler_name, instance_id());
	}

	boost::system::error_code
	send_headers_sync(ioremap::thevoid::http_response http_response) {
		auto promise_ptr = std::make_shared<std::promise<boost::system::error_code>>();
		auto future_result = promise_ptr->get_future();
		auto self = self_type::shared_from_this();

		auto next = [self, promise_ptr](const boost::system::error_code &error_code) {
			promise_ptr->set_value(error_code);
		};

		FS_REQUEST_SEND_HEADERS(handler_name, http_response.code(), instance_id());
		stream_type::send_headers(std::move(http_response), std::move(next));
		m_headers_were_sent = true;

		return on_sent(wait_sent(future_result, stream_type::server()->stopping()));
	}

	boost::system::error_code
	send_data_sync(std::string data) {
		auto promise_ptr = std::make_shared<std::promise<boost::system::error_code>>();
		auto future_result = promise_ptr->get_future();
		auto self = self_type::shared_from_this();

		auto next = [self, promise_ptr](const boost::system::error_code &error_code) {
			promise_ptr->set_value(error_code);
		};

		stream_type::send_data(std::move(data), std::move(next));

		return on_sent(wait_sent(future_result, stream_type::server()->stopping()));
	}

	void
	close(const boost::system::error_code &err) {
		FS_REQUEST_CLOSE(handler_name, instance_id());
		stream_type::close(err);
	}

	void
	close() {
		close(boost::system::error_code());
	}

	void
	send_reply(ioremap::thevoid::http_response http_response) {
		// The result of sending headers is lost here.
		auto next = [](const boost::system::error_code &) {};

		FS_REQUEST_SEND_HEADERS(handler_name, http_response.code(), instance_id());
		stream_type::send_headers(std::move(http_response), std::move(next));
		m_headers_were_sent = true;

		close();
	}

	void
	send_reply(int code) {
		ioremap::thevoid::http_response http_response;
		ioremap::swarm::http_headers http_headers;

		http_headers.set_content_length(0);
		http_response.set_code(code);
		http_response.set_headers(std::move(http_headers));

		send_reply(std::move(http_response));
	}

	bool
	headers_were_sent() const {
		return m_headers_were_sent;
	}

	bool
	peer_is_alive() const {
		return m_peer_is_alive;
	}

	const std::string &
	name() const {
		return handler_name;
	}

private:
	boost::system::error_code
	on_sent(boost::system::error_code error_code) {
		if (error_code) {
			m_peer_is_alive = false;
		}

		return error_code;
	}

	uint64_t
	instance_id() {
		return reinterpret_cast<uint64_t>(self_type::reply().get());
	}

	std::string handler_name;
	std::atomic<bool> m_headers_were_sent;
	std::atomic<bool> m_peer_is_alive;
};

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__HANDLER__HPP */
