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

#include "get.hpp"

#include "error.hpp"
#include "sink.hpp"

namespace {

typedef filestreamer::handler<ioremap::thevoid::simple_request_stream> get_handler_t;

// Blocking sink over the thevoid reply of one request.
class reply_sink_t : public filestreamer::output_sink_t {
public:
	reply_sink_t(std::shared_ptr<get_handler_t> request_)
		: request(std::move(request_))
	{}

	void
	send_headers(ioremap::thevoid::http_response http_response) {
		check(request->send_headers_sync(std::move(http_response)), "cannot send headers");
	}

	void
	send_data(const char *data, size_t size) {
		if (!request->peer_is_alive()) {
			throw filestreamer::streamer_error(filestreamer::streamer_errc::peer_disconnected
					, "cannot send data: connection is lost");
		}

		check(request->send_data_sync(std::string(data, size)), "cannot send data");
	}

	void
	flush() {
		// send_data() returns once the data are handed to the socket
	}

	bool
	is_peer_alive() {
		return request->peer_is_alive();
	}

private:
	void
	check(const boost::system::error_code &error_code, const std::string &what) {
		if (error_code) {
			throw filestreamer::streamer_error(filestreamer::streamer_errc::peer_disconnected
					, what + ": " + error_code.message());
		}
	}

	std::shared_ptr<get_handler_t> request;
};

} // namespace

namespace filestreamer {

req_get::req_get()
	: handler<ioremap::thevoid::simple_request_stream>("get")
{
}

void
req_get::on_request(const ioremap::thevoid::http_request &http_request
		, const boost::asio::const_buffer &const_buffer) {
	(void) const_buffer;

	FS_LOG_INFO("start request processing");
	start_request();

	if (http_request.method() != "GET") {
		FS_LOG_INFO("unsupported http method\'s type: \"%s\"", http_request.method().c_str());
		send_reply(400);
		return;
	}

	std::string path;

	try {
		path = server()->resolve_path(http_request.url().path(), "/get");
	} catch (const http_error &ex) {
		FS_LOG_ERROR("cannot resolve file path: %s", ex.what());
		send_reply(ex.http_status());
		return;
	}

	auto range_header = http_request.headers().get("Range");
	bool inline_disposition = server()->streamer_config().inline_disposition;

	if (auto inline_arg = http_request.url().query().item_value("inline")) {
		inline_disposition = (*inline_arg == "yes");
	}

	auto self = shared_from_this();

	server()->post([this, self, path, range_header, inline_disposition]() {
		stream_file(path, range_header, inline_disposition);
	});
}

void
req_get::stream_file(const std::string &path, const boost::optional<std::string> &range_header
		, bool inline_disposition) {
	file_streamer_t file_streamer(make_component_logger(logger(), "streamer"), path
			, server()->streamer_config());

	file_streamer.set_inline(inline_disposition);
	file_streamer.set_mime_type(server()->mime_type());
	file_streamer.set_mime_resolver(server()->mime_resolver());

	reply_sink_t sink(shared_from_this());

	auto self = shared_from_this();
	auto on_complete = [this, self](const file_streamer_t::result_t &result) {
		on_streamed(result);
	};

	file_streamer.run(range_header, sink, on_complete);
}

void
req_get::on_streamed(const file_streamer_t::result_t &result) {
	if (result.is_success()) {
		FS_LOG_INFO("request is processed");
		close();
		return;
	}

	if (result.error_code == streamer_errc::file_unavailable) {
		send_reply(404);
		return;
	}

	if (is_range_error(result.error_code) && headers_were_sent()) {
		// 416 is already sent
		close();
		return;
	}

	if (!headers_were_sent()) {
		send_reply(500);
		return;
	}

	FS_REQUEST_ABORTED(name());
	FS_LOG_ERROR("error occured after headers were sent and cannot be reported to the client: %s"
			, result.message.c_str());
	close(boost::system::errc::make_error_code(boost::system::errc::operation_canceled));
}

} // namespace filestreamer
