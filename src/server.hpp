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

#ifndef FILESTREAMER__SRC__SERVER__HPP
#define FILESTREAMER__SRC__SERVER__HPP

#include "file_streamer.hpp"
#include "loggers.hpp"
#include "magic_provider.hpp"

#include <thevoid/server.hpp>

#include <boost/asio/thread_pool.hpp>
#include <boost/optional.hpp>
#include <boost/thread/tss.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace filestreamer {

class server_t : public ioremap::thevoid::server<server_t>
{
public:
	server_t();
	~server_t();

	bool initialize(const rapidjson::Value &config);

	struct req_ping
		: public ioremap::thevoid::simple_request_stream<server_t>
		, public std::enable_shared_from_this<req_ping>
	{
		void on_request(const ioremap::thevoid::http_request &req, const boost::asio::const_buffer &buffer);
	};

	template <typename T>
	void register_handler(const std::string &name, bool exact_match);

	// Resolves the url path under the configured root, see filestreamer::resolve_path().
	std::string
	resolve_path(const std::string &url_path, const std::string &handler_prefix) const;

	const streamer_config_t &
	streamer_config() const;

	const boost::optional<std::string> &
	mime_type() const;

	mime_resolver_t
	mime_resolver();

	// Runs the function on the streaming pool, away from network threads.
	void
	post(std::function<void ()> function);

	// Raised before the streaming pool is joined.
	const std::atomic<bool> &
	stopping() const;

private:
	boost::optional<std::string>
	detect_mime_type(const std::string &path);

	std::string m_root;
	streamer_config_t m_streamer_config;
	boost::optional<std::string> m_mime_type;

	boost::thread_specific_ptr<magic_provider> m_magic;
	std::unique_ptr<boost::asio::thread_pool> m_workers;

	std::atomic<bool> m_stopping;
	bool m_handystats_enabled;
};

template <typename T>
void server_t::register_handler(const std::string &name, bool exact_match) {
	options opts;
	if (exact_match) {
		options::exact_match('/' + name)(&opts);
	} else {
		options::prefix_match('/' + name)(&opts);
	}

	base_server::on(std::move(opts), std::make_shared<ioremap::thevoid::stream_factory<server_t, T>>(this));
}

} // namespace filestreamer

#endif /* FILESTREAMER__SRC__SERVER__HPP */
