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

#include <handystats/core.hpp>
#include <handystats/json_dump.hpp>

#include "server.hpp"
#include "get.hpp"
#include "path.hpp"

#include <boost/asio/post.hpp>

#include <stdexcept>
#include <sstream>

namespace {

int get_int(const rapidjson::Value &config, const char *name, int def_val = 0) {
	return config.HasMember(name) ? config[name].GetInt() : def_val;
}

bool get_bool(const rapidjson::Value &config, const char *name, bool def_val = false) {
	return config.HasMember(name) ? config[name].GetBool() : def_val;
}

std::string get_string(const rapidjson::Value &config, const char *name, const std::string &def_val = std::string()) {
	return config.HasMember(name) ? config[name].GetString() : def_val;
}

} // namespace

namespace filestreamer {

server_t::server_t()
	: m_stopping(false)
	, m_handystats_enabled(false)
{
}

server_t::~server_t() {
	FS_LOG_INFO("Filestreamer stops");

	m_stopping = true;

	if (m_workers) {
		FS_LOG_INFO("Filestreamer stops: streaming workers");
		m_workers->join();
		FS_LOG_INFO("Filestreamer stops: done");
	}

	if (m_handystats_enabled) {
		FS_LOG_INFO("Filestreamer stops: handystats");
		HANDY_FINALIZE();
		FS_LOG_INFO("Filestreamer stops: done");
	}
}

bool server_t::initialize(const rapidjson::Value &config) {
	try {
		FS_LOG_INFO("Filestreamer starts");

		if (config.HasMember("root") == false) {
			throw std::runtime_error("You should set a root directory to serve files from");
		}

		m_root = get_string(config, "root");

		while (m_root.size() > 1 && m_root.back() == '/') {
			m_root.pop_back();
		}

		auto chunk_size = get_int(config, "chunk-size", 1024);
		if (chunk_size <= 0) {
			throw std::runtime_error("chunk-size must be positive");
		}
		m_streamer_config.chunk_size = chunk_size;

		auto delay = get_int(config, "delay", 0);
		if (delay < 0) {
			throw std::runtime_error("delay must not be negative");
		}
		m_streamer_config.delay = std::chrono::microseconds(delay);

		m_streamer_config.inline_disposition = get_bool(config, "inline", false);

		if (config.HasMember("mime-type")) {
			m_mime_type = get_string(config, "mime-type");
		}

		auto worker_threads = get_int(config, "worker-threads", 4);
		if (worker_threads <= 0) {
			throw std::runtime_error("worker-threads must be positive");
		}

		FS_LOG_INFO("Filestreamer starts: streaming workers: count=%d", worker_threads);
		m_workers.reset(new boost::asio::thread_pool(worker_threads));
		FS_LOG_INFO("Filestreamer starts: done");

		if (config.HasMember("handystats")) {
			HANDY_CONFIG_JSON(config["handystats"]);

			if (config["handystats"].HasMember("core") &&
					config["handystats"]["core"].HasMember("enable") &&
					config["handystats"]["core"]["enable"].IsBool() &&
					config["handystats"]["core"]["enable"].GetBool()
				)
			{
				HANDY_INIT();
				m_handystats_enabled = true;
			}
		}

		{
			std::ostringstream oss;
			oss << "root=\"" << m_root << "\"; chunk-size=" << m_streamer_config.chunk_size
				<< "; delay=" << m_streamer_config.delay.count() << "us"
				<< "; inline=" << (m_streamer_config.inline_disposition ? "yes" : "no");
			FS_LOG_INFO("Filestreamer starts: %s", oss.str().c_str());
		}
	} catch(const std::exception &ex) {
		FS_LOG_ERROR("%s", ex.what());
		return false;
	}

	FS_LOG_INFO("Filestreamer starts: initialize handlers");

	register_handler<req_get>("get", false);
	register_handler<req_ping>("ping", true);

	FS_LOG_INFO("Filestreamer starts: done");
	FS_LOG_INFO("Filestreamer starts: initialization is done");

	return true;
}

void server_t::req_ping::on_request(const ioremap::thevoid::http_request &req, const boost::asio::const_buffer &buffer) {
	(void) buffer;

	FS_LOG_INFO("Ping: handle request: %s", req.url().path().c_str());
	send_reply(200);
}

std::string
server_t::resolve_path(const std::string &url_path, const std::string &handler_prefix) const {
	return filestreamer::resolve_path(m_root, url_path, handler_prefix);
}

const streamer_config_t &
server_t::streamer_config() const {
	return m_streamer_config;
}

const boost::optional<std::string> &
server_t::mime_type() const {
	return m_mime_type;
}

mime_resolver_t
server_t::mime_resolver() {
	return std::bind(&server_t::detect_mime_type, this, std::placeholders::_1);
}

void
server_t::post(std::function<void ()> function) {
	boost::asio::post(*m_workers, std::move(function));
}

const std::atomic<bool> &
server_t::stopping() const {
	return m_stopping;
}

boost::optional<std::string>
server_t::detect_mime_type(const std::string &path) {
	if (NULL == m_magic.get()) {
		m_magic.reset(new magic_provider());
	}

	return m_magic->type(path);
}

} // namespace filestreamer

int main(int argc, char **argv) {
	return ioremap::thevoid::run_server<filestreamer::server_t>(argc, argv);
}
