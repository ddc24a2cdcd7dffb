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

#include "file_streamer.hpp"
#include "error.hpp"
#include "multipart.hpp"

#include "recording_sink.hpp"
#include "temp_dir.hpp"
#include "test_logger.hpp"

#include <gtest/gtest.h>

#include <boost/lexical_cast.hpp>

#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace filestreamer;

namespace {

std::vector<std::string>
expected_lines(const std::string &content_type, const std::string &content_length
		, const std::string &disposition = "attachment; filename=\"dummyFile.txt\"") {
	std::vector<std::string> result;

	result.push_back("Pragma: public");
	result.push_back("Expires: -1");
	result.push_back("Cache-Control: public, must-revalidate, post-check=0, pre-check=0");
	result.push_back("Accept-Ranges: bytes");
	result.push_back("Content-Type: " + content_type);
	result.push_back("Content-Transfer-Encoding: binary");
	result.push_back("Content-Disposition: " + disposition);
	result.push_back("Content-Length: " + content_length);

	return result;
}

boost::optional<std::string>
text_plain(const std::string &) {
	return std::string("text/plain");
}

class FileStreamerTest : public ::testing::Test {
protected:
	void
	SetUp() {
		path = temp_dir.write_file("dummyFile.txt", "0123456789");
	}

	file_streamer_t::result_t
	run(const boost::optional<std::string> &range_header
			, streamer_config_t config = streamer_config_t()) {
		file_streamer_t file_streamer(test::make_logger(), path, config);
		file_streamer.set_mime_resolver(text_plain);
		return file_streamer.run(range_header, sink);
	}

	test::temp_dir_t temp_dir;
	std::string path;
	test::recording_sink_t sink;
};

struct single_range_case_t {
	const char *header;
	const char *body;
	const char *content_range;
};

class SingleRangeTest
	: public FileStreamerTest
	, public ::testing::WithParamInterface<single_range_case_t>
{};

} // namespace

TEST_F(FileStreamerTest, WholeFile)
{
	auto result = run(boost::none);

	EXPECT_TRUE(result.is_success());
	EXPECT_FALSE(result.error_code);
	EXPECT_EQ(file_streamer_t::state_tag::closed, result.state);

	EXPECT_EQ(200, sink.code);
	EXPECT_EQ(1, sink.headers_sent);
	EXPECT_EQ(expected_lines("text/plain", "10"), sink.header_lines());
	EXPECT_EQ("0123456789", sink.body);
}

TEST_P(SingleRangeTest, Body)
{
	const auto &param = GetParam();
	auto result = run(std::string(param.header));

	EXPECT_TRUE(result.is_success());
	EXPECT_EQ(206, sink.code);
	EXPECT_EQ(param.body, sink.body);

	auto lines = expected_lines("text/plain"
			, boost::lexical_cast<std::string>(std::string(param.body).size()));
	lines.push_back(std::string("Content-Range: ") + param.content_range);

	EXPECT_EQ(lines, sink.header_lines());
}

INSTANTIATE_TEST_SUITE_P(Ranges, SingleRangeTest, ::testing::Values(
	  single_range_case_t{"bytes=3-7", "34567", "bytes 3-7/10"}
	, single_range_case_t{"bytes=0-0", "0", "bytes 0-0/10"}
	, single_range_case_t{"bytes=3-", "3456789", "bytes 3-9/10"}
	, single_range_case_t{"bytes=-3", "789", "bytes 7-9/10"}
	, single_range_case_t{"bytes=-20", "0123456789", "bytes 0-9/10"}
	, single_range_case_t{"bytes=5-100", "56789", "bytes 5-9/10"}
	, single_range_case_t{"bytes=9-9", "9", "bytes 9-9/10"}
));

TEST_F(FileStreamerTest, MultipleRanges)
{
	auto result = run(std::string("bytes=2-3,5-6,-1"));

	EXPECT_TRUE(result.is_success());

	auto boundary = multipart_encoder_t::make_boundary(path);
	std::string expected_body =
		"\r\n--" + boundary + "\r\n"
		"Content-Type: text/plain\r\n"
		"Content-range: bytes 2-3/10\r\n"
		"\r\n"
		"23"
		"\r\n--" + boundary + "\r\n"
		"Content-Type: text/plain\r\n"
		"Content-range: bytes 5-6/10\r\n"
		"\r\n"
		"56"
		"\r\n--" + boundary + "\r\n"
		"Content-Type: text/plain\r\n"
		"Content-range: bytes 9-9/10\r\n"
		"\r\n"
		"9"
		"\r\n--" + boundary + "--\r\n";

	EXPECT_EQ(206, sink.code);
	EXPECT_EQ(expected_lines("multipart/byteranges; boundary=" + boundary, "330")
			, sink.header_lines());
	EXPECT_EQ(expected_body, sink.body);
	EXPECT_EQ(330u, sink.body.size());
}

TEST_F(FileStreamerTest, OverlappingRangesArePassedThrough)
{
	file_streamer_t file_streamer(test::make_logger(), path);
	file_streamer.set_mime_type(std::string("text/plain"));

	auto result = file_streamer.run(std::string("bytes=0-3,2-5"), sink);

	ASSERT_TRUE(result.is_success());
	ASSERT_EQ(2u, file_streamer.ranges().size());
	EXPECT_EQ(file_streamer_t::state_tag::closed, file_streamer.state());

	EXPECT_NE(std::string::npos, sink.body.find("0123"));
	EXPECT_NE(std::string::npos, sink.body.find("2345"));
	EXPECT_EQ(boost::lexical_cast<std::string>(sink.body.size())
			, *sink.header("Content-Length"));
}

TEST_F(FileStreamerTest, UnsatisfiableRange)
{
	file_streamer_t file_streamer(test::make_logger(), path);
	auto result = file_streamer.run(std::string("bytes=2-4,7-5,-2"), sink);

	EXPECT_FALSE(result.is_success());
	EXPECT_EQ(file_streamer_t::state_tag::aborted, result.state);
	EXPECT_EQ(file_streamer_t::state_tag::aborted, file_streamer.state());
	EXPECT_EQ(make_error_code(streamer_errc::range_unsatisfiable), result.error_code);
	EXPECT_TRUE(file_streamer.ranges().empty());

	EXPECT_EQ(416, sink.code);
	EXPECT_TRUE(sink.headers.empty());
	EXPECT_TRUE(sink.body.empty());
}

TEST_F(FileStreamerTest, UnsupportedUnit)
{
	auto result = run(std::string("invalid=3-7"));

	EXPECT_EQ(make_error_code(streamer_errc::range_unit_unsupported), result.error_code);
	EXPECT_EQ(416, sink.code);
	EXPECT_TRUE(sink.headers.empty());
	EXPECT_TRUE(sink.body.empty());
}

TEST_F(FileStreamerTest, StartBeyondEnd)
{
	auto result = run(std::string("bytes=9-7"));

	EXPECT_EQ(make_error_code(streamer_errc::range_unsatisfiable), result.error_code);
	EXPECT_EQ(416, sink.code);
}

TEST_F(FileStreamerTest, MissingFile)
{
	file_streamer_t file_streamer(test::make_logger(), temp_dir.path() + "/missing.txt");
	auto result = file_streamer.run(boost::none, sink);

	EXPECT_EQ(file_streamer_t::state_tag::aborted, result.state);
	EXPECT_EQ(make_error_code(streamer_errc::file_unavailable), result.error_code);
	EXPECT_EQ(0, sink.headers_sent);
	EXPECT_TRUE(sink.body.empty());
}

TEST_F(FileStreamerTest, LockedFile)
{
	int fd = ::open(path.c_str(), O_RDONLY);
	ASSERT_NE(-1, fd);
	ASSERT_EQ(0, ::flock(fd, LOCK_EX));

	auto result = run(boost::none);

	::close(fd);

	EXPECT_EQ(make_error_code(streamer_errc::file_unavailable), result.error_code);
	EXPECT_EQ(0, sink.headers_sent);
}

TEST_F(FileStreamerTest, EmptyFile)
{
	auto empty_path = temp_dir.write_file("empty.txt", "");

	{
		test::recording_sink_t whole_sink;
		file_streamer_t file_streamer(test::make_logger(), empty_path);
		auto result = file_streamer.run(boost::none, whole_sink);

		EXPECT_TRUE(result.is_success());
		EXPECT_EQ(200, whole_sink.code);
		EXPECT_EQ(std::string("0"), *whole_sink.header("Content-Length"));
		EXPECT_EQ(0, whole_sink.data_writes);
	}

	{
		test::recording_sink_t range_sink;
		file_streamer_t file_streamer(test::make_logger(), empty_path);
		auto result = file_streamer.run(std::string("bytes=0-0"), range_sink);

		EXPECT_EQ(make_error_code(streamer_errc::range_unsatisfiable), result.error_code);
		EXPECT_EQ(416, range_sink.code);
	}
}

TEST_F(FileStreamerTest, PeerDisconnect)
{
	sink.alive_polls_limit = 1;

	streamer_config_t config;
	config.chunk_size = 2;

	auto result = run(boost::none, config);

	EXPECT_EQ(file_streamer_t::state_tag::aborted, result.state);
	EXPECT_EQ(make_error_code(streamer_errc::peer_disconnected), result.error_code);
	EXPECT_EQ(200, sink.code);
	EXPECT_EQ("01", sink.body);
}

TEST_F(FileStreamerTest, PeerDisconnectDuringMultipart)
{
	sink.alive_polls_limit = 1;

	auto result = run(std::string("bytes=0-1,4-5"));
	auto boundary = multipart_encoder_t::make_boundary(path);

	EXPECT_EQ(make_error_code(streamer_errc::peer_disconnected), result.error_code);
	EXPECT_EQ(206, sink.code);
	EXPECT_EQ(std::string::npos, sink.body.find("--" + boundary + "--"));
}

TEST_F(FileStreamerTest, FileShrinksWhileStreaming)
{
	sink.on_headers = [this] {
		ASSERT_EQ(0, ::truncate(path.c_str(), 4));
	};

	auto result = run(boost::none);

	EXPECT_EQ(file_streamer_t::state_tag::aborted, result.state);
	EXPECT_EQ(make_error_code(streamer_errc::read_failure), result.error_code);
	EXPECT_EQ(std::string("10"), *sink.header("Content-Length"));
	EXPECT_EQ("0123", sink.body);
}

TEST_F(FileStreamerTest, Chunking)
{
	streamer_config_t config;
	config.chunk_size = 3;

	auto result = run(boost::none, config);

	EXPECT_TRUE(result.is_success());
	EXPECT_EQ("0123456789", sink.body);
	EXPECT_EQ(4, sink.data_writes);
	EXPECT_EQ(4, sink.flushes);
}

TEST_F(FileStreamerTest, TransportSetup)
{
	run(boost::none);

	EXPECT_TRUE(sink.compression_disabled);
	EXPECT_TRUE(sink.time_limit_disabled);
}

TEST_F(FileStreamerTest, CompressionFailureIsNotFatal)
{
	sink.fail_compression = true;

	auto result = run(boost::none);

	EXPECT_TRUE(result.is_success());
	EXPECT_EQ("0123456789", sink.body);
}

TEST_F(FileStreamerTest, CompletionIsCalledOnce)
{
	int calls = 0;
	file_streamer_t::result_t reported;

	file_streamer_t file_streamer(test::make_logger(), path);
	auto result = file_streamer.run(boost::none, sink
			, [&](const file_streamer_t::result_t &r) { ++calls; reported = r; });

	EXPECT_EQ(1, calls);
	EXPECT_EQ(result.state, reported.state);
	EXPECT_EQ(result.error_code, reported.error_code);
}

TEST_F(FileStreamerTest, CompletionIsCalledOnceOnFailure)
{
	int calls = 0;
	file_streamer_t::result_t reported;

	file_streamer_t file_streamer(test::make_logger(), path);
	file_streamer.run(std::string("bytes=7-3"), sink
			, [&](const file_streamer_t::result_t &r) { ++calls; reported = r; });

	EXPECT_EQ(1, calls);
	EXPECT_EQ(make_error_code(streamer_errc::range_unsatisfiable), reported.error_code);
	EXPECT_FALSE(reported.message.empty());
}

TEST_F(FileStreamerTest, SingleUse)
{
	file_streamer_t file_streamer(test::make_logger(), path);

	EXPECT_EQ(file_streamer_t::state_tag::idle, file_streamer.state());
	file_streamer.run(boost::none, sink);
	EXPECT_THROW(file_streamer.run(boost::none, sink), std::logic_error);
}

TEST_F(FileStreamerTest, InlineDisposition)
{
	streamer_config_t config;
	config.inline_disposition = true;

	run(boost::none, config);

	EXPECT_EQ(expected_lines("text/plain", "10", "inline"), sink.header_lines());
}

TEST_F(FileStreamerTest, MimeTypeOverridesResolver)
{
	file_streamer_t file_streamer(test::make_logger(), path);
	file_streamer.set_mime_resolver(text_plain);
	file_streamer.set_mime_type(std::string("application/x-test"));
	file_streamer.set_inline();

	file_streamer.run(boost::none, sink);

	EXPECT_EQ(expected_lines("application/x-test", "10", "inline"), sink.header_lines());
}

TEST_F(FileStreamerTest, DefaultMimeType)
{
	file_streamer_t file_streamer(test::make_logger(), path);
	file_streamer.set_mime_resolver([](const std::string &) -> boost::optional<std::string> {
		return boost::none;
	});

	file_streamer.run(boost::none, sink);

	EXPECT_EQ(std::string("application/octet-stream"), *sink.header("Content-Type"));
}

TEST_F(FileStreamerTest, FailingResolver)
{
	file_streamer_t file_streamer(test::make_logger(), path);
	file_streamer.set_mime_resolver([](const std::string &) -> boost::optional<std::string> {
		throw std::runtime_error("no magic");
	});

	auto result = file_streamer.run(boost::none, sink);

	EXPECT_TRUE(result.is_success());
	EXPECT_EQ(std::string("application/octet-stream"), *sink.header("Content-Type"));
}

TEST_F(FileStreamerTest, PathIsNormalized)
{
	file_streamer_t file_streamer(test::make_logger(), path + "/ \n");

	EXPECT_EQ(path, file_streamer.path());

	auto result = file_streamer.run(boost::none, sink);

	EXPECT_TRUE(result.is_success());
	EXPECT_EQ(std::string("attachment; filename=\"dummyFile.txt\"")
			, *sink.header("Content-Disposition"));
}

TEST(FileStreamerStateTest, Names)
{
	EXPECT_STREQ("idle", file_streamer_t::state_name(file_streamer_t::state_tag::idle));
	EXPECT_STREQ("multi-range"
			, file_streamer_t::state_name(file_streamer_t::state_tag::multi_range));
	EXPECT_STREQ("aborted", file_streamer_t::state_name(file_streamer_t::state_tag::aborted));
}
