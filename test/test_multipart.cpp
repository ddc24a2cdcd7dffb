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

#include "multipart.hpp"

#include <gtest/gtest.h>

using namespace filestreamer;

namespace {

range_t
make_range(uint64_t start, uint64_t end) {
	range_t range;
	range.start = start;
	range.end = end;
	return range;
}

} // namespace

TEST(MultipartTest, BoundaryIsMd5OfPath)
{
	EXPECT_EQ("d41d8cd98f00b204e9800998ecf8427e", multipart_encoder_t::make_boundary(""));
	EXPECT_EQ("900150983cd24fb0d6963f7d28e17f72", multipart_encoder_t::make_boundary("abc"));
}

TEST(MultipartTest, BoundaryIsStable)
{
	auto boundary = multipart_encoder_t::make_boundary("/srv/files/dummyFile.txt");

	EXPECT_EQ(32u, boundary.size());
	EXPECT_EQ(std::string::npos, boundary.find_first_not_of("0123456789abcdef"));
	EXPECT_EQ(boundary, multipart_encoder_t::make_boundary("/srv/files/dummyFile.txt"));
	EXPECT_NE(boundary, multipart_encoder_t::make_boundary("/srv/files/otherFile.txt"));
}

TEST(MultipartTest, ContentType)
{
	multipart_encoder_t encoder("xyz", "text/plain", 10);

	EXPECT_EQ("xyz", encoder.boundary());
	EXPECT_EQ("multipart/byteranges; boundary=xyz", encoder.content_type());
}

TEST(MultipartTest, Framing)
{
	multipart_encoder_t encoder("xyz", "text/plain", 10);

	EXPECT_EQ("\r\n--xyz\r\n"
			"Content-Type: text/plain\r\n"
			"Content-range: bytes 2-3/10\r\n"
			"\r\n"
			, encoder.part_header(make_range(2, 3)));
	EXPECT_EQ("\r\n--xyz--\r\n", encoder.closing_boundary());
}

TEST(MultipartTest, ContentLengthMatchesBody)
{
	const std::string content = "0123456789";
	multipart_encoder_t encoder(multipart_encoder_t::make_boundary("/tmp/dummyFile.txt")
			, "text/plain", content.size());

	ranges_t ranges;
	ranges.push_back(make_range(2, 3));
	ranges.push_back(make_range(5, 6));
	ranges.push_back(make_range(9, 9));

	std::string body;
	for (auto it = ranges.begin(), end = ranges.end(); it != end; ++it) {
		body += encoder.part_header(*it);
		body += content.substr(it->start, it->size());
	}
	body += encoder.closing_boundary();

	EXPECT_EQ(330u, encoder.content_length(ranges));
	EXPECT_EQ(body.size(), encoder.content_length(ranges));
}

TEST(MultipartTest, ContentLengthCountsEveryDigit)
{
	multipart_encoder_t encoder("b", "a/b", 123456);

	ranges_t ranges;
	ranges.push_back(make_range(100, 123455));
	ranges.push_back(make_range(0, 0));

	uint64_t expected = encoder.part_header(ranges[0]).size() + ranges[0].size()
		+ encoder.part_header(ranges[1]).size() + 1
		+ encoder.closing_boundary().size();

	EXPECT_EQ(expected, encoder.content_length(ranges));
}
