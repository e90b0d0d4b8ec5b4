// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "uri/Unescape.hxx"

#include <gtest/gtest.h>

TEST(UriUnescape, Basic)
{
	EXPECT_EQ(UriUnescape(""), "");
	EXPECT_EQ(UriUnescape("movie.mp4"), "movie.mp4");
	EXPECT_EQ(UriUnescape("my%20movie.mp4"), "my movie.mp4");
	EXPECT_EQ(UriUnescape("%41%62%2f"), "Ab/");
	EXPECT_EQ(UriUnescape("a+b"), "a+b");
	EXPECT_EQ(UriUnescape("%4a%4A%e2%82%ac"), "JJ\xe2\x82\xac");
}

TEST(UriUnescape, Malformed)
{
	EXPECT_EQ(UriUnescape("%"), std::nullopt);
	EXPECT_EQ(UriUnescape("a%4"), std::nullopt);
	EXPECT_EQ(UriUnescape("%zz"), std::nullopt);
	EXPECT_EQ(UriUnescape("%g0"), std::nullopt);
	EXPECT_EQ(UriUnescape("%0g"), std::nullopt);
	EXPECT_EQ(UriUnescape("a%00b"), std::nullopt);
}
