// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "util/NumberParser.hxx"

#include <gtest/gtest.h>

#include <cstdint>

TEST(ParseInteger, Unsigned)
{
	EXPECT_EQ(ParseInteger<unsigned>("0"), 0u);
	EXPECT_EQ(ParseInteger<unsigned>("42"), 42u);
	EXPECT_EQ(ParseInteger<uint64_t>("18446744073709551615"),
		  UINT64_MAX);

	EXPECT_EQ(ParseInteger<unsigned>(""), std::nullopt);
	EXPECT_EQ(ParseInteger<unsigned>(" 1"), std::nullopt);
	EXPECT_EQ(ParseInteger<unsigned>("1 "), std::nullopt);
	EXPECT_EQ(ParseInteger<unsigned>("-1"), std::nullopt);
	EXPECT_EQ(ParseInteger<unsigned>("+1"), std::nullopt);
	EXPECT_EQ(ParseInteger<unsigned>("1.5"), std::nullopt);
	EXPECT_EQ(ParseInteger<uint8_t>("256"), std::nullopt);
	EXPECT_EQ(ParseInteger<uint64_t>("18446744073709551616"),
		  std::nullopt);
}

TEST(ParseInteger, Signed)
{
	EXPECT_EQ(ParseInteger<int>("-42"), -42);
	EXPECT_EQ(ParseInteger<int>("-"), std::nullopt);
}
