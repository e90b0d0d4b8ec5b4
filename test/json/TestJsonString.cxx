// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "lib/nlohmann_json/String.hxx"

#include <gtest/gtest.h>

TEST(Json, GetStringRobust)
{
	const auto j = nlohmann::json::parse(R"({"filename": "a.mp4", "n": 3})");
	EXPECT_EQ(Json::GetStringRobust(j, "filename"), "a.mp4");
	EXPECT_TRUE(Json::GetStringRobust(j, "n").empty());
	EXPECT_TRUE(Json::GetStringRobust(j, "missing").empty());
}

TEST(Json, GetUnsignedRobust)
{
	const auto j = nlohmann::json::parse(R"({
		"a": 3,
		"b": "42",
		"c": -1,
		"d": "x",
		"e": 1.5,
		"f": 5000000000,
		"g": "5000000000",
		"h": null
	})");

	EXPECT_EQ(Json::GetUnsignedRobust<unsigned>(j, "a"), 3u);
	EXPECT_EQ(Json::GetUnsignedRobust<unsigned>(j, "b"), 42u);
	EXPECT_EQ(Json::GetUnsignedRobust<unsigned>(j, "c"), std::nullopt);
	EXPECT_EQ(Json::GetUnsignedRobust<unsigned>(j, "d"), std::nullopt);
	EXPECT_EQ(Json::GetUnsignedRobust<unsigned>(j, "e"), std::nullopt);
	EXPECT_EQ(Json::GetUnsignedRobust<uint32_t>(j, "f"), std::nullopt);
	EXPECT_EQ(Json::GetUnsignedRobust<uint64_t>(j, "f"), UINT64_C(5000000000));
	EXPECT_EQ(Json::GetUnsignedRobust<uint64_t>(j, "g"), UINT64_C(5000000000));
	EXPECT_EQ(Json::GetUnsignedRobust<unsigned>(j, "h"), std::nullopt);
	EXPECT_EQ(Json::GetUnsignedRobust<unsigned>(j, "missing"), std::nullopt);
}
