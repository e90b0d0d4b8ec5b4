// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "io/config/ConfigParser.hxx"
#include "io/config/FileLineParser.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

class MyConfigParser final
	: public ConfigParser, public std::vector<std::string> {
public:
	void ParseLine(FileLineParser &line) override {
		const char *value = line.NextUnescape();
		if (value == nullptr)
			throw LineParser::Error("Quoted value expected");
		line.ExpectEnd();
		emplace_back(value);
	}
};

static void
ParseConfigLines(ConfigParser &parser, const char *const*lines)
{
	while (*lines != nullptr) {
		std::string line{*lines++};

		FileLineParser line_parser({}, line.data());
		if (!parser.PreParseLine(line_parser))
			parser.ParseLine(line_parser);
	}

	parser.Finish();
}

static const char *const v_data[] = {
	"@set foo='bar'",
	"@set bar=\"${foo}\"",
	"${foo} ",
	"'${foo}'",
	"\"${foo}\"",
	"\"${bar}\"",
	" \"a${foo}b\" ",
	"@set foo=\"with space\"",
	"\"${foo}\"",
	"  ${foo}  ",
	nullptr
};

static const char *const v_output[] = {
	"bar",
	"${foo}",
	"bar",
	"bar",
	"abarb",
	"with space",
	"with space",
	nullptr
};

TEST(ConfigParserTest, VariableConfigParser)
{
	MyConfigParser p;
	VariableConfigParser v(p);

	ParseConfigLines(v, v_data);

	for (size_t i = 0; v_output[i] != nullptr; ++i) {
		ASSERT_LT(i, p.size());
		ASSERT_STREQ(v_output[i], p[i].c_str());
	}
}

TEST(ConfigParserTest, CommentConfigParser)
{
	static const char *const data[] = {
		"# comment",
		"",
		"   ",
		"'a'",
		"\t# indented comment",
		"'b'",
		nullptr
	};

	MyConfigParser p;
	CommentConfigParser c(p);

	ParseConfigLines(c, data);

	ASSERT_EQ(p.size(), 2u);
	EXPECT_EQ(p[0], "a");
	EXPECT_EQ(p[1], "b");
}
