// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "io/config/ConfigParser.hxx"
#include "io/config/FileLineParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <chrono>
#include <limits>

#include <string.h>

void
Config::Check() const
{
	if (listen_port == 0 || listen_port > 65535)
		throw std::runtime_error("Invalid listener port");

	if (upload.max_chunk_size == 0)
		throw std::runtime_error("max_chunk_size must not be zero");

	if (stream_block_size == 0)
		throw std::runtime_error("stream_block_size must not be zero");
}

class VidstreamConfigParser final : public ConfigParser {
	Config &config;

public:
	explicit VidstreamConfigParser(Config &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
};

static std::size_t
ExpectSizeAndEnd(FileLineParser &line)
{
	const auto value = line.NextSize();
	line.ExpectEnd();

	if (value == 0)
		throw LineParser::Error("Size must not be zero");

	if (value > std::numeric_limits<std::size_t>::max())
		throw LineParser::Error("Size is too large");

	return value;
}

void
VidstreamConfigParser::ParseLine(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "listen") == 0) {
		const unsigned port = line.NextPositiveInteger();
		line.ExpectEnd();

		if (port > 65535)
			throw LineParser::Error("Port number is too large");

		config.listen_port = port;
	} else if (strcmp(word, "video_directory") == 0) {
		config.video_directory = line.ExpectPathAndEnd();
	} else if (strcmp(word, "chunk_directory") == 0) {
		config.chunk_directory = line.ExpectPathAndEnd();
	} else if (strcmp(word, "max_chunk_size") == 0) {
		config.upload.max_chunk_size = ExpectSizeAndEnd(line);
	} else if (strcmp(word, "max_upload_size") == 0) {
		config.upload.max_upload_size = ExpectSizeAndEnd(line);
	} else if (strcmp(word, "stream_block_size") == 0) {
		config.stream_block_size = ExpectSizeAndEnd(line);
	} else if (strcmp(word, "session_timeout") == 0) {
		config.upload.session_timeout =
			std::chrono::seconds{line.NextPositiveInteger()};
		line.ExpectEnd();
	} else if (strcmp(word, "cors_origin") == 0) {
		config.cors_origin = line.ExpectValueAndEnd();
	} else if (strcmp(word, "verbose") == 0) {
		config.verbose = line.NextPositiveInteger();
		line.ExpectEnd();
	} else
		throw FmtRuntimeError("Unknown option '{}'", word);
}

void
LoadConfigFile(Config &config, const std::filesystem::path &path)
{
	VidstreamConfigParser parser(config);
	VariableConfigParser v_parser(parser);
	CommentConfigParser parser2(v_parser);

	ParseConfigFile(path, parser2);
}
