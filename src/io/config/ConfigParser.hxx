// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>
#include <map>
#include <string>

class FileLineParser;

/**
 * Receives the lines of a configuration file.  Implementations can
 * be stacked as filters (e.g. #CommentConfigParser).
 */
class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * Give the parser a chance to consume a line before
	 * ParseLine() is called.
	 *
	 * @return true if the line has been consumed
	 */
	virtual bool PreParseLine(FileLineParser &line);

	virtual void ParseLine(FileLineParser &line) = 0;

	/**
	 * Called after the last line has been parsed.  This may
	 * throw if mandatory settings are missing.
	 */
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) override;
	void Finish() override;
};

/**
 * A #ConfigParser which can define variables ("@set name = 'value'")
 * and expands "${name}" references in all following lines.
 */
class VariableConfigParser final : public ConfigParser {
	ConfigParser &child;

	std::map<std::string, std::string, std::less<>> variables;

	mutable std::string buffer;

public:
	explicit VariableConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) override;
	void Finish() override;

private:
	void ExpandOne(std::string &dest,
		       const char *&src, const char *end) const;
	void ExpandQuoted(std::string &dest,
			  const char *src, const char *end) const;
	void Expand(std::string &dest, const char *src) const;
	char *Expand(const char *src) const;
	void Expand(FileLineParser &line) const;
};

/**
 * Read the given file line by line and pass each line to the
 * #ConfigParser, then call ConfigParser::Finish().
 *
 * Throws on error; parser errors are nested in an exception which
 * names the file and the line number.
 */
void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser);
