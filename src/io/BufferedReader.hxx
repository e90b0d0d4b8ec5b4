// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <vector>

class Reader;

/**
 * Reads lines from a #Reader.
 */
class BufferedReader {
	static constexpr std::size_t MAX_SIZE = 512 * 1024;

	Reader &reader;

	std::vector<char> buffer;

	/**
	 * The start of the unconsumed data in #buffer.
	 */
	std::size_t consumed = 0;

	bool eof = false;

	unsigned line_number = 0;

public:
	explicit BufferedReader(Reader &_reader) noexcept
		:reader(_reader) {}

	/**
	 * Read a line into the internal buffer.  The returned string
	 * is null-terminated and does not include the line
	 * terminator; it is valid until the next call.
	 *
	 * Throws on error (including lines which are too long).
	 *
	 * @return the line or nullptr at the end of the stream
	 */
	char *ReadLine();

	/**
	 * Returns the current line number (starting at 1).
	 */
	unsigned GetLineNumber() const noexcept {
		return line_number;
	}

private:
	/**
	 * @return false at the end of the stream
	 */
	bool Fill();
};
