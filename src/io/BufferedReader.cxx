// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BufferedReader.hxx"
#include "Reader.hxx"

#include <algorithm>
#include <stdexcept>

bool
BufferedReader::Fill()
{
	if (eof)
		return false;

	/* discard consumed data */
	buffer.erase(buffer.begin(), buffer.begin() + consumed);
	consumed = 0;

	if (buffer.size() >= MAX_SIZE)
		throw std::runtime_error("Line is too long");

	const std::size_t old_size = buffer.size();
	buffer.resize(old_size + 16384);

	const auto nbytes = reader.Read(std::as_writable_bytes(std::span{buffer}.subspan(old_size)));
	buffer.resize(old_size + nbytes);

	if (nbytes == 0) {
		eof = true;
		return false;
	}

	return true;
}

char *
BufferedReader::ReadLine()
{
	while (true) {
		const auto begin = buffer.begin() + consumed;
		const auto newline = std::find(begin, buffer.end(), '\n');
		if (newline != buffer.end()) {
			*newline = 0;

			char *line = &*begin;
			consumed = std::distance(buffer.begin(), newline) + 1;
			++line_number;
			return line;
		}

		if (!Fill())
			break;
	}

	if (consumed >= buffer.size())
		return nullptr;

	/* the last line has no line terminator */
	buffer.push_back(0);
	char *line = buffer.data() + consumed;
	consumed = buffer.size();
	++line_number;
	return line;
}
