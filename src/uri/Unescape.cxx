// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Unescape.hxx"
#include "util/HexParse.hxx"

std::optional<std::string>
UriUnescape(std::string_view src)
{
	std::string dest;
	dest.reserve(src.size());

	while (true) {
		const auto percent = src.find('%');
		dest.append(src.substr(0, percent));

		if (percent == src.npos)
			break;

		if (percent + 2 >= src.size())
			/* percent sign at the end of string */
			return std::nullopt;

		const int digit1 = ParseHexDigit(src[percent + 1]);
		const int digit2 = ParseHexDigit(src[percent + 2]);
		if (digit1 == -1 || digit2 == -1)
			return std::nullopt;

		const char ch = (char)((digit1 << 4) | digit2);
		if (ch == 0)
			/* no %00 hack allowed! */
			return std::nullopt;

		dest.push_back(ch);
		src = src.substr(percent + 3);
	}

	return dest;
}
