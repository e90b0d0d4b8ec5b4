// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FormatBytes.hxx"

#include <fmt/format.h>

#include <array>

std::string
FormatBytes(uint64_t bytes) noexcept
{
	static constexpr std::array units{"Bytes", "KB", "MB", "GB"};

	std::size_t i = 0;
	double value = bytes;
	while (value >= 1024 && i + 1 < units.size()) {
		value /= 1024;
		++i;
	}

	std::string number = fmt::format("{:.2f}", value);

	/* "1.50" -> "1.5", "5.00" -> "5" */
	while (number.back() == '0')
		number.pop_back();
	if (number.back() == '.')
		number.pop_back();

	return fmt::format("{} {}", number, units[i]);
}
