// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Range.hxx"
#include "util/StringStrip.hxx"

#include <cassert>
#include <charconv>
#include <optional>

/**
 * Parse a non-negative decimal integer at the beginning of #s and
 * remove it from #s.  Returns std::nullopt if there is no number or
 * if it overflows.
 */
static std::optional<uint64_t>
ParseNumber(std::string_view &s) noexcept
{
	uint64_t value;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       value, 10);
	if (ec != std::errc{} || ptr == s.data())
		return std::nullopt;

	s.remove_prefix(ptr - s.data());
	return value;
}

void
HttpRangeRequest::ParseRangeHeader(std::string_view p) noexcept
{
	assert(type == Type::NONE);

	p = Strip(p);

	if (!p.starts_with("bytes=")) {
		type = Type::MALFORMED;
		return;
	}

	p = StripLeft(p.substr(6));

	/* from_chars() would accept a minus sign; this also rejects
	   suffix-byte-range-spec ("bytes=-500") */
	if (p.starts_with('-')) {
		type = Type::MALFORMED;
		return;
	}

	const auto first = ParseNumber(p);
	if (!first || !p.starts_with('-')) {
		type = Type::MALFORMED;
		return;
	}

	p.remove_prefix(1);
	start = *first;

	if (p.empty()) {
		/* open-ended ("wget -c") */
		if (start >= size) {
			end = start;
			type = Type::UNSATISFIABLE;
			return;
		}

		end = size - 1;
		type = Type::VALID;
		return;
	}

	if (p.starts_with('-')) {
		type = Type::MALFORMED;
		return;
	}

	const auto last = ParseNumber(p);
	if (!last || !p.empty() || *last < start) {
		/* includes multiple ranges ("0-1,5-6") */
		type = Type::MALFORMED;
		return;
	}

	end = *last;
	type = start >= size || end >= size
		? Type::UNSATISFIABLE
		: Type::VALID;
}
