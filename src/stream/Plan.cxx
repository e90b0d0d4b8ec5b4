// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Plan.hxx"
#include "http/Range.hxx"
#include "http/HeaderList.hxx"

#include <fmt/format.h>

StreamPlan
MakeStreamPlan(const HttpRangeRequest &range)
{
	switch (range.type) {
	case HttpRangeRequest::Type::NONE:
		break;

	case HttpRangeRequest::Type::VALID:
		return {
			HttpStatus::PARTIAL_CONTENT,
			true,
			range.start, range.end,
			range.GetLength(),
			range.size,
		};

	case HttpRangeRequest::Type::MALFORMED:
		throw HttpRangeError(range.type, range.size,
				     "Malformed range header");

	case HttpRangeRequest::Type::UNSATISFIABLE:
		throw HttpRangeError(range.type, range.size,
				     fmt::format("Range {}-{} is not satisfiable for file size {}",
						 range.start, range.end,
						 range.size).c_str());
	}

	if (range.size == 0)
		return {HttpStatus::OK, false, 0, 0, 0, 0};

	return {
		HttpStatus::OK,
		false,
		0, range.size - 1,
		range.size,
		range.size,
	};
}

HttpHeaderList
MakeStreamHeaders(const StreamPlan &plan)
{
	HttpHeaderList headers;

	if (plan.is_partial)
		headers.Add("content-range",
			    fmt::format("bytes {}-{}/{}",
					plan.start, plan.end, plan.total_size));

	headers.Add("accept-ranges", "bytes");
	headers.Add("content-length", fmt::format_int{plan.chunk_size}.str());
	headers.Add("content-type", "video/mp4");
	headers.Add("cache-control", "no-cache");
	return headers;
}
