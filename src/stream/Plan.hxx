// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/Status.hxx"

#include <cstdint>

struct HttpRangeRequest;
class HttpHeaderList;

/**
 * Describes the response to a streaming request: which status to
 * send and which window of the file to transmit.
 */
struct StreamPlan {
	HttpStatus status;

	bool is_partial;

	/**
	 * The first and the last byte of the window (inclusive).  If
	 * #chunk_size is zero, both are zero and meaningless.
	 */
	uint64_t start, end;

	/**
	 * The number of body bytes.
	 */
	uint64_t chunk_size;

	/**
	 * The size of the whole file.
	 */
	uint64_t total_size;
};

/**
 * Calculate the #StreamPlan for a parsed "Range" header (which also
 * knows the file size).
 *
 * Throws #HttpRangeError if the range is malformed or not
 * satisfiable.
 */
StreamPlan
MakeStreamPlan(const HttpRangeRequest &range);

/**
 * Generate the response headers for the given plan.
 */
HttpHeaderList
MakeStreamHeaders(const StreamPlan &plan);
