// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/Logger.hxx"

#include <string>

/**
 * Generate a short random identifier for correlating the log lines
 * and the error payload of one request.
 *
 * Throws on error.
 */
std::string
GenerateRequestId();

/**
 * Request-scoped values which are passed down to all operations
 * which handle one HTTP request.
 */
struct RequestContext {
	const std::string id;

	/**
	 * A logger whose domain includes the request id.
	 */
	const ChildLogger logger;

	template<typename P>
	RequestContext(const P &parent_logger, std::string &&_id) noexcept
		:id(std::move(_id)), logger(parent_logger, id) {}

	template<typename P>
	explicit RequestContext(const P &parent_logger)
		:RequestContext(parent_logger, GenerateRequestId()) {}
};
