// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string_view>

/**
 * A parsed "Range" request header, validated against the size of
 * the resource.  Only a single window ("bytes=START-END" or
 * "bytes=START-") is supported.
 */
struct HttpRangeRequest {
	enum class Type {
		/**
		 * No "Range" header; the whole resource is
		 * requested.
		 */
		NONE,

		/**
		 * A satisfiable window; #start and #end are valid.
		 */
		VALID,

		/**
		 * The header value is syntactically wrong (missing
		 * "bytes=" unit, not a non-negative integer, trailing
		 * garbage, suffix or multi-range request, start after
		 * end).
		 */
		MALFORMED,

		/**
		 * Syntactically correct, but the window does not fit
		 * into the resource.  #start and #end contain the
		 * requested bounds.
		 */
		UNSATISFIABLE,
	} type = Type::NONE;

	/**
	 * The first and the last byte of the window (inclusive).
	 */
	uint64_t start = 0, end = 0;

	/**
	 * The total size of the resource.
	 */
	uint64_t size;

	explicit constexpr HttpRangeRequest(uint64_t _size) noexcept
		:size(_size) {}

	/**
	 * Parse a "Range" request header.  May be called only once.
	 */
	void ParseRangeHeader(std::string_view value) noexcept;

	constexpr bool IsPartial() const noexcept {
		return type == Type::VALID;
	}

	/**
	 * The number of bytes in the window.
	 */
	constexpr uint64_t GetLength() const noexcept {
		return end - start + 1;
	}
};

/**
 * Thrown when a range request cannot be served.
 */
class HttpRangeError : public std::runtime_error {
	HttpRangeRequest::Type type;

	uint64_t size;

public:
	HttpRangeError(HttpRangeRequest::Type _type, uint64_t _size,
		       const char *_msg) noexcept
		:std::runtime_error(_msg), type(_type), size(_size) {}

	HttpRangeRequest::Type GetType() const noexcept {
		return type;
	}

	bool IsUnsatisfiable() const noexcept {
		return type == HttpRangeRequest::Type::UNSATISFIABLE;
	}

	/**
	 * The size of the resource (for "Content-Range: bytes
	 * *\/SIZE").
	 */
	uint64_t GetSize() const noexcept {
		return size;
	}
};
