// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/**
 * A "multipart/form-data" body is malformed.
 */
class MultipartError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * One part of a "multipart/form-data" body.
 */
struct MultipartPart {
	/**
	 * The "name" parameter of the "Content-Disposition" header.
	 */
	std::string name;

	/**
	 * The "filename" parameter of the "Content-Disposition"
	 * header.
	 */
	std::string filename;

	bool has_filename = false;

	std::string content_type;

	/**
	 * The contents; points into the buffer passed to
	 * ParseMultipart().
	 */
	std::string_view value;
};

/**
 * Extract the "boundary" parameter from a "Content-Type" header
 * value if its type is "multipart/form-data".
 *
 * @return the boundary or an empty string
 */
[[gnu::pure]]
std::string_view
GetMultipartBoundary(std::string_view content_type) noexcept;

/**
 * Split a "multipart/form-data" body into its parts.
 *
 * Throws #MultipartError on error.
 */
std::vector<MultipartPart>
ParseMultipart(std::string_view body, std::string_view boundary);

/**
 * Find the first part with the given name.
 *
 * @return the part or nullptr
 */
[[gnu::pure]]
const MultipartPart *
FindMultipartPart(const std::vector<MultipartPart> &parts,
		  std::string_view name) noexcept;
