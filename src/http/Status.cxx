// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Status.hxx"

const char *
http_status_to_string(HttpStatus status) noexcept
{
	switch (status) {
	case HttpStatus::UNDEFINED:
		break;

	case HttpStatus::CONTINUE:
		return "100 Continue";

	case HttpStatus::OK:
		return "200 OK";

	case HttpStatus::NO_CONTENT:
		return "204 No Content";

	case HttpStatus::PARTIAL_CONTENT:
		return "206 Partial Content";

	case HttpStatus::BAD_REQUEST:
		return "400 Bad Request";

	case HttpStatus::NOT_FOUND:
		return "404 Not Found";

	case HttpStatus::METHOD_NOT_ALLOWED:
		return "405 Method Not Allowed";

	case HttpStatus::REQUEST_TIMEOUT:
		return "408 Request Timeout";

	case HttpStatus::CONFLICT:
		return "409 Conflict";

	case HttpStatus::LENGTH_REQUIRED:
		return "411 Length Required";

	case HttpStatus::REQUEST_ENTITY_TOO_LARGE:
		return "413 Payload Too Large";

	case HttpStatus::REQUESTED_RANGE_NOT_SATISFIABLE:
		return "416 Range Not Satisfiable";

	case HttpStatus::EXPECTATION_FAILED:
		return "417 Expectation Failed";

	case HttpStatus::UNPROCESSABLE_ENTITY:
		return "422 Unprocessable Entity";

	case HttpStatus::REQUEST_HEADER_FIELDS_TOO_LARGE:
		return "431 Request Header Fields Too Large";

	case HttpStatus::INTERNAL_SERVER_ERROR:
		return "500 Internal Server Error";

	case HttpStatus::NOT_IMPLEMENTED:
		return "501 Not Implemented";

	case HttpStatus::HTTP_VERSION_NOT_SUPPORTED:
		return "505 HTTP Version Not Supported";
	}

	return nullptr;
}
