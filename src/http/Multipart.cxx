// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Multipart.hxx"
#include "util/StringCompare.hxx"
#include "util/StringStrip.hxx"

/**
 * Split off the next semicolon-separated parameter.
 */
static std::string_view
NextParameter(std::string_view &s) noexcept
{
	bool quoted = false;
	for (std::size_t i = 0; i < s.size(); ++i) {
		if (s[i] == '"')
			quoted = !quoted;
		else if (s[i] == '\\' && quoted)
			++i;
		else if (s[i] == ';' && !quoted) {
			const auto result = s.substr(0, i);
			s = s.substr(i + 1);
			return Strip(result);
		}
	}

	const auto result = s;
	s = {};
	return Strip(result);
}

static std::string
Unquote(std::string_view value) noexcept
{
	if (value.size() < 2 || value.front() != '"' || value.back() != '"')
		return std::string{value};

	value = value.substr(1, value.size() - 2);

	std::string result;
	result.reserve(value.size());
	for (std::size_t i = 0; i < value.size(); ++i) {
		if (value[i] == '\\' && i + 1 < value.size())
			++i;
		result.push_back(value[i]);
	}

	return result;
}

/**
 * Look up a parameter in a header value like
 * "form-data; name=\"chunk\"; filename=\"a.mp4\"".
 */
static bool
FindParameter(std::string_view header_value, std::string_view name,
	      std::string &value_r) noexcept
{
	/* skip the type */
	NextParameter(header_value);

	while (!header_value.empty()) {
		const auto p = NextParameter(header_value);
		const auto eq = p.find('=');
		if (eq == p.npos)
			continue;

		if (StringIsEqualIgnoreCase(Strip(p.substr(0, eq)), name)) {
			value_r = Unquote(Strip(p.substr(eq + 1)));
			return true;
		}
	}

	return false;
}

std::string_view
GetMultipartBoundary(std::string_view content_type) noexcept
{
	std::string_view rest = content_type;
	const auto type = NextParameter(rest);
	if (!StringIsEqualIgnoreCase(type, "multipart/form-data"))
		return {};

	while (!rest.empty()) {
		auto p = NextParameter(rest);
		if (!StringStartsWithIgnoreCase(p, "boundary="))
			continue;

		p = p.substr(9);
		if (p.size() >= 2 && p.front() == '"' && p.back() == '"')
			p = p.substr(1, p.size() - 2);

		/* RFC 2046 5.1.1 */
		if (p.size() > 70)
			return {};

		return p;
	}

	return {};
}

static void
ParsePartHeaders(MultipartPart &part, std::string_view headers)
{
	while (!headers.empty()) {
		std::string_view line;
		if (const auto eol = headers.find("\r\n"); eol != headers.npos) {
			line = headers.substr(0, eol);
			headers = headers.substr(eol + 2);
		} else {
			line = headers;
			headers = {};
		}

		const auto colon = line.find(':');
		if (colon == line.npos)
			throw MultipartError("Malformed part header");

		const auto name = Strip(line.substr(0, colon));
		const auto value = Strip(line.substr(colon + 1));

		if (StringIsEqualIgnoreCase(name, "content-disposition")) {
			if (!FindParameter(value, "name", part.name))
				throw MultipartError("Part without a name");

			part.has_filename = FindParameter(value, "filename",
							  part.filename);
		} else if (StringIsEqualIgnoreCase(name, "content-type"))
			part.content_type = value;
	}
}

std::vector<MultipartPart>
ParseMultipart(std::string_view body, std::string_view boundary)
{
	if (boundary.empty())
		throw MultipartError("No multipart boundary");

	const std::string delimiter = std::string{"--"} + std::string{boundary};
	const std::string inner_delimiter = "\r\n" + delimiter;

	std::vector<MultipartPart> parts;

	/* skip the preamble */
	auto position = body.find(delimiter);
	if (position == body.npos)
		throw MultipartError("Multipart boundary not found");

	position += delimiter.size();

	while (true) {
		auto rest = body.substr(position);
		if (rest.starts_with("--"))
			/* close-delimiter; ignore the epilogue */
			break;

		/* transport padding (RFC 2046 5.1.1) */
		while (!rest.empty() && (rest.front() == ' ' || rest.front() == '\t'))
			rest.remove_prefix(1);

		if (!rest.starts_with("\r\n"))
			throw MultipartError("Malformed multipart delimiter");

		rest.remove_prefix(2);

		MultipartPart part;

		if (rest.starts_with("\r\n")) {
			/* no headers */
			rest.remove_prefix(2);
		} else {
			const auto headers_end = rest.find("\r\n\r\n");
			if (headers_end == rest.npos)
				throw MultipartError("Truncated part header");

			ParsePartHeaders(part, rest.substr(0, headers_end));
			rest.remove_prefix(headers_end + 4);
		}

		const auto end = rest.find(inner_delimiter);
		if (end == rest.npos)
			throw MultipartError("Truncated multipart body");

		part.value = rest.substr(0, end);
		parts.push_back(std::move(part));

		position = body.size() - rest.size() + end + inner_delimiter.size();
	}

	return parts;
}

const MultipartPart *
FindMultipartPart(const std::vector<MultipartPart> &parts,
		  std::string_view name) noexcept
{
	for (const auto &i : parts)
		if (i.name == name)
			return &i;

	return nullptr;
}
