// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * An ordered list of HTTP header fields.  Lookups are
 * case-insensitive; the list is expected to be short, so a linear
 * search is fine.
 */
class HttpHeaderList {
	using Field = std::pair<std::string, std::string>;
	std::vector<Field> fields;

public:
	bool empty() const noexcept {
		return fields.empty();
	}

	std::size_t size() const noexcept {
		return fields.size();
	}

	auto begin() const noexcept {
		return fields.begin();
	}

	auto end() const noexcept {
		return fields.end();
	}

	void Add(std::string_view name, std::string_view value) {
		fields.emplace_back(name, value);
	}

	/**
	 * Replace the value of an existing field or add a new one.
	 */
	void Set(std::string_view name, std::string_view value);

	/**
	 * @return the value of the first field with the given name or
	 * nullptr
	 */
	[[gnu::pure]]
	const std::string *Find(std::string_view name) const noexcept;

	[[gnu::pure]]
	bool Contains(std::string_view name) const noexcept {
		return Find(name) != nullptr;
	}
};
