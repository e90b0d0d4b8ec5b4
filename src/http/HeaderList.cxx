// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HeaderList.hxx"
#include "util/StringCompare.hxx"

void
HttpHeaderList::Set(std::string_view name, std::string_view value)
{
	for (auto &i : fields) {
		if (StringIsEqualIgnoreCase(i.first, name)) {
			i.second = value;
			return;
		}
	}

	Add(name, value);
}

const std::string *
HttpHeaderList::Find(std::string_view name) const noexcept
{
	for (const auto &i : fields)
		if (StringIsEqualIgnoreCase(i.first, name))
			return &i.second;

	return nullptr;
}
