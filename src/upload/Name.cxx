// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Name.hxx"
#include "util/CharUtil.hxx"
#include "util/StringCompare.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <array>

static constexpr bool
IsSafeFilenameChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) || ch == '.' || ch == '_' || ch == '-';
}

std::string
SanitizeFilename(std::string_view src) noexcept
{
	src = Strip(src);

	std::string result;
	result.reserve(src.size());

	for (const char ch : src)
		result.push_back(IsSafeFilenameChar(ch) ? ch : '_');

	return result;
}

std::string
MakeStorageName(std::string_view sanitized,
		std::chrono::system_clock::time_point now) noexcept
{
	const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
	return fmt::format("{}_{}", ms, sanitized);
}

static constexpr std::array<std::string_view, 5> video_extensions{
	".mp4", ".avi", ".mov", ".mkv", ".webm",
};

bool
HasVideoExtension(std::string_view filename) noexcept
{
	const auto dot = filename.rfind('.');
	if (dot == filename.npos)
		return false;

	const auto extension = filename.substr(dot);
	return std::any_of(video_extensions.begin(), video_extensions.end(),
			   [extension](std::string_view i){
				   return StringIsEqualIgnoreCase(extension, i);
			   });
}
