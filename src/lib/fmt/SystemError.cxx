// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SystemError.hxx"
#include "ToBuffer.hxx"

std::system_error
VFmtSystemError(std::error_code code,
		fmt::string_view format_str, fmt::format_args args) noexcept
{
	const auto msg = VFmtBuffer<512>(format_str, args);
	return std::system_error{code, msg.c_str()};
}
