// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "CharUtil.hxx"

/**
 * @return the value of the hex digit or -1 if the character is not
 * a hex digit
 */
constexpr int
ParseHexDigit(char ch) noexcept
{
	if (IsDigitASCII(ch))
		return ch - '0';
	else if (ch >= 'a' && ch <= 'f')
		return ch - 'a' + 0xa;
	else if (ch >= 'A' && ch <= 'F')
		return ch - 'A' + 0xa;
	else
		return -1;
}
