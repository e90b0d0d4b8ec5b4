// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "system/Error.hxx"

#include <cerrno>

using socket_error_t = int;

[[gnu::pure]]
static inline socket_error_t
GetSocketError() noexcept
{
	return errno;
}

[[gnu::const]]
static inline bool
IsSocketErrorSendWouldBlock(socket_error_t code) noexcept
{
	return code == EAGAIN;
}

[[gnu::const]]
static inline bool
IsSocketErrorReceiveWouldBlock(socket_error_t code) noexcept
{
	return code == EAGAIN;
}

/**
 * Is this a transient error of accept() which should not stop the
 * listener?
 */
[[gnu::const]]
static inline bool
IsSocketErrorAcceptWouldBlock(socket_error_t code) noexcept
{
	return code == EAGAIN || code == EINTR || code == ECONNABORTED;
}

[[gnu::const]]
static inline bool
IsSocketErrorClosed(socket_error_t code) noexcept
{
	return code == EPIPE || code == ECONNRESET;
}

[[nodiscard]] [[gnu::pure]]
static inline std::system_error
MakeSocketError(socket_error_t code, const char *msg) noexcept
{
	return MakeErrno(code, msg);
}

[[nodiscard]] [[gnu::pure]]
static inline std::system_error
MakeSocketError(const char *msg) noexcept
{
	return MakeSocketError(GetSocketError(), msg);
}
