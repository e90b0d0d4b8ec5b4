// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ServerSocket.hxx"
#include "net/SocketError.hxx"
#include "lib/fmt/SystemError.hxx"

#include <cassert>

#include <netinet/in.h>

ServerSocket::~ServerSocket() noexcept
{
	event.Close();
}

void
ServerSocket::Listen(UniqueSocketDescriptor _fd) noexcept
{
	assert(!event.IsDefined());
	assert(_fd.IsDefined());

	event.Open(_fd.Release());
	event.ScheduleRead();
}

static UniqueSocketDescriptor
MakeListener(int family, const struct sockaddr *address, socklen_t size,
	     unsigned port)
{
	UniqueSocketDescriptor fd;
	if (!fd.CreateNonBlock(family, SOCK_STREAM, 0))
		throw MakeSocketError("Failed to create socket");

	fd.SetReuseAddress();

	if (family == AF_INET6)
		fd.SetV6Only(false);

	if (!fd.Bind(address, size))
		throw FmtErrno("Failed to bind to port {}", port);

	if (!fd.Listen(256))
		throw MakeSocketError("Failed to listen");

	return fd;
}

void
ServerSocket::ListenTCP(unsigned port)
{
	try {
		ListenTCP6(port);
	} catch (const std::system_error &) {
		ListenTCP4(port);
	}
}

void
ServerSocket::ListenTCP4(unsigned port)
{
	struct sockaddr_in sin{};
	sin.sin_family = AF_INET;
	sin.sin_port = htons(port);
	sin.sin_addr.s_addr = htonl(INADDR_ANY);

	Listen(MakeListener(AF_INET, (const struct sockaddr *)&sin,
			    sizeof(sin), port));
}

void
ServerSocket::ListenTCP6(unsigned port)
{
	struct sockaddr_in6 sin6{};
	sin6.sin6_family = AF_INET6;
	sin6.sin6_port = htons(port);
	sin6.sin6_addr = in6addr_any;

	Listen(MakeListener(AF_INET6, (const struct sockaddr *)&sin6,
			    sizeof(sin6), port));
}

void
ServerSocket::EventCallback(unsigned) noexcept
{
	UniqueSocketDescriptor remote_fd{GetSocket().AcceptNonBlock()};
	if (!remote_fd.IsDefined()) {
		const auto e = GetSocketError();
		if (!IsSocketErrorAcceptWouldBlock(e))
			OnAcceptError(std::make_exception_ptr(MakeSocketError(e, "Failed to accept connection")));

		return;
	}

	OnAccept(std::move(remote_fd));
}
