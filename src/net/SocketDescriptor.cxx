// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SocketDescriptor.hxx"

#include <netinet/in.h>

bool
SocketDescriptor::CreateNonBlock(int domain, int type, int protocol) noexcept
{
	int new_fd = ::socket(domain, type | SOCK_CLOEXEC | SOCK_NONBLOCK,
			      protocol);
	if (new_fd < 0)
		return false;

	Set(new_fd);
	return true;
}

bool
SocketDescriptor::SetOption(int level, int name,
			    const void *value, std::size_t size) const noexcept
{
	return setsockopt(fd, level, name, value, size) == 0;
}

bool
SocketDescriptor::SetV6Only(bool value) const noexcept
{
	return SetBoolOption(IPPROTO_IPV6, IPV6_V6ONLY, value);
}

SocketDescriptor
SocketDescriptor::AcceptNonBlock() const noexcept
{
	int connection_fd = ::accept4(Get(), nullptr, nullptr,
				      SOCK_CLOEXEC|SOCK_NONBLOCK);
	return SocketDescriptor(connection_fd);
}

unsigned
SocketDescriptor::GetLocalPort() const noexcept
{
	struct sockaddr_storage ss;
	socklen_t size = sizeof(ss);
	if (getsockname(Get(), (struct sockaddr *)&ss, &size) < 0)
		return 0;

	switch (ss.ss_family) {
	case AF_INET:
		return ntohs(((const struct sockaddr_in *)&ss)->sin_port);

	case AF_INET6:
		return ntohs(((const struct sockaddr_in6 *)&ss)->sin6_port);

	default:
		return 0;
	}
}
