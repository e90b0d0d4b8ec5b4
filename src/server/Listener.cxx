// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Listener.hxx"
#include "io/Logger.hxx"

void
Listener::OnAccept(UniqueSocketDescriptor fd) noexcept
{
	factory.OnNewConnection(std::move(fd));
}

void
Listener::OnAcceptError(std::exception_ptr ep) noexcept
{
	LogConcat(1, "listener", ep);
}
