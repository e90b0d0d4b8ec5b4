// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/net/ServerSocket.hxx"

#include <exception>

class HttpServerConnectionFactory {
public:
	virtual void OnNewConnection(UniqueSocketDescriptor &&socket) noexcept = 0;
};

/**
 * Accepts incoming TCP connections and passes them to a
 * #HttpServerConnectionFactory.
 */
class Listener final : public ServerSocket {
	HttpServerConnectionFactory &factory;

public:
	Listener(EventLoop &event_loop,
		 HttpServerConnectionFactory &_factory) noexcept
		:ServerSocket(event_loop), factory(_factory) {}

protected:
	/* virtual methods from class ServerSocket */
	void OnAccept(UniqueSocketDescriptor fd) noexcept override;
	void OnAcceptError(std::exception_ptr ep) noexcept override;
};
