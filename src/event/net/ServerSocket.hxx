// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "net/UniqueSocketDescriptor.hxx"
#include "event/SocketEvent.hxx"

#include <exception>

/**
 * A listening TCP socket which accepts connections and passes them
 * to the virtual method OnAccept().
 */
class ServerSocket {
	SocketEvent event;

public:
	explicit ServerSocket(EventLoop &event_loop) noexcept
		:event(event_loop, BIND_THIS_METHOD(EventCallback)) {}

	~ServerSocket() noexcept;

	ServerSocket(const ServerSocket &) = delete;
	ServerSocket &operator=(const ServerSocket &) = delete;

	auto &GetEventLoop() const noexcept {
		return event.GetEventLoop();
	}

	void Listen(UniqueSocketDescriptor _fd) noexcept;

	/**
	 * Listen on the given TCP port on all interfaces, preferring a
	 * dual-stack IPv6 socket and falling back to IPv4.  Port 0
	 * picks a free port (see GetLocalPort()).
	 *
	 * Throws on error.
	 */
	void ListenTCP(unsigned port);
	void ListenTCP4(unsigned port);
	void ListenTCP6(unsigned port);

	SocketDescriptor GetSocket() const noexcept {
		return event.GetSocket();
	}

	unsigned GetLocalPort() const noexcept {
		return GetSocket().GetLocalPort();
	}

protected:
	/**
	 * A new incoming connection has been established.
	 *
	 * @param fd the socket owned by the callee
	 */
	virtual void OnAccept(UniqueSocketDescriptor fd) noexcept = 0;
	virtual void OnAcceptError(std::exception_ptr ep) noexcept = 0;

private:
	void EventCallback(unsigned events) noexcept;
};
