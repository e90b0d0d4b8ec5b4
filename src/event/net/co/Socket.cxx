// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Socket.hxx"
#include "event/AwaitableSocketEvent.hxx"
#include "net/SocketDescriptor.hxx"
#include "net/SocketError.hxx"
#include "net/SocketProtocolError.hxx"

namespace Co {

Task<std::size_t>
ReceiveSome(EventLoop &event_loop, SocketDescriptor s,
	    std::span<std::byte> dest)
{
	while (true) {
		const auto nbytes = s.Receive(dest);
		if (nbytes >= 0)
			co_return static_cast<std::size_t>(nbytes);

		const auto e = GetSocketError();
		if (IsSocketErrorClosed(e))
			co_return 0;

		if (!IsSocketErrorReceiveWouldBlock(e))
			throw MakeSocketError(e, "Failed to receive");

		co_await AwaitableSocketEvent(event_loop, s, SocketEvent::READ);
	}
}

Task<void>
SendAll(EventLoop &event_loop, SocketDescriptor s,
	std::span<const std::byte> src)
{
	while (!src.empty()) {
		const auto nbytes = s.Send(src);
		if (nbytes >= 0) {
			src = src.subspan(nbytes);
			continue;
		}

		const auto e = GetSocketError();
		if (IsSocketErrorClosed(e))
			throw SocketClosedPrematurelyError();

		if (!IsSocketErrorSendWouldBlock(e))
			throw MakeSocketError(e, "Failed to send");

		const unsigned events =
			co_await AwaitableSocketEvent(event_loop, s,
						      SocketEvent::WRITE);
		if (events & SocketEvent::HANGUP)
			throw SocketClosedPrematurelyError();
	}
}

} // namespace Co
