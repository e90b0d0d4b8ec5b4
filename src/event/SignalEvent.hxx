// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SocketEvent.hxx"
#include "util/BindMethod.hxx"

#include <cassert>

#include <signal.h>

/**
 * Listen for signals delivered to this process, using a signalfd.
 * Enable() blocks the signals for normal delivery.
 */
class SignalEvent {
	SocketEvent event;

	sigset_t mask;

	using Callback = BoundMethod<void(int) noexcept>;
	const Callback callback;

public:
	SignalEvent(EventLoop &loop, Callback _callback) noexcept;

	~SignalEvent() noexcept {
		Disable();
	}

	auto &GetEventLoop() const noexcept {
		return event.GetEventLoop();
	}

	bool IsDefined() const noexcept {
		return event.IsDefined();
	}

	void Add(int signo) noexcept {
		assert(!IsDefined());

		sigaddset(&mask, signo);
	}

	/**
	 * Throws on error.
	 */
	void Enable();
	void Disable() noexcept;

private:
	void EventCallback(unsigned events) noexcept;
};
