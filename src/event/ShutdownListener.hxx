// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SignalEvent.hxx"

/**
 * Invokes a callback when SIGTERM, SIGINT or SIGQUIT is received.
 * The listener disables itself after the first signal, so a second
 * one kills the process.
 */
class ShutdownListener {
	SignalEvent event;

	using Callback = BoundMethod<void() noexcept>;
	const Callback callback;

public:
	ShutdownListener(EventLoop &loop, Callback _callback) noexcept;

	ShutdownListener(const ShutdownListener &) = delete;
	ShutdownListener &operator=(const ShutdownListener &) = delete;

	void Enable() {
		event.Enable();
	}

	void Disable() noexcept {
		event.Disable();
	}

private:
	void SignalCallback(int signo) noexcept;
};
