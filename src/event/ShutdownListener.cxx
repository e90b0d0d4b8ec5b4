// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ShutdownListener.hxx"
#include "io/Logger.hxx"

#include <signal.h>

inline void
ShutdownListener::SignalCallback(int signo) noexcept
{
	LogFmt(1, "shutdown", "caught signal {}, shutting down", signo);

	Disable();
	callback();
}

ShutdownListener::ShutdownListener(EventLoop &loop,
				   Callback _callback) noexcept
	:event(loop, BIND_THIS_METHOD(SignalCallback)),
	 callback(_callback)
{
	event.Add(SIGTERM);
	event.Add(SIGINT);
	event.Add(SIGQUIT);
}
