// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sys/epoll.h>

/**
 * The epoll event flags, for use by #SocketEvent and its users.
 */
struct EpollBackendEvents {
	static constexpr unsigned READ = EPOLLIN;
	static constexpr unsigned WRITE = EPOLLOUT;
	static constexpr unsigned ERROR = EPOLLERR;
	static constexpr unsigned HANGUP = EPOLLHUP;
};

using EventPollBackendEvents = EpollBackendEvents;
