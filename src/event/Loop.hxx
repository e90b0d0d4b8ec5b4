// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Chrono.hxx"
#include "system/EpollFD.hxx"
#include "util/IntrusiveList.hxx"

#include <cassert>

class DeferEvent;
class SocketEvent;
class TimerEvent;

/**
 * An event loop that polls for events on file/socket descriptors.
 *
 * This class is not thread-safe, all methods must be called from the
 * thread that runs it.
 *
 * @see SocketEvent, TimerEvent, DeferEvent
 */
class EventLoop final
{
	EpollFD poll_backend;

	/**
	 * Pending timers, sorted by due time.
	 */
	IntrusiveList<TimerEvent> timers;

	IntrusiveList<DeferEvent> defer;

	using SocketList = IntrusiveList<SocketEvent>;

	/**
	 * A list of scheduled #SocketEvent instances, without those
	 * which are ready (these are in #ready_sockets).
	 */
	SocketList sockets;

	/**
	 * A list of #SocketEvent instances which have a non-zero
	 * "ready_flags" field and need to be dispatched.
	 */
	SocketList ready_sockets;

	/**
	 * Cached value of Event::Clock::now(), updated once per loop
	 * iteration.
	 */
	Event::TimePoint steady_now;

	bool quit;

	/**
	 * True when the object has been modified and another check is
	 * necessary before going to sleep via epoll_wait().
	 */
	bool again;

public:
	/**
	 * Throws on error.
	 */
	EventLoop();
	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	/**
	 * Caching wrapper for std::chrono::steady_clock::now().  The
	 * real clock is queried at most once per event loop
	 * iteration, because it is assumed that the event loop runs
	 * for a negligible duration.
	 */
	[[gnu::pure]]
	const auto &SteadyNow() const noexcept {
		return steady_now;
	}

	void FlushClockCaches() noexcept {
		steady_now = Event::Clock::now();
	}

	/**
	 * Stop execution of this #EventLoop at the next chance.
	 */
	void Break() noexcept {
		quit = true;
	}

	bool IsEmpty() const noexcept {
		return timers.empty() && defer.empty() &&
			sockets.empty() && ready_sockets.empty();
	}

	bool AddFD(int fd, unsigned events, SocketEvent &event) noexcept;
	bool ModifyFD(int fd, unsigned events, SocketEvent &event) noexcept;
	bool RemoveFD(int fd, SocketEvent &event) noexcept;

	/**
	 * Remove the given #SocketEvent after the file descriptor
	 * has been closed.  This is like RemoveFD(), but does not
	 * attempt to use #EPOLL_CTL_DEL.
	 */
	void AbandonFD(SocketEvent &event) noexcept;

	void Insert(TimerEvent &t) noexcept;

	/**
	 * Schedule a call to DeferEvent::Run().
	 */
	void AddDefer(DeferEvent &e) noexcept;

	/**
	 * The main function of this class.  It will loop until
	 * Break() gets called or until there are no more registered
	 * events.
	 */
	void Run() noexcept;

private:
	void RunDeferred() noexcept;

	/**
	 * Invoke all expired #TimerEvent instances and return the
	 * duration until the next timer expires.  Returns a negative
	 * duration if there is no timeout.
	 */
	Event::Duration HandleTimers() noexcept;

	/**
	 * Call epoll_wait() and pass all returned events to
	 * SocketEvent::SetReadyFlags().
	 *
	 * @return true if one or more sockets have become ready
	 */
	bool Wait(Event::Duration timeout) noexcept;
};
