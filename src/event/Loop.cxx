// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Loop.hxx"
#include "DeferEvent.hxx"
#include "SocketEvent.hxx"
#include "TimerEvent.hxx"

#include <array>

EventLoop::EventLoop()
	:steady_now(Event::Clock::now())
{
}

EventLoop::~EventLoop() noexcept
{
	assert(defer.empty());
	assert(sockets.empty());
	assert(ready_sockets.empty());
}

bool
EventLoop::AddFD(int fd, unsigned events, SocketEvent &event) noexcept
{
	assert(events != 0);

	if (!poll_backend.Add(fd, events, &event))
		return false;

	sockets.push_back(event);
	return true;
}

bool
EventLoop::ModifyFD(int fd, unsigned events, SocketEvent &event) noexcept
{
	assert(events != 0);

	return poll_backend.Modify(fd, events, &event);
}

bool
EventLoop::RemoveFD(int fd, SocketEvent &event) noexcept
{
	event.unlink();
	return poll_backend.Remove(fd);
}

void
EventLoop::AbandonFD(SocketEvent &event) noexcept
{
	event.unlink();
}

void
EventLoop::Insert(TimerEvent &t) noexcept
{
	auto i = timers.begin();
	while (i != timers.end() && i->GetDue() <= t.GetDue())
		++i;

	if (i == timers.end())
		timers.push_back(t);
	else
		timers.insert_before(*i, t);

	again = true;
}

inline Event::Duration
EventLoop::HandleTimers() noexcept
{
	while (!timers.empty() && !quit) {
		auto &t = timers.front();
		const auto remaining = t.GetDue() - SteadyNow();
		if (remaining > remaining.zero())
			return remaining;

		timers.pop_front();
		t.Run();
	}

	return Event::Duration(-1);
}

void
EventLoop::AddDefer(DeferEvent &e) noexcept
{
	defer.push_back(e);
}

void
EventLoop::RunDeferred() noexcept
{
	/* events scheduled by the callbacks are postponed to the next
	   iteration, so a coroutine which yields lets ready sockets
	   be handled in between */
	for (std::size_t n = defer.size(); n > 0 && !defer.empty() && !quit; --n) {
		defer.pop_front_and_dispose([](DeferEvent *e){
			e->Run();
		});
	}
}

template<class ToDuration, class Rep, class Period>
static constexpr ToDuration
duration_cast_round_up(std::chrono::duration<Rep, Period> d) noexcept
{
	using FromDuration = decltype(d);
	constexpr auto one = std::chrono::duration_cast<FromDuration>(ToDuration(1));
	constexpr auto round_add = one > one.zero()
		? one - FromDuration(1)
		: one.zero();
	return std::chrono::duration_cast<ToDuration>(d + round_add);
}

/**
 * Convert the given timeout specification to a milliseconds integer,
 * to be used by epoll_wait().  Any negative value (= never times out)
 * is translated to the magic value -1.
 */
static constexpr int
ExportTimeoutMS(Event::Duration timeout) noexcept
{
	return timeout >= timeout.zero()
		? int(duration_cast_round_up<std::chrono::milliseconds>(timeout).count())
		: -1;
}

inline bool
EventLoop::Wait(Event::Duration timeout) noexcept
{
	std::array<struct epoll_event, 256> received_events;
	int ret = poll_backend.Wait(received_events.data(),
				    received_events.size(),
				    ExportTimeoutMS(timeout));
	for (int i = 0; i < ret; ++i) {
		const auto &e = received_events[i];
		auto &socket_event = *(SocketEvent *)e.data.ptr;
		socket_event.SetReadyFlags(e.events);

		/* move from "sockets" to "ready_sockets" */
		socket_event.unlink();
		ready_sockets.push_back(socket_event);
	}

	return ret > 0;
}

void
EventLoop::Run() noexcept
{
	FlushClockCaches();

	quit = false;

	do {
		again = false;

		const auto timeout = HandleTimers();
		if (quit)
			break;

		RunDeferred();
		if (quit)
			break;

		if (again)
			/* re-evaluate timers because one of the
			   DeferEvents may have added a new timeout */
			continue;

		if (IsEmpty())
			return;

		if (ready_sockets.empty()) {
			/* don't sleep if a deferred event is pending */
			Wait(defer.empty() ? timeout : Event::Duration::zero());
			FlushClockCaches();
		}

		while (!ready_sockets.empty() && !quit) {
			auto &socket_event = ready_sockets.front();

			/* move from "ready_sockets" back to "sockets" */
			socket_event.unlink();
			sockets.push_back(socket_event);

			socket_event.Dispatch();
		}
	} while (!quit);
}
