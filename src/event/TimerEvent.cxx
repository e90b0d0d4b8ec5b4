// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimerEvent.hxx"
#include "Loop.hxx"

void
TimerEvent::Schedule(Event::Duration d) noexcept
{
	Cancel();

	due = loop.SteadyNow() + d;
	loop.Insert(*this);
}
