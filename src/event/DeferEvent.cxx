// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DeferEvent.hxx"
#include "Loop.hxx"

void
DeferEvent::Schedule() noexcept
{
	if (!IsPending())
		loop.AddDefer(*this);

	assert(IsPending());
}
