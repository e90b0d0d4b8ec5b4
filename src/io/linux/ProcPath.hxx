// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/FileDescriptor.hxx"
#include "lib/fmt/ToBuffer.hxx"

/**
 * Build the "/proc/self/fd/N" path of the given file descriptor, for
 * system calls which accept only paths (e.g. linkat() with an
 * O_TMPFILE descriptor).
 */
[[gnu::pure]]
inline auto
ProcFdPath(FileDescriptor fd) noexcept
{
	return FmtBuffer<32>("/proc/self/fd/{}", fd.Get());
}
