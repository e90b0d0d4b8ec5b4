// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Reader.hxx"
#include "FileDescriptor.hxx"

/**
 * A #Reader which reads from a (blocking) file descriptor.
 */
class FdReader final : public Reader {
	FileDescriptor fd;

public:
	explicit FdReader(FileDescriptor _fd) noexcept
		:fd(_fd) {}

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override;
};
