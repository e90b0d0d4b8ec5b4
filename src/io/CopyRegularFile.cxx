// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CopyRegularFile.hxx"
#include "FileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <array>
#include <cstddef>
#include <stdexcept>

#include <fcntl.h> // for posix_fadvise()

/**
 * @return the number of bytes which were copied with
 * copy_file_range(); the rest needs to be copied manually
 */
static off_t
CopyFileRange(FileDescriptor src, FileDescriptor dst, off_t size)
{
	off_t done = 0;

	while (done < size) {
		const auto nbytes = copy_file_range(src.Get(), nullptr,
						    dst.Get(), nullptr,
						    size - done, 0);
		if (nbytes < 0) [[unlikely]] {
			switch (errno) {
			case EXDEV:
			case EINVAL:
			case ENOSYS:
			case EOPNOTSUPP:
				/* not supported by this
				   kernel/filesystem */
				return done;

			default:
				throw MakeErrno("Failed to copy file data");
			}
		}

		if (nbytes == 0) [[unlikely]]
			throw std::runtime_error{"Premature end of file"};

		done += nbytes;
	}

	return done;
}

void
CopyRegularFile(FileDescriptor src, FileDescriptor dst, off_t size)
{
	if (size <= 0)
		return;

	size -= CopyFileRange(src, dst, size);
	if (size == 0)
		return;

	posix_fadvise(src.Get(), 0, 0, POSIX_FADV_SEQUENTIAL);

	std::array<std::byte, 65536> buffer;
	while (size > 0) {
		std::span<std::byte> dest{buffer};
		if (off_t(dest.size()) > size)
			dest = dest.first(size);

		const auto nbytes = src.Read(dest);
		if (nbytes <= 0) [[unlikely]] {
			if (nbytes == 0)
				throw std::runtime_error{"Premature end of file"};

			throw MakeErrno("Failed to read file");
		}

		dst.FullWrite(dest.first(nbytes));
		size -= nbytes;
	}
}
