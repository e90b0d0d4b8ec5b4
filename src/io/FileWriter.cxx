// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileWriter.hxx"
#include "io/linux/ProcPath.hxx"
#include "lib/fmt/SystemError.hxx"

#include <cassert>
#include <random>

#include <fcntl.h>
#include <stdio.h> // for renameat()
#include <unistd.h>

static std::string
MakeTempName() noexcept
{
	static std::minstd_rand r{std::random_device{}()};
	return ".tmp." + std::to_string(r());
}

static std::pair<std::string, UniqueFileDescriptor>
MakeTempFileInDirectory(FileDescriptor directory_fd, mode_t mode)
{
	while (true) {
		auto path = MakeTempName();
		UniqueFileDescriptor fd;
		if (fd.Open(directory_fd, path.c_str(),
			    O_CREAT|O_EXCL|O_WRONLY,
			    mode))
			return {std::move(path), std::move(fd)};

		if (errno != EEXIST)
			throw FmtErrno("Failed to create {}", path);
	}
}

FileWriter::FileWriter(FileDescriptor _directory_fd, const char *_path,
		       mode_t mode)
	:path(_path), directory_fd(_directory_fd)
{
	if (fd.Open(directory_fd, ".", O_TMPFILE|O_WRONLY, mode))
		return;

	if (errno != EOPNOTSUPP && errno != EISDIR)
		throw FmtErrno("Failed to create temporary file for {}", path);

	/* this filesystem doesn't support O_TMPFILE */
	auto tmp = MakeTempFileInDirectory(directory_fd, mode);
	tmp_path = std::move(tmp.first);
	fd = std::move(tmp.second);
}

void
FileWriter::Allocate(off_t size) noexcept
{
	fallocate(fd.Get(), FALLOC_FL_KEEP_SIZE, 0, size);
}

void
FileWriter::Write(std::span<const std::byte> src)
{
	while (!src.empty()) {
		ssize_t nbytes = fd.Write(src);
		if (nbytes < 0)
			throw FmtErrno("Failed to write to {}", path);

		if (nbytes == 0)
			throw FmtErrno(ENOSPC, "Short write to {}", path);

		src = src.subspan(nbytes);
	}
}

/**
 * Give the O_TMPFILE a name in the directory.
 */
void
FileWriter::LinkTemporary(const char *name)
{
	assert(tmp_path.empty());

	if (linkat(AT_FDCWD, ProcFdPath(fd),
		   directory_fd.Get(), name,
		   AT_SYMLINK_FOLLOW) < 0)
		throw FmtErrno("Failed to commit {}", path);
}

void
FileWriter::Commit(CommitMode mode)
{
	assert(fd.IsDefined());

	if (tmp_path.empty()) {
		if (mode == CommitMode::NO_REPLACE) {
			/* linkat() never replaces an existing
			   file */
			LinkTemporary(path.c_str());
			if (!fd.Close())
				throw FmtErrno("Failed to commit {}", path);
			return;
		}

		/* link to a temporary name first, then rename it
		   over the final name; this replaces atomically */
		auto name = MakeTempName();
		LinkTemporary(name.c_str());
		tmp_path = std::move(name);
	}

	if (!fd.Close()) {
		const int e = errno;
		Cancel();
		throw FmtErrno(e, "Failed to commit {}", path);
	}

	int result;
	if (mode == CommitMode::NO_REPLACE)
		result = linkat(directory_fd.Get(), tmp_path.c_str(),
				directory_fd.Get(), path.c_str(), 0);
	else
		result = renameat(directory_fd.Get(), tmp_path.c_str(),
				  directory_fd.Get(), path.c_str());

	const int e = errno;

	if (result < 0 || mode == CommitMode::NO_REPLACE)
		unlinkat(directory_fd.Get(), tmp_path.c_str(), 0);

	if (result < 0)
		throw FmtErrno(e, "Failed to commit {}", path);
}

void
FileWriter::Cancel() noexcept
{
	if (fd.IsDefined())
		fd.Close();

	if (!tmp_path.empty()) {
		unlinkat(directory_fd.Get(), tmp_path.c_str(), 0);
		tmp_path.clear();
	}
}
