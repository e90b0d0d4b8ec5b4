// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Open.hxx"
#include "FileAt.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

UniqueFileDescriptor
OpenReadOnly(const char *path, int flags)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(path, O_RDONLY|flags))
		throw FmtErrno("Failed to open '{}'", path);

	return fd;
}

UniqueFileDescriptor
OpenReadOnly(FileDescriptor directory, const char *name, int flags)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(directory, name, O_RDONLY|flags))
		throw FmtErrno("Failed to open '{}'", name);

	return fd;
}

UniqueFileDescriptor
OpenDirectory(const char *path, int flags)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(path, O_DIRECTORY|O_RDONLY|flags))
		throw FmtErrno("Failed to open '{}'", path);

	return fd;
}

UniqueFileDescriptor
OpenDirectory(FileAt file, int flags)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(file.directory, file.name, O_DIRECTORY|O_RDONLY|flags))
		throw FmtErrno("Failed to open '{}'", file.name);

	return fd;
}
