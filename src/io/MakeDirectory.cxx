// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MakeDirectory.hxx"
#include "FileAt.hxx"
#include "Open.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <string>
#include <string_view>

#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>

static constexpr int
FilterErrno(int e, const MakeDirectoryOptions options) noexcept
{
	if (e == EEXIST && !options.exclusive)
		e = 0;

	return e;
}

UniqueFileDescriptor
MakeDirectory(FileDescriptor parent_fd, const char *name,
	      const MakeDirectoryOptions options)
{
	if (mkdirat(parent_fd.Get(), name, options.mode) < 0) {
		if (const int e = FilterErrno(errno, options); e != 0)
			throw FmtErrno(e, "Failed to create directory '{}'",
				       name);
	}

	return OpenDirectory({parent_fd, name});
}

UniqueFileDescriptor
MakeNestedDirectory(FileDescriptor parent_fd, const char *path,
		    const MakeDirectoryOptions options)
{
	if (mkdirat(parent_fd.Get(), path, options.mode) == 0)
		return OpenDirectory({parent_fd, path});

	switch (const int e = FilterErrno(errno, options); e) {
	case 0:
		return OpenDirectory({parent_fd, path});

	case ENOENT:
		/* the parent doesn't exist; create it first */
		break;

	default:
		throw FmtErrno(e, "Failed to create directory '{}'", path);
	}

	std::string_view p{path};
	while (p.size() > 1 && p.back() == '/')
		p.remove_suffix(1);

	const auto slash = p.rfind('/');
	if (slash == p.npos || slash == 0)
		throw FmtErrno(ENOENT, "Failed to create directory '{}'", path);

	const std::string parent{p.substr(0, slash)};
	const std::string name{p.substr(slash + 1)};

	auto middle_options = options;
	middle_options.exclusive = false;

	const auto parent_dir = MakeNestedDirectory(parent_fd, parent.c_str(),
						    middle_options);
	return MakeDirectory(parent_dir, name.c_str(), options);
}
