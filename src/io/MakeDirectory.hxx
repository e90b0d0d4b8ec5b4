// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sys/types.h>

class FileDescriptor;
class UniqueFileDescriptor;

struct MakeDirectoryOptions {
	mode_t mode = 0777;

	/**
	 * Throw an error if the directory already exists?
	 */
	bool exclusive = false;
};

/**
 * Create a directory (unless it exists already) and open it.
 *
 * Throws on error.
 */
UniqueFileDescriptor
MakeDirectory(FileDescriptor parent_fd, const char *name,
	      MakeDirectoryOptions options=MakeDirectoryOptions{});

/**
 * Like MakeDirectory(), but create missing parent directories as
 * well (like "mkdir -p").
 */
UniqueFileDescriptor
MakeNestedDirectory(FileDescriptor parent_fd, const char *path,
		    MakeDirectoryOptions options=MakeDirectoryOptions{});
