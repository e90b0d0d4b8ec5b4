// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "FileDescriptor.hxx"

/**
 * Describes a file by a directory file descriptor and a path name
 * relative to it (like the "at" system calls, e.g. openat()).
 */
struct FileAt {
	FileDescriptor directory;
	const char *name;
};
