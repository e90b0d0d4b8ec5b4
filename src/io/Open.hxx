// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fcntl.h>

struct FileAt;
class FileDescriptor;
class UniqueFileDescriptor;

/**
 * Open a file for reading.  Throws std::system_error on error.
 */
UniqueFileDescriptor
OpenReadOnly(const char *path, int flags=0);

UniqueFileDescriptor
OpenReadOnly(FileDescriptor directory, const char *name, int flags=0);

/**
 * Open a directory.  Throws std::system_error on error.
 */
UniqueFileDescriptor
OpenDirectory(const char *name, int flags=0);

UniqueFileDescriptor
OpenDirectory(FileAt file, int flags=0);
