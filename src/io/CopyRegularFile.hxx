// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sys/types.h> // for off_t

class FileDescriptor;

/**
 * Copy the given number of bytes from the current position of #src
 * to the current position of #dst.  Uses copy_file_range() where the
 * kernel and filesystem support it, and falls back to read()/write().
 *
 * Throws on error, including when #src ends before #size bytes were
 * copied.
 */
void
CopyRegularFile(FileDescriptor src, FileDescriptor dst, off_t size);
