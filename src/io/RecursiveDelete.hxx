// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct FileAt;

/**
 * Delete a file or a directory with all of its contents.  Symlinks
 * are not followed.  A file which does not exist is not an error.
 *
 * Throws on error.
 */
void
RecursiveDelete(FileAt file);
