// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UniqueFileDescriptor.hxx"

#include <cstddef>
#include <span>
#include <string>

/**
 * Create a new file, making it visible under its final name only
 * after Commit().  The data is written to an unnamed O_TMPFILE (or,
 * where the filesystem lacks support for it, to a hidden temporary
 * file), so an interrupted write never leaves a truncated file
 * behind.
 */
class FileWriter {
	std::string path;

	std::string tmp_path;

	FileDescriptor directory_fd;

	UniqueFileDescriptor fd;

public:
	enum class CommitMode {
		/**
		 * Atomically replace an existing file of the same
		 * name.
		 */
		REPLACE,

		/**
		 * Fail with EEXIST if the name already exists.
		 */
		NO_REPLACE,
	};

	FileWriter() = default;

	/**
	 * Throws std::system_error on error.
	 */
	FileWriter(FileDescriptor _directory_fd, const char *_path,
		   mode_t mode=0666);

	~FileWriter() noexcept {
		if (fd.IsDefined())
			Cancel();
	}

	FileWriter(FileWriter &&src) noexcept = default;

	FileWriter &operator=(FileWriter &&src) noexcept {
		if (IsDefined())
			Cancel();

		path = std::move(src.path);
		tmp_path = std::move(src.tmp_path);
		directory_fd = src.directory_fd;
		fd = std::move(src.fd);
		return *this;
	}

	bool IsDefined() const noexcept {
		return fd.IsDefined();
	}

	FileDescriptor GetFileDescriptor() const noexcept {
		return fd;
	}

	/**
	 * Attempt to allocate space on the file system.  This is a
	 * hint, and there is no error checking.
	 */
	void Allocate(off_t size) noexcept;

	/**
	 * Throws std::system_error on error.
	 */
	void Write(std::span<const std::byte> src);

	/**
	 * Publish the file under its final name.
	 *
	 * Throws std::system_error on error (with EEXIST if
	 * #CommitMode::NO_REPLACE was requested and the name exists
	 * already).  The temporary file is deleted in any case.
	 */
	void Commit(CommitMode mode=CommitMode::REPLACE);

	/**
	 * Discard the temporary file.
	 */
	void Cancel() noexcept;

private:
	void LinkTemporary(const char *name);
};
