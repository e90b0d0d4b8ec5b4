// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/FileDescriptor.hxx"

#include <cstddef>
#include <span>

#include <sys/socket.h>

/**
 * An OO wrapper for a UNIX socket descriptor.
 */
class SocketDescriptor : protected FileDescriptor {
protected:
	explicit constexpr SocketDescriptor(FileDescriptor _fd) noexcept
		:FileDescriptor(_fd) {}

public:
	SocketDescriptor() = default;

	explicit constexpr SocketDescriptor(int _fd) noexcept
		:FileDescriptor(_fd) {}

	constexpr bool operator==(SocketDescriptor other) const noexcept {
		return fd == other.fd;
	}

	using FileDescriptor::IsDefined;
	using FileDescriptor::Get;
	using FileDescriptor::Set;
	using FileDescriptor::Steal;
	using FileDescriptor::SetUndefined;

	static constexpr SocketDescriptor Undefined() noexcept {
		return SocketDescriptor(-1);
	}

	/**
	 * Convert this object to a #FileDescriptor instance.  This is
	 * only possible on operating systems where socket descriptors
	 * are the same as file descriptors (i.e. not on Windows).
	 */
	constexpr const FileDescriptor &ToFileDescriptor() const noexcept {
		return *this;
	}

	void Close() noexcept {
		FileDescriptor::Close();
	}

	/**
	 * Create a non-blocking socket.
	 *
	 * @return false on error (errno is set)
	 */
	bool CreateNonBlock(int domain, int type, int protocol) noexcept;

	bool SetOption(int level, int name,
		       const void *value, std::size_t size) const noexcept;

	bool SetBoolOption(int level, int name, bool value) const noexcept {
		const int i = value;
		return SetOption(level, name, &i, sizeof(i));
	}

	bool SetReuseAddress(bool value=true) const noexcept {
		return SetBoolOption(SOL_SOCKET, SO_REUSEADDR, value);
	}

	bool SetV6Only(bool value) const noexcept;

	bool Bind(const struct sockaddr *address,
		  socklen_t size) const noexcept {
		return ::bind(Get(), address, size) == 0;
	}

	bool Listen(int backlog) const noexcept {
		return ::listen(Get(), backlog) == 0;
	}

	/**
	 * Accept a new connection as a non-blocking socket.
	 *
	 * @return an undefined #SocketDescriptor on error (errno is set)
	 */
	SocketDescriptor AcceptNonBlock() const noexcept;

	/**
	 * Determine the port number this socket is bound to, or 0 if
	 * that is not possible.
	 */
	[[gnu::pure]]
	unsigned GetLocalPort() const noexcept;

	bool ShutdownWrite() const noexcept {
		return ::shutdown(Get(), SHUT_WR) == 0;
	}

	ssize_t Receive(std::span<std::byte> dest, int flags=0) const noexcept {
		return ::recv(Get(), dest.data(), dest.size(), flags);
	}

	ssize_t Send(std::span<const std::byte> src,
		     int flags=MSG_NOSIGNAL) const noexcept {
		return ::send(Get(), src.data(), src.size(), flags);
	}
};
