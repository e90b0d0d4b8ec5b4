// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RequestContext.hxx"
#include "system/Error.hxx"

#include <array>
#include <stdexcept>

#include <sys/random.h>

std::string
GenerateRequestId()
{
	static constexpr char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
	static constexpr std::size_t alphabet_size = sizeof(alphabet) - 1;

	std::array<std::byte, 8> random;
	const ssize_t nbytes = getrandom(random.data(), random.size(), 0);
	if (nbytes < 0)
		throw MakeErrno("getrandom() failed");

	if (static_cast<std::size_t>(nbytes) != random.size())
		throw std::runtime_error("getrandom() was incomplete");

	std::string result;
	result.reserve(random.size());
	for (const std::byte b : random)
		result.push_back(alphabet[static_cast<unsigned>(b) % alphabet_size]);

	return result;
}
