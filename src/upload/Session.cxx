// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Session.hxx"

std::vector<unsigned>
UploadSession::GetMissing() const
{
	std::vector<unsigned> missing;

	for (unsigned i = 0; i < total_chunks; ++i)
		if (!received[i])
			missing.push_back(i + 1);

	return missing;
}
