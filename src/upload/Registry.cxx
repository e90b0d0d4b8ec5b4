// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Registry.hxx"
#include "Name.hxx"

#include <algorithm>
#include <cassert>

std::shared_ptr<UploadSession>
UploadSessionRegistry::Find(std::string_view key) const noexcept
{
	if (auto i = sessions.find(key); i != sessions.end())
		return i->second;

	return nullptr;
}

std::shared_ptr<UploadSession>
UploadSessionRegistry::Create(std::string_view key,
			      unsigned total_chunks, uint64_t declared_size,
			      Event::TimePoint now,
			      std::chrono::system_clock::time_point wall_now)
{
	assert(!sessions.contains(key));

	auto session = std::make_shared<UploadSession>(std::string{key},
						       MakeStorageName(key, wall_now),
						       total_chunks,
						       declared_size,
						       now);
	sessions.emplace(key, session);
	return session;
}

bool
UploadSessionRegistry::IsCurrent(const UploadSession &session) const noexcept
{
	const auto i = sessions.find(session.key);
	return i != sessions.end() && i->second.get() == &session;
}

void
UploadSessionRegistry::Remove(const UploadSession &session) noexcept
{
	if (auto i = sessions.find(session.key);
	    i != sessions.end() && i->second.get() == &session)
		sessions.erase(i);
}

bool
UploadSessionRegistry::HasStorageName(std::string_view storage_name) const noexcept
{
	return std::any_of(sessions.begin(), sessions.end(), [storage_name](const auto &i){
		return i.second->storage_name == storage_name;
	});
}

std::vector<std::string>
UploadSessionRegistry::RemoveExpired(Event::TimePoint now,
				     Event::Duration timeout) noexcept
{
	std::vector<std::string> removed;

	for (auto i = sessions.begin(); i != sessions.end();) {
		const auto &session = *i->second;
		if (!session.IsBusy() && session.IsExpired(now, timeout)) {
			removed.push_back(session.storage_name);
			i = sessions.erase(i);
		} else
			++i;
	}

	return removed;
}
