// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "upload/Registry.hxx"

#include <gtest/gtest.h>

using std::chrono::hours;
using std::chrono::minutes;

static const std::chrono::system_clock::time_point wall_now{std::chrono::seconds{1700000000}};

TEST(UploadSession, Missing)
{
	UploadSession session{"a.mp4", "1_a.mp4", 4, 1000, Event::TimePoint{}};
	EXPECT_EQ(session.GetReceivedCount(), 0u);
	EXPECT_EQ(session.GetMissing(), (std::vector<unsigned>{1, 2, 3, 4}));

	session.MarkReceived(3);
	session.MarkReceived(1);
	session.MarkReceived(3);
	EXPECT_EQ(session.GetReceivedCount(), 2u);
	EXPECT_TRUE(session.IsReceived(1));
	EXPECT_FALSE(session.IsReceived(2));
	EXPECT_FALSE(session.IsReceived(0));
	EXPECT_FALSE(session.IsReceived(5));
	EXPECT_EQ(session.GetMissing(), (std::vector<unsigned>{2, 4}));

	EXPECT_TRUE(session.Matches(4, 1000));
	EXPECT_FALSE(session.Matches(5, 1000));
	EXPECT_FALSE(session.Matches(4, 999));
}

TEST(UploadSessionRegistry, Basic)
{
	UploadSessionRegistry registry;
	EXPECT_TRUE(registry.empty());
	EXPECT_EQ(registry.Find("a.mp4"), nullptr);

	const auto session = registry.Create("a.mp4", 3, 300,
					     Event::TimePoint{}, wall_now);
	ASSERT_NE(session, nullptr);
	EXPECT_EQ(session->key, "a.mp4");
	EXPECT_EQ(session->storage_name, "1700000000000_a.mp4");
	EXPECT_EQ(registry.size(), 1u);
	EXPECT_EQ(registry.Find("a.mp4"), session);
	EXPECT_TRUE(registry.IsCurrent(*session));
	EXPECT_TRUE(registry.HasStorageName("1700000000000_a.mp4"));
	EXPECT_FALSE(registry.HasStorageName("a.mp4"));

	registry.Remove(*session);
	EXPECT_TRUE(registry.empty());
	EXPECT_FALSE(registry.IsCurrent(*session));

	/* a new session with the same key does not make the old one
	   current again */
	const auto session2 = registry.Create("a.mp4", 3, 300,
					      Event::TimePoint{}, wall_now);
	EXPECT_FALSE(registry.IsCurrent(*session));
	EXPECT_TRUE(registry.IsCurrent(*session2));

	/* removing the stale one does not affect the new one */
	registry.Remove(*session);
	EXPECT_EQ(registry.size(), 1u);
}

TEST(UploadSessionRegistry, RemoveExpired)
{
	UploadSessionRegistry registry;
	const Event::TimePoint t0{};

	const auto a = registry.Create("a.mp4", 1, 1, t0, wall_now);
	const auto b = registry.Create("b.mp4", 1, 1, t0, wall_now);
	b->Touch(t0 + minutes{30});

	EXPECT_TRUE(registry.RemoveExpired(t0 + minutes{59}, hours{1}).empty());

	const auto removed = registry.RemoveExpired(t0 + hours{1}, hours{1});
	ASSERT_EQ(removed.size(), 1u);
	EXPECT_EQ(removed.front(), a->storage_name);
	EXPECT_FALSE(registry.IsCurrent(*a));
	EXPECT_TRUE(registry.IsCurrent(*b));

	EXPECT_EQ(registry.RemoveExpired(t0 + hours{2}, hours{1}).size(), 1u);
	EXPECT_TRUE(registry.empty());
}
