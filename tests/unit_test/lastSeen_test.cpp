#include "unit_test.h"
#include "lastSeen.h"

using namespace xmpres;
using xmpres_test::FakeClock;

static const int64_t kMinute = 60 * 1000;
static const int64_t kHour = 60 * kMinute;
static const int64_t kDay = 24 * kHour;

TEST(LastSeen, DurationBuckets)
{
    EXPECT_EQ(formatDuration(0), "just now");
    EXPECT_EQ(formatDuration(59 * 1000), "just now");
    EXPECT_EQ(formatDuration(kMinute), "1m ago");
    EXPECT_EQ(formatDuration(59 * kMinute), "59m ago");
    EXPECT_EQ(formatDuration(2 * kHour), "2h ago");
    EXPECT_EQ(formatDuration(23 * kHour + 59 * kMinute), "23h ago");
    EXPECT_EQ(formatDuration(kDay + 5 * kHour), "yesterday");
    EXPECT_EQ(formatDuration(3 * kDay), "3d ago");
    EXPECT_EQ(formatDuration(6 * kDay + 23 * kHour), "6d ago");
    EXPECT_EQ(formatDuration(7 * kDay), "1w ago");
    EXPECT_EQ(formatDuration(20 * kDay), "2w ago");
}

TEST(LastSeen, IdleBuckets)
{
    EXPECT_EQ(formatIdleDuration(30 * 1000), "active");
    EXPECT_EQ(formatIdleDuration(15 * kMinute), "idle 15m");
    EXPECT_EQ(formatIdleDuration(3 * kHour), "idle 3h");
    EXPECT_EQ(formatIdleDuration(2 * kDay + kHour), "idle 2d");
}

class LastSeenTest: public ::testing::Test
{
protected:
    FakeClock mClock;
    ContactList mList;
    LastSeenTest(): mList(mClock.clock())
    {
        mList.setContacts({RosterItem("alice@example.com", "Alice")});
    }
    const Contact& alice() { return *mList.contact("alice@example.com"); }
};

TEST_F(LastSeenTest, OfflineWithoutHistory)
{
    auto info = getLastSeenInfo(alice(), mClock.now);
    EXPECT_EQ(info.text, "Offline");
    EXPECT_FALSE(info.isActive);
    EXPECT_EQ(getStatusText(alice(), mClock.now), "Offline");
}

TEST_F(LastSeenTest, OnlineWithoutIdleIsActive)
{
    mList.updatePresence("alice@example.com/r", Show::kOnline, 0);
    auto info = getLastSeenInfo(alice(), mClock.now);
    EXPECT_EQ(info.text, "Active now");
    EXPECT_TRUE(info.isActive);
    EXPECT_EQ(getStatusText(alice(), mClock.now), "Online \xC2\xB7 Active");
}

TEST_F(LastSeenTest, RecentInteractionIsActive)
{
    mList.updatePresence("alice@example.com/r",
        ResourcePresence(Show::kAway, 0, std::nullopt, mClock.now - 30 * 1000));
    EXPECT_TRUE(getLastSeenInfo(alice(), mClock.now).isActive);
    EXPECT_EQ(getStatusText(alice(), mClock.now), "Away \xC2\xB7 Active");
}

TEST_F(LastSeenTest, IdleContact)
{
    mList.updatePresence("alice@example.com/r",
        ResourcePresence(Show::kAway, 0, std::nullopt, mClock.now - 15 * kMinute));
    auto info = getLastSeenInfo(alice(), mClock.now);
    EXPECT_EQ(info.text, "idle 15m");
    EXPECT_FALSE(info.isActive);
    ASSERT_TRUE(info.idleDurationMs.has_value());
    EXPECT_EQ(*info.idleDurationMs, 15 * kMinute);
    EXPECT_EQ(getStatusText(alice(), mClock.now), "Away \xC2\xB7 idle 15m");
}

TEST_F(LastSeenTest, LastSeenAfterGoingOffline)
{
    mList.updatePresence("alice@example.com/r", Show::kDnd, 0);
    mList.removePresence("alice@example.com/r");
    mClock.advance(2 * kHour + 10 * kMinute);
    auto info = getLastSeenInfo(alice(), mClock.now);
    EXPECT_EQ(info.text, "Last seen 2h ago");
    ASSERT_TRUE(info.lastSeenDurationMs.has_value());
    EXPECT_EQ(*info.lastSeenDurationMs, 2 * kHour + 10 * kMinute);
    EXPECT_EQ(getStatusText(alice(), mClock.now), "Last seen 2h ago");
}

TEST(LastSeen, PresenceLabels)
{
    EXPECT_STREQ(getPresenceLabel(Presence::kDnd), "Do not disturb");
    EXPECT_STREQ(getPresenceLabel(Presence::kOffline), "Offline");
}
