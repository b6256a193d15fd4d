#include "unit_test.h"
#include <event2/event.h>
#include "idleMonitor.h"

using namespace xmpres;
using xmpres_test::FakeClock;

typedef SelfPresenceMachine M;

class FakeIdleSource: public IIdleTimeSource
{
public:
    int64_t idle = 0;
    int calls = 0;
    int64_t idleTimeMs() override
    {
        calls++;
        return idle;
    }
};

class IdleMonitorTest: public ::testing::Test
{
protected:
    FakeClock mClock;
    struct event_base* mBase;
    SelfPresenceMachine mMachine;
    FakeIdleSource mSource;
    IdleMonitor mMonitor;
    IdleMonitorTest()
        : mBase(event_base_new()), mMachine(AutoAwayConfig(), mClock.clock()),
          mMonitor(mBase, mMachine, mSource, mClock.clock())
    {}
    ~IdleMonitorTest()
    {
        mMonitor.stop();
        event_base_free(mBase);
    }
    /** Advances the clock by one check interval and polls */
    void tick(int64_t extraMs=0)
    {
        mClock.advance(mMachine.autoAwayConfig().checkIntervalMs + extraMs);
        mMonitor.poll();
    }
};

TEST_F(IdleMonitorTest, GoesAutoAwayAfterThreshold)
{
    mMachine.connect();
    mSource.idle = AutoAwayConfig::kDefaultIdleThresholdMs - 1;
    tick();
    EXPECT_EQ(mMachine.kind(), M::kOnline);

    mSource.idle = AutoAwayConfig::kDefaultIdleThresholdMs;
    tick();
    EXPECT_TRUE(mMachine.isAutoAway());
    ASSERT_TRUE(mMachine.idleSince().has_value());
    EXPECT_EQ(*mMachine.idleSince(), mClock.now - AutoAwayConfig::kDefaultIdleThresholdMs);

    // staying idle keeps the original idle start
    Timestamp since = *mMachine.idleSince();
    mSource.idle += mMachine.autoAwayConfig().checkIntervalMs;
    tick();
    EXPECT_EQ(*mMachine.idleSince(), since);
}

TEST_F(IdleMonitorTest, ActivityRestoresPreviousState)
{
    mMachine.connect();
    mMachine.setPresence(M::kAway);
    mSource.idle = 10 * 60 * 1000;
    tick();
    EXPECT_EQ(mMachine.stateName(), "autoAway(away)");
    mSource.idle = 1000;
    tick();
    EXPECT_EQ(mMachine.kind(), M::kAway);
}

TEST_F(IdleMonitorTest, DndIsLeftAlone)
{
    mMachine.connect();
    mMachine.setPresence(M::kDnd);
    mSource.idle = 60 * 60 * 1000;
    tick();
    EXPECT_EQ(mMachine.kind(), M::kDnd);
}

TEST_F(IdleMonitorTest, DisabledDoesNotPoll)
{
    AutoAwayConfigPatch patch;
    patch.enabled = false;
    mMachine.setAutoAwayConfig(patch);
    mMachine.connect();
    EXPECT_FALSE(mMonitor.start());
    EXPECT_FALSE(mMonitor.isRunning());
    mSource.idle = 60 * 60 * 1000;
    tick();
    EXPECT_EQ(mSource.calls, 0);
    EXPECT_EQ(mMachine.kind(), M::kOnline);
}

TEST_F(IdleMonitorTest, DisablingWhileAutoAwayRestores)
{
    mMachine.connect();
    ASSERT_TRUE(mMonitor.start());
    mSource.idle = 60 * 60 * 1000;
    tick();
    ASSERT_TRUE(mMachine.isAutoAway());
    AutoAwayConfigPatch patch;
    patch.enabled = false;
    mMachine.setAutoAwayConfig(patch);
    mMonitor.applyConfig();
    EXPECT_FALSE(mMonitor.isRunning());
    EXPECT_EQ(mMachine.kind(), M::kOnline);
}

TEST_F(IdleMonitorTest, ClockGapIsReportedAsWake)
{
    mMachine.connect();
    mMonitor.poll();
    mMachine.sleepDetected();
    ASSERT_TRUE(mMachine.isAutoAway());

    // just late, but not enough to be a suspend
    mSource.idle = 0;
    mMachine.idleDetected(mClock.now); //no-op, already auto-away
    tick(IdleMonitor::kSleepGapMs - 1);
    // the activity check alone brings the user back
    EXPECT_EQ(mMachine.kind(), M::kOnline);

    mMachine.sleepDetected();
    mSource.idle = 2 * 60 * 60 * 1000;
    tick(2 * 60 * 60 * 1000);
    // woke up, then went auto-away again because the user is still idle
    EXPECT_TRUE(mMachine.isAutoAway());
    EXPECT_EQ(*mMachine.idleSince(), mClock.now - mSource.idle);
}

TEST_F(IdleMonitorTest, WakeIsDebounced)
{
    mMachine.connect();
    mMachine.sleepDetected();
    EXPECT_TRUE(mMonitor.notifyWake());
    EXPECT_EQ(mMachine.kind(), M::kOnline);

    mMonitor.notifySleep();
    EXPECT_TRUE(mMachine.isAutoAway());
    mClock.advance(IdleMonitor::kWakeDebounceMs - 1);
    EXPECT_FALSE(mMonitor.notifyWake());
    EXPECT_TRUE(mMachine.isAutoAway());
    mClock.advance(1);
    EXPECT_TRUE(mMonitor.notifyWake());
    EXPECT_EQ(mMachine.kind(), M::kOnline);
}

TEST_F(IdleMonitorTest, TimerFiresOnEventLoop)
{
    AutoAwayConfigPatch patch;
    patch.checkIntervalMs = 10;
    patch.idleThresholdMs = 1000;
    mMachine.setAutoAwayConfig(patch);
    mMachine.connect();
    mSource.idle = 5000;
    ASSERT_TRUE(mMonitor.start());
    EXPECT_TRUE(mMonitor.isRunning());
    event_base_loop(mBase, EVLOOP_ONCE);
    EXPECT_GE(mSource.calls, 1);
    EXPECT_TRUE(mMachine.isAutoAway());

    mMonitor.stop();
    EXPECT_FALSE(mMonitor.isRunning());
}

TEST_F(IdleMonitorTest, NonPositiveIntervalNeverArmsTimer)
{
    mMachine.connect();
    AutoAwayConfigPatch patch;
    patch.checkIntervalMs = -5000;
    EXPECT_FALSE(mMachine.setAutoAwayConfig(patch));
    ASSERT_TRUE(mMonitor.start());
    EXPECT_TRUE(mMonitor.isRunning());
    EXPECT_EQ(mMachine.autoAwayConfig().checkIntervalMs, AutoAwayConfig::kDefaultCheckIntervalMs);

    // a bad interval can still come in through the constructor
    AutoAwayConfig config;
    config.checkIntervalMs = 0;
    SelfPresenceMachine machine(config, mClock.clock());
    machine.connect();
    IdleMonitor monitor(mBase, machine, mSource, mClock.clock());
    EXPECT_FALSE(monitor.start());
    EXPECT_FALSE(monitor.isRunning());
}
