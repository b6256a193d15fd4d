#include "idleMonitor.h"

namespace xmpres
{
IdleMonitor::IdleMonitor(struct event_base* base, SelfPresenceMachine& machine,
                         IIdleTimeSource& source, Clock clock)
    : mEventBase(base), mMachine(machine), mSource(source),
      mClock(clock ? clock : Clock(timestampMs))
{}

IdleMonitor::~IdleMonitor()
{
    stop();
}

bool IdleMonitor::start()
{
    auto& config = mMachine.autoAwayConfig();
    if (!config.enabled)
    {
        IDLE_LOG_DEBUG("Auto-away is disabled, not starting idle timer");
        return false;
    }
    if (config.checkIntervalMs <= 0)
    {
        IDLE_LOG_WARNING("Invalid check interval %lld ms, not starting idle timer",
                         static_cast<long long>(config.checkIntervalMs));
        stop();
        return false;
    }
    if (mTimer)
    {
        if (mTimerIntervalMs == config.checkIntervalMs)
            return true;
        stop();
    }
    mTimer = event_new(mEventBase, -1, EV_PERSIST, onTimer, this);
    if (!mTimer)
        throw std::runtime_error("IdleMonitor: event_new() failed");
    mTimerIntervalMs = config.checkIntervalMs;
    struct timeval tv;
    tv.tv_sec = mTimerIntervalMs / 1000;
    tv.tv_usec = (mTimerIntervalMs % 1000) * 1000;
    if (evtimer_add(mTimer, &tv) != 0)
    {
        event_free(mTimer);
        mTimer = nullptr;
        mTimerIntervalMs = 0;
        throw std::runtime_error("IdleMonitor: evtimer_add() failed");
    }
    mLastPoll = mClock();
    IDLE_LOG_INFO("Idle timer started: %s", config.toString().c_str());
    return true;
}

void IdleMonitor::stop()
{
    if (!mTimer)
        return;
    event_del(mTimer);
    event_free(mTimer);
    mTimer = nullptr;
    mTimerIntervalMs = 0;
    mLastPoll.reset();
    IDLE_LOG_DEBUG("Idle timer stopped");
}

void IdleMonitor::applyConfig()
{
    if (mMachine.autoAwayConfig().enabled)
    {
        start();
        return;
    }
    stop();
    if (mMachine.isAutoAway())
        mMachine.activityDetected();
}

void IdleMonitor::onTimer(evutil_socket_t /*fd*/, short /*what*/, void* arg)
{
    static_cast<IdleMonitor*>(arg)->poll();
}

void IdleMonitor::poll()
{
    if (!mMachine.autoAwayConfig().enabled)
        return;

    Timestamp now = mClock();
    if (mLastPoll)
    {
        int64_t late = now - *mLastPoll - mMachine.autoAwayConfig().checkIntervalMs;
        if (late >= kSleepGapMs)
        {
            IDLE_LOG_INFO("Poll is %lld ms late, system was probably suspended", (long long)late);
            notifyWake();
        }
    }
    mLastPoll = now;
    checkIdle(now);
}

void IdleMonitor::checkIdle(Timestamp now)
{
    int64_t idleMs = mSource.idleTimeMs();
    auto kind = mMachine.kind();
    if (idleMs >= mMachine.autoAwayConfig().idleThresholdMs)
    {
        if (kind == SelfPresenceMachine::kOnline || kind == SelfPresenceMachine::kAway)
        {
            IDLE_LOG_DEBUG("User idle for %lld ms", (long long)idleMs);
            mMachine.idleDetected(now - idleMs);
        }
    }
    else if (kind == SelfPresenceMachine::kAutoAway)
    {
        IDLE_LOG_DEBUG("User activity detected");
        mMachine.activityDetected();
    }
}

void IdleMonitor::notifySleep()
{
    IDLE_LOG_INFO("System is going to sleep");
    mMachine.sleepDetected();
}

bool IdleMonitor::notifyWake()
{
    Timestamp now = mClock();
    if (mLastWake && now - *mLastWake < kWakeDebounceMs)
    {
        IDLE_LOG_DEBUG("Wake ignored, %lld ms since the previous one", (long long)(now - *mLastWake));
        return false;
    }
    mLastWake = now;
    mLastPoll = now;
    IDLE_LOG_INFO("System woke up");
    mMachine.wakeDetected();
    return true;
}
}
