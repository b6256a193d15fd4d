#ifndef XMPRES_IDLEMONITOR_H
#define XMPRES_IDLEMONITOR_H

#include <optional>
#include <event2/event.h>
#include "selfPresence.h"

#define IDLE_LOG_DEBUG(fmtString,...) XMPRES_LOG_DEBUG(xpLogChannel_idle, fmtString, ##__VA_ARGS__)
#define IDLE_LOG_INFO(fmtString,...) XMPRES_LOG_INFO(xpLogChannel_idle, fmtString, ##__VA_ARGS__)
#define IDLE_LOG_WARNING(fmtString,...) XMPRES_LOG_WARNING(xpLogChannel_idle, fmtString, ##__VA_ARGS__)
#define IDLE_LOG_ERROR(fmtString,...) XMPRES_LOG_ERROR(xpLogChannel_idle, fmtString, ##__VA_ARGS__)

namespace xmpres
{
/** Platform-specific source of the user's input idle time */
class IIdleTimeSource
{
public:
    /** Milliseconds since the last keyboard or mouse input */
    virtual int64_t idleTimeMs() = 0;
    virtual ~IIdleTimeSource() {}
};

/** @brief Polls the idle time on a libevent timer and feeds idle, activity
 * and wake events into a SelfPresenceMachine.
 *
 * A poll that runs much later than scheduled means the system was suspended,
 * and is reported as a wake. The timer runs on the host's event loop, so all
 * events are delivered on the loop's thread.
 */
class IdleMonitor
{
public:
    enum: int64_t
    {
        /** A poll late by at least this much means the system slept */
        kSleepGapMs = 30000,
        /** Wakes closer than this to the previous one are ignored */
        kWakeDebounceMs = 2000
    };

protected:
    struct event_base* mEventBase;
    SelfPresenceMachine& mMachine;
    IIdleTimeSource& mSource;
    Clock mClock;
    struct event* mTimer = nullptr;
    int64_t mTimerIntervalMs = 0;
    std::optional<Timestamp> mLastPoll;
    std::optional<Timestamp> mLastWake;
    static void onTimer(evutil_socket_t fd, short what, void* arg);
    void checkIdle(Timestamp now);

public:
    IdleMonitor(struct event_base* base, SelfPresenceMachine& machine,
                IIdleTimeSource& source, Clock clock=Clock());
    ~IdleMonitor();
    IdleMonitor(const IdleMonitor&) = delete;
    IdleMonitor& operator=(const IdleMonitor&) = delete;

    /** @brief Starts polling every autoAwayConfig().checkIntervalMs.
     * @returns \c false if auto-away is disabled or the interval is not
     * positive, in which case no timer is started
     * @throws std::runtime_error if the libevent timer can't be created or
     * scheduled
     */
    bool start();
    void stop();
    bool isRunning() const { return mTimer != nullptr; }

    /** Re-reads the machine's auto-away config, restarting or stopping the
     * timer as needed. If auto-away got disabled while auto-away, the machine
     * returns to the previous state */
    void applyConfig();

    /** Performs one check. Called by the timer */
    void poll();

    /** For hosts that get OS power notifications */
    void notifySleep();
    /** @returns \c true if the wake was handled, \c false if it was debounced */
    bool notifyWake();
};
}
#endif
