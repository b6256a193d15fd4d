#ifndef XMPRES_SELFPRESENCE_H
#define XMPRES_SELFPRESENCE_H

#include <optional>
#include <string>
#include "xmpresCommon.h"
#include "presence.h"

#define SELFPRES_LOG_DEBUG(fmtString,...) XMPRES_LOG_DEBUG(xpLogChannel_presence, fmtString, ##__VA_ARGS__)
#define SELFPRES_LOG_VERBOSE(fmtString,...) XMPRES_LOG_VERBOSE(xpLogChannel_presence, fmtString, ##__VA_ARGS__)
#define SELFPRES_LOG_INFO(fmtString,...) XMPRES_LOG_INFO(xpLogChannel_presence, fmtString, ##__VA_ARGS__)
#define SELFPRES_LOG_WARNING(fmtString,...) XMPRES_LOG_WARNING(xpLogChannel_presence, fmtString, ##__VA_ARGS__)
#define SELFPRES_LOG_ERROR(fmtString,...) XMPRES_LOG_ERROR(xpLogChannel_presence, fmtString, ##__VA_ARGS__)

namespace xmpres
{
class AutoAwayConfig
{
public:
    enum: int64_t
    {
        kDefaultIdleThresholdMs = 300000,
        kDefaultCheckIntervalMs = 30000
    };
    /** How long the user must be idle before going auto-away */
    int64_t idleThresholdMs = kDefaultIdleThresholdMs;
    /** How often the idle time is polled */
    int64_t checkIntervalMs = kDefaultCheckIntervalMs;
    bool enabled = true;

    bool operator==(const AutoAwayConfig& other) const
    {
        return idleThresholdMs == other.idleThresholdMs
            && checkIntervalMs == other.checkIntervalMs
            && enabled == other.enabled;
    }
    bool operator!=(const AutoAwayConfig& other) const { return !(*this == other); }
    std::string toString() const;

    /** @brief Parses a "threshold=<ms>,interval=<ms>,enabled=<0|1|true|false>"
     * string. Missing keys keep their value from \c base.
     * @throws std::runtime_error on unknown keys or malformed values
     */
    static AutoAwayConfig fromString(const std::string& str, const AutoAwayConfig& base);
    /** Same as above, with the defaults as the base */
    static AutoAwayConfig fromString(const std::string& str);

    /** @brief Reads the XMPRES_AUTOAWAY env variable. If it is not set or can't
     * be parsed (the error is logged), the defaults are returned */
    static AutoAwayConfig fromEnv();
};

/** A partial update of AutoAwayConfig. Only the fields that are set are merged */
struct AutoAwayConfigPatch
{
    std::optional<int64_t> idleThresholdMs;
    std::optional<int64_t> checkIntervalMs;
    std::optional<bool> enabled;
    /** @brief Merges the set fields into \c config.
     * @returns false, leaving \c config untouched, if a threshold or interval
     * is not positive
     */
    bool applyTo(AutoAwayConfig& config) const;
};

/** @brief The state machine of the local user's own presence.
 *
 * States are Disconnected, Online, Away, Dnd and AutoAway, the latter
 * remembering whether it was entered from Online or Away. Events that are not
 * valid in the current state are ignored. The user's last explicit choice
 * survives disconnects and is restored on the next connect.
 */
class SelfPresenceMachine
{
public:
    typedef uint8_t Kind;
    enum: Kind
    {
        kDisconnected = 0,
        kOnline,
        kAway,
        kDnd,
        kAutoAway
    };
    static const char* kindToString(Kind kind);

    struct Event
    {
        enum Type: uint8_t
        {
            kConnect = 0,
            kDisconnect,
            kSetPresence,
            kIdleDetected,
            kActivityDetected,
            kSleepDetected,
            kWakeDetected,
            kSetAutoAwayConfig
        };
        Type type;
        /** kSetPresence: one of kOnline, kAway, kDnd */
        Kind show = kOnline;
        /** kSetPresence: the new status message, empty for none */
        std::string status;
        /** kIdleDetected: when the user became idle */
        Timestamp since = 0;
        /** kSetAutoAwayConfig */
        AutoAwayConfigPatch config;

        Event(Type aType): type(aType) {}
        static Event setPresence(Kind aShow, const std::string& aStatus=std::string());
        static Event idleDetected(Timestamp aSince);
        static Event setAutoAwayConfig(const AutoAwayConfigPatch& patch);
        static const char* typeToString(Type type);
    };

    class Listener
    {
    public:
        /** Called after every accepted event that changed the presence state
         * or its context */
        virtual void onSelfPresenceChange(const SelfPresenceMachine& machine) = 0;
        virtual void onAutoAwayConfigChange(const AutoAwayConfig& /*config*/) {}
        virtual ~Listener() {}
    };

protected:
    Kind mKind = kDisconnected;
    Kind mPreAutoAway = kOnline; //valid only while mKind == kAutoAway
    Kind mLastUserPreference = kOnline;
    std::string mStatusMessage;
    std::optional<Timestamp> mIdleSince;
    AutoAwayConfig mAutoAwayConfig;
    Clock mClock;
    Listener* mListener = nullptr;
    void enterIdle(Timestamp since, const char* reason);
    void exitIdle(const char* reason);
    void notifyChange();

public:
    explicit SelfPresenceMachine(const AutoAwayConfig& config=AutoAwayConfig(),
                                 Clock clock=Clock());
    void setListener(Listener* listener) { mListener = listener; }

    /** @brief Applies an event.
     * @returns \c true if the event was valid in the current state and was
     * applied, \c false if it was ignored */
    bool dispatch(const Event& event);

    bool connect() { return dispatch(Event(Event::kConnect)); }
    bool disconnect() { return dispatch(Event(Event::kDisconnect)); }
    bool setPresence(Kind show, const std::string& status=std::string())
    {
        return dispatch(Event::setPresence(show, status));
    }
    bool idleDetected(Timestamp since) { return dispatch(Event::idleDetected(since)); }
    bool activityDetected() { return dispatch(Event(Event::kActivityDetected)); }
    bool sleepDetected() { return dispatch(Event(Event::kSleepDetected)); }
    bool wakeDetected() { return dispatch(Event(Event::kWakeDetected)); }
    bool setAutoAwayConfig(const AutoAwayConfigPatch& patch)
    {
        return dispatch(Event::setAutoAwayConfig(patch));
    }

    Kind kind() const { return mKind; }
    bool isConnected() const { return mKind != kDisconnected; }
    bool isAutoAway() const { return mKind == kAutoAway; }

    /** The <show/> value to advertise. Away while auto-away, an invalid Show
     * while disconnected */
    Show wireShow() const;

    /** The UI status. Offline while disconnected */
    Presence status() const;

    /** "disconnected", "online", "away", "dnd", "autoAway(online)" or "autoAway(away)" */
    std::string stateName() const;

    const std::string& statusMessage() const { return mStatusMessage; }
    Kind lastUserPreference() const { return mLastUserPreference; }

    /** The state auto-away was entered from. Set only while auto-away */
    std::optional<Kind> preAutoAwayState() const;
    const std::optional<Timestamp>& idleSince() const { return mIdleSince; }
    const AutoAwayConfig& autoAwayConfig() const { return mAutoAwayConfig; }
};
}
#endif
