#include "selfPresence.h"
#include <map>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include "stringUtils.h"

namespace xmpres
{
static int64_t parseMs(const std::string& name, const std::string& value)
{
    char* end = nullptr;
    long long ms = strtoll(value.c_str(), &end, 10);
    if (value.empty() || *end || ms <= 0)
        throw std::runtime_error("AutoAwayConfig: invalid value '"+value+"' for '"+name+"'");
    return ms;
}

static bool parseBool(const std::string& name, const std::string& value)
{
    if (value == "1" || strcasecmp(value.c_str(), "true") == 0 || strcasecmp(value.c_str(), "on") == 0)
        return true;
    if (value == "0" || strcasecmp(value.c_str(), "false") == 0 || strcasecmp(value.c_str(), "off") == 0)
        return false;
    throw std::runtime_error("AutoAwayConfig: invalid value '"+value+"' for '"+name+"'");
}

std::string AutoAwayConfig::toString() const
{
    std::string result;
    result.reserve(64);
    result.append("threshold: ").append(std::to_string(idleThresholdMs))
          .append(", interval: ").append(std::to_string(checkIntervalMs))
          .append(", enabled: ").append(enabled ? "1" : "0");
    return result;
}

AutoAwayConfig AutoAwayConfig::fromString(const std::string& str, const AutoAwayConfig& base)
{
    std::map<std::string, std::string> values;
    parseNameValues(str.c_str(), ",;", '=', values);
    AutoAwayConfig config(base);
    for (auto& item: values)
    {
        if (item.first == "threshold")
            config.idleThresholdMs = parseMs(item.first, item.second);
        else if (item.first == "interval")
            config.checkIntervalMs = parseMs(item.first, item.second);
        else if (item.first == "enabled")
            config.enabled = parseBool(item.first, item.second);
        else
            throw std::runtime_error("AutoAwayConfig: unknown key '"+item.first+"'");
    }
    return config;
}

AutoAwayConfig AutoAwayConfig::fromString(const std::string& str)
{
    return fromString(str, AutoAwayConfig());
}

AutoAwayConfig AutoAwayConfig::fromEnv()
{
    const char* str = getenv("XMPRES_AUTOAWAY");
    if (!str)
        return AutoAwayConfig();
    try
    {
        auto config = fromString(str);
        SELFPRES_LOG_INFO("Auto-away config from XMPRES_AUTOAWAY env variable: %s", config.toString().c_str());
        return config;
    }
    catch (std::exception& e)
    {
        SELFPRES_LOG_ERROR("Error parsing XMPRES_AUTOAWAY env variable, using defaults:\n%s", e.what());
        return AutoAwayConfig();
    }
}

bool AutoAwayConfigPatch::applyTo(AutoAwayConfig& config) const
{
    if ((idleThresholdMs && *idleThresholdMs <= 0) || (checkIntervalMs && *checkIntervalMs <= 0))
        return false;
    if (idleThresholdMs)
        config.idleThresholdMs = *idleThresholdMs;
    if (checkIntervalMs)
        config.checkIntervalMs = *checkIntervalMs;
    if (enabled)
        config.enabled = *enabled;
    return true;
}

SelfPresenceMachine::Event SelfPresenceMachine::Event::setPresence(Kind aShow, const std::string& aStatus)
{
    Event event(kSetPresence);
    event.show = aShow;
    event.status = aStatus;
    return event;
}

SelfPresenceMachine::Event SelfPresenceMachine::Event::idleDetected(Timestamp aSince)
{
    Event event(kIdleDetected);
    event.since = aSince;
    return event;
}

SelfPresenceMachine::Event SelfPresenceMachine::Event::setAutoAwayConfig(const AutoAwayConfigPatch& patch)
{
    Event event(kSetAutoAwayConfig);
    event.config = patch;
    return event;
}

const char* SelfPresenceMachine::Event::typeToString(Type type)
{
    switch (type)
    {
        case kConnect: return "CONNECT";
        case kDisconnect: return "DISCONNECT";
        case kSetPresence: return "SET_PRESENCE";
        case kIdleDetected: return "IDLE_DETECTED";
        case kActivityDetected: return "ACTIVITY_DETECTED";
        case kSleepDetected: return "SLEEP_DETECTED";
        case kWakeDetected: return "WAKE_DETECTED";
        case kSetAutoAwayConfig: return "SET_AUTO_AWAY_CONFIG";
        default: return "(unknown)";
    }
}

const char* SelfPresenceMachine::kindToString(Kind kind)
{
    switch (kind)
    {
        case kDisconnected: return "disconnected";
        case kOnline: return "online";
        case kAway: return "away";
        case kDnd: return "dnd";
        case kAutoAway: return "autoAway";
        default: return "(invalid)";
    }
}

SelfPresenceMachine::SelfPresenceMachine(const AutoAwayConfig& config, Clock clock)
    : mAutoAwayConfig(config), mClock(clock ? clock : Clock(timestampMs))
{}

bool SelfPresenceMachine::dispatch(const Event& event)
{
    switch (event.type)
    {
        case Event::kConnect:
            if (mKind != kDisconnected)
                break;
            mKind = mLastUserPreference;
            SELFPRES_LOG_INFO("Connected, restoring presence '%s'", kindToString(mKind));
            notifyChange();
            return true;

        case Event::kDisconnect:
            if (mKind == kDisconnected)
                break;
            mKind = kDisconnected;
            mIdleSince.reset();
            SELFPRES_LOG_INFO("Disconnected, will restore '%s' on reconnect", kindToString(mLastUserPreference));
            notifyChange();
            return true;

        case Event::kSetPresence:
            if (mKind == kDisconnected)
                break;
            if (event.show != kOnline && event.show != kAway && event.show != kDnd)
            {
                SELFPRES_LOG_WARNING("SET_PRESENCE with invalid show %d ignored", event.show);
                return false;
            }
            SELFPRES_LOG_VERBOSE("setPresence: %s -> %s", stateName().c_str(), kindToString(event.show));
            mKind = event.show;
            mLastUserPreference = event.show;
            mStatusMessage = event.status;
            mIdleSince.reset();
            notifyChange();
            return true;

        case Event::kIdleDetected:
            if (mKind != kOnline && mKind != kAway)
                break;
            enterIdle(event.since, "idle");
            return true;

        case Event::kSleepDetected:
            if (mKind != kOnline && mKind != kAway)
                break;
            enterIdle(mClock(), "sleep");
            return true;

        case Event::kActivityDetected:
        case Event::kWakeDetected:
            if (mKind != kAutoAway)
                break;
            exitIdle(event.type == Event::kWakeDetected ? "wake" : "activity");
            return true;

        case Event::kSetAutoAwayConfig:
        {
            AutoAwayConfig config(mAutoAwayConfig);
            if (!event.config.applyTo(config))
            {
                SELFPRES_LOG_WARNING("Auto-away config update rejected: threshold and interval must be positive");
                return false;
            }
            if (config != mAutoAwayConfig)
            {
                mAutoAwayConfig = config;
                SELFPRES_LOG_DEBUG("Auto-away config changed: %s", config.toString().c_str());
                XP_CALL_LISTENER(xpLogChannel_presence, onAutoAwayConfigChange, mAutoAwayConfig);
            }
            return true;
        }
        default:
            SELFPRES_LOG_WARNING("Unknown event type %d ignored", event.type);
            return false;
    }
    SELFPRES_LOG_DEBUG("Event %s ignored in state %s", Event::typeToString(event.type), stateName().c_str());
    return false;
}

void SelfPresenceMachine::enterIdle(Timestamp since, const char* reason)
{
    mPreAutoAway = mKind;
    mKind = kAutoAway;
    mIdleSince = since;
    SELFPRES_LOG_INFO("Going auto-away (%s) from '%s'", reason, kindToString(mPreAutoAway));
    notifyChange();
}

void SelfPresenceMachine::exitIdle(const char* reason)
{
    mKind = mPreAutoAway;
    mPreAutoAway = kOnline;
    mIdleSince.reset();
    SELFPRES_LOG_INFO("Back from auto-away (%s) to '%s'", reason, kindToString(mKind));
    notifyChange();
}

void SelfPresenceMachine::notifyChange()
{
    XP_CALL_LISTENER(xpLogChannel_presence, onSelfPresenceChange, *this);
}

Show SelfPresenceMachine::wireShow() const
{
    switch (mKind)
    {
        case kOnline: return Show::kOnline;
        case kAway:
        case kAutoAway:
            return Show::kAway;
        case kDnd: return Show::kDnd;
        default: return Show::kInvalid;
    }
}

Presence SelfPresenceMachine::status() const
{
    switch (mKind)
    {
        case kOnline: return Presence::kOnline;
        case kAway:
        case kAutoAway:
            return Presence::kAway;
        case kDnd: return Presence::kDnd;
        default: return Presence::kOffline;
    }
}

std::string SelfPresenceMachine::stateName() const
{
    if (mKind != kAutoAway)
        return kindToString(mKind);
    return std::string("autoAway(") + kindToString(mPreAutoAway) + ")";
}

std::optional<SelfPresenceMachine::Kind> SelfPresenceMachine::preAutoAwayState() const
{
    if (mKind != kAutoAway)
        return std::nullopt;
    return mPreAutoAway;
}
}
