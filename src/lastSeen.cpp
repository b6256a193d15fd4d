#include "lastSeen.h"

namespace xmpres
{
enum: int64_t
{
    kMinuteMs = 60 * 1000,
    kHourMs = 60 * kMinuteMs,
    kDayMs = 24 * kHourMs,
    kWeekMs = 7 * kDayMs
};

std::string formatDuration(int64_t ms)
{
    if (ms < kMinuteMs)
        return "just now";
    if (ms < kHourMs)
        return std::to_string(ms / kMinuteMs) + "m ago";
    if (ms < kDayMs)
        return std::to_string(ms / kHourMs) + "h ago";
    int64_t days = ms / kDayMs;
    if (days == 1)
        return "yesterday";
    if (days < 7)
        return std::to_string(days) + "d ago";
    return std::to_string(ms / kWeekMs) + "w ago";
}

std::string formatIdleDuration(int64_t ms)
{
    if (ms < kMinuteMs)
        return "active";
    if (ms < kHourMs)
        return "idle " + std::to_string(ms / kMinuteMs) + "m";
    if (ms < kDayMs)
        return "idle " + std::to_string(ms / kHourMs) + "h";
    return "idle " + std::to_string(ms / kDayMs) + "d";
}

LastSeenInfo getLastSeenInfo(const Contact& contact, Timestamp now)
{
    LastSeenInfo info;
    if (contact.isOnline())
    {
        auto& since = contact.lastInteraction();
        int64_t idle = since ? now - *since : 0;
        if (idle < kMinuteMs)
        {
            // no idle info means the contact is using the device
            info.text = "Active now";
            info.isActive = true;
            return info;
        }
        info.text = formatIdleDuration(idle);
        info.idleDurationMs = idle;
        return info;
    }
    if (contact.lastSeen())
    {
        int64_t ago = now - *contact.lastSeen();
        info.text = "Last seen " + formatDuration(ago);
        info.lastSeenDurationMs = ago;
        return info;
    }
    info.text = "Offline";
    return info;
}

std::string getStatusText(const Contact& contact, Timestamp now)
{
    auto info = getLastSeenInfo(contact, now);
    if (!contact.isOnline())
        return info.text;

    std::string result = getPresenceLabel(contact.presence());
    result.append(" \xC2\xB7 ");
    result.append(info.isActive ? "Active" : info.text);
    return result;
}
}
