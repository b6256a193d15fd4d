#ifndef XMPRES_LASTSEEN_H
#define XMPRES_LASTSEEN_H

#include <optional>
#include <string>
#include "contactList.h"

namespace xmpres
{
struct LastSeenInfo
{
    /** i.e. "Active now", "idle 15m", "Last seen 2h ago" */
    std::string text;
    /** Online and not idle */
    bool isActive = false;
    /** Set if the contact is online but idle */
    std::optional<int64_t> idleDurationMs;
    /** Set if the contact is offline and its last-seen time is known */
    std::optional<int64_t> lastSeenDurationMs;
};

/** "just now", "5m ago", "3h ago", "yesterday", "4d ago", "2w ago" */
std::string formatDuration(int64_t ms);

/** "active", "idle 5m", "idle 3h", "idle 2d" */
std::string formatIdleDuration(int64_t ms);

LastSeenInfo getLastSeenInfo(const Contact& contact, Timestamp now);
inline LastSeenInfo getLastSeenInfo(const Contact& contact) { return getLastSeenInfo(contact, timestampMs()); }

/** "Online", "Away", "Do not disturb" or "Offline" */
inline const char* getPresenceLabel(Presence presence) { return presence.label(); }

/** @brief Status line for tooltips.
 * "Online · Active", "Away · idle 15m" for online contacts,
 * "Last seen 2h ago" or "Offline" for offline ones */
std::string getStatusText(const Contact& contact, Timestamp now);
inline std::string getStatusText(const Contact& contact) { return getStatusText(contact, timestampMs()); }
}
#endif
