#ifndef XMPRES_STROPHE_PRESENCESTANZA_H
#define XMPRES_STROPHE_PRESENCESTANZA_H

#include <optional>
#include <string>
#include <strophe.h>
#include "../presenceSession.h"

#define STROPHE_LOG_DEBUG(fmtString,...) XMPRES_LOG_DEBUG(xpLogChannel_strophe, fmtString, ##__VA_ARGS__)
#define STROPHE_LOG_INFO(fmtString,...) XMPRES_LOG_INFO(xpLogChannel_strophe, fmtString, ##__VA_ARGS__)
#define STROPHE_LOG_WARNING(fmtString,...) XMPRES_LOG_WARNING(xpLogChannel_strophe, fmtString, ##__VA_ARGS__)
#define STROPHE_LOG_ERROR(fmtString,...) XMPRES_LOG_ERROR(xpLogChannel_strophe, fmtString, ##__VA_ARGS__)

namespace xmpres
{
namespace strophe
{
/** XEP-0319 Last User Interaction in Presence */
extern const char* kNsIdle;

/** A <presence/> stanza, decoded into a presence state event */
struct PresenceEvent
{
    enum Type: uint8_t
    {
        kNone = 0,      // not a presence state stanza (subscribe, probe...) or malformed
        kAvailable,
        kUnavailable,
        kError
    };
    Type type = kNone;
    /** The sender. A bare JID for kError */
    std::string from;
    /** kAvailable only */
    ResourcePresence presence;
    /** kError only: the defined condition, i.e. "recipient-unavailable" */
    std::string errorCondition;
};

/** Parses an XEP-0082 date-time, i.e. "2024-05-01T12:00:00.123Z" or
 * "2024-05-01T14:00:00+02:00" */
std::optional<Timestamp> parseDateTime(const std::string& str);
/** Formats a timestamp as an XEP-0082 UTC date-time, "2024-05-01T12:00:00Z" */
std::string formatDateTime(Timestamp ts);

PresenceEvent decodePresence(xmpp_stanza_t* stanza);

/** @brief Builds our outbound presence from the machine's state. The caller
 * owns the returned stanza and must release it.
 * @returns \c nullptr while disconnected
 */
xmpp_stanza_t* encodePresence(xmpp_ctx_t* ctx, const SelfPresenceMachine& machine, int priority=0);

/** Decodes \c stanza and routes it to \c session.
 * @returns \c true if the stanza changed the presence of a roster contact */
bool dispatchPresence(PresenceSession& session, xmpp_stanza_t* stanza);
}
}
#endif
