#include "presenceStanza.h"
#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

namespace xmpres
{
namespace strophe
{
const char* kNsIdle = "urn:xmpp:idle:1";
static const char* kNsStanzas = "urn:ietf:params:xml:ns:xmpp-stanzas";

static std::optional<std::string> childText(xmpp_stanza_t* stanza, const char* name)
{
    auto child = xmpp_stanza_get_child_by_name(stanza, name);
    if (!child)
        return std::nullopt;
    char* text = xmpp_stanza_get_text(child);
    if (!text)
        return std::string();
    std::string result(text);
    xmpp_free(xmpp_stanza_get_context(stanza), text);
    return result;
}

static void addTextChild(xmpp_ctx_t* ctx, xmpp_stanza_t* parent, const char* name, const std::string& value)
{
    auto child = xmpp_stanza_new(ctx);
    xmpp_stanza_set_name(child, name);
    auto text = xmpp_stanza_new(ctx);
    xmpp_stanza_set_text(text, value.c_str());
    xmpp_stanza_add_child(child, text);
    xmpp_stanza_release(text);
    xmpp_stanza_add_child(parent, child);
    xmpp_stanza_release(child);
}

std::optional<Timestamp> parseDateTime(const std::string& str)
{
    struct tm t;
    memset(&t, 0, sizeof(t));
    int consumed = 0;
    if (sscanf(str.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &t.tm_year, &t.tm_mon, &t.tm_mday,
               &t.tm_hour, &t.tm_min, &t.tm_sec, &consumed) != 6)
        return std::nullopt;
    t.tm_year -= 1900;
    t.tm_mon -= 1;
    const char* pos = str.c_str() + consumed;
    int64_t ms = 0;
    if (*pos == '.')
    {
        // keep millisecond precision, ignore the rest of the fraction
        int digits = 0;
        for (pos++; isdigit(static_cast<unsigned char>(*pos)); pos++, digits++)
        {
            if (digits < 3)
                ms = ms * 10 + (*pos - '0');
        }
        for (; digits < 3; digits++)
            ms *= 10;
    }
    int64_t offsetSec = 0;
    if (*pos == 'Z')
    {
        pos++;
    }
    else if (*pos == '+' || *pos == '-')
    {
        // exactly [+-]HH:MM, each check stops at the terminator
        if (!isdigit(static_cast<unsigned char>(pos[1])) || !isdigit(static_cast<unsigned char>(pos[2])) || pos[3] != ':'
         || !isdigit(static_cast<unsigned char>(pos[4])) || !isdigit(static_cast<unsigned char>(pos[5])))
            return std::nullopt;
        int hours = 0, minutes = 0, consumed = 0;
        if (sscanf(pos + 1, "%2d:%2d%n", &hours, &minutes, &consumed) != 2 || consumed != 5)
            return std::nullopt;
        offsetSec = (hours * 3600 + minutes * 60) * (*pos == '-' ? -1 : 1);
        pos += 1 + consumed;
    }
    else
    {
        return std::nullopt;
    }
    if (*pos)
        return std::nullopt;
    time_t secs = timegm(&t);
    if (secs == (time_t)-1)
        return std::nullopt;
    return (static_cast<int64_t>(secs) - offsetSec) * 1000 + ms;
}

std::string formatDateTime(Timestamp ts)
{
    time_t secs = static_cast<time_t>(ts / 1000);
    struct tm t;
    gmtime_r(&secs, &t);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &t);
    return buf;
}

PresenceEvent decodePresence(xmpp_stanza_t* stanza)
{
    PresenceEvent event;
    const char* name = xmpp_stanza_get_name(stanza);
    if (!name || strcmp(name, "presence"))
    {
        STROPHE_LOG_WARNING("decodePresence: not a presence stanza: <%s/>", name ? name : "(null)");
        return event;
    }
    const char* from = xmpp_stanza_get_from(stanza);
    if (!from)
    {
        STROPHE_LOG_WARNING("Received presence stanza without 'from' attribute");
        return event;
    }
    const char* type = xmpp_stanza_get_type(stanza);
    if (!type)
    {
        event.type = PresenceEvent::kAvailable;
        event.from = from;
        auto show = childText(stanza, "show");
        event.presence.show = show ? Show::fromString(*show) : Show(Show::kOnline);
        auto prio = childText(stanza, "priority");
        if (prio)
        {
            char* end = nullptr;
            long val = strtol(prio->c_str(), &end, 10);
            if (end != prio->c_str() && !*end && val >= -128 && val <= 127)
                event.presence.priority = static_cast<int>(val);
            else
                STROPHE_LOG_WARNING("Invalid priority '%s' from %s, using 0", prio->c_str(), from);
        }
        event.presence.statusMessage = childText(stanza, "status");
        auto idle = xmpp_stanza_get_child_by_name_and_ns(stanza, "idle", kNsIdle);
        if (idle)
        {
            const char* since = xmpp_stanza_get_attribute(idle, "since");
            if (since)
            {
                event.presence.lastInteraction = parseDateTime(since);
                if (!event.presence.lastInteraction)
                    STROPHE_LOG_WARNING("Can't parse idle 'since' value '%s' from %s", since, from);
            }
        }
    }
    else if (!strcmp(type, "unavailable"))
    {
        event.type = PresenceEvent::kUnavailable;
        event.from = from;
    }
    else if (!strcmp(type, "error"))
    {
        event.type = PresenceEvent::kError;
        event.from = jidToBare(from);
        auto error = xmpp_stanza_get_child_by_name(stanza, "error");
        for (auto child = error ? xmpp_stanza_get_children(error) : nullptr; child;
             child = xmpp_stanza_get_next(child))
        {
            if (!xmpp_stanza_is_tag(child))
                continue;
            const char* ns = xmpp_stanza_get_ns(child);
            if (ns && strcmp(ns, kNsStanzas))
                continue;
            event.errorCondition = xmpp_stanza_get_name(child);
            break;
        }
        if (event.errorCondition.empty())
            event.errorCondition = "undefined-condition";
    }
    else
    {
        STROPHE_LOG_DEBUG("Ignoring presence of type '%s' from %s", type, from);
    }
    return event;
}

xmpp_stanza_t* encodePresence(xmpp_ctx_t* ctx, const SelfPresenceMachine& machine, int priority)
{
    if (!machine.isConnected())
        return nullptr;
    auto pres = xmpp_presence_new(ctx);
    auto show = machine.wireShow();
    if (show != Show::kOnline)
        addTextChild(ctx, pres, "show", show.toString());
    if (!machine.statusMessage().empty())
        addTextChild(ctx, pres, "status", machine.statusMessage());
    addTextChild(ctx, pres, "priority", std::to_string(priority));
    if (machine.isAutoAway() && machine.idleSince())
    {
        auto idle = xmpp_stanza_new(ctx);
        xmpp_stanza_set_name(idle, "idle");
        xmpp_stanza_set_ns(idle, kNsIdle);
        xmpp_stanza_set_attribute(idle, "since", formatDateTime(*machine.idleSince()).c_str());
        xmpp_stanza_add_child(pres, idle);
        xmpp_stanza_release(idle);
    }
    return pres;
}

bool dispatchPresence(PresenceSession& session, xmpp_stanza_t* stanza)
{
    auto event = decodePresence(stanza);
    switch (event.type)
    {
        case PresenceEvent::kAvailable:
            return session.onPresence(event.from, event.presence);
        case PresenceEvent::kUnavailable:
            return session.onUnavailable(event.from);
        case PresenceEvent::kError:
            return session.onPresenceError(event.from, event.errorCondition);
        default:
            return false;
    }
}
}
}
