#ifndef XMPRES_PRESENCE_H
#define XMPRES_PRESENCE_H

#include <stdint.h>
#include <string>
#include <vector>

namespace xmpres
{
/** The XMPP <show/> sub-state of an available presence. Plain "available"
 * (no <show/> element) is represented by kOnline. Codes are ordered from
 * most to least available */
class Show
{
public:
    typedef uint8_t Code;
    enum: Code
    {
        kChat = 0,
        kOnline = 1,
        kAway = 2,
        kXa = 3,
        kDnd = 4,
        kUnknown = 5,   // a <show/> value we don't recognize
        kInvalid = 0xff // no value at all
    };

    Show(Code code = kOnline): mCode(code) {}
    Code code() const { return mCode; }
    operator Code() const { return mCode; }
    bool isValid() const { return mCode != kInvalid; }

    /** Maps the text of a <show/> element. An empty string means plain online,
     * anything unrecognized maps to kUnknown */
    static Show fromString(const std::string& text);

    /** The <show/> text to put on the wire. Empty for plain online */
    const char* toString() const { return toString(mCode); }
    static inline const char* toString(Code code);

protected:
    Code mCode;
};

/** The simplified, aggregated status shown in the UI */
class Presence
{
public:
    typedef uint8_t Code;
    enum: Code
    {
        kOnline = 0,
        kAway = 1,
        kDnd = 2,
        kOffline = 3,
        kLast = kOffline,
        kInvalid = 0xff
    };

    Presence(Code pres = kInvalid): mPres(pres) {}
    Code code() const { return mPres; }
    operator Code() const { return mPres; }
    bool isValid() const { return mPres != kInvalid; }
    const char* toString() const { return toString(mPres); }
    static inline const char* toString(Code pres);

    /** Human readable label, i.e. "Do not disturb" */
    const char* label() const;

protected:
    Code mPres;
};

inline const char* Show::toString(Code code)
{
    switch (code)
    {
        case kChat: return "chat";
        case kOnline: return "";
        case kAway: return "away";
        case kXa: return "xa";
        case kDnd: return "dnd";
        case kUnknown: return "(unknown)";
        default: return "(invalid)";
    }
}

inline const char* Presence::toString(Code pres)
{
    switch (pres)
    {
        case kOnline: return "online";
        case kAway: return "away";
        case kDnd: return "dnd";
        case kOffline: return "offline";
        default: return "(invalid)";
    }
}

/** Ranking of show values. This ordering is the single source of truth for
 * every availability tie-break */
namespace ranking
{
/** chat=0, online=1, away=2, xa=3, dnd=4, anything else 5. Lower is more available */
int rank(Show show);

/** @brief Returns the most available show value of the list.
 * Ties keep the first occurrence. An empty list yields an invalid Show */
Show bestOf(const std::vector<Show>& shows);

/** @brief Maps a show value to the UI status.
 * Never returns kOffline: offline is derived from the absence of resources */
Presence toStatus(Show show);
}
}
#endif
