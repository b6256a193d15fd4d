#include "presence.h"

namespace xmpres
{
Show Show::fromString(const std::string& text)
{
    if (text.empty())
        return kOnline;
    if (text == "chat")
        return kChat;
    if (text == "away")
        return kAway;
    if (text == "xa")
        return kXa;
    if (text == "dnd")
        return kDnd;
    return kUnknown;
}

const char* Presence::label() const
{
    switch (mPres)
    {
        case kOnline: return "Online";
        case kAway: return "Away";
        case kDnd: return "Do not disturb";
        case kOffline: return "Offline";
        default: return "Unknown";
    }
}

namespace ranking
{
int rank(Show show)
{
    switch (show.code())
    {
        case Show::kChat: return 0;
        case Show::kOnline: return 1;
        case Show::kAway: return 2;
        case Show::kXa: return 3;
        case Show::kDnd: return 4;
        default: return 5;
    }
}

Show bestOf(const std::vector<Show>& shows)
{
    Show best(Show::kInvalid);
    int bestRank = 0;
    for (auto show: shows)
    {
        int r = rank(show);
        if (!best.isValid() || r < bestRank)
        {
            best = show;
            bestRank = r;
        }
    }
    return best;
}

Presence toStatus(Show show)
{
    switch (show.code())
    {
        case Show::kAway:
        case Show::kXa:
            return Presence::kAway;
        case Show::kDnd:
            return Presence::kDnd;
        default:
            return Presence::kOnline;
    }
}
}
}
