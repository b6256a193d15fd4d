#include "contactList.h"
#include <algorithm>
#include <strings.h>
#include "contactColor.h"

namespace xmpres
{
AggregatedPresence aggregatePresence(const ResourceMap& resources)
{
    AggregatedPresence result;
    if (resources.empty())
        return result;

    int topPriority = resources.begin()->second.priority;
    for (auto& item: resources)
    {
        if (item.second.priority > topPriority)
            topPriority = item.second.priority;
    }
    const ResourcePresence* winner = nullptr;
    std::vector<Show> shows;
    for (auto& item: resources)
    {
        if (item.second.priority == topPriority)
            shows.push_back(item.second.show);
    }
    Show best = ranking::bestOf(shows);
    for (auto& item: resources)
    {
        if (item.second.priority == topPriority && item.second.show == best)
        {
            winner = &item.second;
            break;
        }
    }
    result.presence = ranking::toStatus(winner->show);
    result.statusMessage = winner->statusMessage;
    result.lastInteraction = winner->lastInteraction;
    return result;
}

const char* RosterItem::subscriptionToString(Subscription sub)
{
    switch (sub)
    {
        case kSubNone: return "none";
        case kSubTo: return "to";
        case kSubFrom: return "from";
        case kSubBoth: return "both";
        default: return "(invalid)";
    }
}

RosterItem::Subscription RosterItem::subscriptionFromString(const std::string& str)
{
    if (str == "to")
        return kSubTo;
    if (str == "from")
        return kSubFrom;
    if (str == "both")
        return kSubBoth;
    return kSubNone;
}

Contact::Contact(const RosterItem& item)
    : mJid(item.jid)
{
    updateRosterData(item);
    auto colors = ContactColorAssigner::assign(mJid);
    mColorLight = colors.light;
    mColorDark = colors.dark;
}

void Contact::updateRosterData(const RosterItem& item)
{
    mName = item.name;
    mSubscription = item.subscription;
    mGroups = item.groups;
}

bool Contact::recalculate()
{
    auto aggr = aggregatePresence(mResources);
    bool changed = (aggr.presence != mPresence)
                || (aggr.statusMessage != mStatusMessage)
                || (aggr.lastInteraction != mLastInteraction);
    mPresence = aggr.presence;
    mStatusMessage = std::move(aggr.statusMessage);
    mLastInteraction = aggr.lastInteraction;
    return changed;
}

ContactList::ContactList(Clock clock)
    : mClock(clock ? clock : Clock(timestampMs))
{}

Contact* ContactList::findByAddress(const std::string& fullJid, const char* opName, std::string& resource)
{
    auto bareJid = jidToBare(fullJid);
    auto it = find(bareJid);
    if (it == end())
    {
        ROSTER_LOG_DEBUG("%s: '%s' is not in the roster, ignoring", opName, bareJid.c_str());
        return nullptr;
    }
    resource = jidToResource(fullJid);
    return it->second.get();
}

void ContactList::notifyPresenceChange(const Contact& contact)
{
    ROSTER_LOG_VERBOSE("%s is now %s (%zu resource(s))", contact.jid().c_str(),
        contact.presence().toString(), contact.resources().size());
    XP_CALL_LISTENER(xpLogChannel_roster, onContactPresenceChange, contact);
}

bool ContactList::updatePresence(const std::string& fullJid, const ResourcePresence& presence)
{
    std::string resource;
    auto contact = findByAddress(fullJid, "updatePresence", resource);
    if (!contact)
        return false;

    contact->mResources[resource] = presence;
    contact->mPresenceError.reset();
    contact->recalculate();
    notifyPresenceChange(*contact);
    return true;
}

bool ContactList::removePresence(const std::string& fullJid)
{
    std::string resource;
    auto contact = findByAddress(fullJid, "removePresence", resource);
    if (!contact)
        return false;

    // only an actual online to offline transition counts as last seen.
    // Probe replies for contacts that never came online change nothing
    bool removed = contact->mResources.erase(resource) > 0;
    contact->recalculate();
    if (removed && contact->mResources.empty())
        contact->mLastSeen = mClock();
    notifyPresenceChange(*contact);
    return true;
}

bool ContactList::setPresenceError(const std::string& bareJid, const std::string& condition)
{
    std::string resource;
    auto contact = findByAddress(bareJid, "setPresenceError", resource);
    if (!contact)
        return false;

    bool changed = (contact->mPresenceError != condition) || !contact->mResources.empty();
    ROSTER_LOG_DEBUG("Presence error '%s' from %s", condition.c_str(), contact->jid().c_str());
    contact->mPresenceError = condition;
    contact->mResources.clear();
    changed |= contact->recalculate();
    if (changed)
        notifyPresenceChange(*contact);
    return true;
}

void ContactList::resetAllPresence()
{
    ROSTER_LOG_INFO("Resetting presence of all %zu contacts", size());
    for (auto& item: *this)
    {
        auto& contact = *item.second;
        bool changed = !contact.mResources.empty() || contact.mPresenceError;
        contact.mResources.clear();
        contact.mPresenceError.reset();
        changed |= contact.recalculate();
        if (changed)
            notifyPresenceChange(contact);
    }
}

void ContactList::setContacts(const std::vector<RosterItem>& items)
{
    std::map<std::string, const RosterItem*> byJid;
    for (auto& item: items)
    {
        XP_CHECK_EMPTYARG(item.jid);
        byJid[jidToBare(item.jid)] = &item;
    }
    for (auto it = begin(); it != end();)
    {
        if (byJid.find(it->first) != byJid.end())
        {
            ++it;
            continue;
        }
        auto jid = it->first;
        it = erase(it);
        XP_CALL_LISTENER(xpLogChannel_roster, onContactRemove, jid);
    }
    for (auto& item: items)
        addOrUpdateContact(item);
    ROSTER_LOG_INFO("Roster set, %zu contacts", size());
}

const Contact& ContactList::addOrUpdateContact(const RosterItem& item)
{
    XP_CHECK_EMPTYARG(item.jid);
    auto bareJid = jidToBare(item.jid);
    auto it = find(bareJid);
    if (it == end())
    {
        RosterItem bareItem(item);
        bareItem.jid = bareJid;
        it = emplace(bareJid, std::make_shared<Contact>(bareItem)).first;
        ROSTER_LOG_DEBUG("Added contact %s", bareJid.c_str());
    }
    else
    {
        it->second->updateRosterData(item);
    }
    auto& contact = *it->second;
    XP_CALL_LISTENER(xpLogChannel_roster, onContactUpdate, contact);
    return contact;
}

bool ContactList::removeContact(const std::string& jid)
{
    XP_CHECK_EMPTYARG(jid);
    auto it = find(jidToBare(jid));
    if (it == end())
        return false;
    auto bareJid = it->first;
    erase(it);
    ROSTER_LOG_DEBUG("Removed contact %s", bareJid.c_str());
    XP_CALL_LISTENER(xpLogChannel_roster, onContactRemove, bareJid);
    return true;
}

void ContactList::reset()
{
    std::vector<std::string> jids;
    for (auto& item: *this)
        jids.push_back(item.first);
    clear();
    for (auto& jid: jids)
        XP_CALL_LISTENER(xpLogChannel_roster, onContactRemove, jid);
}

const Contact* ContactList::contact(const std::string& jid) const
{
    auto it = find(jidToBare(jid));
    return (it == end()) ? nullptr : it->second.get();
}

std::vector<const Contact*> ContactList::onlineContacts() const
{
    std::vector<const Contact*> result;
    for (auto& item: *this)
    {
        if (item.second->isOnline())
            result.push_back(item.second.get());
    }
    return result;
}

std::vector<const Contact*> ContactList::offlineContacts() const
{
    std::vector<const Contact*> result;
    for (auto& item: *this)
    {
        if (!item.second->isOnline())
            result.push_back(item.second.get());
    }
    return result;
}

std::vector<const Contact*> ContactList::sortedContacts() const
{
    std::vector<const Contact*> result;
    result.reserve(size());
    for (auto& item: *this)
        result.push_back(item.second.get());

    std::stable_sort(result.begin(), result.end(), [](const Contact* a, const Contact* b)
    {
        if (a->presence() != b->presence())
            return a->presence().code() < b->presence().code();
        return strcasecmp(a->displayName().c_str(), b->displayName().c_str()) < 0;
    });
    return result;
}
}
