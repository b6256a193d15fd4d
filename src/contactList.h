#ifndef XMPRES_CONTACTLIST_H
#define XMPRES_CONTACTLIST_H

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "xmpresCommon.h"
#include "presence.h"

#define ROSTER_LOG_DEBUG(fmtString,...) XMPRES_LOG_DEBUG(xpLogChannel_roster, fmtString, ##__VA_ARGS__)
#define ROSTER_LOG_VERBOSE(fmtString,...) XMPRES_LOG_VERBOSE(xpLogChannel_roster, fmtString, ##__VA_ARGS__)
#define ROSTER_LOG_INFO(fmtString,...) XMPRES_LOG_INFO(xpLogChannel_roster, fmtString, ##__VA_ARGS__)
#define ROSTER_LOG_WARNING(fmtString,...) XMPRES_LOG_WARNING(xpLogChannel_roster, fmtString, ##__VA_ARGS__)
#define ROSTER_LOG_ERROR(fmtString,...) XMPRES_LOG_ERROR(xpLogChannel_roster, fmtString, ##__VA_ARGS__)

namespace xmpres
{
/** The presence of one connected device (resource) of a contact */
struct ResourcePresence
{
    Show show;
    int priority = 0;
    std::optional<std::string> statusMessage;
    /** XEP-0319 idle 'since' */
    std::optional<Timestamp> lastInteraction;

    ResourcePresence(Show aShow=Show::kOnline, int aPriority=0,
                     std::optional<std::string> aStatus=std::nullopt,
                     std::optional<Timestamp> aLastInteraction=std::nullopt)
        : show(aShow), priority(aPriority), statusMessage(std::move(aStatus)),
          lastInteraction(aLastInteraction)
    {}
};

/** Resources by resource id */
typedef std::map<std::string, ResourcePresence> ResourceMap;

struct AggregatedPresence
{
    Presence presence = Presence::kOffline;
    std::optional<std::string> statusMessage;
    std::optional<Timestamp> lastInteraction;
};

/** @brief Merges the presences of all connected resources of a contact.
 *
 * The resource with the highest priority wins. Among resources sharing the top
 * priority, the most available show wins, and among equally available ones the
 * first (in resource id order). No resources means offline.
 */
AggregatedPresence aggregatePresence(const ResourceMap& resources);

/** Roster data of a contact, as received from the server */
struct RosterItem
{
    enum Subscription: uint8_t
    {
        kSubNone = 0,
        kSubTo,
        kSubFrom,
        kSubBoth
    };
    std::string jid;
    std::string name;
    Subscription subscription = kSubNone;
    std::vector<std::string> groups;

    RosterItem(const std::string& aJid, const std::string& aName=std::string(),
               Subscription aSub=kSubNone, std::vector<std::string> aGroups={})
        : jid(aJid), name(aName), subscription(aSub), groups(std::move(aGroups))
    {}
    static const char* subscriptionToString(Subscription sub);
    /** Unknown strings map to kSubNone */
    static Subscription subscriptionFromString(const std::string& str);
};

class Contact
{
protected:
    std::string mJid;
    std::string mName;
    RosterItem::Subscription mSubscription = RosterItem::kSubNone;
    std::vector<std::string> mGroups;
    Presence mPresence = Presence::kOffline;
    std::optional<std::string> mStatusMessage;
    ResourceMap mResources;
    std::optional<std::string> mPresenceError;
    std::optional<Timestamp> mLastSeen;
    std::optional<Timestamp> mLastInteraction;
    std::string mColorLight;
    std::string mColorDark;
    void updateRosterData(const RosterItem& item);
    /** Recomputes the aggregated fields from mResources. Returns true if any of
     * them changed */
    bool recalculate();
    friend class ContactList;

public:
    explicit Contact(const RosterItem& item);
    const std::string& jid() const { return mJid; }
    const std::string& name() const { return mName; }
    /** The name, or the JID if the contact has no name */
    const std::string& displayName() const { return mName.empty() ? mJid : mName; }
    RosterItem::Subscription subscription() const { return mSubscription; }
    const std::vector<std::string>& groups() const { return mGroups; }
    Presence presence() const { return mPresence; }
    bool isOnline() const { return mPresence != Presence::kOffline; }
    const std::optional<std::string>& statusMessage() const { return mStatusMessage; }
    const ResourceMap& resources() const { return mResources; }
    const std::optional<std::string>& presenceError() const { return mPresenceError; }
    const std::optional<Timestamp>& lastSeen() const { return mLastSeen; }
    const std::optional<Timestamp>& lastInteraction() const { return mLastInteraction; }
    const std::string& colorLight() const { return mColorLight; }
    const std::string& colorDark() const { return mColorDark; }
};

/** @brief The roster, and the aggregated presence of every contact in it.
 *
 * Contacts are keyed by bare JID. Presence updates are applied synchronously,
 * in arrival order, and recompute the contact's presence right away.
 */
class ContactList: protected std::map<std::string, std::shared_ptr<Contact>>
{
public:
    class Listener
    {
    public:
        virtual void onContactPresenceChange(const Contact& contact) = 0;
        /** A contact was added or its roster data changed */
        virtual void onContactUpdate(const Contact& /*contact*/) {}
        virtual void onContactRemove(const std::string& /*jid*/) {}
        virtual ~Listener() {}
    };

protected:
    typedef std::map<std::string, std::shared_ptr<Contact>> Base;
    Listener* mListener = nullptr;
    Clock mClock;
    Contact* findByAddress(const std::string& fullJid, const char* opName, std::string& resource);
    void notifyPresenceChange(const Contact& contact);

public:
    explicit ContactList(Clock clock=Clock());
    void setListener(Listener* listener) { mListener = listener; }

    /** @name Presence */
    ///@{
    /** @brief Inserts or replaces the presence of the resource \c fullJid and
     * clears any presence error of the contact.
     * @returns \c false if the contact is not in the roster, in which case the
     * presence is ignored
     */
    bool updatePresence(const std::string& fullJid, const ResourcePresence& presence);
    bool updatePresence(const std::string& fullJid, Show show, int priority,
                        std::optional<std::string> status=std::nullopt)
    {
        return updatePresence(fullJid, ResourcePresence(show, priority, std::move(status)));
    }

    /** @brief Removes the resource \c fullJid. When no resources are left the
     * contact goes offline and its lastSeen is set to now.
     * @returns \c false if the contact is not in the roster
     */
    bool removePresence(const std::string& fullJid);

    /** @brief Marks the contact offline with an error condition, dropping all of
     * its resources */
    bool setPresenceError(const std::string& bareJid, const std::string& condition);

    /** @brief Marks every contact offline, dropping resources, status messages
     * and errors. Used when the server session could not be resumed and all
     * presence must be received again */
    void resetAllPresence();
    ///@}

    /** @name Roster */
    ///@{
    /** Replaces the whole roster. Contacts that are kept preserve their
     * presence and colors */
    void setContacts(const std::vector<RosterItem>& items);
    /** Adds a contact or updates its name, subscription and groups */
    const Contact& addOrUpdateContact(const RosterItem& item);
    bool removeContact(const std::string& jid);
    /** Removes all contacts */
    void reset();
    ///@}

    /** @name Queries
     * The returned pointers are valid until the contact is removed */
    ///@{
    const Contact* contact(const std::string& jid) const;
    /** Contacts that are not offline, dnd included */
    std::vector<const Contact*> onlineContacts() const;
    std::vector<const Contact*> offlineContacts() const;
    /** All contacts ordered by presence (online, away, dnd, offline), then
     * by display name */
    std::vector<const Contact*> sortedContacts() const;
    ///@}
    using Base::size;
    using Base::empty;
};
}
#endif
