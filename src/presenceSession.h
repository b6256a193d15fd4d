#ifndef XMPRES_PRESENCESESSION_H
#define XMPRES_PRESENCESESSION_H

#include <memory>
#include "selfPresence.h"
#include "contactList.h"
#include "idleMonitor.h"

namespace xmpres
{
/** @brief Entry point of the transport layer into the presence subsystem.
 *
 * Owns the self presence machine and the contact list, and routes connection
 * lifecycle and inbound presence events to them. When the server could not
 * resume the previous session, all contact presence is stale: a reset is
 * armed, and applied before any presence of the new session is processed.
 */
class PresenceSession: public SelfPresenceMachine::Listener
{
protected:
    SelfPresenceMachine mMachine;
    ContactList mContacts;
    std::unique_ptr<IdleMonitor> mIdleMonitor;
    SelfPresenceMachine::Listener* mListener = nullptr;
    bool mResetPending = false;
    bool applyPendingReset();
    //SelfPresenceMachine::Listener
    void onSelfPresenceChange(const SelfPresenceMachine& machine) override;
    void onAutoAwayConfigChange(const AutoAwayConfig& config) override;

public:
    explicit PresenceSession(const AutoAwayConfig& config=AutoAwayConfig::fromEnv(),
                             Clock clock=Clock());
    ~PresenceSession();
    PresenceSession(const PresenceSession&) = delete;
    PresenceSession& operator=(const PresenceSession&) = delete;

    SelfPresenceMachine& self() { return mMachine; }
    const SelfPresenceMachine& self() const { return mMachine; }
    ContactList& contacts() { return mContacts; }
    const ContactList& contacts() const { return mContacts; }

    /** Receives the self presence notifications of the machine */
    void setSelfListener(SelfPresenceMachine::Listener* listener) { mListener = listener; }

    /** @brief Enables idle detection, polling \c source on \c base's loop
     * while connected */
    void enableIdleMonitor(struct event_base* base, IIdleTimeSource& source,
                           Clock clock=Clock());
    IdleMonitor* idleMonitor() { return mIdleMonitor.get(); }

    /** @name Connection lifecycle */
    ///@{
    void onConnected();
    void onDisconnected();
    /** The stream could not be resumed and a full login is needed.
     * Contact presence is reset right away, and once more before the next
     * presence or connect, so that stanzas of the dead stream don't linger */
    void onFullAuthRequired();
    bool isResetPending() const { return mResetPending; }
    ///@}

    /** @name Inbound presence
     * Return \c false if the contact is not in the roster */
    ///@{
    bool onPresence(const std::string& fullJid, const ResourcePresence& presence);
    bool onUnavailable(const std::string& fullJid);
    bool onPresenceError(const std::string& bareJid, const std::string& condition);
    ///@}
};
}
#endif
