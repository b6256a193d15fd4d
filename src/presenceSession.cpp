#include "presenceSession.h"

namespace xmpres
{
PresenceSession::PresenceSession(const AutoAwayConfig& config, Clock clock)
    : mMachine(config, clock), mContacts(clock)
{
    mMachine.setListener(this);
}

PresenceSession::~PresenceSession()
{
    mIdleMonitor.reset();
    mMachine.setListener(nullptr);
}

void PresenceSession::enableIdleMonitor(struct event_base* base, IIdleTimeSource& source, Clock clock)
{
    mIdleMonitor.reset(new IdleMonitor(base, mMachine, source, clock));
    if (mMachine.isConnected())
        mIdleMonitor->start();
}

void PresenceSession::onConnected()
{
    // A full login starts with an empty presence state
    applyPendingReset();
    mMachine.connect();
    if (mIdleMonitor)
        mIdleMonitor->start();
}

void PresenceSession::onDisconnected()
{
    if (mIdleMonitor)
        mIdleMonitor->stop();
    mMachine.disconnect();
}

void PresenceSession::onFullAuthRequired()
{
    SELFPRES_LOG_INFO("Session resumption failed, resetting contact presence");
    mContacts.resetAllPresence();
    mResetPending = true;
}

bool PresenceSession::applyPendingReset()
{
    if (!mResetPending)
        return false;
    mResetPending = false;
    mContacts.resetAllPresence();
    return true;
}

bool PresenceSession::onPresence(const std::string& fullJid, const ResourcePresence& presence)
{
    applyPendingReset();
    return mContacts.updatePresence(fullJid, presence);
}

bool PresenceSession::onUnavailable(const std::string& fullJid)
{
    applyPendingReset();
    return mContacts.removePresence(fullJid);
}

bool PresenceSession::onPresenceError(const std::string& bareJid, const std::string& condition)
{
    applyPendingReset();
    return mContacts.setPresenceError(bareJid, condition);
}

void PresenceSession::onSelfPresenceChange(const SelfPresenceMachine& machine)
{
    XP_CALL_LISTENER(xpLogChannel_presence, onSelfPresenceChange, machine);
}

void PresenceSession::onAutoAwayConfigChange(const AutoAwayConfig& config)
{
    if (mIdleMonitor && mMachine.isConnected())
        mIdleMonitor->applyConfig();
    XP_CALL_LISTENER(xpLogChannel_presence, onAutoAwayConfigChange, config);
}
}
