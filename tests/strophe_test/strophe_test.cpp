#include <gtest/gtest.h>
#include <string.h>
#include "strophe/presenceStanza.h"

using namespace xmpres;
using namespace xmpres::strophe;

class StanzaTest: public ::testing::Test
{
protected:
    xmpp_ctx_t* mCtx = nullptr;
    std::vector<xmpp_stanza_t*> mStanzas;
    void SetUp() override
    {
        xmpp_initialize();
        mCtx = xmpp_ctx_new(nullptr, nullptr);
        ASSERT_NE(mCtx, nullptr);
    }
    void TearDown() override
    {
        for (auto stanza: mStanzas)
            xmpp_stanza_release(stanza);
        xmpp_ctx_free(mCtx);
        xmpp_shutdown();
    }
    xmpp_stanza_t* parse(const char* xml)
    {
        auto stanza = xmpp_stanza_new_from_string(mCtx, xml);
        EXPECT_NE(stanza, nullptr) << xml;
        if (stanza)
            mStanzas.push_back(stanza);
        return stanza;
    }
    std::string childText(xmpp_stanza_t* stanza, const char* name)
    {
        auto child = xmpp_stanza_get_child_by_name(stanza, name);
        if (!child)
            return "<missing>";
        char* text = xmpp_stanza_get_text(child);
        std::string result(text ? text : "");
        if (text)
            xmpp_free(mCtx, text);
        return result;
    }
};

TEST(DateTime, Parse)
{
    EXPECT_EQ(parseDateTime("2024-05-01T12:00:00Z"), std::optional<Timestamp>(1714564800000));
    EXPECT_EQ(parseDateTime("2024-05-01T12:00:00.25Z"), std::optional<Timestamp>(1714564800250));
    EXPECT_EQ(parseDateTime("2024-05-01T12:00:00.123456Z"), std::optional<Timestamp>(1714564800123));
    EXPECT_EQ(parseDateTime("2024-05-01T14:00:00+02:00"), std::optional<Timestamp>(1714564800000));
    EXPECT_EQ(parseDateTime("2024-05-01T07:00:00-05:00"), std::optional<Timestamp>(1714564800000));
    EXPECT_FALSE(parseDateTime("2024-05-01T12:00:00").has_value());
    EXPECT_FALSE(parseDateTime("yesterday").has_value());
    EXPECT_FALSE(parseDateTime("2024-05-01T12:00:00Zjunk").has_value());
    // malformed offsets
    EXPECT_FALSE(parseDateTime("2024-05-01T12:00:00+1:2").has_value());
    EXPECT_FALSE(parseDateTime("2024-05-01T12:00:00+02").has_value());
    EXPECT_FALSE(parseDateTime("2024-05-01T12:00:00+02:0").has_value());
    EXPECT_FALSE(parseDateTime("2024-05-01T12:00:00-0200").has_value());
    EXPECT_FALSE(parseDateTime("2024-05-01T12:00:00+02:00:00").has_value());
}

TEST(DateTime, Format)
{
    EXPECT_EQ(formatDateTime(1714564800000), "2024-05-01T12:00:00Z");
    EXPECT_EQ(formatDateTime(1714564800999), "2024-05-01T12:00:00Z");
}

TEST_F(StanzaTest, DecodeAvailable)
{
    auto event = decodePresence(parse(
        "<presence from='alice@example.com/phone'>"
          "<show>dnd</show><priority>5</priority><status>In a meeting</status>"
          "<idle xmlns='urn:xmpp:idle:1' since='2024-05-01T12:00:00Z'/>"
        "</presence>"));
    EXPECT_EQ(event.type, PresenceEvent::kAvailable);
    EXPECT_EQ(event.from, "alice@example.com/phone");
    EXPECT_EQ(event.presence.show.code(), Show::kDnd);
    EXPECT_EQ(event.presence.priority, 5);
    EXPECT_EQ(event.presence.statusMessage, std::optional<std::string>("In a meeting"));
    EXPECT_EQ(event.presence.lastInteraction, std::optional<Timestamp>(1714564800000));
}

TEST_F(StanzaTest, DecodeDefaults)
{
    auto event = decodePresence(parse(
        "<presence from='bob@example.com/laptop'><priority>1000</priority>"
        "<idle xmlns='urn:xmpp:other' since='2024-05-01T12:00:00Z'/></presence>"));
    EXPECT_EQ(event.type, PresenceEvent::kAvailable);
    EXPECT_EQ(event.presence.show.code(), Show::kOnline);
    EXPECT_EQ(event.presence.priority, 0);
    EXPECT_FALSE(event.presence.statusMessage.has_value());
    EXPECT_FALSE(event.presence.lastInteraction.has_value());
}

TEST_F(StanzaTest, DecodeUnavailableAndError)
{
    auto unavail = decodePresence(parse("<presence from='bob@example.com/laptop' type='unavailable'/>"));
    EXPECT_EQ(unavail.type, PresenceEvent::kUnavailable);
    EXPECT_EQ(unavail.from, "bob@example.com/laptop");

    auto error = decodePresence(parse(
        "<presence from='bob@example.com/laptop' type='error'><error type='cancel'>"
          "<remote-server-not-found xmlns='urn:ietf:params:xml:ns:xmpp-stanzas'/>"
        "</error></presence>"));
    EXPECT_EQ(error.type, PresenceEvent::kError);
    EXPECT_EQ(error.from, "bob@example.com");
    EXPECT_EQ(error.errorCondition, "remote-server-not-found");

    auto bare = decodePresence(parse("<presence from='bob@example.com' type='error'/>"));
    EXPECT_EQ(bare.errorCondition, "undefined-condition");
}

TEST_F(StanzaTest, SubscriptionStanzasAreIgnored)
{
    EXPECT_EQ(decodePresence(parse("<presence from='eve@example.com' type='subscribe'/>")).type,
              PresenceEvent::kNone);
    EXPECT_EQ(decodePresence(parse("<presence><show>away</show></presence>")).type,
              PresenceEvent::kNone);
    EXPECT_EQ(decodePresence(parse("<message from='eve@example.com'/>")).type,
              PresenceEvent::kNone);
}

TEST_F(StanzaTest, EncodeFollowsSelfPresence)
{
    Timestamp now = 1714564800000;
    SelfPresenceMachine machine(AutoAwayConfig(), [&now]() { return now; });
    EXPECT_EQ(encodePresence(mCtx, machine), nullptr);

    machine.connect();
    auto online = encodePresence(mCtx, machine, 3);
    ASSERT_NE(online, nullptr);
    mStanzas.push_back(online);
    EXPECT_STREQ(xmpp_stanza_get_name(online), "presence");
    EXPECT_EQ(childText(online, "show"), "<missing>");
    EXPECT_EQ(childText(online, "status"), "<missing>");
    EXPECT_EQ(childText(online, "priority"), "3");

    machine.setPresence(SelfPresenceMachine::kDnd, "Busy");
    auto dnd = encodePresence(mCtx, machine);
    mStanzas.push_back(dnd);
    EXPECT_EQ(childText(dnd, "show"), "dnd");
    EXPECT_EQ(childText(dnd, "status"), "Busy");
    EXPECT_EQ(xmpp_stanza_get_child_by_name(dnd, "idle"), nullptr);

    machine.setPresence(SelfPresenceMachine::kOnline, "");
    machine.idleDetected(now - 5 * 60 * 1000);
    auto away = encodePresence(mCtx, machine);
    mStanzas.push_back(away);
    EXPECT_EQ(childText(away, "show"), "away");
    auto idle = xmpp_stanza_get_child_by_name_and_ns(away, "idle", kNsIdle);
    ASSERT_NE(idle, nullptr);
    EXPECT_STREQ(xmpp_stanza_get_attribute(idle, "since"), "2024-05-01T11:55:00Z");
}

TEST_F(StanzaTest, DispatchRoutesToSession)
{
    PresenceSession session(AutoAwayConfig(), []() { return Timestamp(1714564800000); });
    session.contacts().setContacts({RosterItem("alice@example.com")});
    session.onConnected();

    EXPECT_TRUE(dispatchPresence(session, parse("<presence from='alice@example.com/r'><show>xa</show></presence>")));
    EXPECT_EQ(session.contacts().contact("alice@example.com")->presence().code(), Presence::kAway);
    EXPECT_FALSE(dispatchPresence(session, parse("<presence from='alice@example.com' type='subscribe'/>")));
    EXPECT_FALSE(dispatchPresence(session, parse("<presence from='mallory@example.com/x'/>")));
    EXPECT_TRUE(dispatchPresence(session, parse("<presence from='alice@example.com/r' type='unavailable'/>")));
    EXPECT_FALSE(session.contacts().contact("alice@example.com")->isOnline());
}
