// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include <boost/test/unit_test.hpp>
#include "event-bus/event-bus.h"
#include "event-bus/presence.h"

namespace {
    struct Recorder {
        std::vector<std::pair<std::string, GameEvent>> events{};
        EventHandler handler() {
            return [this](const std::string& topic, const GameEvent& event) {
                events.emplace_back(topic, event);
            };
        }
    };
}


BOOST_AUTO_TEST_SUITE(event_bus)

    BOOST_AUTO_TEST_CASE(should_build_topics) {
        BOOST_CHECK_EQUAL(gameTopic(GameId{42}), "game:42");
        BOOST_CHECK_EQUAL(hostTopic(GameId{42}), "game:42:host");
        BOOST_CHECK_EQUAL(playersTopic(GameId{42}), "game:42:players");
        BOOST_CHECK(parseGameTopic("game:42:host") == GameId{42});
        BOOST_CHECK(parseGameTopic("game:7") == GameId{7});
        BOOST_CHECK(!parseGameTopic("active_games"));
        BOOST_CHECK(!parseGameTopic("game:x:host"));
    }

    BOOST_AUTO_TEST_CASE(should_deliver_on_subscriber_strand) {
        auto strand = std::make_shared<Strand_Manual>();
        EventBus bus{};
        Recorder recorder{};
        bool onStrand = true;
        bus.subscribe("game:1", strand, [&](const std::string& topic, const GameEvent& event) {
            onStrand = onStrand && strand->isCurrent();
            recorder.events.emplace_back(topic, event);
        });

        bus.publish("game:1", GameEvent::keywordRevealed(GameId{1}, RoundId{2}, 1, 0));
        bus.publish("game:2", GameEvent::roundTimeout(GameId{2}, RoundId{3}));
        BOOST_CHECK(recorder.events.empty());

        strand->runUntilDone();
        BOOST_REQUIRE_EQUAL(recorder.events.size(), 1u);
        BOOST_CHECK(onStrand);
        BOOST_CHECK_EQUAL(recorder.events[0].first, "game:1");
        BOOST_CHECK(recorder.events[0].second.type == GameEventType::KeywordRevealed);
        BOOST_CHECK(recorder.events[0].second.roundId == RoundId{2});
    }

    BOOST_AUTO_TEST_CASE(should_keep_publish_order) {
        auto strand = std::make_shared<Strand_Manual>();
        EventBus bus{};
        Recorder recorder{};
        bus.subscribe("game:1", strand, recorder.handler());
        for (int i = 0; i < 5; ++i) {
            bus.publish("game:1", GameEvent::keywordRevealed(GameId{1}, RoundId{1}, i, i));
        }
        strand->runUntilDone();
        BOOST_REQUIRE_EQUAL(recorder.events.size(), 5u);
        for (int i = 0; i < 5; ++i) {
            BOOST_CHECK_EQUAL(recorder.events[i].second.revealCount, i);
        }
    }

    BOOST_AUTO_TEST_CASE(unsubscribe_should_drop_queued_events) {
        auto strand = std::make_shared<Strand_Manual>();
        EventBus bus{};
        Recorder recorder{};
        auto subscription = bus.subscribe("game:1", strand, recorder.handler());
        BOOST_CHECK_EQUAL(bus.subscriberCount("game:1"), 1u);

        bus.publish("game:1", GameEvent::roundTimeout(GameId{1}, RoundId{1}));
        bus.unsubscribe(subscription);
        bus.unsubscribe(subscription);
        bus.publish("game:1", GameEvent::roundTimeout(GameId{1}, RoundId{1}));
        strand->runUntilDone();

        BOOST_CHECK(recorder.events.empty());
        BOOST_CHECK_EQUAL(bus.subscriberCount("game:1"), 0u);
    }

    BOOST_AUTO_TEST_CASE(should_fan_out_to_every_subscriber) {
        auto strand1 = std::make_shared<Strand_Manual>();
        auto strand2 = std::make_shared<Strand_Manual>();
        EventBus bus{};
        Recorder recorder1{};
        Recorder recorder2{};
        bus.subscribe(ActiveGamesTopic, strand1, recorder1.handler());
        bus.subscribe(ActiveGamesTopic, strand2, recorder2.handler());
        bus.publish(ActiveGamesTopic, GameEvent::gameCountChanged(3));
        strand1->runUntilDone();
        strand2->runUntilDone();
        BOOST_REQUIRE_EQUAL(recorder1.events.size(), 1u);
        BOOST_REQUIRE_EQUAL(recorder2.events.size(), 1u);
        BOOST_CHECK_EQUAL(recorder2.events[0].second.activeGames, 3);
    }

    /***/

    BOOST_AUTO_TEST_CASE(presence_should_publish_joins_and_leaves) {
        auto strand = std::make_shared<Strand_Manual>();
        EventBus bus{};
        PresenceTracker presence{bus};
        Recorder recorder{};
        bus.subscribe("game:5:host", strand, recorder.handler());

        BOOST_CHECK(presence.track("game:5:host", "user:1", "c1"));
        BOOST_CHECK(!presence.track("game:5:host", "user:1", "c1"));
        BOOST_CHECK(presence.track("game:5:host", "user:1", "c2"));
        BOOST_CHECK_EQUAL(presence.list("game:5:host").size(), 2u);

        BOOST_CHECK(presence.untrack("game:5:host", "c1"));
        BOOST_CHECK(!presence.untrack("game:5:host", "c1"));
        BOOST_CHECK(!presence.isEmpty("game:5:host"));
        strand->runUntilDone();

        BOOST_REQUIRE_EQUAL(recorder.events.size(), 3u);
        const auto& leave = recorder.events[2].second;
        BOOST_CHECK(leave.type == GameEventType::PresenceDiff);
        BOOST_CHECK(leave.gameId == GameId{5});
        BOOST_CHECK(leave.joins.empty());
        BOOST_REQUIRE_EQUAL(leave.leaves.size(), 1u);
        BOOST_CHECK_EQUAL(leave.leaves[0].connectionId, "c1");
    }

    BOOST_AUTO_TEST_CASE(closing_connection_should_leave_every_topic) {
        auto strand = std::make_shared<Strand_Manual>();
        EventBus bus{};
        PresenceTracker presence{bus};
        Recorder recorder{};
        bus.subscribe("game:5:host", strand, recorder.handler());
        bus.subscribe("game:5:players", strand, recorder.handler());

        presence.track("game:5:host", "user:1", "c1");
        presence.track("game:5:players", "user:1", "c1");
        presence.track("game:5:players", "user:2", "c2");
        presence.untrackConnection("c1");
        strand->runUntilDone();

        BOOST_CHECK(presence.isEmpty("game:5:host"));
        BOOST_CHECK_EQUAL(presence.list("game:5:players").size(), 1u);
        int leaveCount = 0;
        for (const auto& [topic, event] : recorder.events) {
            leaveCount += static_cast<int>(event.leaves.size());
        }
        BOOST_CHECK_EQUAL(leaveCount, 2);
    }

BOOST_AUTO_TEST_SUITE_END()
