// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include <boost/test/unit_test.hpp>
#include "gateway/gateway-session.h"
#include "game-store/memory-game-store.h"
#include "game-store/memory-word-catalog.h"
#include "supervision/presence-monitor.h"

namespace {
    using namespace std::chrono_literals;

    class RecordingSession : public GatewaySession {
    public:
        std::vector<std::string> sent{};

        RecordingSession(GatewayServices services, std::shared_ptr<Strand_base> strand, std::string connectionId) :
            GatewaySession{services, std::move(strand), std::move(connectionId)} {
        }

        void receive(const std::string& text) {
            receiveText_strand(text);
        }

    protected:
        void sendTextImpl_strand(const std::string& text) override {
            sent.push_back(text);
        }
    };

    MemoryWordCatalog makeCatalog() {
        MemoryWordCatalog result{};
        for (std::uint64_t word = 1; word <= 12; ++word) {
            std::vector<KeywordId> keywords{};
            for (std::uint64_t k = 1; k <= 6; ++k) {
                keywords.emplace_back(word * 100 + k);
            }
            result.addWord(WordId{word}, keywords);
        }
        return result;
    }

    bool startsWith(const std::string& value, const std::string& prefix) {
        return value.compare(0, prefix.size(), prefix) == 0;
    }

    struct GatewayFixture {
        std::shared_ptr<Strand_Manual> strand{std::make_shared<Strand_Manual>()};
        MemoryGameStore store{};
        MemoryWordCatalog catalog{makeCatalog()};
        RoundGenerator generator{catalog, 5};
        EventBus bus{};
        PresenceTracker presence{bus};
        SessionRegistry registry{store, bus, [this](const char*) -> std::shared_ptr<Strand_base> { return strand; }};
        std::shared_ptr<GameLifecycle> lifecycle{};
        std::shared_ptr<PresenceMonitor> monitor{};
        std::shared_ptr<RecordingSession> session{};

        GatewayFixture() {
            lifecycle = std::make_shared<GameLifecycle>(strand, store, generator, bus, registry);
            monitor = std::make_shared<PresenceMonitor>(strand, store, bus, presence, *lifecycle, 2000ms);
            lifecycle->setPresenceMonitor(monitor);
            session = std::make_shared<RecordingSession>(GatewayServices{bus, presence, *lifecycle, registry}, strand, "conn-1");
        }

        ~GatewayFixture() {
            session->shutdown().done();
            lifecycle->shutdown().done();
            monitor->shutdown().done();
            registry.shutdown().done();
            strand->runUntilDone();
        }

        // sends one command and returns the reply
        std::string send(const std::string& text) {
            auto before = session->sent.size();
            strand->setImmediate([this, text]() {
                session->receive(text);
            });
            strand->runUntilDone();
            BOOST_REQUIRE_EQUAL(session->sent.size(), before + 1);
            return session->sent.back();
        }

        std::string idFrom(const std::string& reply, const std::string& prefix) {
            BOOST_REQUIRE(startsWith(reply, prefix));
            return reply.substr(prefix.size());
        }
    };
}


BOOST_AUTO_TEST_SUITE(gateway_session)

    BOOST_AUTO_TEST_CASE(malformed_command_should_be_answered_with_error) {
        GatewayFixture f{};
        BOOST_CHECK_EQUAL(f.send("dance 1"), "error bad_request unknown command 'dance'");
        BOOST_CHECK_EQUAL(f.send("start"), "error bad_request start takes 1 arguments");
    }

    BOOST_AUTO_TEST_CASE(subscribed_events_should_be_delivered) {
        GatewayFixture f{};
        BOOST_CHECK_EQUAL(f.send("subscribe game:7"), "ok");

        GameEvent event{};
        event.type = GameEventType::GameCancelled;
        event.gameId = GameId{7};
        f.bus.publish("game:7", event);
        f.strand->runUntilDone();
        BOOST_REQUIRE_EQUAL(f.session->sent.size(), 2u);
        BOOST_CHECK_EQUAL(f.session->sent.back(), "event game:7 game_cancelled game=7");

        BOOST_CHECK_EQUAL(f.send("unsubscribe game:7"), "ok");
        f.bus.publish("game:7", event);
        f.strand->runUntilDone();
        BOOST_CHECK_EQUAL(f.session->sent.size(), 3u);
    }

    BOOST_AUTO_TEST_CASE(track_and_untrack_should_update_presence) {
        GatewayFixture f{};
        BOOST_CHECK_EQUAL(f.send("track game:1:host 1"), "ok");
        BOOST_CHECK_EQUAL(f.send("track game:1:host 1"), "error invalid_state already tracked on game:1:host");
        BOOST_REQUIRE_EQUAL(f.presence.list("game:1:host").size(), 1u);
        BOOST_CHECK_EQUAL(f.presence.list("game:1:host")[0].connectionId, "conn-1");

        BOOST_CHECK_EQUAL(f.send("untrack game:1:host"), "ok");
        BOOST_CHECK_EQUAL(f.send("untrack game:1:host"), "error not_found not tracked on game:1:host");
        BOOST_CHECK(f.presence.isEmpty("game:1:host"));
    }

    BOOST_AUTO_TEST_CASE(game_commands_should_reply_with_records) {
        GatewayFixture f{};
        auto gameId = f.idFrom(f.send("create 1 2 3 4"), "ok game ");
        auto playerId = f.idFrom(f.send("join " + gameId + " 10 alice bear"), "ok player ");
        BOOST_CHECK_EQUAL(f.send("start " + gameId), "ok");
        BOOST_CHECK(startsWith(f.send("state " + gameId), "ok state round="));

        auto round = f.store.currentRound(*GameId::parse(gameId));
        BOOST_REQUIRE(round);
        auto reply = f.send("pick " + gameId + " " + playerId + " " + round->targetWordId.str() + " 2");
        BOOST_CHECK(startsWith(reply, "ok pick "));
        BOOST_CHECK(reply.find("correct=1 points=5") != std::string::npos);

        BOOST_CHECK(startsWith(f.send("pick " + gameId + " " + playerId + " " + round->targetWordId.str() + " 2"), "error invalid_state"));
        BOOST_CHECK_EQUAL(f.send("stop " + gameId), "ok");
    }

    BOOST_AUTO_TEST_CASE(failed_commands_should_reply_with_error_code) {
        GatewayFixture f{};
        BOOST_CHECK(startsWith(f.send("create 1 0 3 4"), "error invalid_argument"));
        BOOST_CHECK_EQUAL(f.send("state 99"), "error not_running no session process for game 99");
        BOOST_CHECK(startsWith(f.send("start 99"), "error not_found"));

        auto gameId = f.idFrom(f.send("create 1 2 3 4"), "ok game ");
        BOOST_CHECK(startsWith(f.send("start " + gameId), "error invalid_state"));
        BOOST_CHECK_EQUAL(f.send("cancel " + gameId), "ok");
    }

    BOOST_AUTO_TEST_CASE(shutdown_should_leave_every_topic) {
        GatewayFixture f{};
        BOOST_CHECK_EQUAL(f.send("track game:1:host 1"), "ok");
        BOOST_CHECK_EQUAL(f.send("track game:1:players 1"), "ok");
        BOOST_CHECK_EQUAL(f.send("subscribe game:1"), "ok");

        f.session->shutdown().done();
        f.strand->runUntilDone();
        BOOST_CHECK(f.presence.isEmpty("game:1:host"));
        BOOST_CHECK(f.presence.isEmpty("game:1:players"));
        BOOST_CHECK_EQUAL(f.bus.subscriberCount("game:1"), 0u);
    }

BOOST_AUTO_TEST_SUITE_END()
