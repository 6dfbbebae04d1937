// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include <boost/test/unit_test.hpp>
#include "supervision/presence-monitor.h"
#include "game-store/memory-game-store.h"

namespace {
    class GameCleanupMock : public GameCleanup {
    public:
        std::vector<GameId> calls{};
        bool fail = false;
        void cleanupGameOnHostDisconnect(GameId gameId) override {
            calls.push_back(gameId);
            if (fail) {
                throw GameStoreError{GameStoreErrorCode::InvalidState, "store unavailable"};
            }
        }
    };

    struct MonitorFixture {
        std::shared_ptr<Strand_Manual> strand{std::make_shared<Strand_Manual>()};
        MemoryGameStore store{};
        EventBus bus{};
        PresenceTracker presence{bus};
        GameCleanupMock cleanup{};
        std::shared_ptr<PresenceMonitor> monitor{};
        Game game{};

        MonitorFixture() {
            monitor = std::make_shared<PresenceMonitor>(strand, store, bus, presence, cleanup, std::chrono::milliseconds{2000});
            game = store.createGame(UserId{1}, GameSettings{}, std::chrono::system_clock::now());
            presence.track(hostTopic(game.id), "user:1", "c1");
            monitor->monitorGameHost(game.id);
            strand->runUntilDone();
        }

        ~MonitorFixture() {
            monitor->shutdown().done();
            strand->runUntilDone();
        }

        void advance(int milliseconds) {
            strand->advanceTime(std::chrono::milliseconds{milliseconds});
        }
    };
}


BOOST_AUTO_TEST_SUITE(presence_monitor)

    BOOST_AUTO_TEST_CASE(should_subscribe_once) {
        MonitorFixture f{};
        f.monitor->monitorGameHost(f.game.id);
        f.monitor->monitorGameHost(f.game.id);
        f.strand->runUntilDone();
        BOOST_CHECK(f.monitor->isMonitored_safe(f.game.id));
        BOOST_CHECK_EQUAL(f.monitor->monitoredCount_safe(), 1u);
        BOOST_CHECK_EQUAL(f.bus.subscriberCount(hostTopic(f.game.id)), 1u);
    }

    BOOST_AUTO_TEST_CASE(reconnect_within_window_should_not_clean_up) {
        MonitorFixture f{};
        f.presence.untrack(hostTopic(f.game.id), "c1");
        f.advance(500);
        f.presence.track(hostTopic(f.game.id), "user:1", "c2");
        f.advance(5000);

        BOOST_CHECK(f.cleanup.calls.empty());
        BOOST_CHECK(f.monitor->isMonitored_safe(f.game.id));
    }

    BOOST_AUTO_TEST_CASE(sustained_absence_should_clean_up_after_window) {
        MonitorFixture f{};
        f.presence.untrack(hostTopic(f.game.id), "c1");
        f.advance(1999);
        BOOST_CHECK(f.cleanup.calls.empty());

        f.advance(1);
        BOOST_REQUIRE_EQUAL(f.cleanup.calls.size(), 1u);
        BOOST_CHECK(f.cleanup.calls[0] == f.game.id);
        BOOST_CHECK(!f.monitor->isMonitored_safe(f.game.id));
        BOOST_CHECK_EQUAL(f.bus.subscriberCount(hostTopic(f.game.id)), 0u);
    }

    BOOST_AUTO_TEST_CASE(several_leaves_should_clean_up_once) {
        MonitorFixture f{};
        f.presence.track(hostTopic(f.game.id), "user:1", "c2");
        f.presence.untrack(hostTopic(f.game.id), "c1");
        f.advance(100);
        f.presence.untrack(hostTopic(f.game.id), "c2");
        f.advance(5000);

        BOOST_CHECK_EQUAL(f.cleanup.calls.size(), 1u);

        f.presence.track(hostTopic(f.game.id), "user:1", "c3");
        f.presence.untrack(hostTopic(f.game.id), "c3");
        f.advance(5000);
        BOOST_CHECK_EQUAL(f.cleanup.calls.size(), 1u);
    }

    BOOST_AUTO_TEST_CASE(ended_game_should_not_be_cleaned_up) {
        MonitorFixture f{};
        f.store.markGameState(f.game.id, GameState::GameOver);
        f.presence.untrack(hostTopic(f.game.id), "c1");
        f.advance(5000);

        BOOST_CHECK(f.cleanup.calls.empty());
        BOOST_CHECK(f.monitor->isMonitored_safe(f.game.id));
    }

    BOOST_AUTO_TEST_CASE(running_game_should_be_cleaned_up) {
        MonitorFixture f{};
        f.store.markGameStarted(f.game.id, std::chrono::system_clock::now());
        f.presence.untrackConnection("c1");
        f.advance(2000);
        BOOST_CHECK_EQUAL(f.cleanup.calls.size(), 1u);
    }

    BOOST_AUTO_TEST_CASE(failed_cleanup_should_not_be_retried) {
        MonitorFixture f{};
        f.cleanup.fail = true;
        f.presence.untrack(hostTopic(f.game.id), "c1");
        f.advance(2000);

        BOOST_CHECK_EQUAL(f.cleanup.calls.size(), 1u);
        BOOST_CHECK(!f.monitor->isMonitored_safe(f.game.id));

        f.presence.track(hostTopic(f.game.id), "user:1", "c2");
        f.presence.untrack(hostTopic(f.game.id), "c2");
        f.advance(5000);
        BOOST_CHECK_EQUAL(f.cleanup.calls.size(), 1u);
    }

    BOOST_AUTO_TEST_CASE(unmonitored_game_should_be_ignored) {
        MonitorFixture f{};
        auto other = f.store.createGame(UserId{2}, GameSettings{}, std::chrono::system_clock::now());
        f.presence.track(hostTopic(other.id), "user:2", "c9");
        f.presence.untrack(hostTopic(other.id), "c9");
        f.advance(5000);
        BOOST_CHECK(f.cleanup.calls.empty());
    }

    BOOST_AUTO_TEST_CASE(unmonitor_should_release_subscription) {
        MonitorFixture f{};
        f.presence.untrack(hostTopic(f.game.id), "c1");
        f.advance(500);
        f.monitor->unmonitorGameHost(f.game.id);
        f.monitor->unmonitorGameHost(f.game.id);
        f.strand->runUntilDone();

        BOOST_CHECK(!f.monitor->isMonitored_safe(f.game.id));
        BOOST_CHECK_EQUAL(f.monitor->monitoredCount_safe(), 0u);
        BOOST_CHECK_EQUAL(f.bus.subscriberCount(hostTopic(f.game.id)), 0u);

        f.advance(5000);
        BOOST_CHECK(f.cleanup.calls.empty());
    }

BOOST_AUTO_TEST_SUITE_END()
