// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include <boost/test/unit_test.hpp>
#include "session/session-registry.h"
#include "game-store/memory-game-store.h"
#include <optional>

namespace {
    struct RegistryFixture {
        std::shared_ptr<Strand_Manual> strand{std::make_shared<Strand_Manual>()};
        MemoryGameStore store{};
        EventBus bus{};
        SessionRegistry registry{store, bus, [this](const char*) -> std::shared_ptr<Strand_base> { return strand; }};
        Game game{};
        Round round{};

        RegistryFixture() {
            game = store.createGame(UserId{1}, GameSettings{1, 3, 2}, std::chrono::system_clock::now());
            round = store.insertRounds(game.id, {
                RoundSpec{WordId{1}, {KeywordId{1}, KeywordId{2}, KeywordId{3}}, {WordId{1}, WordId{2}}, 1}
            })[0];
        }

        ~RegistryFixture() {
            registry.shutdown().done();
            strand->runUntilDone();
        }
    };

    bool isNotRunning(const std::exception_ptr& reason) {
        try {
            std::rethrow_exception(reason);
        } catch (const SessionNotRunning&) {
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }
}


BOOST_AUTO_TEST_SUITE(session_registry)

    BOOST_AUTO_TEST_CASE(get_state_without_session_should_be_not_running) {
        RegistryFixture f{};
        bool notRunning = false;
        bool fulfilled = false;
        f.registry.getState(f.game.id).then([&fulfilled](const SessionSnapshot&) {
            fulfilled = true;
        }, [&notRunning](const std::exception_ptr& reason) {
            notRunning = isNotRunning(reason);
        }).done();
        f.strand->runUntilDone();
        BOOST_CHECK(notRunning);
        BOOST_CHECK(!fulfilled);
    }

    BOOST_AUTO_TEST_CASE(should_create_one_session_per_game) {
        RegistryFixture f{};
        auto first = f.registry.ensureSession(f.game.id);
        auto second = f.registry.ensureSession(f.game.id);
        BOOST_CHECK_EQUAL(first.get(), second.get());
        BOOST_CHECK_EQUAL(f.registry.size(), 1u);
        BOOST_CHECK(f.registry.find(f.game.id) == first);
        BOOST_CHECK(!f.registry.find(GameId{12345}));
    }

    BOOST_AUTO_TEST_CASE(start_round_timer_should_create_session) {
        RegistryFixture f{};
        f.registry.startRoundTimer(f.game.id, f.round.id, 3);
        f.strand->advanceTime(std::chrono::seconds{2});

        std::optional<SessionSnapshot> state{};
        f.registry.getState(f.game.id).then([&state](const SessionSnapshot& value) {
            state = value;
        }).done();
        f.strand->runUntilDone();
        BOOST_REQUIRE(state);
        BOOST_CHECK(state->roundId == f.round.id);
        BOOST_CHECK_EQUAL(state->elapsedSeconds, 2);
        BOOST_CHECK(f.registry.pauseTimer(f.game.id));
        BOOST_CHECK(f.registry.stopRoundTimer(f.game.id));
        BOOST_CHECK(!f.registry.pauseTimer(GameId{12345}));
    }

    BOOST_AUTO_TEST_CASE(stop_game_session_should_reclaim_process) {
        RegistryFixture f{};
        f.registry.startRoundTimer(f.game.id, f.round.id, 3);
        f.strand->runUntilDone();
        std::weak_ptr<SessionProcess> weak = f.registry.find(f.game.id);

        auto stopped = f.registry.stopGameSession(f.game.id);
        BOOST_CHECK_EQUAL(f.registry.size(), 0u);
        f.strand->runUntilDone();
        BOOST_CHECK(stopped.isFulfilled());
        BOOST_CHECK(weak.expired());

        BOOST_CHECK(f.registry.stopGameSession(f.game.id).isFulfilled());
    }

    BOOST_AUTO_TEST_CASE(shutdown_should_stop_every_session) {
        RegistryFixture f{};
        auto other = f.store.createGame(UserId{2}, GameSettings{}, std::chrono::system_clock::now());
        f.registry.ensureSession(f.game.id);
        f.registry.ensureSession(other.id);
        BOOST_CHECK_EQUAL(f.registry.size(), 2u);

        auto promise = f.registry.shutdown();
        f.strand->runUntilDone();
        BOOST_CHECK(promise.isFulfilled());
        BOOST_CHECK_EQUAL(f.registry.size(), 0u);
        BOOST_CHECK_THROW(f.registry.ensureSession(f.game.id), std::logic_error);
    }

BOOST_AUTO_TEST_SUITE_END()
