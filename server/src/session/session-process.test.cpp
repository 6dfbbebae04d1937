// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include <boost/test/unit_test.hpp>
#include "session/session-process.h"
#include "game-store/memory-game-store.h"
#include <optional>

namespace {
    struct SessionFixture {
        std::shared_ptr<Strand_Manual> strand{std::make_shared<Strand_Manual>()};
        MemoryGameStore store{};
        EventBus bus{};
        Game game{};
        Round roundA{};
        Round roundB{};
        std::vector<GameEvent> events{};
        std::shared_ptr<SessionProcess> session{};

        SessionFixture() {
            auto now = std::chrono::system_clock::now();
            game = store.createGame(UserId{1}, GameSettings{2, 3, 2}, now);
            auto rounds = store.insertRounds(game.id, {
                RoundSpec{WordId{1}, {KeywordId{11}, KeywordId{12}}, {WordId{1}, WordId{2}}, 1},
                RoundSpec{WordId{2}, {KeywordId{21}, KeywordId{22}, KeywordId{23}}, {WordId{3}, WordId{2}}, 2}
            });
            roundA = rounds[0];
            roundB = rounds[1];
            bus.subscribe(gameTopic(game.id), strand, [this](const std::string&, const GameEvent& event) {
                events.push_back(event);
            });
            session = std::make_shared<SessionProcess>(game.id, strand, store, bus);
        }

        ~SessionFixture() {
            session->shutdown().done();
            strand->runUntilDone();
        }

        void advanceSeconds(int seconds) {
            strand->advanceTime(std::chrono::seconds{seconds});
        }

        [[nodiscard]] std::vector<GameEvent> eventsOfType(GameEventType type) const {
            std::vector<GameEvent> result{};
            for (const auto& event : events) {
                if (event.type == type) {
                    result.push_back(event);
                }
            }
            return result;
        }

        SessionSnapshot snapshot() {
            std::optional<SessionSnapshot> result{};
            session->getState().then([&result](const SessionSnapshot& value) {
                result = value;
            }).done();
            strand->runUntilDone();
            BOOST_REQUIRE(result);
            return *result;
        }
    };
}


BOOST_AUTO_TEST_SUITE(session_process)

    BOOST_AUTO_TEST_CASE(should_reveal_first_keyword_at_start) {
        SessionFixture f{};
        f.session->startRoundTimer(f.roundA.id, 3);
        f.strand->runUntilDone();

        BOOST_REQUIRE_EQUAL(f.events.size(), 1u);
        BOOST_CHECK(f.events[0].type == GameEventType::KeywordRevealed);
        BOOST_CHECK(f.events[0].roundId == f.roundA.id);
        BOOST_CHECK_EQUAL(f.events[0].revealCount, 1);
        BOOST_CHECK_EQUAL(f.events[0].elapsedSeconds, 0);

        auto state = f.snapshot();
        BOOST_CHECK(state.roundState == SessionTimerState::Playing);
        BOOST_CHECK_EQUAL(state.keywordsTotal, 2);
        BOOST_CHECK_EQUAL(state.cluesInterval, 3);
    }

    BOOST_AUTO_TEST_CASE(should_publish_progress_every_tick) {
        SessionFixture f{};
        f.session->startRoundTimer(f.roundB.id, 6);
        f.advanceSeconds(4);

        auto reveals = f.eventsOfType(GameEventType::KeywordRevealed);
        BOOST_REQUIRE_EQUAL(reveals.size(), 5u);
        for (int i = 0; i < 5; ++i) {
            BOOST_CHECK_EQUAL(reveals[i].elapsedSeconds, i);
            BOOST_CHECK_EQUAL(reveals[i].revealCount, 1);
        }
    }

    BOOST_AUTO_TEST_CASE(interval_three_with_two_keywords_should_time_out_once_at_six) {
        SessionFixture f{};
        f.session->startRoundTimer(f.roundA.id, 3);
        f.advanceSeconds(12);

        int firstAtTwo = -1;
        int timeoutAfter = -1;
        int lastElapsed = -1;
        for (const auto& event : f.events) {
            if (event.type == GameEventType::KeywordRevealed) {
                if (event.revealCount == 2 && firstAtTwo < 0) {
                    firstAtTwo = event.elapsedSeconds;
                }
                lastElapsed = event.elapsedSeconds;
            } else if (event.type == GameEventType::RoundTimeout) {
                timeoutAfter = lastElapsed;
            }
        }
        BOOST_CHECK_EQUAL(firstAtTwo, 3);
        BOOST_CHECK_EQUAL(timeoutAfter, 6);
        BOOST_CHECK_EQUAL(f.eventsOfType(GameEventType::RoundTimeout).size(), 1u);
        BOOST_CHECK(f.eventsOfType(GameEventType::RoundTimeout)[0].roundId == f.roundA.id);
        BOOST_CHECK_EQUAL(lastElapsed, 12);
    }

    BOOST_AUTO_TEST_CASE(reveal_count_should_not_decrease_or_pass_total) {
        SessionFixture f{};
        f.session->startRoundTimer(f.roundB.id, 3);
        f.advanceSeconds(20);

        int previous = 0;
        for (const auto& event : f.eventsOfType(GameEventType::KeywordRevealed)) {
            BOOST_CHECK_GE(event.revealCount, previous);
            BOOST_CHECK_LE(event.revealCount, 3);
            previous = event.revealCount;
        }
        BOOST_CHECK_EQUAL(previous, 3);
        BOOST_CHECK_EQUAL(f.snapshot().keywordsRevealed, 3);
    }

    BOOST_AUTO_TEST_CASE(timeout_should_fire_at_most_once) {
        SessionFixture f{};
        f.session->startRoundTimer(f.roundB.id, 3);
        f.advanceSeconds(60);

        BOOST_CHECK_EQUAL(f.eventsOfType(GameEventType::RoundTimeout).size(), 1u);
        auto state = f.snapshot();
        BOOST_CHECK(state.timeoutScheduled);
        BOOST_CHECK_EQUAL(state.elapsedSeconds, 60);
    }

    BOOST_AUTO_TEST_CASE(ticks_of_replaced_round_should_be_ignored) {
        SessionFixture f{};
        f.session->startRoundTimer(f.roundA.id, 3);
        f.advanceSeconds(2);
        auto replaced = f.snapshot();
        f.session->startRoundTimer(f.roundB.id, 3);
        f.strand->runUntilDone();
        f.events.clear();

        f.session->postTick(f.roundA.id, replaced.runGeneration);
        f.session->postRoundTimeout(f.roundA.id, replaced.runGeneration);
        f.strand->runUntilDone();
        BOOST_CHECK(f.events.empty());

        auto state = f.snapshot();
        BOOST_CHECK(state.roundId == f.roundB.id);
        BOOST_CHECK_EQUAL(state.elapsedSeconds, 0);
        BOOST_CHECK_EQUAL(state.keywordsRevealed, 1);

        f.advanceSeconds(1);
        BOOST_REQUIRE_EQUAL(f.events.size(), 1u);
        BOOST_CHECK(f.events[0].roundId == f.roundB.id);
        BOOST_CHECK_EQUAL(f.events[0].elapsedSeconds, 1);
    }

    BOOST_AUTO_TEST_CASE(stop_then_start_should_not_reference_old_round) {
        SessionFixture f{};
        f.session->startRoundTimer(f.roundA.id, 5);
        f.advanceSeconds(2);
        auto running = f.snapshot();
        BOOST_CHECK_EQUAL(running.elapsedSeconds, 2);

        f.session->stopRoundTimer();
        f.strand->runUntilDone();
        auto stopped = f.snapshot();
        BOOST_CHECK(stopped.roundState == SessionTimerState::Idle);
        BOOST_CHECK_EQUAL(stopped.elapsedSeconds, 0);

        f.events.clear();
        f.session->startRoundTimer(f.roundB.id, 5);
        f.session->postTick(f.roundA.id, running.runGeneration);
        f.session->postRoundTimeout(f.roundA.id, running.runGeneration);
        f.advanceSeconds(30);

        BOOST_REQUIRE(!f.events.empty());
        BOOST_CHECK_EQUAL(f.events[0].revealCount, 1);
        BOOST_CHECK_EQUAL(f.events[0].elapsedSeconds, 0);
        for (const auto& event : f.events) {
            BOOST_CHECK(event.roundId == f.roundB.id);
        }
    }

    BOOST_AUTO_TEST_CASE(restart_of_same_round_should_discard_previous_run) {
        SessionFixture f{};
        f.session->startRoundTimer(f.roundA.id, 3);
        f.advanceSeconds(7);
        BOOST_CHECK_EQUAL(f.eventsOfType(GameEventType::RoundTimeout).size(), 1u);
        auto firstRun = f.snapshot();
        BOOST_CHECK(firstRun.timeoutScheduled);

        f.session->startRoundTimer(f.roundA.id, 3);
        f.strand->runUntilDone();
        auto secondRun = f.snapshot();
        BOOST_CHECK(secondRun.roundId == f.roundA.id);
        BOOST_CHECK(!secondRun.timeoutScheduled);
        BOOST_CHECK_NE(secondRun.runGeneration, firstRun.runGeneration);
        f.events.clear();

        f.session->postTick(f.roundA.id, firstRun.runGeneration);
        f.session->postRoundTimeout(f.roundA.id, firstRun.runGeneration);
        f.strand->runUntilDone();
        BOOST_CHECK(f.events.empty());
        BOOST_CHECK_EQUAL(f.snapshot().elapsedSeconds, 0);

        f.advanceSeconds(6);
        auto timeouts = f.eventsOfType(GameEventType::RoundTimeout);
        BOOST_REQUIRE_EQUAL(timeouts.size(), 1u);
        BOOST_CHECK(timeouts[0].roundId == f.roundA.id);
    }

    BOOST_AUTO_TEST_CASE(current_run_timeout_should_publish) {
        SessionFixture f{};
        f.session->startRoundTimer(f.roundB.id, 5);
        f.strand->runUntilDone();
        auto state = f.snapshot();
        f.events.clear();

        f.session->postRoundTimeout(f.roundB.id, state.runGeneration);
        f.strand->runUntilDone();
        BOOST_REQUIRE_EQUAL(f.events.size(), 1u);
        BOOST_CHECK(f.events[0].type == GameEventType::RoundTimeout);
    }

    BOOST_AUTO_TEST_CASE(stopped_timer_should_not_tick) {
        SessionFixture f{};
        f.session->startRoundTimer(f.roundA.id, 3);
        f.advanceSeconds(1);
        auto running = f.snapshot();
        f.session->stopRoundTimer();
        f.strand->runUntilDone();
        f.events.clear();

        f.session->postTick(f.roundA.id, running.runGeneration);
        f.session->postRoundTimeout(f.roundA.id, running.runGeneration);
        f.advanceSeconds(10);
        BOOST_CHECK(f.events.empty());
    }

    BOOST_AUTO_TEST_CASE(pause_should_be_idempotent) {
        SessionFixture f{};
        f.session->startRoundTimer(f.roundB.id, 3);
        f.advanceSeconds(4);

        f.session->pauseTimer();
        auto first = f.snapshot();
        f.session->pauseTimer();
        auto second = f.snapshot();

        BOOST_CHECK(first.paused);
        BOOST_CHECK_EQUAL(first.elapsedSeconds, 4);
        BOOST_CHECK_EQUAL(second.elapsedSeconds, first.elapsedSeconds);
        BOOST_CHECK_EQUAL(second.keywordsRevealed, first.keywordsRevealed);

        f.events.clear();
        f.session->postTick(f.roundB.id, first.runGeneration);
        f.advanceSeconds(10);
        BOOST_CHECK(f.events.empty());
        BOOST_CHECK_EQUAL(f.snapshot().elapsedSeconds, 4);
    }

    BOOST_AUTO_TEST_CASE(restart_of_paused_round_should_resume) {
        SessionFixture f{};
        f.session->startRoundTimer(f.roundB.id, 3);
        f.advanceSeconds(4);
        f.session->pauseTimer();
        f.advanceSeconds(5);
        f.events.clear();

        f.session->startRoundTimer(f.roundB.id, 3);
        f.strand->runUntilDone();
        BOOST_REQUIRE_EQUAL(f.events.size(), 1u);
        BOOST_CHECK_EQUAL(f.events[0].elapsedSeconds, 4);
        BOOST_CHECK_EQUAL(f.events[0].revealCount, 2);

        f.advanceSeconds(1);
        auto state = f.snapshot();
        BOOST_CHECK(!state.paused);
        BOOST_CHECK_EQUAL(state.elapsedSeconds, 5);
    }

    BOOST_AUTO_TEST_CASE(should_reject_interval_below_one) {
        SessionFixture f{};
        BOOST_CHECK_THROW(f.session->startRoundTimer(f.roundA.id, 0), std::invalid_argument);
        BOOST_CHECK_THROW(f.session->startRoundTimer(RoundId::None, 3), std::invalid_argument);
    }

    BOOST_AUTO_TEST_CASE(unknown_round_should_leave_timer_idle) {
        SessionFixture f{};
        f.session->startRoundTimer(RoundId{9999}, 3);
        f.advanceSeconds(5);
        BOOST_CHECK(f.events.empty());
        BOOST_CHECK(f.snapshot().roundState == SessionTimerState::Idle);
    }

    BOOST_AUTO_TEST_CASE(shutdown_should_stop_ticking) {
        SessionFixture f{};
        f.session->startRoundTimer(f.roundA.id, 3);
        f.advanceSeconds(1);
        f.session->shutdown().done();
        f.strand->runUntilDone();
        BOOST_CHECK(f.session->shutdownCompleted());
        f.events.clear();
        f.advanceSeconds(10);
        BOOST_CHECK(f.events.empty());
    }

BOOST_AUTO_TEST_SUITE_END()
