// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include <boost/test/unit_test.hpp>
#include "async/promise.h"
#include "async/strand.h"
#include <algorithm>
#include <atomic>
#include <random>
#include <vector>

namespace {

    std::default_random_engine gen{0};
    template <typename T>
    auto randint(T a, T b) {
        return std::uniform_int_distribution{a, b}(gen);
    }

    Promise<void> coAwaitOnRandomStrand(const std::vector<std::shared_ptr<Strand>>& strands,
        std::atomic_int& counter, std::atomic_int& wrongStrand, int count) {
        for (auto i = 0; i != count; ++i) {
            auto strand = strands[randint(std::size_t{0}, strands.size() - 1)];
            co_await *strand;
            if (!strand->isCurrent()) {
                ++wrongStrand;
            }
            ++counter;
        }
    }
}

BOOST_AUTO_TEST_SUITE(async_strand)

    BOOST_AUTO_TEST_CASE(asio_should_run_until_stopped) {
        Strand_Asio::Context context{};
        std::atomic_int counter = 0;
        context.getMain()->setTimeout([&context, &counter]() {
            ++counter;
            context.stop();
        }, 100);
        context.runUntilStopped(1);
        BOOST_CHECK_EQUAL(counter.load(), 1);
    }

    BOOST_AUTO_TEST_CASE(asio_should_execute_immediate_on_correct_strand) {
        Strand_Asio::Context context{};
        std::vector<std::shared_ptr<Strand>> strands(10);
        std::generate(strands.begin(), strands.end(), [&context](){ return context.makeStrand("test"); });
        std::atomic_int wrongStrand = 0;
        std::atomic_int executed = 0;
        for (int i = 0; i < 20; ++i) {
            auto strand = strands[randint(std::size_t{0}, strands.size() - 1)];
            strand->setImmediate([strand, &wrongStrand, &executed]() {
                if (!strand->isCurrent()) {
                    ++wrongStrand;
                }
                ++executed;
            });
        }
        context.getMain()->setTimeout([&context]() {
            context.stop();
        }, 200);
        context.runUntilStopped(1);
        BOOST_CHECK_EQUAL(wrongStrand.load(), 0);
        BOOST_CHECK_EQUAL(executed.load(), 20);
    }

    BOOST_AUTO_TEST_CASE(asio_cleared_timeout_should_not_fire) {
        Strand_Asio::Context context{};
        std::atomic_int counter = 0;
        auto timeout = context.getMain()->setTimeout([&counter]() {
            ++counter;
        }, 50);
        clearTimeout(*timeout);
        context.getMain()->setTimeout([&context]() {
            context.stop();
        }, 150);
        context.runUntilStopped(1);
        BOOST_CHECK_EQUAL(counter.load(), 0);
    }

    BOOST_AUTO_TEST_CASE(co_await_should_continue_on_correct_strand) {
        Strand_Asio::Context context{};
        std::vector<std::shared_ptr<Strand>> strands(4);
        std::generate(strands.begin(), strands.end(), [&context](){ return context.makeStrand("test"); });
        std::atomic_int counter = 0;
        std::atomic_int wrongStrand = 0;
        context.getMain()->setImmediate([&context, &strands, &counter, &wrongStrand]() {
            coAwaitOnRandomStrand(strands, counter, wrongStrand, 100).then(std::shared_ptr<Strand_base>{}, [&context]() {
                context.getMain()->setImmediate([&context]() {
                    context.stop();
                });
            }).done();
        });
        context.runUntilStopped(1);
        BOOST_CHECK_EQUAL(counter.load(), 100);
        BOOST_CHECK_EQUAL(wrongStrand.load(), 0);
    }

    /***/

    BOOST_AUTO_TEST_CASE(manual_timeout_should_wait_for_virtual_clock) {
        auto strand = std::make_shared<Strand_Manual>();
        int counter = 0;
        strand->setTimeout([&counter]() { ++counter; }, 1000);
        strand->runUntilDone();
        BOOST_CHECK_EQUAL(counter, 0);
        strand->advanceTime(std::chrono::milliseconds{999});
        BOOST_CHECK_EQUAL(counter, 0);
        strand->advanceTime(std::chrono::milliseconds{1});
        BOOST_CHECK_EQUAL(counter, 1);
        strand->advanceTime(std::chrono::milliseconds{5000});
        BOOST_CHECK_EQUAL(counter, 1);
    }

    BOOST_AUTO_TEST_CASE(manual_timeouts_should_fire_in_deadline_order) {
        auto strand = std::make_shared<Strand_Manual>();
        std::vector<int> order{};
        strand->setTimeout([&order]() { order.push_back(3); }, 300);
        strand->setTimeout([&order]() { order.push_back(1); }, 100);
        strand->setTimeout([&order]() { order.push_back(2); }, 200);
        strand->advanceTime(std::chrono::milliseconds{1000});
        BOOST_REQUIRE_EQUAL(order.size(), 3u);
        BOOST_CHECK_EQUAL(order[0], 1);
        BOOST_CHECK_EQUAL(order[1], 2);
        BOOST_CHECK_EQUAL(order[2], 3);
    }

    BOOST_AUTO_TEST_CASE(manual_chained_timeouts_should_see_advancing_clock) {
        auto strand = std::make_shared<Strand_Manual>();
        std::vector<long> ticks{};
        const auto start = strand->now();
        std::function<void()> tick;
        tick = [&]() {
            ticks.push_back(std::chrono::duration_cast<std::chrono::milliseconds>(strand->now() - start).count());
            if (ticks.size() < 3) {
                strand->setTimeout(tick, 1000);
            }
        };
        strand->setTimeout(tick, 1000);
        strand->advanceTime(std::chrono::milliseconds{10000});
        BOOST_REQUIRE_EQUAL(ticks.size(), 3u);
        BOOST_CHECK_EQUAL(ticks[0], 1000);
        BOOST_CHECK_EQUAL(ticks[1], 2000);
        BOOST_CHECK_EQUAL(ticks[2], 3000);
    }

    BOOST_AUTO_TEST_CASE(manual_interval_should_repeat_until_cleared) {
        auto strand = std::make_shared<Strand_Manual>();
        int counter = 0;
        auto interval = strand->setInterval([&counter]() { ++counter; }, 250);
        strand->advanceTime(std::chrono::milliseconds{1000});
        BOOST_CHECK_EQUAL(counter, 4);
        clearInterval(*interval);
        strand->advanceTime(std::chrono::milliseconds{1000});
        BOOST_CHECK_EQUAL(counter, 4);
    }

    BOOST_AUTO_TEST_CASE(manual_should_contain_callback_exceptions) {
        auto strand = std::make_shared<Strand_Manual>();
        int counter = 0;
        strand->setImmediate([]() { throw std::runtime_error("callback failed"); });
        strand->setImmediate([&counter]() { ++counter; });
        BOOST_REQUIRE_NO_THROW(strand->runUntilDone());
        BOOST_CHECK_EQUAL(counter, 1);
    }

BOOST_AUTO_TEST_SUITE_END()
