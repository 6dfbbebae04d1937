// Copyright Felix Ungman. All rights reserved.
// Licensed under GNU General Public License version 3 or later.

#include <boost/test/unit_test.hpp>
#include "utilities/logging.h"
#include <stdexcept>
#include <vector>


BOOST_AUTO_TEST_SUITE(logging)

    BOOST_AUTO_TEST_CASE(parse_log_level) {
        BOOST_CHECK(parseLogLevel("error") == LogLevel::Error);
        BOOST_CHECK(parseLogLevel("debug") == LogLevel::Debug);
        BOOST_CHECK_EQUAL(str(LogLevel::Warning), "warning");
        BOOST_CHECK_THROW(parseLogLevel("verbose"), std::invalid_argument);
    }

    BOOST_AUTO_TEST_CASE(error_reporter_receives_exceptions_and_rejections) {
        std::vector<std::string> reports{};
        auto level = getLogLevel();
        setLogLevel(LogLevel::Error);
        setErrorReporter([&reports](const char* name, const char* message, const char*) {
            reports.push_back(std::string(name) + ":" + message);
        });

        LOG_EXCEPTION(std::runtime_error{"boom"});
        LOG_REJECTION(std::make_exception_ptr(std::logic_error{"refused"}));

        setErrorReporter(nullptr);
        setLogLevel(level);

        BOOST_REQUIRE_EQUAL(reports.size(), 2u);
        BOOST_CHECK_EQUAL(reports[0], "EXCEPTION:boom");
        BOOST_CHECK_EQUAL(reports[1], "REJECT:refused");
    }

    BOOST_AUTO_TEST_CASE(reason_string_of_empty_reason) {
        BOOST_CHECK_EQUAL(ReasonString(std::exception_ptr{}), "");
    }

BOOST_AUTO_TEST_SUITE_END()
