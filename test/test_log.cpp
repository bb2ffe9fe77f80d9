/*

test_log.cpp
------------

Logger levels, callbacks and protocol trace sanitizing.

*/

#define BOOST_TEST_MODULE log

#include <boost/test/unit_test.hpp>
#include <string>
#include <vector>
#include <enginexx/detail/log.hpp>

using namespace enginexx;

namespace
{

/// Routes log entries into a vector for the lifetime of the fixture
struct captured_log
{
    captured_log()
    {
        auto& logger = log::logger::instance();
        logger.set_level(log::level::debug);
        logger.set_callback([this](const log::entry& e) { entries.push_back(e); });
    }

    ~captured_log()
    {
        auto& logger = log::logger::instance();
        logger.clear_callback();
        logger.set_level(log::level::info);
        logger.set_trace_enabled(false);
    }

    std::vector<log::entry> entries;
};

}


BOOST_FIXTURE_TEST_CASE(levels_below_minimum_are_dropped, captured_log)
{
    ENGINEXX_LOG_TRACE("POOL", "not shown");
    ENGINEXX_LOG_DEBUG("POOL", "connection " << 1 << " opened");
    ENGINEXX_LOG_WARN("RECONNECT", "attempt " << 2);

    BOOST_TEST(entries.size() == 2u);
    BOOST_TEST(entries.at(0).message == "connection 1 opened");
    BOOST_TEST(entries.at(0).category == "POOL");
    BOOST_TEST((entries.at(1).lvl == log::level::warn));
}

BOOST_FIXTURE_TEST_CASE(message_is_built_only_when_enabled, captured_log)
{
    log::logger::instance().set_level(log::level::error);
    int evaluated = 0;
    auto expensive = [&] { ++evaluated; return "x"; };

    ENGINEXX_LOG_INFO("POOL", expensive());
    BOOST_TEST(evaluated == 0);

    ENGINEXX_LOG_ERROR("POOL", expensive());
    BOOST_TEST(evaluated == 1);
    BOOST_TEST(entries.size() == 1u);
}

BOOST_FIXTURE_TEST_CASE(off_disables_everything, captured_log)
{
    auto& logger = log::logger::instance();
    logger.set_level(log::level::off);
    BOOST_TEST(!logger.is_enabled(log::level::fatal));
    BOOST_TEST(!logger.is_enabled(log::level::off));
    ENGINEXX_LOG_ERROR("POOL", "dropped");
    BOOST_TEST(entries.empty());
}

BOOST_FIXTURE_TEST_CASE(protocol_trace, captured_log)
{
    ENGINEXX_TRACE_SEND("ENGINE", "{\"method\":\"OpenDoc\"}");
    BOOST_TEST(entries.empty());

    log::logger::instance().set_trace_enabled(true);
    ENGINEXX_TRACE_SEND("ENGINE", "{\"method\":\"OpenDoc\"}");
    ENGINEXX_TRACE_RECV("ENGINE", "{\"result\":{}}");

    BOOST_TEST(entries.size() == 2u);
    BOOST_TEST(entries.at(0).trace_info.has_value());
    BOOST_TEST((entries.at(0).trace_info->dir == log::direction::send));
    BOOST_TEST((entries.at(1).trace_info->dir == log::direction::receive));
    BOOST_TEST(entries.at(1).trace_info->data == "{\"result\":{}}");
}

BOOST_AUTO_TEST_CASE(sanitize_trace)
{
    BOOST_TEST(log::logger::sanitize_trace("a\r\nb\tc") == "a..b.c");

    const std::string long_frame(600, 'x');
    const std::string sanitized = log::logger::sanitize_trace(long_frame);
    BOOST_TEST(sanitized.size() == 500u + std::string("... [truncated]").size());
    BOOST_TEST(sanitized.substr(500) == "... [truncated]");
}

BOOST_AUTO_TEST_CASE(level_names)
{
    BOOST_TEST(log::level_to_string(log::level::trace) == "TRACE");
    BOOST_TEST(log::level_to_string(log::level::warn) == "WARN");
    BOOST_TEST(log::level_to_string(log::level::off) == "OFF");
}
