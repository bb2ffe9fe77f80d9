/*

test_engine_session.cpp
-----------------------

Engine sessions against a local WebSocket JSON-RPC server.

*/

#define BOOST_TEST_MODULE engine_session

#include <boost/test/unit_test.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/websocket.hpp>
#include <enginexx/engine/engine_pool.hpp>
#include "fake_session.hpp"

using namespace enginexx;
using namespace std::chrono_literals;

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using json = nlohmann::json;

namespace
{

/**
 * Minimal engine: answers OpenDoc and GetAppLayout, and misbehaves on request.
 *
 * Fail     -> JSON-RPC error reply
 * BadError -> error reply with a string code and a numeric message
 * Echo     -> result is the params
 * Slow     -> no reply
 * CloseMe  -> close handshake (going away)
 * DropMe   -> TCP connection dropped
 */
class local_engine
{
public:
    explicit local_engine(asio::any_io_executor executor)
        : acceptor_(executor, asio::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
    {
        asio::co_spawn(executor, accept_loop(), asio::detached);
    }

    [[nodiscard]] std::string port() const
    {
        return std::to_string(acceptor_.local_endpoint().port());
    }

    [[nodiscard]] std::string url() const
    {
        return "ws://127.0.0.1:" + port();
    }

    void stop()
    {
        asio::error_code ec;
        acceptor_.close(ec);
    }

    int sessions = 0;
    int clean_closes = 0;
    std::vector<std::string> targets;
    std::vector<std::string> authorizations;
    std::vector<std::string> user_agents;
    std::vector<std::string> methods;
    std::vector<std::string> opened;

private:
    static std::string to_string(beast::string_view text)
    {
        return std::string(text.data(), text.size());
    }

    asio::awaitable<void> accept_loop()
    {
        for (;;)
        {
            asio::error_code ec;
            auto socket = co_await acceptor_.async_accept(asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
                co_return;
            asio::co_spawn(acceptor_.get_executor(), serve(std::move(socket)), asio::detached);
        }
    }

    asio::awaitable<void> serve(asio::tcp::socket socket)
    {
        websocket::stream<beast::tcp_stream> ws(std::move(socket));
        asio::error_code ec;

        beast::flat_buffer buffer;
        http::request<http::string_body> request;
        co_await http::async_read(ws.next_layer(), buffer, request, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return;

        targets.push_back(to_string(request.target()));
        authorizations.push_back(to_string(request[http::field::authorization]));
        user_agents.push_back(to_string(request[http::field::user_agent]));

        co_await ws.async_accept(request, asio::redirect_error(asio::use_awaitable, ec));
        if (ec)
            co_return;
        ++sessions;

        // The engine greets every session with a notification
        const std::string greeting = json{
            {"jsonrpc", "2.0"},
            {"method", "OnConnected"},
            {"params", {{"qSessionState", "SESSION_CREATED"}}}
        }.dump();
        co_await ws.async_write(asio::buffer(greeting), asio::redirect_error(asio::use_awaitable, ec));

        for (;;)
        {
            beast::flat_buffer frame;
            co_await ws.async_read(frame, asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
            {
                if (ec == websocket::error::closed)
                    ++clean_closes;
                co_return;
            }

            const json call = json::parse(beast::buffers_to_string(frame.data()));
            const std::string method = call.at("method").get<std::string>();
            methods.push_back(method);

            json reply = {{"jsonrpc", "2.0"}, {"id", call.at("id")}};
            if (method == "OpenDoc")
            {
                opened.push_back(call.at("params").at(0).get<std::string>());
                reply["result"] = {{"qReturn", {{"qType", "Doc"}, {"qHandle", 1}}}};
            }
            else if (method == "GetAppLayout")
            {
                reply["result"] = {{"qLayout", {{"qTitle", "Sales"}}}};
            }
            else if (method == "Fail")
            {
                reply["error"] = {{"code", -32602}, {"message", "Invalid params"}};
            }
            else if (method == "BadError")
            {
                reply["error"] = {{"code", "x"}, {"message", 42}};
            }
            else if (method == "Echo")
            {
                reply["result"] = call.at("params");
            }
            else if (method == "Slow")
            {
                continue;
            }
            else if (method == "CloseMe")
            {
                co_await ws.async_close(websocket::close_code::going_away, asio::redirect_error(asio::use_awaitable, ec));
                co_return;
            }
            else if (method == "DropMe")
            {
                beast::get_lowest_layer(ws).socket().close(ec);
                co_return;
            }
            else
            {
                reply["result"] = json::object();
            }

            const std::string text = reply.dump();
            co_await ws.async_write(asio::buffer(text), asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
                co_return;
        }
    }

    asio::tcp::acceptor acceptor_;
};

engine::engine_target local_target(const local_engine& server, std::string credential = "key-1")
{
    return engine::make_engine_target(session::engine_endpoint{server.url(), std::move(credential)}, "app-1");
}

}


BOOST_AUTO_TEST_SUITE(targets)

BOOST_AUTO_TEST_CASE(secure_url)
{
    const auto target = engine::make_engine_target(
        session::engine_endpoint{"https://tenant.example.com", "key"}, "abc");
    BOOST_TEST(target.secure);
    BOOST_TEST(target.host == "tenant.example.com");
    BOOST_TEST(target.port == "443");
    BOOST_TEST(target.path == "/app/abc");
    BOOST_TEST(target.credential == "key");
    BOOST_TEST(target.host_header() == "tenant.example.com");
}

BOOST_AUTO_TEST_CASE(plain_url_with_port)
{
    const auto target = engine::make_engine_target(session::engine_endpoint{"ws://localhost:4848", ""}, "abc");
    BOOST_TEST(!target.secure);
    BOOST_TEST(target.host == "localhost");
    BOOST_TEST(target.port == "4848");
    BOOST_TEST(target.host_header() == "localhost:4848");

    const auto http_target = engine::make_engine_target(session::engine_endpoint{"http://engine", ""}, "abc");
    BOOST_TEST(http_target.port == "80");
    BOOST_TEST(http_target.host_header() == "engine");
}

BOOST_AUTO_TEST_CASE(base_path_is_kept)
{
    const auto target = engine::make_engine_target(
        session::engine_endpoint{"https://proxy.example.com/engine/", ""}, "abc");
    BOOST_TEST(target.host == "proxy.example.com");
    BOOST_TEST(target.path == "/engine/app/abc");
}

BOOST_AUTO_TEST_CASE(missing_scheme_means_secure)
{
    const auto target = engine::make_engine_target(session::engine_endpoint{"tenant.example.com", ""}, "abc");
    BOOST_TEST(target.secure);
    BOOST_TEST(target.port == "443");
}

BOOST_AUTO_TEST_CASE(missing_host_throws)
{
    BOOST_CHECK_THROW(engine::make_engine_target(session::engine_endpoint{"https://", ""}, "abc"),
        engine::engine_error);
}

BOOST_AUTO_TEST_CASE(option_fallbacks)
{
    engine::engine_options options;
    options.call = 50ms;
    BOOST_TEST((options.get_call() == 50ms));
    BOOST_TEST((options.get_connect() == 30s));

    const auto slow = engine::engine_options::long_running();
    BOOST_TEST((slow.get_call() == 10min));
    BOOST_TEST((slow.get_close() == 5s));

    const auto uniform = engine::engine_options::uniform(3s);
    BOOST_TEST((uniform.get_handshake() == 3s));
}

BOOST_AUTO_TEST_SUITE_END()


BOOST_AUTO_TEST_CASE(open_document_and_get_layout)
{
    test::run_async([&](asio::any_io_executor ex) -> asio::awaitable<void>
    {
        local_engine server(ex);
        auto events = std::make_shared<session::event_channel>(ex);

        auto session = co_await engine::plain_engine_session::connect(ex, nullptr, local_target(server),
            session::event_sink(events, 1));
        BOOST_TEST(session->is_open());

        auto document = co_await session->open_document();
        BOOST_TEST(document->handle() == 1);
        BOOST_TEST(document->resource_id() == "app-1");

        const json layout = co_await document->get_app_layout();
        BOOST_TEST(layout.at("qTitle").get<std::string>() == "Sales");

        BOOST_TEST(server.targets.at(0) == "/app/app-1");
        BOOST_TEST(server.authorizations.at(0) == "Bearer key-1");
        BOOST_TEST(server.user_agents.at(0) == "enginexx");
        BOOST_TEST(server.opened.at(0) == "app-1");
        BOOST_TEST(server.methods.size() == 2u);

        co_await session->close();
        auto event = co_await events->receive();
        BOOST_TEST(event.has_value());
        BOOST_TEST((event->signal == session::session_signal::closed));
        BOOST_TEST(event->connection_id == 1u);
        BOOST_TEST(!session->is_open());

        // The engine saw a close handshake, not a dropped socket
        co_await test::sleep_for(10ms);
        BOOST_TEST(server.clean_closes == 1);

        server.stop();
    });
}

BOOST_AUTO_TEST_CASE(no_authorization_without_credential)
{
    test::run_async([&](asio::any_io_executor ex) -> asio::awaitable<void>
    {
        local_engine server(ex);
        auto events = std::make_shared<session::event_channel>(ex);

        engine::engine_options options;
        options.user_agent = "reporting/1.0";
        auto session = co_await engine::plain_engine_session::connect(ex, nullptr, local_target(server, ""),
            session::event_sink(events, 1), options);

        BOOST_TEST(server.authorizations.at(0).empty());
        BOOST_TEST(server.user_agents.at(0) == "reporting/1.0");

        co_await session->close();
        server.stop();
    });
}

BOOST_AUTO_TEST_CASE(error_reply_is_an_application_error)
{
    test::run_async([&](asio::any_io_executor ex) -> asio::awaitable<void>
    {
        local_engine server(ex);
        auto events = std::make_shared<session::event_channel>(ex);
        auto session = co_await engine::plain_engine_session::connect(ex, nullptr, local_target(server),
            session::event_sink(events, 1));

        bool thrown = false;
        try
        {
            co_await session->call("Fail");
        }
        catch (const engine::engine_error& e)
        {
            thrown = true;
            BOOST_TEST(e.code() == -32602);
            BOOST_TEST(std::string(e.what()) == "Invalid params");
            BOOST_TEST(!detail::is_transport_fault(e));
        }
        BOOST_TEST(thrown);

        // The session is still usable
        BOOST_TEST(session->is_open());
        co_await session->call("GetAppLayout");

        co_await session->close();
        server.stop();
    });
}

BOOST_AUTO_TEST_CASE(mistyped_error_reply_fails_only_that_call)
{
    test::run_async([&](asio::any_io_executor ex) -> asio::awaitable<void>
    {
        local_engine server(ex);
        auto events = std::make_shared<session::event_channel>(ex);

        engine::engine_options options;
        options.call = 2s;
        auto session = co_await engine::plain_engine_session::connect(ex, nullptr, local_target(server),
            session::event_sink(events, 1), options);

        const auto start = std::chrono::steady_clock::now();
        bool thrown = false;
        try
        {
            co_await session->call("BadError");
        }
        catch (const engine::engine_timeout_error&)
        {
            BOOST_FAIL("error reply was not delivered");
        }
        catch (const engine::engine_error& e)
        {
            thrown = true;
            BOOST_TEST(e.code() == 0);
            BOOST_TEST(std::string(e.what()) == "Engine error");
        }
        BOOST_TEST(thrown);
        BOOST_TEST((std::chrono::steady_clock::now() - start < 1s));

        // The read loop survived the reply
        BOOST_TEST(session->is_open());
        const json layout = co_await session->call("GetAppLayout");
        BOOST_TEST(layout.contains("qLayout"));

        co_await session->close();
        server.stop();
    });
}

BOOST_AUTO_TEST_CASE(close_during_large_write)
{
    test::run_async([&](asio::any_io_executor ex) -> asio::awaitable<void>
    {
        local_engine server(ex);
        auto events = std::make_shared<session::event_channel>(ex);
        auto session = co_await engine::plain_engine_session::connect(ex, nullptr, local_target(server),
            session::event_sink(events, 1));

        // Several frames larger than Beast's masking chunk, queued behind each other
        int finished = 0;
        for (int i = 0; i < 3; ++i)
        {
            asio::co_spawn(ex,
                [&session]() -> asio::awaitable<void>
                {
                    json params = json::array({std::string(256 * 1024, 'x')});
                    co_await session->call("Echo", std::move(params));
                },
                [&finished](std::exception_ptr) { ++finished; });
        }

        // Yield until the calls are queued and the write loop is sending, then close under it
        for (int i = 0; i < 4; ++i)
            co_await asio::post(ex, asio::use_awaitable);
        co_await session->close();

        auto event = co_await events->receive();
        BOOST_TEST(event.has_value());
        BOOST_TEST((event->signal == session::session_signal::closed));
        BOOST_TEST(!session->is_open());

        co_await test::sleep_for(20ms);
        BOOST_TEST(finished == 3);

        server.stop();
    });
}

BOOST_AUTO_TEST_CASE(call_without_reply_times_out)
{
    test::run_async([&](asio::any_io_executor ex) -> asio::awaitable<void>
    {
        local_engine server(ex);
        auto events = std::make_shared<session::event_channel>(ex);

        engine::engine_options options;
        options.call = 50ms;
        auto session = co_await engine::plain_engine_session::connect(ex, nullptr, local_target(server),
            session::event_sink(events, 1), options);

        bool timed_out = false;
        try
        {
            co_await session->call("Slow");
        }
        catch (const engine::engine_timeout_error& e)
        {
            timed_out = true;
            BOOST_TEST(std::string(e.what()) == "Call Slow timed out");
        }
        BOOST_TEST(timed_out);
        BOOST_TEST(session->is_open());

        co_await session->close();
        server.stop();
    });
}

BOOST_AUTO_TEST_CASE(engine_close_reports_closed)
{
    test::run_async([&](asio::any_io_executor ex) -> asio::awaitable<void>
    {
        local_engine server(ex);
        auto events = std::make_shared<session::event_channel>(ex);
        auto session = co_await engine::plain_engine_session::connect(ex, nullptr, local_target(server),
            session::event_sink(events, 7));

        bool thrown = false;
        try
        {
            co_await session->call("CloseMe");
        }
        catch (const engine::engine_error& e)
        {
            thrown = true;
            BOOST_TEST(std::string(e.what()).find("Socket closed: closed by engine (code 1001)") == 0u);
        }
        BOOST_TEST(thrown);

        auto event = co_await events->receive();
        BOOST_TEST(event.has_value());
        BOOST_TEST((event->signal == session::session_signal::closed));
        BOOST_TEST(event->connection_id == 7u);
        BOOST_TEST(!session->is_open());

        // Later calls fail fast with a transport fault
        bool rejected = false;
        try
        {
            co_await session->call("GetAppLayout");
        }
        catch (const engine::engine_error& e)
        {
            rejected = true;
            BOOST_TEST(detail::is_transport_fault(e));
        }
        BOOST_TEST(rejected);

        // Closing an already closed session is a no-op
        co_await session->close();
        server.stop();
    });
}

BOOST_AUTO_TEST_CASE(dropped_connection_reports_error)
{
    test::run_async([&](asio::any_io_executor ex) -> asio::awaitable<void>
    {
        local_engine server(ex);
        auto events = std::make_shared<session::event_channel>(ex);
        auto session = co_await engine::plain_engine_session::connect(ex, nullptr, local_target(server),
            session::event_sink(events, 3));

        BOOST_CHECK_THROW(co_await session->call("DropMe"), engine::engine_error);

        auto event = co_await events->receive();
        BOOST_TEST(event.has_value());
        BOOST_TEST((event->signal == session::session_signal::error));
        BOOST_TEST(!event->detail.empty());

        server.stop();
    });
}

BOOST_AUTO_TEST_CASE(connect_failure_throws)
{
    test::run_async([&](asio::any_io_executor ex) -> asio::awaitable<void>
    {
        std::string port;
        {
            local_engine server(ex);
            port = server.port();
            server.stop();
        }

        auto events = std::make_shared<session::event_channel>(ex);
        const auto target = engine::make_engine_target(
            session::engine_endpoint{"ws://127.0.0.1:" + port, ""}, "app-1");

        bool thrown = false;
        try
        {
            co_await engine::plain_engine_session::connect(ex, nullptr, target, session::event_sink(events, 1));
        }
        catch (const asio::system_error& e)
        {
            thrown = true;
            BOOST_TEST(detail::is_transport_fault(e));
        }
        BOOST_TEST(thrown);
    });
}

BOOST_AUTO_TEST_CASE(tls_session_requires_context)
{
    test::run_async([&](asio::any_io_executor ex) -> asio::awaitable<void>
    {
        auto events = std::make_shared<session::event_channel>(ex);
        const auto target = engine::make_engine_target(
            session::engine_endpoint{"https://127.0.0.1:1", ""}, "app-1");

        BOOST_CHECK_THROW(co_await engine::engine_session::connect(ex, nullptr, target,
            session::event_sink(events, 1)), engine::engine_error);
    });
}

BOOST_AUTO_TEST_CASE(pool_repairs_dropped_engine_session)
{
    test::run_async([&](asio::any_io_executor ex) -> asio::awaitable<void>
    {
        local_engine server(ex);
        auto endpoints = std::make_shared<session::static_endpoint_provider>(
            session::engine_endpoint{server.url(), "key-1", "local"});

        auto cfg = test::test_config();
        auto pool = engine::make_engine_pool<engine::plain_engine_session>(ex, nullptr, endpoints, cfg);

        int attempts = 0;
        const json layout = co_await pool->execute_with_retry("app-1",
            [&](engine::engine_document& doc) -> asio::awaitable<json>
            {
                if (++attempts == 1)
                    co_await doc.call("DropMe");
                co_return co_await doc.get_app_layout();
            });

        BOOST_TEST(layout.at("qTitle").get<std::string>() == "Sales");
        BOOST_TEST(attempts == 2);
        BOOST_TEST(server.sessions == 2);
        BOOST_TEST(pool->stats().transport_faults == 1u);
        BOOST_TEST(pool->stats().reconnect_successes == 1u);

        co_await pool->shutdown();
        co_await test::sleep_for(10ms);
        BOOST_TEST(server.clean_closes == 1);

        server.stop();
    });
}
