/*

pool_warmup.cpp
---------------

Warms a session pool for a few resources, runs requests against it and prints the pool statistics.
Sessions are simulated in memory; see engine_layout.cpp for a real engine.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include <enginexx/pool.hpp>
#include <enginexx/detail/log.hpp>


using namespace enginexx;
using std::cout;
using std::endl;


struct demo_document
{
    std::string resource_id;
    int requests = 0;
};

// Opens instantly, fails on "broken-app", drops its link every third request.
class demo_session
{
public:
    using document_type = demo_document;

    demo_session(std::string resource_id, session::event_sink events)
        : resource_id_(std::move(resource_id)), events_(std::move(events))
    {
    }

    asio::awaitable<std::shared_ptr<demo_document>> open_document()
    {
        auto document = std::make_shared<demo_document>();
        document->resource_id = resource_id_;
        co_return document;
    }

    asio::awaitable<void> close()
    {
        cout << "  closing session for " << resource_id_ << endl;
        co_return;
    }

    void resume() {}

private:
    std::string resource_id_;
    session::event_sink events_;
};


asio::awaitable<std::string> fetch_title(demo_document& doc)
{
    if (++doc.requests % 3 == 0)
        throw std::runtime_error("Socket closed: simulated network hiccup");
    co_return "Layout of " + doc.resource_id;
}


int main()
{
    log::logger::instance().set_level(log::level::info);

    asio::io_context io_ctx;

    auto tenants = std::make_shared<session::tenant_registry>(std::vector<session::tenant>{
        {"main", "Main", "https://main.example.com", "main-key", "Production tenant"},
        {"it", "Internal IT", "https://it.example.com", "it-key", "IT tenant"}
    });

    auto factory = [](std::string resource_id, session::engine_endpoint endpoint, session::event_sink events)
        -> asio::awaitable<std::unique_ptr<demo_session>>
    {
        if (resource_id == "broken-app")
            throw std::runtime_error("App not found: " + resource_id);
        cout << "  opening " << resource_id << " on " << endpoint.display_name << endl;
        co_return std::make_unique<demo_session>(std::move(resource_id), std::move(events));
    };

    auto cfg = pool::session_pool_config::interactive();
    auto pool = pool::make_session_pool<demo_session>(io_ctx.get_executor(), cfg, tenants, factory);

    asio::co_spawn(io_ctx,
        [&]() -> asio::awaitable<void>
        {
            try
            {
                const std::vector<std::string> warm_up_ids{"sales", "finance", "broken-app"};
                const auto ready = co_await pool->warm_up(warm_up_ids);
                cout << ready << " of 3 resources warmed up" << endl;

                for (int i = 0; i < 6; ++i)
                {
                    const auto title = co_await pool->execute_with_retry("sales", fetch_title);
                    cout << "  " << title << endl;
                }

                // New sessions go to the IT tenant, existing ones are kept
                tenants->set_active("it");
                pool->evict("finance");
                co_await pool->execute_with_retry("finance", fetch_title);

                const auto stats = pool->stats();
                cout << "connections: " << stats.total_connections
                     << ", requests: " << stats.total_requests
                     << ", hit rate: " << stats.hit_rate()
                     << ", transport faults: " << stats.transport_faults
                     << ", reconnects: " << stats.reconnect_successes << endl;
                cout << tenants->describe() << endl;
            }
            catch (const std::exception& exc)
            {
                cout << exc.what() << endl;
            }

            co_await pool->shutdown();
        },
        asio::detached);

    io_ctx.run();
    return EXIT_SUCCESS;
}
