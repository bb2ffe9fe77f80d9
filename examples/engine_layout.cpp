/*

engine_layout.cpp
-----------------

Opens an app on an analytics engine through a session pool and prints its layout.

Usage: engine_layout <url> <api key> <app id>, e.g. engine_layout https://tenant.example.com key 1a2b3c


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <enginexx/enginexx.hpp>


using namespace enginexx;
using std::cout;
using std::endl;


int main(int argc, char* argv[])
{
    if (argc != 4)
    {
        std::cerr << "Usage: " << argv[0] << " <url> <api key> <app id>" << endl;
        return EXIT_FAILURE;
    }

    const std::string url = argv[1];
    const std::string api_key = argv[2];
    const std::string app_id = argv[3];

    log::logger::instance().set_level(log::level::debug);

    asio::io_context io_ctx;
    boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
    ssl_ctx.set_default_verify_paths();

    auto endpoints = std::make_shared<session::static_endpoint_provider>(
        session::engine_endpoint{url, api_key, "engine"});

    engine::engine_options options;
    options.connect = std::chrono::seconds(10);
    options.call = std::chrono::seconds(60);

    auto pool = engine::make_engine_pool(io_ctx.get_executor(), &ssl_ctx, endpoints,
        pool::session_pool_config::defaults(), options);

    asio::co_spawn(io_ctx,
        [&]() -> asio::awaitable<void>
        {
            try
            {
                const auto layout = co_await pool->execute_with_retry(app_id,
                    [](engine::engine_document& doc) { return doc.get_app_layout(); });

                cout << "title: " << layout.value("qTitle", std::string("?")) << endl;
                cout << layout.dump(2) << endl;
            }
            catch (const engine::engine_error& exc)
            {
                cout << "engine error " << exc.code() << ": " << exc.what() << endl;
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
