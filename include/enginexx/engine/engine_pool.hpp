/*

engine/engine_pool.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <memory>
#include <string>
#include <utility>
#include <enginexx/engine/engine_session.hpp>
#include <enginexx/pool/session_pool.hpp>

namespace enginexx::engine
{

/// Pool of engine sessions over TLS
using engine_pool = pool::session_pool<engine_session>;

/// Pool of engine sessions over plain TCP
using plain_engine_pool = pool::session_pool<plain_engine_session>;


template<typename Session>
awaitable<std::unique_ptr<Session>> open_engine_session(ssl::context* tls, engine_options options,
    std::string resource_id, session::engine_endpoint endpoint, session::event_sink events)
{
    auto executor = co_await this_coro::executor;
    co_return co_await Session::connect(executor, tls, make_engine_target(endpoint, resource_id),
        std::move(events), std::move(options));
}

/**
 * Factory opening engine sessions for a session pool.
 *
 * @param tls TLS context for engine_session; must outlive the pool. May be null for plain sessions.
 */
template<typename Session = engine_session>
typename pool::session_pool<Session>::factory_type make_engine_factory(ssl::context* tls, engine_options options = {})
{
    return [tls, options](std::string resource_id, session::engine_endpoint endpoint, session::event_sink events)
    {
        return open_engine_session<Session>(tls, options, std::move(resource_id), std::move(endpoint),
            std::move(events));
    };
}

/// Liveness probe: GetAppLayout on the document
inline awaitable<void> probe_app_layout(engine_document& document)
{
    co_await document.get_app_layout();
}

/**
 * Create and start a pool of engine sessions, probed with GetAppLayout.
 *
 * @code
 * ssl::context tls(ssl::context::tls_client);
 * tls.set_default_verify_paths();
 *
 * auto tenants = std::make_shared<session::tenant_registry>(load_tenants());
 * auto pool = engine::make_engine_pool(ctx.get_executor(), &tls, tenants);
 *
 * co_spawn(ctx, [pool]() -> awaitable<void>
 * {
 *     co_await pool->warm_up({"app-1", "app-2"});
 *     auto layout = co_await pool->execute_with_retry("app-1",
 *         [](engine::engine_document& doc) { return doc.get_app_layout(); });
 *     co_await pool->shutdown();
 * }, detached);
 * @endcode
 */
template<typename Session = engine_session>
std::shared_ptr<pool::session_pool<Session>> make_engine_pool(
    any_io_executor executor,
    ssl::context* tls,
    std::shared_ptr<session::endpoint_provider> endpoints,
    pool::session_pool_config config = pool::session_pool_config::defaults(),
    engine_options options = {})
{
    return pool::make_session_pool<Session>(std::move(executor), std::move(config), std::move(endpoints),
        make_engine_factory<Session>(tls, std::move(options)), &probe_app_layout);
}

} // namespace enginexx::engine
