/*

pool.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Session pooling for enginexx.

*/

#pragma once

#include <enginexx/pool/pool_config.hpp>
#include <enginexx/pool/session_pool.hpp>
#include <enginexx/session/endpoint.hpp>
#include <enginexx/session/session_event.hpp>

/**
 * @file pool.hpp
 * @brief Warm, self-repairing sessions to a stateful analytics engine.
 *
 * @section Overview
 *
 * Opening an engine session costs a TCP+TLS connect, a WebSocket upgrade and
 * an OpenDoc round trip. The pool keeps one or more sessions per resource
 * (app id) open between requests and hands them out through RAII leases.
 *
 * @section Lifecycle
 *
 * - A request for a resource reuses an idle session whose idle time is below
 *   the TTL, or opens a new one. Callers never wait for each other.
 * - The sweeper removes sessions idle for at least the TTL.
 * - Each session is probed periodically; a failed probe removes it and a
 *   background reconnect replaces it.
 * - Sessions report `closed`, `suspended` and `error` through an event
 *   channel; closed and failed sessions are deregistered, suspended ones
 *   resumed.
 *
 * @section Usage
 *
 * @code
 * #include <enginexx/pool.hpp>
 *
 * auto pool = enginexx::pool::make_session_pool<my_session>(
 *     ctx.get_executor(), enginexx::pool::session_pool_config::defaults(),
 *     endpoints, factory, probe);
 *
 * {
 *     auto lease = co_await pool->get_connection("app-1");
 *     co_await lease->call("GetTablesAndKeys");
 * }   // released here
 *
 * // Or let the pool repair broken links between attempts
 * auto result = co_await pool->execute_with_retry("app-1",
 *     [](my_document& doc) { return doc.call("GetAppLayout"); });
 *
 * co_await pool->shutdown();
 * @endcode
 *
 * @section Threading
 *
 * A pool and every coroutine it starts run on one executor and take no locks.
 * Sessions may post lifecycle events from any thread.
 */
