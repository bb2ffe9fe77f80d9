/*

engine/engine_options.hpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace enginexx::engine
{

/**
 * Per-phase timeouts and transport settings of an engine session.
 *
 * A phase without its own timeout uses default_timeout.
 *
 * @code
 * engine_options opts;
 * opts.connect = std::chrono::seconds(5);
 * opts.call = std::chrono::seconds(120);   // long reloads
 * @endcode
 */
struct engine_options
{
    /// Default timeout used when a specific timeout is not set
    std::chrono::steady_clock::duration default_timeout{std::chrono::seconds(30)};

    /// Name resolution and TCP connect
    std::optional<std::chrono::steady_clock::duration> connect;

    /// TLS and WebSocket upgrade handshakes
    std::optional<std::chrono::steady_clock::duration> handshake;

    /// Wait for the reply of one JSON-RPC call
    std::optional<std::chrono::steady_clock::duration> call;

    /// WebSocket close handshake
    std::optional<std::chrono::steady_clock::duration> close;

    /// Sent as User-Agent on the upgrade request
    std::string user_agent = "enginexx";

    /// Verify the server certificate (TLS sessions only)
    bool verify_peer = true;

    // ========== Getters with fallback to default ==========

    std::chrono::steady_clock::duration get_connect() const
    { return connect.value_or(default_timeout); }

    std::chrono::steady_clock::duration get_handshake() const
    { return handshake.value_or(default_timeout); }

    std::chrono::steady_clock::duration get_call() const
    { return call.value_or(default_timeout); }

    std::chrono::steady_clock::duration get_close() const
    { return close.value_or(default_timeout); }

    // ========== Presets ==========

    /// Same timeout for every phase
    static engine_options uniform(std::chrono::steady_clock::duration timeout)
    {
        engine_options opts;
        opts.default_timeout = timeout;
        return opts;
    }

    /// Short connect/handshake, long calls (reloads, large hypercubes)
    static engine_options long_running()
    {
        engine_options opts;
        opts.connect = std::chrono::seconds(10);
        opts.handshake = std::chrono::seconds(15);
        opts.call = std::chrono::minutes(10);
        opts.close = std::chrono::seconds(5);
        return opts;
    }
};

} // namespace enginexx::engine
