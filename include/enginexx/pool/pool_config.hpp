/*

pool/pool_config.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <string>
#include <enginexx/detail/reconnection.hpp>
#include <enginexx/detail/transport_fault.hpp>

namespace enginexx::pool
{

/**
 * Configuration for session pools.
 */
struct session_pool_config
{
    /// Idle connections at least this old are expired (never reused, swept)
    std::chrono::milliseconds connection_ttl{std::chrono::minutes{3}};

    /// Interval between liveness probes of each connection
    std::chrono::milliseconds health_check_interval{std::chrono::seconds{30}};

    /// Interval between cleanup sweeps
    std::chrono::milliseconds cleanup_interval{std::chrono::seconds{60}};

    /// Soft per-resource cap; creation is never refused because of it
    std::size_t max_connections_per_resource = 3;

    /// Evict a released connection that leaves its resource above the cap
    bool trim_surplus_on_release = true;

    /// Attempts made by execute_with_retry (first try included)
    unsigned int max_execute_attempts = 3;

    /// Backoff used when a broken connection is rebuilt
    detail::reconnection_policy reconnect = detail::reconnection_policy::exponential_backoff();

    /// Decides which failures are transport faults worth a reconnect
    std::function<bool(const std::exception&)> transport_fault = detail::is_transport_fault;

    // ==================== Factory Methods ====================

    /// Production defaults
    static session_pool_config defaults()
    {
        return session_pool_config{};
    }

    /// Short-lived interactive use: shorter TTL, faster probes and repair
    static session_pool_config interactive()
    {
        session_pool_config cfg;
        cfg.connection_ttl = std::chrono::minutes{1};
        cfg.health_check_interval = std::chrono::seconds{10};
        cfg.cleanup_interval = std::chrono::seconds{15};
        cfg.reconnect = detail::reconnection_policy::exponential_backoff(
            3, std::chrono::milliseconds{250}, std::chrono::milliseconds{2000});
        return cfg;
    }
};


/**
 * Pool statistics for monitoring.
 */
struct pool_stats
{
    std::size_t total_connections = 0;     ///< All registered connections
    std::size_t active_connections = 0;    ///< Held by a caller (or being probed)
    std::size_t idle_connections = 0;      ///< Available for reuse

    /// Registered connections per resource id
    std::map<std::string, std::size_t> connections_by_resource;

    /// Mean age of the registered connections
    std::chrono::milliseconds avg_connection_age{0};

    std::size_t total_requests = 0;        ///< get_connection() calls
    std::size_t cache_hits = 0;            ///< Served by an idle connection
    std::size_t cache_misses = 0;          ///< Required a new connection

    std::size_t connections_created = 0;
    std::size_t connections_removed = 0;   ///< Deregistered for any reason
    std::size_t connections_expired = 0;   ///< Removed by the sweeper
    std::size_t probe_failures = 0;
    std::size_t reconnect_attempts = 0;
    std::size_t reconnect_successes = 0;
    std::size_t transport_faults = 0;      ///< Seen by execute_with_retry
    std::size_t soft_cap_exceeded = 0;     ///< Creations above the per-resource cap

    /// Hit rate (hits / requests), 0 when nothing was requested
    [[nodiscard]] double hit_rate() const noexcept
    {
        return total_requests > 0
            ? static_cast<double>(cache_hits) / static_cast<double>(total_requests)
            : 0.0;
    }
};


/**
 * Connection metadata stored alongside each pooled connection.
 * Times are passed in so a whole sweep uses one "now".
 */
struct connection_metadata
{
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_used_at;
    std::size_t times_used = 0;

    connection_metadata()
        : created_at(std::chrono::steady_clock::now())
        , last_used_at(created_at)
    {
    }

    void mark_used(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now())
    {
        last_used_at = now;
        ++times_used;
    }

    void touch(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now())
    {
        last_used_at = now;
    }

    [[nodiscard]] std::chrono::steady_clock::duration age(
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const
    {
        return now - created_at;
    }

    [[nodiscard]] std::chrono::steady_clock::duration idle_for(
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const
    {
        return now - last_used_at;
    }

    /// An idle time equal to the TTL already counts as expired
    [[nodiscard]] bool is_expired(std::chrono::steady_clock::time_point now,
                                  std::chrono::steady_clock::duration ttl) const
    {
        return idle_for(now) >= ttl;
    }
};

} // namespace enginexx::pool
