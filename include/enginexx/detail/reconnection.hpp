/*

reconnection.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <random>
#include <string>
#include <variant>

namespace enginexx::detail
{

/**
 * Reconnection policy configuration.
 * Controls the backoff schedule used when a pooled session has to be rebuilt.
 */
struct reconnection_policy
{
    /// Maximum number of reconnection attempts
    unsigned int max_attempts = 3;

    /// Delay before the first attempt
    std::chrono::milliseconds initial_delay{1000};

    /// Upper bound for a single delay
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff (2.0 doubles the delay each attempt)
    double backoff_multiplier = 2.0;

    /// Random jitter applied to delays (0.0 to 1.0, e.g., 0.25 = +/-25%)
    double jitter_factor = 0.0;

    /// Create a policy with a fixed delay between attempts
    static reconnection_policy simple(
        unsigned int attempts = 3,
        std::chrono::milliseconds delay = std::chrono::milliseconds{1000})
    {
        reconnection_policy policy;
        policy.max_attempts = attempts;
        policy.initial_delay = delay;
        policy.max_delay = delay;
        policy.backoff_multiplier = 1.0;
        return policy;
    }

    /// Create an exponential backoff policy
    static reconnection_policy exponential_backoff(
        unsigned int max_attempts = 3,
        std::chrono::milliseconds initial = std::chrono::milliseconds{1000},
        std::chrono::milliseconds max_delay = std::chrono::milliseconds{30000},
        double multiplier = 2.0,
        double jitter = 0.0)
    {
        reconnection_policy policy;
        policy.max_attempts = max_attempts;
        policy.initial_delay = initial;
        policy.max_delay = max_delay;
        policy.backoff_multiplier = multiplier;
        policy.jitter_factor = jitter;
        return policy;
    }

    /// Delay before a given attempt (1-based): initial_delay * multiplier^(attempt-1)
    [[nodiscard]] std::chrono::milliseconds calculate_delay(unsigned int attempt) const
    {
        if (attempt <= 1)
            return std::min(initial_delay, max_delay);

        double delay_ms = static_cast<double>(initial_delay.count());
        for (unsigned int i = 1; i < attempt; ++i)
        {
            delay_ms *= backoff_multiplier;
            if (delay_ms > static_cast<double>(max_delay.count()))
            {
                delay_ms = static_cast<double>(max_delay.count());
                break;
            }
        }

        if (jitter_factor > 0.0)
        {
            thread_local std::mt19937 rng(std::random_device{}());
            std::uniform_real_distribution<double> dist(1.0 - jitter_factor, 1.0 + jitter_factor);
            delay_ms *= dist(rng);
        }

        auto result = std::chrono::milliseconds(static_cast<long long>(delay_ms));
        if (result > max_delay)
            result = max_delay;

        return result;
    }
};


/// A reconnect produced a fresh, registered connection.
template<typename Connection>
struct reconnect_connected
{
    std::shared_ptr<Connection> connection;
};

/// Every attempt failed, or the pool shut down while waiting.
struct reconnect_exhausted
{
    std::string resource_id;
    unsigned int attempts = 0;
    std::exception_ptr last_error;
};

/// Outcome of a bounded reconnect loop.
template<typename Connection>
using reconnect_result = std::variant<reconnect_connected<Connection>, reconnect_exhausted>;


} // namespace enginexx::detail
