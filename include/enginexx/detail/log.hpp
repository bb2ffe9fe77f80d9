/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for enginexx.
Supports multiple log levels, per-subsystem categories, optional callbacks
and engine protocol tracing.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

namespace enginexx::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Protocol-level tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (non-fatal issues)
    error = 4,   ///< Errors (operation failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Direction for protocol tracing
enum class direction : std::uint8_t
{
    send,     ///< Frame sent to the engine
    receive   ///< Frame received from the engine
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string category;  // "POOL", "RECONNECT", "ENGINE"
    std::string message;
    std::source_location location;

    struct trace_info_t
    {
        direction dir;
        std::string data;      // Raw protocol frame
    };
    std::optional<trace_info_t> trace_info;
};

/// Log callback signature
using callback_t = std::function<void(const entry&)>;

/// Convert level to string
[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    /// Set minimum log level
    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    /// Check if level is enabled
    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off
            && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default stderr output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    /// Enable/disable protocol tracing
    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    /// Log a message
    void log(level lvl, std::string_view category, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .category = std::string(category),
            .message = std::string(message),
            .location = loc,
            .trace_info = std::nullopt
        };

        dispatch(e);
    }

    /// Log protocol trace
    void trace_protocol(std::string_view category, direction dir, std::string_view data,
                        std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;

        entry e{
            .lvl = level::trace,
            .timestamp = std::chrono::system_clock::now(),
            .category = std::string(category),
            .message = {},
            .location = loc,
            .trace_info = entry::trace_info_t{
                .dir = dir,
                .data = sanitize_trace(data)
            }
        };

        dispatch(e);
    }

    /// Sanitize trace data (truncate long frames, mask control characters)
    [[nodiscard]] static std::string sanitize_trace(std::string_view data)
    {
        std::string result(data);

        constexpr std::size_t max_len = 500;
        if (result.size() > max_len)
        {
            result.resize(max_len);
            result += "... [truncated]";
        }

        for (char& c : result)
        {
            if (static_cast<unsigned char>(c) < 32)
                c = '.';
        }

        return result;
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            default_output(e);
    }

    static void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);

        std::ostringstream line;
        line << '[' << std::put_time(&tm_buf, "%H:%M:%S") << '.'
             << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        if (e.trace_info)
        {
            const char* dir_str = (e.trace_info->dir == direction::send) ? ">>>" : "<<<";
            line << e.category << ' ' << dir_str << ' ' << e.trace_info->data;
        }
        else
        {
            line << '[' << level_to_string(e.lvl) << "] [" << e.category << "] " << e.message;
        }

        std::cerr << line.str() << '\n';
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
};

} // namespace enginexx::log

// Stream-style logging macros; the message is only built when the level is enabled.
#define ENGINEXX_LOG(lvl, category, expr) \
    do \
    { \
        auto& enginexx_logger_ = ::enginexx::log::logger::instance(); \
        if (enginexx_logger_.is_enabled(lvl)) \
        { \
            std::ostringstream enginexx_log_stream_; \
            enginexx_log_stream_ << expr; \
            enginexx_logger_.log(lvl, category, enginexx_log_stream_.str(), std::source_location::current()); \
        } \
    } while (0)

#define ENGINEXX_LOG_TRACE(category, expr) ENGINEXX_LOG(::enginexx::log::level::trace, category, expr)
#define ENGINEXX_LOG_DEBUG(category, expr) ENGINEXX_LOG(::enginexx::log::level::debug, category, expr)
#define ENGINEXX_LOG_INFO(category, expr)  ENGINEXX_LOG(::enginexx::log::level::info, category, expr)
#define ENGINEXX_LOG_WARN(category, expr)  ENGINEXX_LOG(::enginexx::log::level::warn, category, expr)
#define ENGINEXX_LOG_ERROR(category, expr) ENGINEXX_LOG(::enginexx::log::level::error, category, expr)

/// Protocol trace helpers
#define ENGINEXX_TRACE_SEND(category, data) \
    ::enginexx::log::logger::instance().trace_protocol(category, ::enginexx::log::direction::send, data)

#define ENGINEXX_TRACE_RECV(category, data) \
    ::enginexx::log::logger::instance().trace_protocol(category, ::enginexx::log::direction::receive, data)
