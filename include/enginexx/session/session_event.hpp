/*

session/session_event.hpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <enginexx/detail/asio_decl.hpp>
#include <enginexx/detail/event_signal.hpp>

namespace enginexx::session
{

using namespace enginexx::asio;

/// Lifecycle signals a session reports about its transport
enum class session_signal : std::uint8_t
{
    closed,     ///< Remote side or local close ended the session
    suspended,  ///< Transport paused, the session can be resumed in place
    error       ///< Transport failed
};

[[nodiscard]] constexpr std::string_view to_string(session_signal signal) noexcept
{
    switch (signal)
    {
        case session_signal::closed:    return "closed";
        case session_signal::suspended: return "suspended";
        case session_signal::error:     return "error";
    }
    return "unknown";
}

struct session_event
{
    std::uint64_t connection_id = 0;
    session_signal signal = session_signal::closed;
    std::string detail;
};


/**
 * Queue of lifecycle events written by sessions and consumed by the pool.
 *
 * post() may be called from any thread; it hands the event to the channel's
 * executor. receive() and close() must run on that executor.
 */
class event_channel : public std::enable_shared_from_this<event_channel>
{
public:
    explicit event_channel(any_io_executor executor)
        : executor_(executor)
        , ready_(executor)
    {
    }

    event_channel(const event_channel&) = delete;
    event_channel& operator=(const event_channel&) = delete;

    void post(session_event event)
    {
        asio::post(executor_,
            [self = shared_from_this(), event = std::move(event)]() mutable
            {
                self->push(std::move(event));
            });
    }

    /// Next event, or std::nullopt once the channel is closed
    awaitable<std::optional<session_event>> receive()
    {
        for (;;)
        {
            if (closed_)
                co_return std::nullopt;

            if (!queue_.empty())
            {
                session_event event = std::move(queue_.front());
                queue_.pop_front();
                co_return event;
            }

            co_await ready_.wait();
        }
    }

    /// Drop queued events and wake the consumer
    void close()
    {
        if (closed_)
            return;
        closed_ = true;
        queue_.clear();
        ready_.notify();
    }

    [[nodiscard]] bool is_closed() const noexcept { return closed_; }

    [[nodiscard]] std::size_t pending() const noexcept { return queue_.size(); }

    [[nodiscard]] const any_io_executor& get_executor() const noexcept { return executor_; }

private:
    void push(session_event event)
    {
        if (closed_)
            return;
        queue_.push_back(std::move(event));
        ready_.notify();
    }

    any_io_executor executor_;
    detail::event_signal ready_;
    std::deque<session_event> queue_;
    bool closed_ = false;
};


/**
 * Writer side of the channel handed to a session factory.
 * Bound to one connection id; a sink outliving its channel is harmless.
 */
class event_sink
{
public:
    event_sink() = default;

    event_sink(std::weak_ptr<event_channel> channel, std::uint64_t connection_id)
        : channel_(std::move(channel))
        , connection_id_(connection_id)
    {
    }

    void closed(std::string detail = {}) const
    {
        emit(session_signal::closed, std::move(detail));
    }

    void suspended(std::string detail = {}) const
    {
        emit(session_signal::suspended, std::move(detail));
    }

    void error(std::string detail) const
    {
        emit(session_signal::error, std::move(detail));
    }

    [[nodiscard]] std::uint64_t connection_id() const noexcept { return connection_id_; }

    explicit operator bool() const noexcept { return !channel_.expired(); }

private:
    void emit(session_signal signal, std::string detail) const
    {
        if (auto channel = channel_.lock())
            channel->post(session_event{connection_id_, signal, std::move(detail)});
    }

    std::weak_ptr<event_channel> channel_;
    std::uint64_t connection_id_ = 0;
};

} // namespace enginexx::session
