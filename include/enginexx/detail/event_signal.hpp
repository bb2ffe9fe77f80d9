/*

event_signal.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <enginexx/detail/asio_decl.hpp>

namespace enginexx::detail
{

/**
 * Wake-up primitive for coroutines running on a single executor.
 *
 * A timer parked at time_point::max() is waited on; notify() cancels it,
 * which resumes every current waiter. Waiters must re-check their condition
 * after waking, a notify() with no waiter is not remembered.
 */
class event_signal
{
public:
    explicit event_signal(enginexx::asio::any_io_executor executor)
        : timer_(std::move(executor))
    {
        timer_.expires_at(enginexx::asio::steady_timer::time_point::max());
    }

    event_signal(const event_signal&) = delete;
    event_signal& operator=(const event_signal&) = delete;

    enginexx::asio::awaitable<void> wait()
    {
        enginexx::asio::error_code ec;
        co_await timer_.async_wait(enginexx::asio::redirect_error(enginexx::asio::use_awaitable, ec));
    }

    void notify()
    {
        timer_.cancel();
    }

private:
    enginexx::asio::steady_timer timer_;
};

} // namespace enginexx::detail
