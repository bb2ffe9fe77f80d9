/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized Boost.Asio declarations for enginexx.
This header simplifies async notation throughout the library.

*/

#pragma once

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 101800 // Boost.Asio 1.18.0
#error "Boost.Asio version 1.18.0 or higher is required (Boost 1.74+)"
#endif

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#if !defined(BOOST_ASIO_HAS_CO_AWAIT)
#error "enginexx requires coroutine support (C++20) and Boost.Asio 1.18+ (Boost 1.74+)"
#endif

namespace enginexx::asio
{
    // Core types
    using boost::asio::awaitable;
    using boost::asio::buffer;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::use_awaitable;
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::redirect_error;
    using boost::asio::post;

    namespace this_coro = boost::asio::this_coro;

    // IP networking
    namespace ip = boost::asio::ip;
    using tcp = boost::asio::ip::tcp;

    namespace error = boost::asio::error;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

} // namespace enginexx::asio

// Common chrono literals
namespace enginexx
{
    using namespace std::literals::chrono_literals;
    using std::chrono::steady_clock;
}
