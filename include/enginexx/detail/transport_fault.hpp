/*

transport_fault.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Classification of failures into transport faults (the link to the engine
broke, reconnecting may help) and everything else.

*/


#pragma once

#include <cctype>
#include <exception>
#include <string>
#include <string_view>
#include <enginexx/detail/asio_decl.hpp>

namespace enginexx::detail
{

/// Phrases that identify a broken link in an error message (matched case-insensitively).
inline constexpr std::string_view transport_fault_phrases[] = {
    "socket closed",
    "websocket",
    "econnreset",
    "connection reset",
    "connection",
    "broken pipe",
    "end of file",
    "transport"
};

[[nodiscard]] inline bool contains_ci(std::string_view text, std::string_view needle) noexcept
{
    if (needle.empty())
        return true;
    if (text.size() < needle.size())
        return false;
    for (std::size_t i = 0; i + needle.size() <= text.size(); ++i)
    {
        std::size_t j = 0;
        while (j < needle.size()
            && std::tolower(static_cast<unsigned char>(text[i + j]))
                == std::tolower(static_cast<unsigned char>(needle[j])))
        {
            ++j;
        }
        if (j == needle.size())
            return true;
    }
    return false;
}

/// Check whether an error code reports a connectivity problem.
[[nodiscard]] inline bool is_transport_error_code(const enginexx::asio::error_code& ec) noexcept
{
    namespace error = enginexx::asio::error;

    if (!ec)
        return false;

    if (ec == error::connection_reset
        || ec == error::connection_aborted
        || ec == error::connection_refused
        || ec == error::broken_pipe
        || ec == error::not_connected
        || ec == error::timed_out
        || ec == error::shut_down
        || ec == error::host_unreachable
        || ec == error::network_unreachable
        || ec == error::eof)
    {
        return true;
    }

    // Beast reports websocket and stream timeouts in its own categories.
    const std::string_view category = ec.category().name();
    return category == "boost.beast.websocket" || category == "boost.beast";
}

/**
 * Default transport-fault classifier.
 *
 * A system_error is judged by its code first; any exception whose message
 * contains one of transport_fault_phrases counts as a transport fault.
 */
[[nodiscard]] inline bool is_transport_fault(const std::exception& e) noexcept
{
    if (const auto* sys = dynamic_cast<const enginexx::asio::system_error*>(&e))
    {
        if (is_transport_error_code(sys->code()))
            return true;
    }

    const std::string_view msg = e.what();
    for (std::string_view phrase : transport_fault_phrases)
    {
        if (contains_ci(msg, phrase))
            return true;
    }
    return false;
}

} // namespace enginexx::detail
