/*

engine/engine_session.hpp
-------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

JSON-RPC 2.0 session with an analytics engine over a WebSocket, plain or TLS.

*/

#pragma once

#include <cstdint>
#include <deque>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <enginexx/detail/asio_decl.hpp>
#include <enginexx/detail/event_signal.hpp>
#include <enginexx/detail/log.hpp>
#include <enginexx/engine/engine_options.hpp>
#include <enginexx/session/endpoint.hpp>
#include <enginexx/session/session_event.hpp>

namespace enginexx::engine
{

using namespace enginexx::asio;

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
namespace ssl = boost::asio::ssl;

using json = nlohmann::json;

/// Handle of the engine's global object
inline constexpr int global_handle = -1;


/**
 * Error reported by the engine (JSON-RPC error reply) or by the session.
 */
class engine_error : public std::runtime_error
{
public:
    explicit engine_error(const std::string& msg, int code = 0)
        : std::runtime_error(msg)
        , code_(code)
    {
    }

    /// JSON-RPC error code, 0 when the error did not come from the engine
    [[nodiscard]] int code() const noexcept { return code_; }

private:
    int code_;
};


/**
 * A JSON-RPC call got no reply in time.
 */
class engine_timeout_error : public engine_error
{
public:
    explicit engine_timeout_error(const std::string& operation)
        : engine_error(operation + " timed out")
    {
    }
};


/**
 * Where a session for one resource connects.
 */
struct engine_target
{
    std::string host;
    std::string port;
    std::string path;         ///< "/app/<resource id>", after any base path of the URL
    std::string resource_id;
    std::string credential;
    bool secure = true;

    /// Value of the Host header
    [[nodiscard]] std::string host_header() const
    {
        const bool default_port = (secure && port == "443") || (!secure && port == "80");
        return default_port ? host : host + ":" + port;
    }
};

/**
 * Build the connection target of a resource on an endpoint.
 *
 * The scheme only selects the default port: "https://" and "wss://" (or no
 * scheme) mean 443, "http://" and "ws://" mean 80. Any path of the URL is
 * kept as a prefix of "/app/<resource id>".
 */
inline engine_target make_engine_target(const session::engine_endpoint& endpoint, std::string_view resource_id)
{
    engine_target target;
    target.resource_id = std::string(resource_id);
    target.credential = endpoint.credential;

    std::string_view url = endpoint.url;
    if (const auto pos = url.find("://"); pos != std::string_view::npos)
    {
        const std::string_view scheme = url.substr(0, pos);
        target.secure = !(scheme == "http" || scheme == "ws");
        url.remove_prefix(pos + 3);
    }

    std::string_view authority = url;
    std::string_view base_path;
    if (const auto slash = url.find('/'); slash != std::string_view::npos)
    {
        authority = url.substr(0, slash);
        base_path = url.substr(slash);
    }
    while (!base_path.empty() && base_path.back() == '/')
        base_path.remove_suffix(1);

    if (authority.empty())
        throw engine_error("Endpoint URL has no host: " + endpoint.url);

    if (const auto colon = authority.rfind(':'); colon != std::string_view::npos)
    {
        target.host = std::string(authority.substr(0, colon));
        target.port = std::string(authority.substr(colon + 1));
    }
    else
    {
        target.host = std::string(authority);
        target.port = target.secure ? "443" : "80";
    }

    target.path = std::string(base_path) + "/app/" + target.resource_id;
    return target;
}


/**
 * Sends JSON-RPC requests and returns their results.
 */
class rpc_channel
{
public:
    virtual ~rpc_channel() = default;

    /**
     * @return The "result" member of the reply
     * @throws engine_error for an error reply or a broken socket
     * @throws engine_timeout_error when no reply arrives in time
     */
    virtual awaitable<json> call(int handle, std::string method, json params) = 0;
};


/**
 * An opened app: a handle bound to the session that opened it.
 */
class engine_document
{
public:
    engine_document(std::shared_ptr<rpc_channel> channel, int handle, std::string resource_id)
        : channel_(std::move(channel))
        , handle_(handle)
        , resource_id_(std::move(resource_id))
    {
    }

    [[nodiscard]] int handle() const noexcept { return handle_; }

    [[nodiscard]] const std::string& resource_id() const noexcept { return resource_id_; }

    /// Call a method on this document
    awaitable<json> call(std::string method, json params = json::array())
    {
        return channel_->call(handle_, std::move(method), std::move(params));
    }

    /// The app layout ("qLayout"); also used as the liveness probe
    awaitable<json> get_app_layout()
    {
        json result = co_await channel_->call(handle_, "GetAppLayout", json::array());
        co_return result.value("qLayout", json::object());
    }

private:
    std::shared_ptr<rpc_channel> channel_;
    int handle_;
    std::string resource_id_;
};


template<typename Stream>
struct is_tls_stream : std::false_type {};

template<typename NextLayer>
struct is_tls_stream<beast::ssl_stream<NextLayer>> : std::true_type {};

} // namespace enginexx::engine


namespace enginexx::detail
{

/**
 * Shared state of one engine WebSocket: pending calls, the write queue and
 * the read loop. Outlives the session object while loops are running.
 */
template<typename Stream>
class engine_link
    : public engine::rpc_channel
    , public std::enable_shared_from_this<engine_link<Stream>>
{
public:
    using stream_type = boost::beast::websocket::stream<Stream>;

    template<typename... StreamArgs>
    engine_link(enginexx::asio::any_io_executor executor, engine::engine_options options,
                session::event_sink events, StreamArgs&&... stream_args)
        : executor_(executor)
        , options_(std::move(options))
        , events_(std::move(events))
        , ws_(std::forward<StreamArgs>(stream_args)...)
        , write_idle_(executor)
    {
    }

    stream_type& ws() noexcept { return ws_; }

    [[nodiscard]] bool is_open() const noexcept { return started_ && !finished_; }

    /// Start reading; call once the WebSocket handshake is done.
    void start()
    {
        started_ = true;
        enginexx::asio::co_spawn(executor_, read_loop(this->shared_from_this()), enginexx::asio::detached);
    }

    enginexx::asio::awaitable<engine::json> call(int handle, std::string method, engine::json params) override
    {
        using namespace enginexx::asio;

        if (finished_)
            throw engine::engine_error("Socket closed: " + close_reason_);
        if (closing_)
            throw engine::engine_error("Socket closed: session is closing");

        auto self = this->shared_from_this();
        const std::int64_t id = next_id_++;
        engine::json request = {
            {"jsonrpc", "2.0"},
            {"id", id},
            {"method", method},
            {"handle", handle},
            {"params", std::move(params)}
        };

        auto pending = std::make_shared<pending_call>(executor_);
        pending->timer.expires_after(options_.get_call());
        pending_.emplace(id, pending);
        enqueue(request.dump());

        error_code ec;
        co_await pending->timer.async_wait(redirect_error(use_awaitable, ec));
        pending_.erase(id);

        if (!pending->done)
            throw engine::engine_timeout_error("Call " + method);
        if (pending->error)
            std::rethrow_exception(pending->error);
        co_return std::move(*pending->reply);
    }

    /// Close handshake; the read loop then reports the session closed.
    enginexx::asio::awaitable<void> close()
    {
        using namespace enginexx::asio;

        if (finished_ || closing_)
            co_return;
        closing_ = true;
        outbox_.clear();

        auto self = this->shared_from_this();
        while (writing_)
            co_await write_idle_.wait();
        if (finished_)
            co_return;

        boost::beast::websocket::stream_base::timeout timeouts{};
        timeouts.handshake_timeout = options_.get_close();
        timeouts.idle_timeout = boost::beast::websocket::stream_base::none();
        timeouts.keep_alive_pings = false;
        ws_.set_option(timeouts);

        error_code ec;
        co_await ws_.async_close(boost::beast::websocket::close_code::normal, redirect_error(use_awaitable, ec));
        if (ec && ec != boost::asio::error::operation_aborted)
        {
            ENGINEXX_LOG_DEBUG("ENGINE", "Close handshake failed: " << ec.message());
            abort();
            throw system_error(ec, "WebSocket close");
        }
    }

    /// Drop the TCP connection without a close handshake.
    void abort() noexcept
    {
        closing_ = true;
        error_code ec;
        boost::beast::get_lowest_layer(ws_).socket().close(ec);
    }

private:
    using error_code = enginexx::asio::error_code;

    struct pending_call
    {
        explicit pending_call(enginexx::asio::any_io_executor executor) : timer(std::move(executor)) {}

        enginexx::asio::steady_timer timer;
        std::optional<engine::json> reply;
        std::exception_ptr error;
        bool done = false;
    };

    void enqueue(std::string frame)
    {
        ENGINEXX_TRACE_SEND("ENGINE", frame);
        outbox_.push_back(std::move(frame));
        if (!writing_)
        {
            writing_ = true;
            enginexx::asio::co_spawn(executor_, write_loop(this->shared_from_this()), enginexx::asio::detached);
        }
    }

    void dispatch(const std::string& text)
    {
        ENGINEXX_TRACE_RECV("ENGINE", text);

        engine::json message = engine::json::parse(text, nullptr, false);
        if (message.is_discarded() || !message.is_object())
        {
            ENGINEXX_LOG_WARN("ENGINE", "Ignoring malformed frame (" << text.size() << " bytes)");
            return;
        }

        const auto id_it = message.find("id");
        if (id_it == message.end() || !id_it->is_number_integer())
        {
            if (message.contains("method"))
                ENGINEXX_LOG_DEBUG("ENGINE", "Notification " << message["method"].dump());
            return;
        }

        auto it = pending_.find(id_it->get<std::int64_t>());
        if (it == pending_.end() || it->second->done)
            return;
        auto& call = *it->second;

        if (const auto err = message.find("error"); err != message.end() && err->is_object())
        {
            const auto code = err->find("code");
            const auto text = err->find("message");
            call.error = std::make_exception_ptr(engine::engine_error(
                text != err->end() && text->is_string() ? text->get<std::string>() : std::string("Engine error"),
                code != err->end() && code->is_number_integer() ? code->get<int>() : 0));
        }
        else
        {
            call.reply = message.value("result", engine::json::object());
        }
        call.done = true;
        call.timer.cancel();
    }

    void fail_pending(const std::string& reason)
    {
        for (auto& [id, call] : pending_)
        {
            if (call->done)
                continue;
            call->error = std::make_exception_ptr(engine::engine_error("Socket closed: " + reason));
            call->done = true;
            call->timer.cancel();
        }
    }

    /// Report the end of the link once: closed if requested or closed by the engine, error otherwise.
    void finish(const error_code& ec)
    {
        if (finished_)
            return;
        finished_ = true;

        const bool orderly = closing_ || ec == boost::beast::websocket::error::closed;
        if (ec == boost::beast::websocket::error::closed)
        {
            const auto& reason = ws_.reason();
            close_reason_ = "closed by engine (code " + std::to_string(static_cast<int>(reason.code)) + ")";
            if (!reason.reason.empty())
                close_reason_ += ": " + std::string(reason.reason.c_str());
        }
        else
        {
            close_reason_ = ec ? ec.message() : std::string("closed");
        }

        fail_pending(close_reason_);
        outbox_.clear();

        if (orderly)
        {
            ENGINEXX_LOG_DEBUG("ENGINE", "Session closed: " << close_reason_);
            events_.closed(close_reason_);
        }
        else
        {
            ENGINEXX_LOG_WARN("ENGINE", "Session failed: " << close_reason_);
            events_.error(close_reason_);
        }
    }

    static enginexx::asio::awaitable<void> read_loop(std::shared_ptr<engine_link> self)
    {
        using namespace enginexx::asio;

        boost::beast::flat_buffer buffer;
        error_code ec;
        for (;;)
        {
            co_await self->ws_.async_read(buffer, redirect_error(use_awaitable, ec));
            if (ec)
                break;
            self->dispatch(boost::beast::buffers_to_string(buffer.data()));
            buffer.consume(buffer.size());
        }
        self->finish(ec);
    }

    static enginexx::asio::awaitable<void> write_loop(std::shared_ptr<engine_link> self)
    {
        using namespace enginexx::asio;

        while (!self->outbox_.empty() && !self->finished_)
        {
            // The frame in flight belongs to this loop; close() and finish() may clear the queue meanwhile
            const std::string frame = std::move(self->outbox_.front());
            self->outbox_.pop_front();

            error_code ec;
            co_await self->ws_.async_write(boost::asio::buffer(frame), redirect_error(use_awaitable, ec));
            if (ec)
            {
                self->finish(ec);
                self->abort();
                break;
            }
        }
        self->writing_ = false;
        self->write_idle_.notify();
    }

    enginexx::asio::any_io_executor executor_;
    engine::engine_options options_;
    session::event_sink events_;
    stream_type ws_;

    std::map<std::int64_t, std::shared_ptr<pending_call>> pending_;
    std::int64_t next_id_ = 1;

    std::deque<std::string> outbox_;
    bool writing_ = false;
    enginexx::detail::event_signal write_idle_;

    bool started_ = false;
    bool closing_ = false;
    bool finished_ = false;
    std::string close_reason_;
};

} // namespace enginexx::detail


namespace enginexx::engine
{

/**
 * Session with the engine for one resource.
 *
 * Satisfies the session contract of pool::session_pool: open_document(),
 * close(), resume(), and lifecycle events through the sink given to connect().
 * A close frame from the engine or a requested close reports `closed`; any
 * other transport failure reports `error`. The transport never suspends.
 *
 * @tparam Stream beast::tcp_stream (ws://) or beast::ssl_stream<beast::tcp_stream> (wss://)
 */
template<typename Stream>
class basic_engine_session
{
public:
    using stream_type = Stream;
    using document_type = engine_document;
    using link_type = enginexx::detail::engine_link<Stream>;

    static constexpr bool is_tls = is_tls_stream<Stream>::value;

    /// Only the session itself can create the key, so only connect() constructs sessions.
    class construct_key
    {
        friend class basic_engine_session;
        explicit construct_key() = default;
    };

    basic_engine_session(construct_key, std::shared_ptr<link_type> link, engine_target target)
        : link_(std::move(link))
        , target_(std::move(target))
    {
    }

    basic_engine_session(const basic_engine_session&) = delete;
    basic_engine_session& operator=(const basic_engine_session&) = delete;

    ~basic_engine_session()
    {
        if (link_->is_open())
            link_->abort();
    }

    /**
     * Connect, upgrade to a WebSocket on target.path and start reading.
     *
     * @param tls TLS context, required for TLS sessions, ignored otherwise
     * @throws boost::system::system_error on resolve/connect/handshake failures
     */
    static awaitable<std::unique_ptr<basic_engine_session>> connect(
        any_io_executor executor, ssl::context* tls, engine_target target,
        session::event_sink events, engine_options options = {})
    {
        std::shared_ptr<link_type> link;
        if constexpr (is_tls)
        {
            if (tls == nullptr)
                throw engine_error("TLS context is required for " + target.host);
            link = std::make_shared<link_type>(executor, options, std::move(events), executor, *tls);
        }
        else
        {
            link = std::make_shared<link_type>(executor, options, std::move(events), executor);
        }

        auto& ws = link->ws();
        auto& lowest = beast::get_lowest_layer(ws);

        ENGINEXX_LOG_DEBUG("ENGINE", "Connecting to " << target.host << ":" << target.port << target.path);

        tcp::resolver resolver(executor);
        auto results = co_await resolver.async_resolve(target.host, target.port, use_awaitable);

        lowest.expires_after(options.get_connect());
        co_await lowest.async_connect(results, use_awaitable);

        if constexpr (is_tls)
        {
            auto& tls_stream = ws.next_layer();
            if (!SSL_set_tlsext_host_name(tls_stream.native_handle(), target.host.c_str()))
            {
                throw system_error(error_code(static_cast<int>(::ERR_get_error()),
                    boost::asio::error::get_ssl_category()), "SNI");
            }
            if (options.verify_peer)
            {
                tls_stream.set_verify_mode(ssl::verify_peer);
                tls_stream.set_verify_callback(ssl::host_name_verification(target.host));
            }
            else
            {
                tls_stream.set_verify_mode(ssl::verify_none);
            }

            lowest.expires_after(options.get_handshake());
            co_await tls_stream.async_handshake(ssl::stream_base::client, use_awaitable);
        }

        // The websocket timeouts take over from the TCP deadline.
        lowest.expires_never();

        websocket::stream_base::timeout timeouts{};
        timeouts.handshake_timeout = options.get_handshake();
        timeouts.idle_timeout = websocket::stream_base::none();
        timeouts.keep_alive_pings = false;
        ws.set_option(timeouts);

        ws.set_option(websocket::stream_base::decorator(
            [user_agent = options.user_agent, credential = target.credential](websocket::request_type& req)
            {
                req.set(http::field::user_agent, user_agent);
                if (!credential.empty())
                    req.set(http::field::authorization, "Bearer " + credential);
            }));

        co_await ws.async_handshake(target.host_header(), target.path, use_awaitable);

        link->start();
        ENGINEXX_LOG_INFO("ENGINE", "Session open on " << target.host << target.path);
        co_return std::make_unique<basic_engine_session>(construct_key{}, std::move(link), std::move(target));
    }

    /// Open the app named by the target's resource id (OpenDoc on the global handle)
    awaitable<std::shared_ptr<engine_document>> open_document()
    {
        json params = json::array({target_.resource_id});
        json result = co_await link_->call(global_handle, "OpenDoc", std::move(params));

        const auto ret = result.find("qReturn");
        if (ret == result.end() || !ret->is_object() || !ret->contains("qHandle"))
            throw engine_error("OpenDoc returned no document handle for " + target_.resource_id);

        const int handle = (*ret)["qHandle"].get<int>();
        ENGINEXX_LOG_DEBUG("ENGINE", "Opened " << target_.resource_id << " as handle " << handle);
        co_return std::make_shared<engine_document>(link_, handle, target_.resource_id);
    }

    /// Call a method on the global object
    awaitable<json> call(std::string method, json params = json::array())
    {
        return link_->call(global_handle, std::move(method), std::move(params));
    }

    awaitable<void> close()
    {
        return link_->close();
    }

    void resume()
    {
        ENGINEXX_LOG_DEBUG("ENGINE", "Resume requested for " << target_.resource_id
            << " (" << (link_->is_open() ? "open" : "closed") << "), nothing to do");
    }

    [[nodiscard]] bool is_open() const noexcept { return link_->is_open(); }

    [[nodiscard]] const engine_target& target() const noexcept { return target_; }

private:
    std::shared_ptr<link_type> link_;
    engine_target target_;
};


/// Session over TLS (wss://)
using engine_session = basic_engine_session<beast::ssl_stream<beast::tcp_stream>>;

/// Session over plain TCP (ws://)
using plain_engine_session = basic_engine_session<beast::tcp_stream>;

} // namespace enginexx::engine
