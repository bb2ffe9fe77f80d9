/*

pool/session_pool.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include <enginexx/detail/asio_decl.hpp>
#include <enginexx/detail/awaitable_traits.hpp>
#include <enginexx/detail/event_signal.hpp>
#include <enginexx/detail/log.hpp>
#include <enginexx/detail/reconnection.hpp>
#include <enginexx/pool/pool_config.hpp>
#include <enginexx/session/endpoint.hpp>
#include <enginexx/session/session_event.hpp>

namespace enginexx::pool
{

using namespace enginexx::asio;

/**
 * Exception thrown when pool operations fail.
 */
class pool_error : public std::runtime_error
{
public:
    explicit pool_error(const std::string& msg) : std::runtime_error(msg) {}
    explicit pool_error(const char* msg) : std::runtime_error(msg) {}
};


/**
 * Exception thrown by any operation started after shutdown().
 */
class pool_shutdown_error : public pool_error
{
public:
    pool_shutdown_error() : pool_error("Session pool is shut down") {}
};


/**
 * Exception thrown by execute_with_retry() when a broken resource could not
 * be reconnected.
 */
class reconnect_exhausted_error : public pool_error
{
public:
    reconnect_exhausted_error(std::string resource_id, unsigned int attempts)
        : pool_error("Failed to reconnect to " + resource_id + " after "
            + std::to_string(attempts) + " attempts")
        , resource_id_(std::move(resource_id))
        , attempts_(attempts)
    {
    }

    [[nodiscard]] const std::string& resource_id() const noexcept { return resource_id_; }

    [[nodiscard]] unsigned int attempts() const noexcept { return attempts_; }

private:
    std::string resource_id_;
    unsigned int attempts_;
};


/// Life cycle of a pooled connection. removed is terminal.
enum class connection_state : std::uint8_t
{
    creating,
    idle,
    in_use,
    removed
};

[[nodiscard]] constexpr std::string_view to_string(connection_state state) noexcept
{
    switch (state)
    {
        case connection_state::creating: return "creating";
        case connection_state::idle:     return "idle";
        case connection_state::in_use:   return "in_use";
        case connection_state::removed:  return "removed";
    }
    return "unknown";
}

} // namespace enginexx::pool


namespace enginexx::detail
{

/**
 * One pooled session, shared by the pool, its health loop and a lease.
 */
template<typename Session>
struct pooled_entry
{
    using document_type = typename Session::document_type;

    pooled_entry(enginexx::asio::any_io_executor executor, std::uint64_t connection_id, std::string resource)
        : id(connection_id)
        , resource_id(std::move(resource))
        , health_timer(std::move(executor))
    {
    }

    pooled_entry(const pooled_entry&) = delete;
    pooled_entry& operator=(const pooled_entry&) = delete;

    std::uint64_t id;
    std::string resource_id;
    std::unique_ptr<Session> session;
    std::shared_ptr<document_type> document;
    pool::connection_metadata metadata;
    pool::connection_state state = pool::connection_state::creating;
    enginexx::asio::steady_timer health_timer;

    bool probing = false;            // in_use because of a health probe, not a caller
    bool close_on_release = false;   // evicted while held
    bool closed = false;             // close() already issued
    std::string creation_failure;    // lifecycle event received while creating
};

} // namespace enginexx::detail


namespace enginexx::pool
{

template<typename Session>
class session_pool;


/**
 * RAII handle on a connection held by a caller.
 * The connection goes back to the pool when the lease is released or destroyed.
 */
template<typename Session>
class session_lease
{
public:
    using pool_type = session_pool<Session>;
    using entry_type = enginexx::detail::pooled_entry<Session>;
    using document_type = typename Session::document_type;

    session_lease() = default;

    session_lease(session_lease&& other) noexcept
        : entry_(std::move(other.entry_))
        , pool_(std::move(other.pool_))
        , reused_(other.reused_)
    {
    }

    session_lease& operator=(session_lease&& other) noexcept
    {
        if (this != &other)
        {
            release();
            entry_ = std::move(other.entry_);
            pool_ = std::move(other.pool_);
            reused_ = other.reused_;
        }
        return *this;
    }

    // Non-copyable
    session_lease(const session_lease&) = delete;
    session_lease& operator=(const session_lease&) = delete;

    ~session_lease()
    {
        release();
    }

    /// Document handle of the leased connection
    document_type& document() const { return *entry_->document; }

    const std::shared_ptr<document_type>& document_ptr() const { return entry_->document; }

    document_type& operator*() const { return *entry_->document; }
    document_type* operator->() const { return entry_->document.get(); }

    Session& session() const { return *entry_->session; }

    explicit operator bool() const noexcept { return entry_ != nullptr; }

    /// True when the connection came from the pool rather than the factory
    [[nodiscard]] bool reused() const noexcept { return reused_; }

    [[nodiscard]] std::uint64_t connection_id() const { return entry_->id; }

    [[nodiscard]] const std::string& resource_id() const { return entry_->resource_id; }

    /// Give the connection back (normally done by the destructor). Idempotent.
    void release()
    {
        if (!entry_)
            return;

        auto entry = std::move(entry_);
        if (auto pool = pool_.lock())
        {
            pool->release_entry(entry);
        }
        else if (entry->state == connection_state::in_use)
        {
            entry->state = connection_state::idle;
            entry->metadata.touch();
        }
        pool_.reset();
    }

private:
    friend class session_pool<Session>;

    session_lease(std::shared_ptr<entry_type> entry, std::weak_ptr<pool_type> pool, bool reused)
        : entry_(std::move(entry))
        , pool_(std::move(pool))
        , reused_(reused)
    {
    }

    std::shared_ptr<entry_type> entry_;
    std::weak_ptr<pool_type> pool_;
    bool reused_ = false;
};


/**
 * Pool of engine sessions keyed by resource id.
 *
 * Keeps sessions warm between requests for the same resource, expires idle
 * ones after a TTL, probes each one periodically and rebuilds broken ones in
 * the background. Sessions report closes and failures through an event
 * channel instead of callbacks.
 *
 * All members must be called on the pool executor; the pool takes no locks.
 *
 * @tparam Session Session type. Must provide
 *   - `document_type`
 *   - `awaitable<std::shared_ptr<document_type>> open_document()`
 *   - `awaitable<void> close()`
 *   - `void resume()`
 *
 * @code
 * auto pool = pool::make_session_pool<engine::engine_session>(
 *     ctx.get_executor(), pool::session_pool_config::defaults(), tenants, factory, probe);
 *
 * auto layout = co_await pool->execute_with_retry("app-1",
 *     [](engine::engine_document& doc) { return doc.get_app_layout(); });
 *
 * co_await pool->shutdown();
 * @endcode
 */
template<typename Session>
class session_pool : public std::enable_shared_from_this<session_pool<Session>>
{
public:
    using session_type = Session;
    using document_type = typename Session::document_type;
    using lease_type = session_lease<Session>;
    using entry_type = enginexx::detail::pooled_entry<Session>;
    using factory_type = std::function<awaitable<std::unique_ptr<Session>>(
        std::string resource_id, session::engine_endpoint endpoint, session::event_sink events)>;
    using probe_type = std::function<awaitable<void>(document_type&)>;
    using reconnect_result = enginexx::detail::reconnect_result<entry_type>;

    /**
     * Create a session pool. Background tasks only run after start();
     * make_session_pool() does both.
     *
     * @param executor  Executor every pool coroutine runs on
     * @param config    Pool configuration
     * @param endpoints Provider consulted each time a session is opened
     * @param factory   Opens a session for a resource id
     * @param probe     Liveness check run against the document handle (empty = no probing)
     */
    session_pool(any_io_executor executor, session_pool_config config,
                 std::shared_ptr<session::endpoint_provider> endpoints,
                 factory_type factory, probe_type probe = {})
        : executor_(std::move(executor))
        , config_(std::move(config))
        , endpoints_(std::move(endpoints))
        , factory_(std::move(factory))
        , probe_(std::move(probe))
        , events_(std::make_shared<session::event_channel>(executor_))
        , sweep_timer_(std::make_shared<steady_timer>(executor_))
        , tasks_done_(executor_)
    {
        if (!factory_)
            throw pool_error("Factory function is required");
        if (!endpoints_)
            throw pool_error("Endpoint provider is required");
    }

    ~session_pool()
    {
        // Wake every background loop; they find the pool gone and stop.
        sweep_timer_->cancel();
        events_->close();
        for (auto& [id, timer] : backoff_timers_)
            timer->cancel();
        for (auto& [id, entry] : index_)
            entry->health_timer.cancel();
    }

    // Non-copyable, non-movable
    session_pool(const session_pool&) = delete;
    session_pool& operator=(const session_pool&) = delete;
    session_pool(session_pool&&) = delete;
    session_pool& operator=(session_pool&&) = delete;

    /// Start the cleanup sweeper and the lifecycle event handler.
    void start()
    {
        if (started_ || shut_down_)
            return;
        started_ = true;

        if (config_.cleanup_interval.count() > 0)
            spawn_tracked(sweep_loop(this->weak_from_this(), sweep_timer_, config_.cleanup_interval));
        spawn_tracked(event_loop(this->weak_from_this(), events_));

        ENGINEXX_LOG_DEBUG("POOL", "Session pool started (ttl " << config_.connection_ttl.count()
            << "ms, probe every " << config_.health_check_interval.count()
            << "ms, sweep every " << config_.cleanup_interval.count() << "ms)");
    }

    /**
     * Lease a connection for a resource.
     *
     * Reuses an idle connection whose idle time is below the TTL, otherwise
     * opens a new one against the endpoint current at that moment. Never
     * waits for a connection held by another caller.
     *
     * @throws pool_shutdown_error after shutdown()
     * @throws whatever the factory or open_document() throws
     */
    awaitable<lease_type> get_connection(std::string resource_id)
    {
        if (shut_down_)
            throw pool_shutdown_error();

        ++stats_.total_requests;
        const auto now = steady_clock::now();

        if (auto it = resources_.find(resource_id); it != resources_.end())
        {
            for (const auto& entry : it->second)
            {
                if (entry->state == connection_state::idle
                    && !entry->close_on_release
                    && !entry->metadata.is_expired(now, config_.connection_ttl))
                {
                    entry->state = connection_state::in_use;
                    entry->metadata.mark_used(now);
                    ++stats_.cache_hits;
                    ENGINEXX_LOG_DEBUG("POOL", "Reusing connection " << entry->id << " for " << resource_id
                        << " (used " << entry->metadata.times_used << " times)");
                    co_return lease_type(entry, this->weak_from_this(), true);
                }
            }
        }

        ++stats_.cache_misses;
        auto entry = co_await create_entry(resource_id, connection_state::in_use);
        co_return lease_type(std::move(entry), this->weak_from_this(), false);
    }

    /**
     * Run an operation against a pooled document, repairing the connection
     * after transport faults.
     *
     * Each attempt leases a connection and releases it whatever happens. A
     * transport fault before the last attempt evicts the resource's
     * connections, reconnects once and retries. Other failures, and a
     * transport fault on the last attempt, are rethrown unchanged.
     *
     * @param operation Callable `awaitable<T>(document_type&)`
     * @throws reconnect_exhausted_error if the reconnect between attempts fails
     */
    template<typename Operation>
    awaitable<enginexx::detail::invoke_awaitable_t<Operation&, document_type&>>
    execute_with_retry(std::string resource_id, Operation operation)
    {
        using result_type = enginexx::detail::invoke_awaitable_t<Operation&, document_type&>;

        const unsigned int max_attempts = std::max(1u, config_.max_execute_attempts);
        for (unsigned int attempt = 1; ; ++attempt)
        {
            std::exception_ptr failure;
            bool transport = false;
            std::string message;

            try
            {
                auto lease = co_await get_connection(resource_id);
                if constexpr (std::is_void_v<result_type>)
                {
                    co_await operation(lease.document());
                    co_return;
                }
                else
                {
                    co_return co_await operation(lease.document());
                }
            }
            catch (const std::exception& e)
            {
                failure = std::current_exception();
                message = e.what();
                transport = config_.transport_fault && config_.transport_fault(e);
            }

            if (transport)
                ++stats_.transport_faults;

            if (!transport || attempt >= max_attempts || shut_down_)
                std::rethrow_exception(failure);

            ENGINEXX_LOG_WARN("POOL", "Transport fault on " << resource_id << " (attempt " << attempt
                << "/" << max_attempts << "): " << message);

            evict(resource_id);
            auto outcome = co_await reconnect(resource_id);
            if (const auto* exhausted = std::get_if<enginexx::detail::reconnect_exhausted>(&outcome))
                throw reconnect_exhausted_error(resource_id, exhausted->attempts);
        }
    }

    /**
     * Open (or reuse) one connection per resource id concurrently and give
     * it straight back. Failures are logged.
     *
     * @return Number of resources that got a connection
     */
    awaitable<std::size_t> warm_up(std::vector<std::string> resource_ids)
    {
        if (resource_ids.empty())
            co_return 0;

        auto state = std::make_shared<warm_up_state>(executor_);
        state->remaining = resource_ids.size();

        ENGINEXX_LOG_INFO("POOL", "Warming up " << resource_ids.size() << " resources");
        for (auto& id : resource_ids)
            spawn_tracked(warm_one(this->shared_from_this(), std::move(id), state));

        while (state->remaining > 0)
            co_await state->done.wait();

        ENGINEXX_LOG_INFO("POOL", "Warm-up finished: " << state->succeeded << "/" << resource_ids.size()
            << " resources ready");
        co_return state->succeeded;
    }

    /**
     * Rebuild a connection for a resource with bounded backoff.
     *
     * Attempt n waits reconnect.calculate_delay(n) and then opens a session
     * like a cache miss. The new connection is registered idle.
     */
    awaitable<reconnect_result> reconnect(std::string resource_id)
    {
        const auto& policy = config_.reconnect;
        unsigned int attempts = 0;
        std::exception_ptr last_error;

        for (unsigned int attempt = 1; attempt <= policy.max_attempts && !shut_down_; ++attempt)
        {
            const auto delay = policy.calculate_delay(attempt);
            ENGINEXX_LOG_INFO("RECONNECT", "Reconnecting " << resource_id << " (attempt " << attempt
                << "/" << policy.max_attempts << ") in " << delay.count() << "ms");

            auto timer = std::make_shared<steady_timer>(executor_);
            const auto timer_id = next_timer_id_++;
            backoff_timers_.emplace(timer_id, timer);
            timer->expires_after(delay);

            error_code ec;
            co_await timer->async_wait(redirect_error(use_awaitable, ec));
            backoff_timers_.erase(timer_id);
            if (ec == error::operation_aborted || shut_down_)
                break;

            ++attempts;
            ++stats_.reconnect_attempts;
            try
            {
                auto entry = co_await create_entry(resource_id, connection_state::idle);
                ++stats_.reconnect_successes;
                ENGINEXX_LOG_INFO("RECONNECT", "Reconnected " << resource_id << " as connection " << entry->id);
                co_return enginexx::detail::reconnect_connected<entry_type>{std::move(entry)};
            }
            catch (const std::exception& e)
            {
                last_error = std::current_exception();
                ENGINEXX_LOG_WARN("RECONNECT", "Reconnect attempt " << attempt << " for " << resource_id
                    << " failed: " << e.what());
            }
        }

        co_return enginexx::detail::reconnect_exhausted{resource_id, attempts, last_error};
    }

    /**
     * Deregister every connection of a resource. Idle ones are closed now,
     * held ones when their lease is released.
     *
     * @return Number of connections evicted
     */
    std::size_t evict(const std::string& resource_id)
    {
        auto it = resources_.find(resource_id);
        if (it == resources_.end())
            return 0;

        const auto entries = it->second;
        std::size_t count = 0;
        for (const auto& entry : entries)
        {
            if (entry->state == connection_state::idle)
            {
                remove_entry(entry, "evicted");
                spawn_close(entry);
                ++count;
            }
            else if (entry->state == connection_state::in_use && !entry->close_on_release)
            {
                entry->close_on_release = true;
                ++count;
            }
        }

        ENGINEXX_LOG_INFO("POOL", "Evicted " << count << " connections for " << resource_id);
        return count;
    }

    /**
     * One cleanup pass: remove idle connections whose idle time reached the TTL.
     *
     * @return Number of connections removed
     */
    std::size_t evict_expired()
    {
        const auto now = steady_clock::now();

        std::vector<std::shared_ptr<entry_type>> expired;
        for (const auto& [resource_id, entries] : resources_)
        {
            for (const auto& entry : entries)
            {
                if (entry->state == connection_state::idle
                    && entry->metadata.is_expired(now, config_.connection_ttl))
                {
                    expired.push_back(entry);
                }
            }
        }

        for (const auto& entry : expired)
        {
            remove_entry(entry, "idle TTL expired");
            ++stats_.connections_expired;
            spawn_close(entry);
        }

        if (!expired.empty())
            ENGINEXX_LOG_INFO("POOL", "Cleanup removed " << expired.size() << " expired connections");
        return expired.size();
    }

    /**
     * Stop the pool: cancel every timer, close every session and wait for
     * the background tasks. Idempotent.
     */
    awaitable<void> shutdown()
    {
        auto self = this->shared_from_this();

        if (!shut_down_)
        {
            shut_down_ = true;
            ENGINEXX_LOG_INFO("POOL", "Shutting down session pool (" << index_.size() << " connections)");

            sweep_timer_->cancel();
            for (auto& [id, timer] : backoff_timers_)
                timer->cancel();
            backoff_timers_.clear();
            events_->close();

            std::vector<std::shared_ptr<entry_type>> entries;
            entries.reserve(index_.size());
            for (auto& [id, entry] : index_)
                entries.push_back(entry);
            index_.clear();
            resources_.clear();

            for (const auto& entry : entries)
            {
                entry->health_timer.cancel();
                entry->state = connection_state::removed;
            }
            stats_.connections_removed += entries.size();

            for (const auto& entry : entries)
                co_await close_session(entry);
        }

        while (active_tasks_ > 0)
            co_await tasks_done_.wait();

        ENGINEXX_LOG_INFO("POOL", "Session pool shut down");
    }

    /**
     * Snapshot of the pool: live counts plus lifetime counters.
     */
    pool_stats stats() const
    {
        pool_stats snapshot = stats_;
        snapshot.total_connections = 0;
        snapshot.active_connections = 0;
        snapshot.idle_connections = 0;
        snapshot.connections_by_resource.clear();

        const auto now = steady_clock::now();
        steady_clock::duration total_age{0};
        for (const auto& [resource_id, entries] : resources_)
        {
            snapshot.connections_by_resource[resource_id] = entries.size();
            for (const auto& entry : entries)
            {
                ++snapshot.total_connections;
                if (entry->state == connection_state::in_use)
                    ++snapshot.active_connections;
                else
                    ++snapshot.idle_connections;
                total_age += entry->metadata.age(now);
            }
        }

        if (snapshot.total_connections > 0)
        {
            snapshot.avg_connection_age = std::chrono::duration_cast<std::chrono::milliseconds>(
                total_age / static_cast<long long>(snapshot.total_connections));
        }
        return snapshot;
    }

    /// cache_hits / total_requests, 0 before the first request
    [[nodiscard]] double hit_rate() const noexcept
    {
        return stats_.hit_rate();
    }

    /// Registered connections across all resources
    [[nodiscard]] std::size_t size() const noexcept
    {
        return index_.size();
    }

    [[nodiscard]] std::size_t connection_count(const std::string& resource_id) const
    {
        auto it = resources_.find(resource_id);
        return it == resources_.end() ? 0 : it->second.size();
    }

    [[nodiscard]] const session_pool_config& config() const noexcept { return config_; }

    [[nodiscard]] bool is_shut_down() const noexcept { return shut_down_; }

    [[nodiscard]] const any_io_executor& get_executor() const noexcept { return executor_; }

private:
    friend class session_lease<Session>;

    struct warm_up_state
    {
        explicit warm_up_state(any_io_executor executor) : done(std::move(executor)) {}

        std::size_t remaining = 0;
        std::size_t succeeded = 0;
        enginexx::detail::event_signal done;
    };

    /**
     * Open a session and its document, then register it in the given state.
     * A session that fails after being opened is closed before rethrowing.
     */
    awaitable<std::shared_ptr<entry_type>> create_entry(std::string resource_id, connection_state initial)
    {
        const session::engine_endpoint endpoint = endpoints_->current();
        auto entry = std::make_shared<entry_type>(executor_, next_connection_id_++, resource_id);
        creating_.emplace(entry->id, entry);

        ENGINEXX_LOG_DEBUG("POOL", "Opening connection " << entry->id << " for " << resource_id
            << " on " << (endpoint.display_name.empty() ? endpoint.url : endpoint.display_name));

        std::exception_ptr failure;
        try
        {
            entry->session = co_await factory_(resource_id, endpoint,
                session::event_sink(events_, entry->id));
            if (!entry->session)
                throw pool_error("Session factory returned no session for " + resource_id);

            entry->document = co_await entry->session->open_document();
            if (!entry->document)
                throw pool_error("Session returned no document for " + resource_id);
        }
        catch (const std::exception& e)
        {
            failure = std::current_exception();
            ENGINEXX_LOG_WARN("POOL", "Failed to open connection for " << resource_id << ": " << e.what());
        }
        creating_.erase(entry->id);

        if (!failure && shut_down_)
            failure = std::make_exception_ptr(pool_shutdown_error());
        if (!failure && !entry->creation_failure.empty())
        {
            failure = std::make_exception_ptr(pool_error("Connection for " + resource_id + " "
                + entry->creation_failure + " while being created"));
        }

        if (failure)
        {
            entry->state = connection_state::removed;
            co_await close_session(entry);
            std::rethrow_exception(failure);
        }

        register_entry(entry, initial);
        co_return entry;
    }

    void register_entry(const std::shared_ptr<entry_type>& entry, connection_state initial)
    {
        const auto now = steady_clock::now();
        entry->metadata = connection_metadata{};
        entry->state = initial;
        if (initial == connection_state::in_use)
            entry->metadata.mark_used(now);

        auto& entries = resources_[entry->resource_id];
        if (entries.size() >= config_.max_connections_per_resource)
        {
            ++stats_.soft_cap_exceeded;
            ENGINEXX_LOG_WARN("POOL", "Resource " << entry->resource_id << " now has " << entries.size() + 1
                << " connections (soft cap " << config_.max_connections_per_resource << ")");
        }
        entries.push_back(entry);
        index_.emplace(entry->id, entry);
        ++stats_.connections_created;

        ENGINEXX_LOG_INFO("POOL", "Connection " << entry->id << " registered for " << entry->resource_id
            << " (" << to_string(initial) << ", " << entries.size() << " for this resource)");

        if (probe_ && config_.health_check_interval.count() > 0)
            spawn_tracked(health_loop(this->weak_from_this(), entry, config_.health_check_interval));
    }

    /// Drop an entry from every index. Returns false if it was already removed.
    bool remove_entry(const std::shared_ptr<entry_type>& entry, std::string_view reason)
    {
        if (entry->state == connection_state::removed)
            return false;
        entry->state = connection_state::removed;
        entry->health_timer.cancel();

        index_.erase(entry->id);
        if (auto it = resources_.find(entry->resource_id); it != resources_.end())
        {
            auto& entries = it->second;
            entries.erase(std::remove(entries.begin(), entries.end(), entry), entries.end());
            if (entries.empty())
                resources_.erase(it);
        }
        ++stats_.connections_removed;

        ENGINEXX_LOG_DEBUG("POOL", "Connection " << entry->id << " for " << entry->resource_id
            << " removed: " << reason);
        return true;
    }

    void release_entry(const std::shared_ptr<entry_type>& entry)
    {
        if (entry->state != connection_state::in_use || entry->probing)
            return;

        if (entry->close_on_release)
        {
            remove_entry(entry, "evicted while in use");
            spawn_close(entry);
            return;
        }

        entry->state = connection_state::idle;
        entry->metadata.touch();

        if (config_.trim_surplus_on_release
            && connection_count(entry->resource_id) > config_.max_connections_per_resource)
        {
            remove_entry(entry, "above the per-resource cap");
            spawn_close(entry);
        }
    }

    void handle_event(const session::session_event& event)
    {
        if (auto it = creating_.find(event.connection_id); it != creating_.end())
        {
            if (event.signal != session::session_signal::suspended)
            {
                it->second->creation_failure = std::string(session::to_string(event.signal));
                if (!event.detail.empty())
                    it->second->creation_failure += " (" + event.detail + ")";
            }
            return;
        }

        auto it = index_.find(event.connection_id);
        if (it == index_.end())
        {
            ENGINEXX_LOG_TRACE("POOL", "Ignoring " << session::to_string(event.signal)
                << " event for unknown connection " << event.connection_id);
            return;
        }
        auto entry = it->second;

        switch (event.signal)
        {
            case session::session_signal::closed:
                ENGINEXX_LOG_INFO("POOL", "Connection " << entry->id << " for " << entry->resource_id
                    << " closed" << (event.detail.empty() ? "" : ": ") << event.detail);
                entry->closed = true;
                remove_entry(entry, "session closed");
                break;

            case session::session_signal::error:
                ENGINEXX_LOG_WARN("POOL", "Connection " << entry->id << " for " << entry->resource_id
                    << " failed: " << event.detail);
                remove_entry(entry, "session error");
                spawn_close(entry);
                break;

            case session::session_signal::suspended:
                ENGINEXX_LOG_INFO("POOL", "Connection " << entry->id << " for " << entry->resource_id
                    << " suspended, resuming");
                try
                {
                    entry->session->resume();
                }
                catch (const std::exception& e)
                {
                    ENGINEXX_LOG_WARN("POOL", "Resuming connection " << entry->id << " failed: " << e.what());
                    remove_entry(entry, "resume failed");
                    spawn_close(entry);
                }
                break;
        }
    }

    /**
     * Probe one connection. Connections held by a caller are skipped; the
     * probed one is marked in use so no caller receives it mid-probe.
     */
    awaitable<void> probe(std::shared_ptr<entry_type> entry)
    {
        if (entry->state != connection_state::idle)
        {
            ENGINEXX_LOG_TRACE("POOL", "Skipping probe of connection " << entry->id
                << " (" << to_string(entry->state) << ")");
            co_return;
        }

        entry->state = connection_state::in_use;
        entry->probing = true;

        std::exception_ptr failure;
        std::string message;
        try
        {
            co_await probe_(*entry->document);
        }
        catch (const std::exception& e)
        {
            failure = std::current_exception();
            message = e.what();
        }
        entry->probing = false;

        if (entry->state == connection_state::removed)
            co_return;

        if (!failure)
        {
            if (entry->close_on_release)
            {
                remove_entry(entry, "evicted while probed");
                spawn_close(entry);
            }
            else
            {
                entry->state = connection_state::idle;
            }
            co_return;
        }

        ++stats_.probe_failures;
        ENGINEXX_LOG_WARN("POOL", "Health check failed for connection " << entry->id << " ("
            << entry->resource_id << "): " << message);
        remove_entry(entry, "health check failed");
        spawn_close(entry);
        spawn_repair(entry->resource_id);
    }

    void spawn_repair(std::string resource_id)
    {
        if (shut_down_)
            return;
        spawn_tracked(repair(this->shared_from_this(), std::move(resource_id)));
    }

    void spawn_close(std::shared_ptr<entry_type> entry)
    {
        spawn_tracked(close_session(std::move(entry)));
    }

    /// Run a background task that shutdown() waits for.
    void spawn_tracked(awaitable<void> task)
    {
        ++active_tasks_;
        co_spawn(executor_, std::move(task),
            [weak = this->weak_from_this()](std::exception_ptr ep)
            {
                auto self = weak.lock();
                if (self)
                    self->task_finished();
                if (ep)
                    log_background_failure(ep);
            });
    }

    static void log_background_failure(std::exception_ptr ep)
    {
        try
        {
            std::rethrow_exception(ep);
        }
        catch (const std::exception& e)
        {
            ENGINEXX_LOG_ERROR("POOL", "Background task failed: " << e.what());
        }
        catch (...)
        {
            ENGINEXX_LOG_ERROR("POOL", "Background task failed with an unknown exception");
        }
    }

    void task_finished()
    {
        if (active_tasks_ > 0 && --active_tasks_ == 0)
            tasks_done_.notify();
    }

    static awaitable<void> close_session(std::shared_ptr<entry_type> entry)
    {
        if (!entry->session || entry->closed)
            co_return;
        entry->closed = true;

        try
        {
            co_await entry->session->close();
        }
        catch (const std::exception& e)
        {
            ENGINEXX_LOG_DEBUG("POOL", "Closing connection " << entry->id << " failed: " << e.what());
        }
    }

    static awaitable<void> repair(std::shared_ptr<session_pool> self, std::string resource_id)
    {
        auto outcome = co_await self->reconnect(resource_id);
        if (const auto* exhausted = std::get_if<enginexx::detail::reconnect_exhausted>(&outcome))
        {
            ENGINEXX_LOG_ERROR("RECONNECT", "Giving up on " << resource_id << " after "
                << exhausted->attempts << " attempts");
        }
    }

    static awaitable<void> warm_one(std::shared_ptr<session_pool> self, std::string resource_id,
                                    std::shared_ptr<warm_up_state> state)
    {
        try
        {
            auto lease = co_await self->get_connection(resource_id);
            lease.release();
            ++state->succeeded;
        }
        catch (const std::exception& e)
        {
            ENGINEXX_LOG_WARN("POOL", "Warm-up of " << resource_id << " failed: " << e.what());
        }

        if (--state->remaining == 0)
            state->done.notify();
    }

    static awaitable<void> health_loop(std::weak_ptr<session_pool> weak, std::shared_ptr<entry_type> entry,
                                       std::chrono::milliseconds interval)
    {
        // The entry may be removed while a probe is in flight, when no wait is pending to cancel
        while (entry->state != connection_state::removed)
        {
            entry->health_timer.expires_after(interval);
            error_code ec;
            co_await entry->health_timer.async_wait(redirect_error(use_awaitable, ec));
            if (ec == error::operation_aborted || entry->state == connection_state::removed)
                co_return;

            auto self = weak.lock();
            if (!self || self->shut_down_)
                co_return;
            co_await self->probe(entry);
            if (self->shut_down_)
                co_return;
        }
    }

    static awaitable<void> sweep_loop(std::weak_ptr<session_pool> weak, std::shared_ptr<steady_timer> timer,
                                      std::chrono::milliseconds interval)
    {
        for (;;)
        {
            timer->expires_after(interval);
            error_code ec;
            co_await timer->async_wait(redirect_error(use_awaitable, ec));
            if (ec == error::operation_aborted)
                co_return;

            auto self = weak.lock();
            if (!self || self->shut_down_)
                co_return;
            self->evict_expired();
        }
    }

    static awaitable<void> event_loop(std::weak_ptr<session_pool> weak,
                                      std::shared_ptr<session::event_channel> events)
    {
        for (;;)
        {
            auto event = co_await events->receive();
            if (!event)
                co_return;

            auto self = weak.lock();
            if (!self)
                co_return;
            self->handle_event(*event);
        }
    }

    any_io_executor executor_;
    session_pool_config config_;
    std::shared_ptr<session::endpoint_provider> endpoints_;
    factory_type factory_;
    probe_type probe_;

    std::shared_ptr<session::event_channel> events_;
    std::shared_ptr<steady_timer> sweep_timer_;

    // Connection storage: per resource in creation order, plus routing by id
    std::unordered_map<std::string, std::vector<std::shared_ptr<entry_type>>> resources_;
    std::unordered_map<std::uint64_t, std::shared_ptr<entry_type>> index_;
    std::unordered_map<std::uint64_t, std::shared_ptr<entry_type>> creating_;
    std::uint64_t next_connection_id_ = 1;

    // Reconnect backoff timers, cancelled by shutdown()
    std::map<std::uint64_t, std::shared_ptr<steady_timer>> backoff_timers_;
    std::uint64_t next_timer_id_ = 1;

    // Background tasks joined by shutdown()
    std::size_t active_tasks_ = 0;
    enginexx::detail::event_signal tasks_done_;

    pool_stats stats_;
    bool started_ = false;
    bool shut_down_ = false;
};


/**
 * Create a session pool and start its background tasks.
 */
template<typename Session>
std::shared_ptr<session_pool<Session>> make_session_pool(
    any_io_executor executor,
    session_pool_config config,
    std::shared_ptr<session::endpoint_provider> endpoints,
    typename session_pool<Session>::factory_type factory,
    typename session_pool<Session>::probe_type probe = {})
{
    auto pool = std::make_shared<session_pool<Session>>(
        std::move(executor), std::move(config), std::move(endpoints), std::move(factory), std::move(probe));
    pool->start();
    return pool;
}

} // namespace enginexx::pool
