/*

session/endpoint.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace enginexx::session
{

/**
 * Remote engine endpoint and the credential used to open sessions against it.
 */
struct engine_endpoint
{
    std::string url;           ///< Base URL of the tenant (e.g., "https://tenant.example.com")
    std::string credential;    ///< Bearer credential (API key), may be empty
    std::string display_name;  ///< Human readable name used in logs

    engine_endpoint() = default;
    engine_endpoint(std::string u, std::string cred, std::string name = {})
        : url(std::move(u)), credential(std::move(cred)), display_name(std::move(name))
    {
    }

    [[nodiscard]] bool has_credential() const noexcept
    {
        return !credential.empty();
    }
};


/**
 * Source of the currently selected endpoint.
 * The pool asks for it every time it opens a session, so a switch only
 * affects sessions created afterwards.
 */
class endpoint_provider
{
public:
    virtual ~endpoint_provider() = default;

    [[nodiscard]] virtual engine_endpoint current() const = 0;
};


/// Provider that always returns the same endpoint.
class static_endpoint_provider : public endpoint_provider
{
public:
    explicit static_endpoint_provider(engine_endpoint endpoint)
        : endpoint_(std::move(endpoint))
    {
    }

    [[nodiscard]] engine_endpoint current() const override
    {
        return endpoint_;
    }

private:
    engine_endpoint endpoint_;
};


/**
 * Exception thrown for unknown tenants or an empty registry.
 */
class tenant_error : public std::runtime_error
{
public:
    explicit tenant_error(const std::string& msg) : std::runtime_error(msg) {}
};


/**
 * Named engine tenant.
 */
struct tenant
{
    std::string id;
    std::string name;
    std::string url;
    std::string credential;
    std::string description;

    [[nodiscard]] engine_endpoint endpoint() const
    {
        return engine_endpoint{url, credential, name};
    }
};


/**
 * Multi-tenant endpoint provider.
 *
 * Holds a fixed set of tenants and the id of the active one. The active
 * tenant can be switched at runtime from any thread.
 *
 * @code
 * auto tenants = std::make_shared<tenant_registry>(std::vector<tenant>{
 *     {"main", "Main", "https://main.example.com", key_main, {}},
 *     {"it", "Internal IT", "https://it.example.com", key_it, {}}
 * }, "main");
 *
 * tenants->set_active("it");  // new sessions go to it.example.com
 * @endcode
 */
class tenant_registry : public endpoint_provider
{
public:
    explicit tenant_registry(std::vector<tenant> tenants, std::string active_id = {})
        : tenants_(std::move(tenants))
        , active_id_(std::move(active_id))
    {
        if (active_id_.empty() && !tenants_.empty())
            active_id_ = tenants_.front().id;
    }

    /// Endpoint of the active tenant, or of the first tenant if the active id is unknown
    [[nodiscard]] engine_endpoint current() const override
    {
        return active().endpoint();
    }

    /// Active tenant (falls back to the first configured tenant)
    [[nodiscard]] tenant active() const
    {
        std::lock_guard lock(mutex_);
        if (tenants_.empty())
            throw tenant_error("No tenants configured");

        if (const tenant* t = find_locked(active_id_))
            return *t;
        return tenants_.front();
    }

    /**
     * Switch the active tenant.
     * @throws tenant_error if the id is unknown; the message lists the available ids
     */
    tenant set_active(const std::string& tenant_id)
    {
        std::lock_guard lock(mutex_);
        const tenant* t = find_locked(tenant_id);
        if (t == nullptr)
        {
            std::ostringstream msg;
            msg << "Unknown tenant: " << tenant_id << ". Available: ";
            for (std::size_t i = 0; i < tenants_.size(); ++i)
            {
                if (i > 0)
                    msg << ", ";
                msg << tenants_[i].id;
            }
            throw tenant_error(msg.str());
        }
        active_id_ = tenant_id;
        return *t;
    }

    [[nodiscard]] std::string active_id() const
    {
        std::lock_guard lock(mutex_);
        return active_id_;
    }

    [[nodiscard]] std::optional<tenant> find(std::string_view tenant_id) const
    {
        std::lock_guard lock(mutex_);
        if (const tenant* t = find_locked(tenant_id))
            return *t;
        return std::nullopt;
    }

    /// Find the tenant whose host appears in the given URL
    [[nodiscard]] std::optional<tenant> find_by_url(std::string_view url) const
    {
        std::lock_guard lock(mutex_);
        for (const auto& t : tenants_)
        {
            const std::string_view host = strip_scheme(t.url);
            if (!host.empty() && url.find(host) != std::string_view::npos)
                return t;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::vector<tenant> tenants() const
    {
        std::lock_guard lock(mutex_);
        return tenants_;
    }

    /// One entry per tenant, the active one marked; credentials are never printed
    [[nodiscard]] std::string describe() const
    {
        std::lock_guard lock(mutex_);
        std::ostringstream out;
        for (std::size_t i = 0; i < tenants_.size(); ++i)
        {
            const auto& t = tenants_[i];
            if (i > 0)
                out << "\n\n";
            out << "- " << t.id << ": " << t.name;
            if (t.id == active_id_)
                out << " (ACTIVE)";
            out << "\n  URL: " << t.url;
        }
        return out.str();
    }

    /// URL without its scheme ("https://host/x" -> "host/x")
    [[nodiscard]] static std::string_view strip_scheme(std::string_view url) noexcept
    {
        const auto pos = url.find("://");
        return pos == std::string_view::npos ? url : url.substr(pos + 3);
    }

private:
    const tenant* find_locked(std::string_view tenant_id) const
    {
        auto it = std::find_if(tenants_.begin(), tenants_.end(),
            [&](const tenant& t) { return t.id == tenant_id; });
        return it == tenants_.end() ? nullptr : &*it;
    }

    mutable std::mutex mutex_;
    std::vector<tenant> tenants_;
    std::string active_id_;
};

} // namespace enginexx::session
