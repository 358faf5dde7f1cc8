#include "backend_pool.h"
#include "../shared/net_util.h"

#include <mutex>

const char* health_state_name(health_state s)
{
    switch (s)
    {
        case health_state::unknown:   return "unknown";
        case health_state::healthy:   return "healthy";
        case health_state::unhealthy: return "unhealthy";
        default:                      return "?";
    }
}

health_state apply_probe_result(backend_endpoint& b, bool success, int threshold)
{
    if (success)
    {
        b.consecutive_failures = 0;
        b.health = health_state::healthy;
        return b.health;
    }

    b.consecutive_failures++;
    if (b.consecutive_failures >= threshold)
        b.health = health_state::unhealthy;
    return b.health;
}

bool backend_pool::upsert(std::string_view address,
                          std::optional<bool> registry_present,
                          std::optional<health_state> health,
                          std::optional<std::string> metadata)
{
    std::unique_lock lock(m_mutex);

    bool created = false;
    auto it = m_backends.find(address);
    if (it == m_backends.end())
    {
        backend_endpoint b;
        b.address = std::string(address);
        it = m_backends.emplace(b.address, std::move(b)).first;
        created = true;
    }

    auto& b = it->second;
    if (registry_present)
    {
        b.registry_present = *registry_present;
        if (*registry_present)
            b.last_seen = clock::now();
    }
    if (health)
    {
        b.health = *health;
        if (*health == health_state::healthy)
            b.consecutive_failures = 0;
    }
    if (metadata)
        b.metadata = std::move(*metadata);
    if (created && !registry_present)
        b.last_seen = clock::now();

    return created;
}

bool backend_pool::remove_if_drained(std::string_view address)
{
    std::unique_lock lock(m_mutex);

    auto it = m_backends.find(address);
    if (it == m_backends.end())
        return false;

    const auto& b = it->second;
    if (b.registry_present || b.active_connections != 0)
        return false;

    m_backends.erase(it);
    return true;
}

std::vector<backend_endpoint> backend_pool::snapshot_eligible() const
{
    std::shared_lock lock(m_mutex);

    std::vector<backend_endpoint> out;
    out.reserve(m_backends.size());
    for (const auto& [addr, b] : m_backends)
    {
        if (b.eligible())
            out.push_back(b);
    }
    return out;
}

std::vector<backend_endpoint> backend_pool::snapshot_all() const
{
    std::shared_lock lock(m_mutex);

    std::vector<backend_endpoint> out;
    out.reserve(m_backends.size());
    for (const auto& [addr, b] : m_backends)
        out.push_back(b);
    return out;
}

std::vector<std::string> backend_pool::addresses() const
{
    std::shared_lock lock(m_mutex);

    std::vector<std::string> out;
    out.reserve(m_backends.size());
    for (const auto& [addr, b] : m_backends)
        out.push_back(addr);
    return out;
}

std::optional<backend_endpoint> backend_pool::find(std::string_view address) const
{
    std::shared_lock lock(m_mutex);

    auto it = m_backends.find(address);
    if (it == m_backends.end())
        return std::nullopt;
    return it->second;
}

bool backend_pool::set_cached_address(std::string_view address, const struct sockaddr_in& addr)
{
    std::unique_lock lock(m_mutex);

    auto it = m_backends.find(address);
    if (it == m_backends.end())
        return false;
    it->second.cached_addr = addr;
    it->second.has_cached_addr = true;
    return true;
}

std::optional<struct sockaddr_in> backend_pool::cached_address(std::string_view address) const
{
    std::shared_lock lock(m_mutex);

    auto it = m_backends.find(address);
    if (it == m_backends.end() || !it->second.has_cached_addr)
        return std::nullopt;
    return it->second.cached_addr;
}

size_t backend_pool::size() const
{
    std::shared_lock lock(m_mutex);
    return m_backends.size();
}

size_t backend_pool::healthy_count() const
{
    std::shared_lock lock(m_mutex);

    size_t n = 0;
    for (const auto& [addr, b] : m_backends)
    {
        if (b.eligible())
            n++;
    }
    return n;
}

std::optional<uint32_t> backend_pool::increment_connections(std::string_view address)
{
    std::unique_lock lock(m_mutex);

    auto it = m_backends.find(address);
    if (it == m_backends.end())
        return std::nullopt;

    return ++it->second.active_connections;
}

std::optional<uint32_t> backend_pool::decrement_connections(std::string_view address)
{
    std::unique_lock lock(m_mutex);

    auto it = m_backends.find(address);
    if (it == m_backends.end() || it->second.active_connections == 0)
        return std::nullopt;

    auto& b = it->second;
    b.active_connections--;
    // Drain grace is measured from the last connection leaving
    if (b.active_connections == 0 && !b.registry_present)
        b.last_seen = clock::now();
    return b.active_connections;
}

std::optional<health_state> backend_pool::record_probe(std::string_view address, bool success, int threshold)
{
    std::unique_lock lock(m_mutex);

    auto it = m_backends.find(address);
    if (it == m_backends.end())
        return std::nullopt;

    return apply_probe_result(it->second, success, threshold);
}

std::vector<std::string> backend_pool::purge_drained(clock::duration grace)
{
    std::unique_lock lock(m_mutex);

    std::vector<std::string> removed;
    auto now = clock::now();
    for (auto it = m_backends.begin(); it != m_backends.end();)
    {
        const auto& b = it->second;
        if (!b.registry_present && b.active_connections == 0 && (now - b.last_seen) >= grace)
        {
            removed.push_back(it->first);
            it = m_backends.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

std::vector<std::string> backend_pool::mark_stale(clock::duration older_than)
{
    std::unique_lock lock(m_mutex);

    std::vector<std::string> affected;
    auto now = clock::now();
    for (auto& [addr, b] : m_backends)
    {
        if (b.registry_present && (now - b.last_seen) >= older_than)
        {
            b.registry_present = false;
            affected.push_back(addr);
        }
    }
    return affected;
}

scoped_fd connect_backend(const backend_pool& pool, const std::string& address, int timeout_ms)
{
    if (auto addr = pool.cached_address(address))
        return net::connect_with_timeout(*addr, timeout_ms);
    return net::connect_with_timeout(address, timeout_ms);
}
