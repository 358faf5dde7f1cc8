#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>
#include <netinet/in.h>

#include "../shared/scoped_fd.h"

enum class health_state : uint8_t { unknown = 0, healthy = 1, unhealthy = 2 };

const char* health_state_name(health_state s);

struct backend_endpoint
{
    std::string address;                 // host:port, identity
    uint32_t active_connections = 0;
    health_state health = health_state::unknown;
    bool registry_present = false;
    int consecutive_failures = 0;
    std::string metadata;                // registry payload (heartbeat score)
    std::chrono::steady_clock::time_point last_seen{};
    struct sockaddr_in cached_addr{};    // resolved once, off the pool lock
    bool has_cached_addr = false;

    bool eligible() const
    {
        return registry_present && health != health_state::unhealthy;
    }
};

// Debounced health transition. Success flips to healthy immediately;
// `threshold` consecutive failures flip to unhealthy.
health_state apply_probe_result(backend_endpoint& b, bool success, int threshold);

// Authoritative set of backends. Every operation is a short critical section
// with no I/O inside; readers get copies, never references into the map.
class backend_pool
{
public:
    using clock = std::chrono::steady_clock;

    backend_pool() = default;

    backend_pool(const backend_pool&) = delete;
    backend_pool& operator=(const backend_pool&) = delete;

    // Merge a partial update, creating the record if absent.
    // Returns true when the record was created.
    bool upsert(std::string_view address,
                std::optional<bool> registry_present = std::nullopt,
                std::optional<health_state> health = std::nullopt,
                std::optional<std::string> metadata = std::nullopt);

    // Delete the record only if it is absent from the registry and has no
    // active connections
    bool remove_if_drained(std::string_view address);

    // Eligible backends ordered by address
    std::vector<backend_endpoint> snapshot_eligible() const;
    std::vector<backend_endpoint> snapshot_all() const;
    std::vector<std::string> addresses() const;
    std::optional<backend_endpoint> find(std::string_view address) const;
    size_t size() const;
    size_t healthy_count() const;

    // Store the resolved address. False when the backend is unknown.
    bool set_cached_address(std::string_view address, const struct sockaddr_in& addr);
    std::optional<struct sockaddr_in> cached_address(std::string_view address) const;

    // Returns the new count, or nullopt when the backend is unknown
    std::optional<uint32_t> increment_connections(std::string_view address);
    // Never goes below zero; nullopt when unknown or already zero
    std::optional<uint32_t> decrement_connections(std::string_view address);

    // Apply one probe outcome. nullopt when the backend is not in the pool.
    std::optional<health_state> record_probe(std::string_view address, bool success, int threshold);

    // Remove absent, drained records not seen for at least `grace`
    std::vector<std::string> purge_drained(clock::duration grace);

    // Flip registry-present records not seen within `older_than` to absent.
    // Returns the affected addresses.
    std::vector<std::string> mark_stale(clock::duration older_than);

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, backend_endpoint, std::less<>> m_backends;
};

// Connect to a backend through its cached address, or through a lookup that
// shares the same timeout when none is cached yet. Never holds the pool lock
// across the connect.
scoped_fd connect_backend(const backend_pool& pool, const std::string& address, int timeout_ms);
