#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

class backend_pool;

// Process-lifetime counters and gauges published by the balancer components.
// Scalars are lock-free; labelled per-backend counters sit behind one mutex.
// The per-backend active gauge is read from the pool at scrape time, so it
// can never disagree with the counters the scheduler sees.
class metrics_sink
{
public:
    explicit metrics_sink(const backend_pool* pool = nullptr) : m_pool(pool) {}

    metrics_sink(const metrics_sink&) = delete;
    metrics_sink& operator=(const metrics_sink&) = delete;

    // Connection lifecycle
    void connection_accepted();
    void connection_opened();
    void connection_closed();
    void connection_rejected();
    void connection_rate_limited();
    void handshake_failed();
    void bytes_transferred(uint64_t client_to_backend, uint64_t backend_to_client);

    // Backend health and discovery
    void health_check_failed(std::string_view backend);
    // Empty backend counts only the total (record already gone)
    void backend_connect_failed(std::string_view backend);
    void registry_failed();
    void set_backend_counts(size_t total, size_t eligible);
    void forget_backend(std::string_view backend);

    // Prometheus text exposition format
    std::string render_prometheus() const;

    uint64_t total_connections() const { return m_total_connections.load(std::memory_order_relaxed); }
    int64_t active_connections() const { return m_active_connections.load(std::memory_order_relaxed); }
    uint64_t rejected_connections() const { return m_rejected.load(std::memory_order_relaxed); }
    uint64_t rate_limited_connections() const { return m_rate_limited.load(std::memory_order_relaxed); }
    uint64_t handshake_failures() const { return m_handshake_failures.load(std::memory_order_relaxed); }
    uint64_t registry_failures() const { return m_registry_failures.load(std::memory_order_relaxed); }
    // 0 without a pool or for unknown backends
    uint32_t backend_active(std::string_view backend) const;
    uint64_t backend_health_failures(std::string_view backend) const;

private:
    struct backend_series
    {
        uint64_t health_check_failures = 0;
        uint64_t connect_failures = 0;
    };

    std::atomic<uint64_t> m_total_connections{0};
    std::atomic<int64_t> m_active_connections{0};
    std::atomic<uint64_t> m_rejected{0};
    std::atomic<uint64_t> m_rate_limited{0};
    std::atomic<uint64_t> m_handshake_failures{0};
    std::atomic<uint64_t> m_connect_failures{0};
    std::atomic<uint64_t> m_registry_failures{0};
    std::atomic<uint64_t> m_bytes_c2b{0};
    std::atomic<uint64_t> m_bytes_b2c{0};
    std::atomic<uint64_t> m_backends_total{0};
    std::atomic<uint64_t> m_backends_eligible{0};

    const backend_pool* m_pool;

    mutable std::mutex m_series_mutex;
    std::map<std::string, backend_series, std::less<>> m_series;
};
