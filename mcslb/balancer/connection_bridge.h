#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../shared/duplex_stream.h"

class backend_pool;
class scheduler;
class health_checker;
class metrics_sink;
class client_state;

struct bridge_options
{
    int connect_timeout_ms{1000};
    int idle_timeout_s{300};
    int write_timeout_ms{10000};
    size_t buffer_size{16384};
};

enum class bridge_result : uint8_t
{
    completed,      // bridged and closed normally
    rejected,       // no backend could be reached
    interrupted     // force-closed during shutdown
};

const char* bridge_result_name(bridge_result r);

// Pairs one client stream with a backend connection and copies bytes both
// ways until either side finishes. run() blocks the calling thread; one
// bridge instance serves every connection.
class connection_bridge
{
public:
    using connect_fn = std::function<scoped_fd(const std::string& address, int timeout_ms)>;

    connection_bridge(backend_pool& pool, scheduler& sched, health_checker& health,
                      metrics_sink& metrics, bridge_options opts, connect_fn connect = {});

    connection_bridge(const connection_bridge&) = delete;
    connection_bridge& operator=(const connection_bridge&) = delete;

    // `budget` may be null for an unthrottled client. The client stream is
    // always closed on return.
    bridge_result run(std::unique_ptr<duplex_stream> client, std::shared_ptr<client_state> budget = {});

    // Make every running bridge close at its next poll tick
    void force_stop() { m_force_stop.store(true, std::memory_order_release); }
    bool stopping() const { return m_force_stop.load(std::memory_order_acquire); }

    const bridge_options& options() const { return m_opts; }

private:
    struct backend_link
    {
        std::string address;
        scoped_fd fd;
    };

    // Schedule and connect, retrying once on a different backend
    std::optional<backend_link> open_backend();

    bridge_result pump(duplex_stream& client, duplex_stream& backend,
                       client_state* budget, const std::string& address);

    backend_pool& m_pool;
    scheduler& m_scheduler;
    health_checker& m_health;
    metrics_sink& m_metrics;
    bridge_options m_opts;
    connect_fn m_connect;
    std::atomic<bool> m_force_stop{false};
};
