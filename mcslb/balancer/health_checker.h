#pragma once
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "backend_pool.h"
#include "../shared/periodic_task.h"

class metrics_sink;

struct health_options
{
    int interval_ms{3000};
    int timeout_ms{500};     // per probe
    int threshold{3};        // consecutive failures to mark unhealthy
};

// Active liveness probing, independent of registry presence. Results are
// committed to the pool after each probe; the pool lock is never held while
// a probe is in flight.
class health_checker
{
public:
    // Returns true when `address` accepted a connection within timeout_ms
    using probe_fn = std::function<bool(const std::string& address, int timeout_ms)>;

    health_checker(backend_pool& pool, metrics_sink& metrics,
                   health_options opts, probe_fn probe = {});
    ~health_checker();

    bool start();
    void stop();

    // One probe round over every backend in the pool
    void sweep();

    // A failed bridge connect counts exactly like one failed probe
    std::optional<health_state> report_failure(std::string_view address);

    const health_options& options() const { return m_opts; }

    // Plain TCP connect; the default probe prefers the pool's cached address
    static bool tcp_probe(const std::string& address, int timeout_ms);

private:
    std::optional<health_state> commit(std::string_view address, bool success);

    backend_pool& m_pool;
    metrics_sink& m_metrics;
    health_options m_opts;
    probe_fn m_probe;
    periodic_task m_task;
};
