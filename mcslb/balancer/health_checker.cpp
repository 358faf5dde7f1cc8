#include "health_checker.h"
#include "metrics_sink.h"
#include "../shared/logging.h"
#include "../shared/net_util.h"

#include <chrono>

health_checker::health_checker(backend_pool& pool, metrics_sink& metrics,
                               health_options opts, probe_fn probe)
    : m_pool(pool)
    , m_metrics(metrics)
    , m_opts(opts)
    , m_probe(std::move(probe))
{
    if (m_opts.threshold < 1)
        m_opts.threshold = 1;
    if (!m_probe)
    {
        m_probe = [this](const std::string& address, int timeout_ms) {
            return static_cast<bool>(connect_backend(m_pool, address, timeout_ms));
        };
    }
}

health_checker::~health_checker()
{
    stop();
}

bool health_checker::start()
{
    LOG_INFO("health: probing every %d ms (timeout %d ms, threshold %d)",
        m_opts.interval_ms, m_opts.timeout_ms, m_opts.threshold);
    return m_task.start("health", std::chrono::milliseconds(m_opts.interval_ms),
        [this] { sweep(); });
}

void health_checker::stop()
{
    m_task.stop();
}

bool health_checker::tcp_probe(const std::string& address, int timeout_ms)
{
    scoped_fd fd = net::connect_with_timeout(address, timeout_ms);
    return static_cast<bool>(fd);
}

void health_checker::sweep()
{
    // Unhealthy backends are probed too so they can recover
    for (const auto& addr : m_pool.addresses())
    {
        bool ok = m_probe(addr, m_opts.timeout_ms);
        commit(addr, ok);
    }

    m_metrics.set_backend_counts(m_pool.size(), m_pool.healthy_count());
}

std::optional<health_state> health_checker::report_failure(std::string_view address)
{
    return commit(address, false);
}

std::optional<health_state> health_checker::commit(std::string_view address, bool success)
{
    auto before = m_pool.find(address);
    if (!before)
        return std::nullopt; // removed while the probe was in flight

    auto after = m_pool.record_probe(address, success, m_opts.threshold);
    if (!after)
        return std::nullopt;

    // Only for records that still exist, so a purged series stays purged
    if (!success)
        m_metrics.health_check_failed(address);

    if (*after != before->health)
    {
        if (*after == health_state::unhealthy)
        {
            LOG_WARN("health: %.*s %s -> unhealthy after %d failures",
                static_cast<int>(address.size()), address.data(),
                health_state_name(before->health), m_opts.threshold);
        }
        else
        {
            LOG_INFO("health: %.*s %s -> %s",
                static_cast<int>(address.size()), address.data(),
                health_state_name(before->health), health_state_name(*after));
        }
    }
    else if (!success)
    {
        LOG_DEBUG("health: probe to %.*s failed",
            static_cast<int>(address.size()), address.data());
    }

    return after;
}
