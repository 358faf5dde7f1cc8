#include "connection_bridge.h"
#include "backend_pool.h"
#include "health_checker.h"
#include "metrics_sink.h"
#include "rate_limiter.h"
#include "scheduler.h"
#include "../shared/logging.h"
#include "../shared/net_util.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <vector>

namespace {

constexpr int stop_check_ms = 1000;
constexpr int attempts = 2;

// Holds one slot of a backend's active_connections for the bridge lifetime.
// The per-backend gauge reads the pool directly; only the global gauge moves here.
class connection_slot
{
public:
    connection_slot(backend_pool& pool, metrics_sink& metrics, const std::string& address)
        : m_pool(pool), m_metrics(metrics), m_address(address)
    {
        if (m_pool.increment_connections(m_address))
        {
            m_held = true;
            m_metrics.connection_opened();
        }
    }

    ~connection_slot()
    {
        if (!m_held)
            return;

        if (!m_pool.decrement_connections(m_address))
            LOG_WARN("bridge: %s had no connection to release", m_address.c_str());
        m_metrics.connection_closed();
    }

    connection_slot(const connection_slot&) = delete;
    connection_slot& operator=(const connection_slot&) = delete;

    bool held() const { return m_held; }

private:
    backend_pool& m_pool;
    metrics_sink& m_metrics;
    const std::string& m_address;
    bool m_held = false;
};

} // namespace

const char* bridge_result_name(bridge_result r)
{
    switch (r)
    {
        case bridge_result::completed:   return "completed";
        case bridge_result::rejected:    return "rejected";
        case bridge_result::interrupted: return "interrupted";
    }
    return "unknown";
}

connection_bridge::connection_bridge(backend_pool& pool, scheduler& sched, health_checker& health,
                                     metrics_sink& metrics, bridge_options opts, connect_fn connect)
    : m_pool(pool)
    , m_scheduler(sched)
    , m_health(health)
    , m_metrics(metrics)
    , m_opts(opts)
    , m_connect(std::move(connect))
{
    if (!m_connect)
    {
        m_connect = [this](const std::string& address, int timeout_ms) {
            return connect_backend(m_pool, address, timeout_ms);
        };
    }
    if (m_opts.buffer_size == 0)
        m_opts.buffer_size = 16384;
}

std::optional<connection_bridge::backend_link> connection_bridge::open_backend()
{
    std::string failed;

    for (int attempt = 0; attempt < attempts; ++attempt)
    {
        auto target = m_scheduler.select(m_pool, failed);
        if (!target)
        {
            if (attempt == 0)
                LOG_WARN("bridge: no backends available");
            return std::nullopt;
        }

        scoped_fd fd = m_connect(*target, m_opts.connect_timeout_ms);
        if (fd)
            return backend_link{std::move(*target), std::move(fd)};

        int err = errno;
        LOG_WARN("bridge: connect to %s failed: %s", target->c_str(), std::strerror(err));
        auto state = m_health.report_failure(*target);
        m_metrics.backend_connect_failed(state ? std::string_view(*target) : std::string_view{});
        failed = std::move(*target);
    }

    return std::nullopt;
}

bridge_result connection_bridge::run(std::unique_ptr<duplex_stream> client, std::shared_ptr<client_state> budget)
{
    auto link = open_backend();
    if (!link)
    {
        m_metrics.connection_rejected();
        client->close();
        return bridge_result::rejected;
    }

    net::tune_socket(link->fd.get());

    connection_slot slot(m_pool, m_metrics, link->address);
    if (!slot.held())
    {
        // Removed from the pool while connecting
        LOG_WARN("bridge: backend %s vanished during connect", link->address.c_str());
        m_metrics.connection_rejected();
        client->close();
        return bridge_result::rejected;
    }

    LOG_DEBUG("bridge: client fd=%d -> %s", client->fd(), link->address.c_str());

    plain_stream backend(std::move(link->fd));
    bridge_result r = pump(*client, backend, budget.get(), link->address);

    client->close();
    backend.close();
    return r;
}

bridge_result connection_bridge::pump(duplex_stream& client, duplex_stream& backend,
                                      client_state* budget, const std::string& address)
{
    using clock = std::chrono::steady_clock;

    std::vector<char> buf(m_opts.buffer_size);
    const auto idle_limit = std::chrono::seconds(m_opts.idle_timeout_s);
    auto last_activity = clock::now();
    uint64_t c2b = 0;
    uint64_t b2c = 0;
    bridge_result result = bridge_result::completed;
    bool done = false;

    while (!done)
    {
        if (stopping())
        {
            result = bridge_result::interrupted;
            break;
        }

        size_t allowance = budget ? budget->bandwidth_available(buf.size()) : buf.size();
        int throttle_ms = allowance == 0 ? budget->bandwidth_wait_ms() : 0;

        auto idle_left = std::chrono::duration_cast<std::chrono::milliseconds>(
            idle_limit - (clock::now() - last_activity)).count();
        if (idle_left <= 0)
        {
            LOG_DEBUG("bridge: %s idle timeout", address.c_str());
            break;
        }

        int timeout = static_cast<int>(std::min<int64_t>(idle_left, stop_check_ms));
        if (throttle_ms > 0)
            timeout = std::min(timeout, throttle_ms);

        bool client_buffered = allowance > 0 && client.has_buffered();
        if (client_buffered)
            timeout = 0;

        struct pollfd fds[2];
        fds[0].fd = allowance > 0 ? client.fd() : -1;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = backend.fd();
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int rc = ::poll(fds, 2, timeout);
        if (rc < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_WARN("bridge: poll failed: %s", std::strerror(errno));
            break;
        }

        bool client_ready = client_buffered || (fds[0].revents & (POLLIN | POLLHUP | POLLERR));
        bool backend_ready = fds[1].revents & (POLLIN | POLLHUP | POLLERR);

        if (client_ready)
        {
            size_t n = 0;
            io_status st = client.read_some(buf.data(), allowance, n);
            if (st == io_status::ok)
            {
                if (budget)
                    budget->consume_bandwidth(n);
                if (backend.write_all(buf.data(), n, m_opts.write_timeout_ms) != io_status::ok)
                    done = true;
                c2b += n;
                last_activity = clock::now();
            }
            else if (st != io_status::would_block)
            {
                done = true;
            }
        }

        if (!done && backend_ready)
        {
            size_t n = 0;
            io_status st = backend.read_some(buf.data(), buf.size(), n);
            if (st == io_status::ok)
            {
                if (client.write_all(buf.data(), n, m_opts.write_timeout_ms) != io_status::ok)
                    done = true;
                b2c += n;
                last_activity = clock::now();
            }
            else if (st != io_status::would_block)
            {
                done = true;
            }
        }

        if (c2b > 0 || b2c > 0)
        {
            m_metrics.bytes_transferred(c2b, b2c);
            c2b = 0;
            b2c = 0;
        }
    }

    return result;
}
