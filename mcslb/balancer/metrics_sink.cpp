#include "metrics_sink.h"
#include "backend_pool.h"

#include <charconv>
#include <vector>

void metrics_sink::connection_accepted()
{
    m_total_connections.fetch_add(1, std::memory_order_relaxed);
}

void metrics_sink::connection_opened()
{
    m_active_connections.fetch_add(1, std::memory_order_relaxed);
}

void metrics_sink::connection_closed()
{
    m_active_connections.fetch_sub(1, std::memory_order_relaxed);
}

void metrics_sink::connection_rejected()
{
    m_rejected.fetch_add(1, std::memory_order_relaxed);
}

void metrics_sink::connection_rate_limited()
{
    m_rate_limited.fetch_add(1, std::memory_order_relaxed);
}

void metrics_sink::handshake_failed()
{
    m_handshake_failures.fetch_add(1, std::memory_order_relaxed);
}

void metrics_sink::bytes_transferred(uint64_t client_to_backend, uint64_t backend_to_client)
{
    m_bytes_c2b.fetch_add(client_to_backend, std::memory_order_relaxed);
    m_bytes_b2c.fetch_add(backend_to_client, std::memory_order_relaxed);
}

void metrics_sink::health_check_failed(std::string_view backend)
{
    std::lock_guard<std::mutex> lock(m_series_mutex);
    auto it = m_series.find(backend);
    if (it == m_series.end())
        it = m_series.emplace(std::string(backend), backend_series{}).first;
    it->second.health_check_failures++;
}

void metrics_sink::backend_connect_failed(std::string_view backend)
{
    m_connect_failures.fetch_add(1, std::memory_order_relaxed);
    if (backend.empty())
        return;

    std::lock_guard<std::mutex> lock(m_series_mutex);
    auto it = m_series.find(backend);
    if (it == m_series.end())
        it = m_series.emplace(std::string(backend), backend_series{}).first;
    it->second.connect_failures++;
}

void metrics_sink::registry_failed()
{
    m_registry_failures.fetch_add(1, std::memory_order_relaxed);
}

void metrics_sink::set_backend_counts(size_t total, size_t eligible)
{
    m_backends_total.store(total, std::memory_order_relaxed);
    m_backends_eligible.store(eligible, std::memory_order_relaxed);
}

void metrics_sink::forget_backend(std::string_view backend)
{
    std::lock_guard<std::mutex> lock(m_series_mutex);
    auto it = m_series.find(backend);
    if (it != m_series.end())
        m_series.erase(it);
}

uint32_t metrics_sink::backend_active(std::string_view backend) const
{
    if (!m_pool)
        return 0;
    auto b = m_pool->find(backend);
    return b ? b->active_connections : 0;
}

uint64_t metrics_sink::backend_health_failures(std::string_view backend) const
{
    std::lock_guard<std::mutex> lock(m_series_mutex);
    auto it = m_series.find(backend);
    return it == m_series.end() ? 0 : it->second.health_check_failures;
}

static void append_uint(std::string& out, uint64_t v)
{
    char buf[24];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    out.append(buf, end - buf);
}

static void append_int(std::string& out, int64_t v)
{
    char buf[24];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    out.append(buf, end - buf);
}

// Label values: escape backslash, quote and newline
static void append_label(std::string& out, std::string_view s)
{
    for (char c : s)
    {
        if (c == '"') out += "\\\"";
        else if (c == '\\') out += "\\\\";
        else if (c == '\n') out += "\\n";
        else out += c;
    }
}

static void append_scalar(std::string& out, const char* name, const char* help,
                          const char* type, uint64_t value)
{
    out += "# HELP ";
    out += name;
    out += ' ';
    out += help;
    out += "\n# TYPE ";
    out += name;
    out += ' ';
    out += type;
    out += '\n';
    out += name;
    out += ' ';
    append_uint(out, value);
    out += "\n\n";
}

std::string metrics_sink::render_prometheus() const
{
    // Copy everything labelled first so no lock is held while formatting
    std::vector<backend_endpoint> backends;
    if (m_pool)
        backends = m_pool->snapshot_all();

    std::vector<std::pair<std::string, backend_series>> series;
    {
        std::lock_guard<std::mutex> lock(m_series_mutex);
        series.reserve(m_series.size());
        for (const auto& [name, s] : m_series)
            series.emplace_back(name, s);
    }

    std::string out;
    out.reserve(2048 + series.size() * 256);

    append_scalar(out, "lb_total_connections", "Total client connections accepted.",
                  "counter", total_connections());

    out += "# HELP lb_active_connections Client connections currently bridged.\n"
           "# TYPE lb_active_connections gauge\n"
           "lb_active_connections ";
    append_int(out, active_connections());
    out += "\n\n";

    append_scalar(out, "lb_rejected_connections_total", "Connections closed because no backend was available.",
                  "counter", rejected_connections());
    append_scalar(out, "lb_rate_limited_connections_total", "Connections refused by the per-client rate limit.",
                  "counter", rate_limited_connections());
    append_scalar(out, "lb_tls_handshake_failures_total", "Failed or timed out TLS handshakes.",
                  "counter", handshake_failures());
    append_scalar(out, "lb_backend_connect_failures_total", "Failed connection attempts to backends.",
                  "counter", m_connect_failures.load(std::memory_order_relaxed));
    append_scalar(out, "lb_registry_failures_total", "Failed registry queries.",
                  "counter", registry_failures());
    append_scalar(out, "lb_bytes_client_to_backend_total", "Plaintext bytes forwarded to backends.",
                  "counter", m_bytes_c2b.load(std::memory_order_relaxed));
    append_scalar(out, "lb_bytes_backend_to_client_total", "Plaintext bytes forwarded to clients.",
                  "counter", m_bytes_b2c.load(std::memory_order_relaxed));
    append_scalar(out, "lb_backends", "Backends known to the pool.",
                  "gauge", m_backends_total.load(std::memory_order_relaxed));
    append_scalar(out, "lb_healthy_backends", "Backends eligible for new connections.",
                  "gauge", m_backends_eligible.load(std::memory_order_relaxed));

    out += "# HELP lb_backend_active_connections Active connections per backend.\n"
           "# TYPE lb_backend_active_connections gauge\n";
    for (const auto& b : backends)
    {
        out += "lb_backend_active_connections{backend=\"";
        append_label(out, b.address);
        out += "\"} ";
        append_uint(out, b.active_connections);
        out += '\n';
    }
    out += '\n';

    out += "# HELP lb_backend_health_check_failures Failed health probes per backend.\n"
           "# TYPE lb_backend_health_check_failures counter\n";
    for (const auto& [name, s] : series)
    {
        out += "lb_backend_health_check_failures{backend=\"";
        append_label(out, name);
        out += "\"} ";
        append_uint(out, s.health_check_failures);
        out += '\n';
    }
    out += '\n';

    out += "# HELP lb_backend_connect_failures Failed bridge connects per backend.\n"
           "# TYPE lb_backend_connect_failures counter\n";
    for (const auto& [name, s] : series)
    {
        out += "lb_backend_connect_failures{backend=\"";
        append_label(out, name);
        out += "\"} ";
        append_uint(out, s.connect_failures);
        out += '\n';
    }

    return out;
}
