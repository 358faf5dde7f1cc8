#include "registry_client.h"
#include "backend_pool.h"
#include "metrics_sink.h"
#include "rate_limiter.h"
#include "../shared/keyword_hash.h"
#include "../shared/logging.h"
#include "../shared/net_util.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>

namespace {

constexpr int max_scan_rounds = 1024;

bool valid_address(std::string_view addr)
{
    endpoint ep;
    return net::parse_endpoint(addr, ep);
}

} // namespace

const char* registry_mode_name(registry_mode m)
{
    switch (m)
    {
        case registry_mode::zset: return "zset";
        case registry_mode::keys: return "keys";
    }
    return "unknown";
}

bool parse_registry_mode(std::string_view name, registry_mode& out)
{
    switch (keyword_fold(name))
    {
        case keyword_hash("zset"):
        case keyword_hash("sorted_set"):
            out = registry_mode::zset;
            return true;
        case keyword_hash("keys"):
        case keyword_hash("ttl_keys"):
            out = registry_mode::keys;
            return true;
        default:
            return false;
    }
}

// ─── redis_registry_source ───

redis_registry_source::redis_registry_source(redis_registry_options opts)
    : m_opts(std::move(opts))
{
}

bool redis_registry_source::ensure_connected(std::string& err)
{
    if (m_client.connected())
        return true;
    return m_client.connect(m_opts.url, m_opts.timeout_ms, err);
}

bool redis_registry_source::fetch(std::vector<registry_entry>& out, std::string& err)
{
    out.clear();
    if (!ensure_connected(err))
        return false;

    bool ok = m_opts.mode == registry_mode::zset
        ? fetch_zset(out, err)
        : fetch_keys(out, err);

    if (!ok)
        out.clear();
    return ok;
}

bool redis_registry_source::fetch_zset(std::vector<registry_entry>& out, std::string& err)
{
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string min_score = std::to_string(now - m_opts.heartbeat_ttl_s);

    resp::reply r;
    if (!m_client.command({"ZRANGEBYSCORE", m_opts.key, min_score, "+inf", "WITHSCORES"}, r, err))
        return false;

    if (r.is_error())
    {
        err = "ZRANGEBYSCORE: " + r.str;
        return false;
    }
    if (!r.is_array() || r.elements.size() % 2 != 0)
    {
        err = "ZRANGEBYSCORE: unexpected reply";
        return false;
    }

    for (size_t i = 0; i < r.elements.size(); i += 2)
    {
        const auto& member = r.elements[i];
        const auto& score = r.elements[i + 1];
        if (member.kind != resp::reply::bulk || !valid_address(member.str))
        {
            LOG_DEBUG("registry: skipping malformed member '%s'", member.str.c_str());
            continue;
        }
        out.push_back({member.str, score.str});
    }
    return true;
}

bool redis_registry_source::fetch_keys(std::vector<registry_entry>& out, std::string& err)
{
    std::string prefix = m_opts.key + ":";
    std::string pattern = prefix + "*";
    std::string cursor = "0";

    for (int round = 0; round < max_scan_rounds; ++round)
    {
        resp::reply r;
        if (!m_client.command({"SCAN", cursor, "MATCH", pattern, "COUNT", "100"}, r, err))
            return false;

        if (r.is_error())
        {
            err = "SCAN: " + r.str;
            return false;
        }
        if (!r.is_array() || r.elements.size() != 2 || !r.elements[1].is_array())
        {
            err = "SCAN: unexpected reply";
            return false;
        }

        for (const auto& k : r.elements[1].elements)
        {
            if (k.str.size() <= prefix.size() || !k.str.starts_with(prefix))
                continue;

            std::string addr = k.str.substr(prefix.size());
            if (!valid_address(addr))
            {
                LOG_DEBUG("registry: skipping malformed key '%s'", k.str.c_str());
                continue;
            }
            out.push_back({std::move(addr), {}});
        }

        cursor = r.elements[0].str;
        if (cursor == "0")
            return true;
    }

    err = "SCAN: cursor did not terminate";
    return false;
}

// ─── registry_client ───

registry_client::registry_client(backend_pool& pool, metrics_sink& metrics,
                                 std::unique_ptr<registry_source> source, registry_options opts,
                                 client_limiter* limiter)
    : m_pool(pool)
    , m_metrics(metrics)
    , m_source(std::move(source))
    , m_opts(opts)
    , m_limiter(limiter)
    , m_last_sweep(std::chrono::steady_clock::now())
{
}

registry_client::~registry_client()
{
    stop();
}

bool registry_client::start()
{
    LOG_INFO("registry: polling every %d ms", m_opts.poll_interval_ms);
    return m_task.start("registry", std::chrono::milliseconds(m_opts.poll_interval_ms),
        [this] { poll_once(); });
}

void registry_client::stop()
{
    m_task.stop();
}

bool registry_client::poll_once()
{
    std::vector<registry_entry> entries;
    std::string err;
    bool ok = m_source->fetch(entries, err);

    if (ok)
    {
        if (m_failures.exchange(0, std::memory_order_relaxed) > 0)
            LOG_INFO("registry: query recovered");
        apply_snapshot(entries);
    }
    else
    {
        handle_failure(err);
    }

    purge();
    sweep_clients();
    m_metrics.set_backend_counts(m_pool.size(), m_pool.healthy_count());
    return ok;
}

void registry_client::apply_snapshot(const std::vector<registry_entry>& entries)
{
    std::set<std::string, std::less<>> current;

    for (const auto& e : entries)
    {
        if (!current.insert(e.address).second)
            continue;

        // Upsert every cycle so last_seen tracks the latest snapshot
        if (m_pool.upsert(e.address, true, std::nullopt, e.metadata))
            LOG_INFO("registry: backend %s joined", e.address.c_str());
    }

    for (const auto& addr : m_previous)
    {
        if (current.count(addr))
            continue;

        m_pool.upsert(addr, false);
        LOG_INFO("registry: backend %s left", addr.c_str());
        drop_if_drained(addr);
    }

    resolve_new(current);
    m_previous = std::move(current);
}

// Probes and bridges connect to the cached address, so the lookup cost is
// paid here once per backend instead of on every connect
void registry_client::resolve_new(const std::set<std::string, std::less<>>& addresses)
{
    if (m_opts.resolve_timeout_ms <= 0)
        return;

    for (const auto& addr : addresses)
    {
        if (m_pool.cached_address(addr))
            continue;

        endpoint ep;
        struct sockaddr_in sa{};
        if (!net::parse_endpoint(addr, ep) || !net::resolve(ep, sa, m_opts.resolve_timeout_ms))
        {
            LOG_WARN("registry: cannot resolve %s: %s", addr.c_str(), std::strerror(errno));
            continue;
        }
        m_pool.set_cached_address(addr, sa);
    }
}

void registry_client::handle_failure(const std::string& err)
{
    int failures = m_failures.fetch_add(1, std::memory_order_relaxed) + 1;
    m_metrics.registry_failed();
    LOG_WARN("registry: query failed (%d in a row): %s", failures, err.c_str());

    if (failures < m_opts.max_failures)
        return;

    // Long outage: stop trusting entries we have not seen for a while
    auto stale = m_pool.mark_stale(std::chrono::milliseconds(m_opts.stale_after_ms));
    for (const auto& addr : stale)
    {
        LOG_WARN("registry: backend %s aged out locally", addr.c_str());
        // Re-added as new once the registry answers again
        m_previous.erase(addr);
        drop_if_drained(addr);
    }
}

void registry_client::drop_if_drained(const std::string& address)
{
    if (m_pool.remove_if_drained(address))
    {
        m_metrics.forget_backend(address);
        LOG_DEBUG("registry: removed %s", address.c_str());
    }
}

void registry_client::purge()
{
    for (const auto& addr : m_pool.purge_drained(std::chrono::milliseconds(m_opts.drain_grace_ms)))
    {
        m_metrics.forget_backend(addr);
        LOG_DEBUG("registry: purged drained %s", addr.c_str());
    }
}

void registry_client::sweep_clients()
{
    if (!m_limiter)
        return;

    auto now = std::chrono::steady_clock::now();
    if (now - m_last_sweep < std::chrono::seconds(m_opts.client_sweep_s))
        return;

    m_last_sweep = now;
    size_t removed = m_limiter->sweep(std::chrono::seconds(m_opts.client_idle_s));
    if (removed > 0)
        LOG_DEBUG("registry: swept %zu idle clients", removed);
}
