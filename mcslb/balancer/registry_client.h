#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "../shared/periodic_task.h"
#include "../shared/redis_client.h"

class backend_pool;
class metrics_sink;
class client_limiter;

struct registry_entry
{
    std::string address;    // host:port
    std::string metadata;   // heartbeat score in zset mode
};

// Where the live backend list comes from. fetch() returns the complete
// current set or fails; partial results are never reported.
class registry_source
{
public:
    virtual ~registry_source() = default;
    virtual bool fetch(std::vector<registry_entry>& out, std::string& err) = 0;
};

enum class registry_mode : uint8_t { zset, keys };

const char* registry_mode_name(registry_mode m);
bool parse_registry_mode(std::string_view name, registry_mode& out);

struct redis_registry_options
{
    redis_url url;
    std::string key{"mcs:node"};
    registry_mode mode{registry_mode::zset};
    int heartbeat_ttl_s{5};
    int timeout_ms{1000};
};

// Backends heartbeat into Redis:
//   zset: ZADD <key> <unix_ts> <host:port>, live = score within the TTL
//   keys: SET <key>:<host:port> ... EX <ttl>, live = key exists
class redis_registry_source : public registry_source
{
public:
    explicit redis_registry_source(redis_registry_options opts);

    bool fetch(std::vector<registry_entry>& out, std::string& err) override;

private:
    bool ensure_connected(std::string& err);
    bool fetch_zset(std::vector<registry_entry>& out, std::string& err);
    bool fetch_keys(std::vector<registry_entry>& out, std::string& err);

    redis_registry_options m_opts;
    redis_client m_client;
};

struct registry_options
{
    int poll_interval_ms{2000};
    int max_failures{5};          // consecutive, before local ageing kicks in
    int stale_after_ms{30000};
    int drain_grace_ms{5000};
    int resolve_timeout_ms{1000}; // per backend lookup, 0 disables caching
    int client_idle_s{300};       // client limiter entries
    int client_sweep_s{60};
};

// Keeps the pool's registry view in step with the registry. The TTL on the
// registry side is the failure signal; this side only diffs snapshots.
class registry_client
{
public:
    registry_client(backend_pool& pool, metrics_sink& metrics,
                    std::unique_ptr<registry_source> source, registry_options opts,
                    client_limiter* limiter = nullptr);
    ~registry_client();

    bool start();
    void stop();

    // One poll cycle. Returns false when the registry query failed.
    bool poll_once();

    int consecutive_failures() const { return m_failures.load(std::memory_order_relaxed); }

private:
    void apply_snapshot(const std::vector<registry_entry>& entries);
    void resolve_new(const std::set<std::string, std::less<>>& addresses);
    void handle_failure(const std::string& err);
    void drop_if_drained(const std::string& address);
    void purge();
    void sweep_clients();

    backend_pool& m_pool;
    metrics_sink& m_metrics;
    std::unique_ptr<registry_source> m_source;
    registry_options m_opts;
    client_limiter* m_limiter;

    std::set<std::string, std::less<>> m_previous;
    std::atomic<int> m_failures{0};
    std::chrono::steady_clock::time_point m_last_sweep{};
    periodic_task m_task;
};
