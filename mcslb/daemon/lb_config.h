#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "../balancer/registry_client.h"
#include "../balancer/scheduler.h"
#include "../shared/logging.h"

struct lb_config
{
    // Client-facing TLS listener
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{64400};
    int handshake_timeout_ms{5000};

    // Prometheus scrape endpoint, port 0 disables it
    std::string metrics_host{"0.0.0.0"};
    uint16_t metrics_port{9000};
    std::string metrics_path{"/metrics"};

    // TLS material, relative paths resolve against tls_dir when set
    std::string tls_dir;
    std::string tls_cert{"tls/server.cert"};
    std::string tls_key{"tls/server.key"};

    // Registry
    std::string redis_url{"redis://127.0.0.1:6379"};
    std::string registry_key{"mcs:node"};
    registry_mode registry{registry_mode::zset};
    int heartbeat_ttl_s{5};
    int registry_poll_ms{2000};
    int registry_timeout_ms{1000};
    int registry_max_failures{5};
    int registry_stale_ms{30000};
    int drain_grace_ms{5000};

    // Health checking
    int health_interval_ms{3000};
    int health_timeout_ms{500};
    int health_threshold{3};

    // Routing and bridging
    schedule_policy policy{schedule_policy::least_connections};
    int connect_timeout_ms{1000};
    int idle_timeout_s{300};
    int shutdown_drain_s{30};

    // Per-client limits, 0 disables
    double conn_rate{5.0};
    double bandwidth{102400.0};
    double bandwidth_burst{16384.0};

    log_level level{log_info};

    // File the values were read from, empty when none
    std::string config_path;
};

// Defaults, then the Lua file (--config or MCSLB_CONFIG), then environment,
// then command line. Returns false with err set on any invalid value.
bool load_config(int argc, char** argv, lb_config& cfg, std::string& err);

// Individual layers, exposed for tests
bool apply_config_file(const std::string& path, lb_config& cfg, std::string& err);
bool apply_environment(lb_config& cfg, std::string& err);
bool apply_option(lb_config& cfg, std::string_view key, std::string_view value, std::string& err);
bool validate_config(const lb_config& cfg, std::string& err);

// `file` prefixed with tls_dir unless it is absolute or tls_dir is empty
std::string resolve_tls_path(const lb_config& cfg, const std::string& file);

void print_usage(const char* argv0);
