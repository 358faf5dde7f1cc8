#include "daemon.h"
#include "lb_config.h"
#include "metrics_endpoint.h"
#include "../balancer/backend_pool.h"
#include "../balancer/connection_bridge.h"
#include "../balancer/health_checker.h"
#include "../balancer/metrics_sink.h"
#include "../balancer/rate_limiter.h"
#include "../balancer/registry_client.h"
#include "../balancer/scheduler.h"
#include "../balancer/tls_front_door.h"
#include "../shared/event_loop.h"
#include "../shared/logging.h"
#include "../shared/tls_context.h"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <unistd.h>

static int g_signal_write_fd = -1;

static void signal_handler(int sig)
{
    if (g_signal_write_fd >= 0)
    {
        char c = static_cast<char>(sig);
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-result"
        write(g_signal_write_fd, &c, 1);
#pragma GCC diagnostic pop
    }
}

static void install_signal_handlers(int write_fd)
{
    g_signal_write_fd = write_fd;

    // Peer resets surface as EPIPE from send()
    signal(SIGPIPE, SIG_IGN);

    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);

    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

// Let in-flight bridges finish, then force the rest closed
static void drain_connections(tls_front_door& front_door, connection_bridge& bridge,
                              metrics_sink& metrics, const lb_config& cfg)
{
    size_t pending = front_door.in_flight();
    if (pending == 0)
        return;

    LOG_INFO("draining %zu connections (up to %d s)", pending, cfg.shutdown_drain_s);
    if (front_door.wait_drained(std::chrono::seconds(cfg.shutdown_drain_s)))
        return;

    LOG_WARN("drain period over, closing %zu remaining connections", front_door.in_flight());
    bridge.force_stop();

    // Every bridge notices within a poll tick; a handshake or a blocked write
    // is bounded by its own timeout
    while (!front_door.wait_drained(std::chrono::seconds(1)))
    {
        LOG_DEBUG("waiting for %zu connections (active=%lld)", front_door.in_flight(),
            static_cast<long long>(metrics.active_connections()));
    }
}

int lb_start(int argc, char** argv)
{
    lb_config cfg;
    std::string err;
    if (!load_config(argc, argv, cfg, err))
    {
        LOG_ERROR("config: %s", err.c_str());
        return 1;
    }
    logger::g_level = cfg.level;

    if (!cfg.config_path.empty())
        LOG_INFO("config: loaded %s", cfg.config_path.c_str());

    // TLS material first: nothing is bound without it
    tls_context tls;
    std::string cert = resolve_tls_path(cfg, cfg.tls_cert);
    std::string key = resolve_tls_path(cfg, cfg.tls_key);
    if (!tls.init_server(cert, key, err))
    {
        LOG_ERROR("tls: %s", err.c_str());
        return 1;
    }
    LOG_INFO("tls: loaded %s", cert.c_str());

    redis_registry_options reg_opts;
    if (!parse_redis_url(cfg.redis_url, reg_opts.url))
    {
        LOG_ERROR("config: invalid redis_url '%s'", cfg.redis_url.c_str());
        return 1;
    }
    reg_opts.key = cfg.registry_key;
    reg_opts.mode = cfg.registry;
    reg_opts.heartbeat_ttl_s = cfg.heartbeat_ttl_s;
    reg_opts.timeout_ms = cfg.registry_timeout_ms;

    event_loop loop;
    if (!loop.init())
    {
        LOG_ERROR("failed to init event loop");
        return 1;
    }

    backend_pool pool;
    metrics_sink metrics(&pool);
    auto sched = make_scheduler(cfg.policy);

    limiter_options lim_opts;
    lim_opts.conn_rate = cfg.conn_rate;
    lim_opts.conn_burst = cfg.conn_rate;
    lim_opts.bandwidth = cfg.bandwidth;
    lim_opts.bandwidth_burst = cfg.bandwidth_burst;
    client_limiter limiter(lim_opts);

    health_options h_opts;
    h_opts.interval_ms = cfg.health_interval_ms;
    h_opts.timeout_ms = cfg.health_timeout_ms;
    h_opts.threshold = cfg.health_threshold;
    health_checker health(pool, metrics, h_opts);

    registry_options r_opts;
    r_opts.poll_interval_ms = cfg.registry_poll_ms;
    r_opts.max_failures = cfg.registry_max_failures;
    r_opts.stale_after_ms = cfg.registry_stale_ms;
    r_opts.drain_grace_ms = cfg.drain_grace_ms;
    r_opts.resolve_timeout_ms = cfg.registry_timeout_ms;
    registry_client registry(pool, metrics,
        std::make_unique<redis_registry_source>(reg_opts), r_opts, &limiter);

    bridge_options b_opts;
    b_opts.connect_timeout_ms = cfg.connect_timeout_ms;
    b_opts.idle_timeout_s = cfg.idle_timeout_s;
    connection_bridge bridge(pool, *sched, health, metrics, b_opts);

    front_door_options f_opts;
    f_opts.host = cfg.listen_host;
    f_opts.port = cfg.listen_port;
    f_opts.handshake_timeout_ms = cfg.handshake_timeout_ms;
    tls_front_door front_door(tls, bridge, metrics, limiter, f_opts);

    metrics_endpoint endpoint(metrics, cfg.metrics_path);
    if (cfg.metrics_port > 0 && !endpoint.start(cfg.metrics_host, cfg.metrics_port, err))
    {
        LOG_ERROR("metrics: %s", err.c_str());
        return 1;
    }

    if (!front_door.listen(err))
    {
        LOG_ERROR("front door: %s", err.c_str());
        return 1;
    }

    registry.start();
    health.start();
    front_door.start(loop);

    install_signal_handlers(loop.wake_fd());

    LOG_INFO("mcslb started (policy=%s, registry=%s %s)", schedule_policy_name(cfg.policy),
        registry_mode_name(cfg.registry), cfg.registry_key.c_str());

    loop.run();

    if (loop.stop_signal() > 0)
        LOG_INFO("received %s, shutting down", strsignal(loop.stop_signal()));
    else
        LOG_INFO("shutting down");
    front_door.teardown();
    registry.stop();
    health.stop();

    drain_connections(front_door, bridge, metrics, cfg);

    endpoint.stop();
    g_signal_write_fd = -1;

    LOG_INFO("mcslb stopped");
    return 0;
}
