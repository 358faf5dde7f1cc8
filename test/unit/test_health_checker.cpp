#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "mcslb/balancer/health_checker.h"
#include "mcslb/balancer/metrics_sink.h"
#include "mcslb/shared/net_util.h"

#include <arpa/inet.h>
#include <map>
#include <mutex>
#include <sys/socket.h>

// Scripted probe results per backend; missing entries succeed
struct fake_probe
{
    std::map<std::string, bool> up;
    std::map<std::string, int> calls;
    std::mutex mtx;

    health_checker::probe_fn fn()
    {
        return [this](const std::string& addr, int) {
            std::lock_guard<std::mutex> lock(mtx);
            calls[addr]++;
            auto it = up.find(addr);
            return it == up.end() ? true : it->second;
        };
    }
};

TEST_CASE("health checker sweep")
{
    backend_pool pool;
    metrics_sink metrics;
    fake_probe probe;
    health_options opts;
    opts.threshold = 3;
    health_checker checker(pool, metrics, opts, probe.fn());

    pool.upsert("a:1", true);
    pool.upsert("b:1", true);

    SUBCASE("first success marks healthy")
    {
        checker.sweep();
        CHECK(pool.find("a:1")->health == health_state::healthy);
        CHECK(pool.find("b:1")->health == health_state::healthy);
        CHECK(metrics.backend_health_failures("a:1") == 0);
    }

    SUBCASE("debounce with threshold three")
    {
        probe.up["b:1"] = false;

        checker.sweep();
        checker.sweep();
        CHECK(pool.find("b:1")->health == health_state::unknown);
        CHECK(pool.snapshot_eligible().size() == 2);

        checker.sweep();
        CHECK(pool.find("b:1")->health == health_state::unhealthy);
        auto eligible = pool.snapshot_eligible();
        REQUIRE(eligible.size() == 1);
        CHECK(eligible[0].address == "a:1");

        // One metric increment per failed probe
        CHECK(metrics.backend_health_failures("b:1") == 3);
    }

    SUBCASE("unhealthy backends keep being probed and recover")
    {
        probe.up["a:1"] = false;
        for (int i = 0; i < 4; ++i)
            checker.sweep();
        CHECK(pool.find("a:1")->health == health_state::unhealthy);
        CHECK(probe.calls["a:1"] == 4);

        probe.up["a:1"] = true;
        checker.sweep();
        CHECK(pool.find("a:1")->health == health_state::healthy);
        CHECK(pool.find("a:1")->consecutive_failures == 0);
    }

    SUBCASE("connect failures feed the same state machine")
    {
        checker.sweep();
        CHECK(checker.report_failure("a:1") == health_state::healthy);
        CHECK(checker.report_failure("a:1") == health_state::healthy);
        CHECK(checker.report_failure("a:1") == health_state::unhealthy);
        CHECK(metrics.backend_health_failures("a:1") == 3);
    }

    SUBCASE("unknown backends are ignored")
    {
        CHECK_FALSE(checker.report_failure("zz:1").has_value());
        CHECK(pool.size() == 2);
    }
}

TEST_CASE("tcp probe")
{
    scoped_fd listener = net::listen_tcp("127.0.0.1", 0, 4, false);
    REQUIRE(listener);

    struct sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    REQUIRE(getsockname(listener.get(), reinterpret_cast<struct sockaddr*>(&addr), &len) == 0);
    std::string target = "127.0.0.1:" + std::to_string(ntohs(addr.sin_port));

    CHECK(health_checker::tcp_probe(target, 500));

    listener.reset();
    CHECK_FALSE(health_checker::tcp_probe(target, 500));
}

TEST_CASE("default health check connects through the cached backend address")
{
    scoped_fd listener = net::listen_tcp("127.0.0.1", 0, 4, false);
    REQUIRE(listener);
    struct sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    REQUIRE(getsockname(listener.get(), reinterpret_cast<struct sockaddr*>(&addr), &len) == 0);

    backend_pool pool;
    metrics_sink metrics(&pool);
    health_checker checker(pool, metrics, health_options{});

    // Unresolvable name: only the cached address makes the probe succeed
    pool.upsert("chat-node.invalid:7000", true);
    REQUIRE(pool.set_cached_address("chat-node.invalid:7000", addr));

    checker.sweep();
    CHECK(pool.find("chat-node.invalid:7000")->health == health_state::healthy);
    CHECK(metrics.backend_health_failures("chat-node.invalid:7000") == 0);
}

TEST_CASE("a health check racing a purge leaves no labelled series behind")
{
    backend_pool pool;
    metrics_sink metrics(&pool);
    health_checker checker(pool, metrics, health_options{},
        [&](const std::string& addr, int) {
            // The registry drops the backend while this probe is in flight
            pool.upsert(addr, false);
            pool.remove_if_drained(addr);
            metrics.forget_backend(addr);
            return false;
        });

    pool.upsert("gone:1", true);
    checker.sweep();

    CHECK_FALSE(pool.find("gone:1"));
    CHECK(metrics.backend_health_failures("gone:1") == 0);
    CHECK(metrics.render_prometheus().find("backend=\"gone:1\"") == std::string::npos);
}
