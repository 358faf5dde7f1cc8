#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "mcslb/balancer/backend_pool.h"
#include "mcslb/balancer/metrics_sink.h"
#include "mcslb/daemon/metrics_endpoint.h"

#include <thread>
#include <vector>

static bool contains(const std::string& haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string::npos;
}

TEST_CASE("metrics_sink counters")
{
    backend_pool pool;
    metrics_sink m(&pool);

    pool.upsert("10.0.0.1:7000", true);
    pool.increment_connections("10.0.0.1:7000");

    m.connection_accepted();
    m.connection_accepted();
    m.connection_opened();
    m.connection_opened();
    m.connection_closed();
    m.connection_rejected();
    m.handshake_failed();
    m.connection_rate_limited();
    m.health_check_failed("10.0.0.2:7000");
    m.health_check_failed("10.0.0.2:7000");
    m.registry_failed();

    CHECK(m.total_connections() == 2);
    CHECK(m.active_connections() == 1);
    CHECK(m.rejected_connections() == 1);
    CHECK(m.handshake_failures() == 1);
    CHECK(m.rate_limited_connections() == 1);
    CHECK(m.registry_failures() == 1);
    CHECK(m.backend_active("10.0.0.1:7000") == 1);
    CHECK(m.backend_active("unknown:1") == 0);
    CHECK(m.backend_health_failures("10.0.0.2:7000") == 2);
    CHECK(m.backend_health_failures("unknown:1") == 0);

    SUBCASE("forget drops the labelled series")
    {
        m.forget_backend("10.0.0.2:7000");
        CHECK(m.backend_health_failures("10.0.0.2:7000") == 0);
        CHECK_FALSE(contains(m.render_prometheus(), "backend=\"10.0.0.2:7000\""));
    }

    SUBCASE("connect failures without a record only count the total")
    {
        m.backend_connect_failed({});
        std::string text = m.render_prometheus();
        CHECK(contains(text, "lb_backend_connect_failures_total 1\n"));
        CHECK_FALSE(contains(text, "lb_backend_connect_failures{backend=\"\"}"));
    }
}

TEST_CASE("prometheus rendering")
{
    backend_pool pool;
    metrics_sink m(&pool);
    pool.upsert("a:1", true);
    pool.increment_connections("a:1");

    m.connection_accepted();
    m.connection_opened();
    m.health_check_failed("b:2");
    m.backend_connect_failed("b:2");
    m.bytes_transferred(100, 250);
    m.set_backend_counts(2, 1);

    std::string text = m.render_prometheus();

    CHECK(contains(text, "# TYPE lb_total_connections counter\nlb_total_connections 1\n"));
    CHECK(contains(text, "# TYPE lb_active_connections gauge\nlb_active_connections 1\n"));
    CHECK(contains(text, "lb_backend_active_connections{backend=\"a:1\"} 1\n"));
    CHECK(contains(text, "lb_backend_health_check_failures{backend=\"b:2\"} 1\n"));
    CHECK(contains(text, "lb_backend_connect_failures{backend=\"b:2\"} 1\n"));
    CHECK(contains(text, "lb_backend_connect_failures_total 1\n"));
    CHECK(contains(text, "lb_bytes_client_to_backend_total 100\n"));
    CHECK(contains(text, "lb_bytes_backend_to_client_total 250\n"));
    CHECK(contains(text, "lb_backends 2\n"));
    CHECK(contains(text, "lb_healthy_backends 1\n"));
    CHECK(contains(text, "lb_rejected_connections_total 0\n"));
}

TEST_CASE("per-backend active gauge follows the pool whatever the close order")
{
    backend_pool pool;
    metrics_sink m(&pool);
    pool.upsert("A:1", true);

    // Two bridges open, then close with their metric updates swapped
    pool.increment_connections("A:1");
    m.connection_opened();
    pool.increment_connections("A:1");
    m.connection_opened();

    pool.decrement_connections("A:1");
    pool.decrement_connections("A:1");
    m.connection_closed();
    m.connection_closed();

    CHECK(pool.find("A:1")->active_connections == 0);
    CHECK(m.backend_active("A:1") == 0);
    CHECK(m.active_connections() == 0);
    CHECK(contains(m.render_prometheus(), "lb_backend_active_connections{backend=\"A:1\"} 0\n"));
}

TEST_CASE("concurrent open and close leave the gauges at zero")
{
    backend_pool pool;
    metrics_sink m(&pool);
    pool.upsert("A:1", true);
    pool.upsert("B:1", true);

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t)
    {
        workers.emplace_back([&, t] {
            const char* addr = (t % 2) ? "A:1" : "B:1";
            for (int i = 0; i < 2000; ++i)
            {
                if (pool.increment_connections(addr))
                    m.connection_opened();
                pool.decrement_connections(addr);
                m.connection_closed();
            }
        });
    }
    for (auto& w : workers)
        w.join();

    CHECK(m.active_connections() == 0);
    std::string text = m.render_prometheus();
    CHECK(contains(text, "lb_backend_active_connections{backend=\"A:1\"} 0\n"));
    CHECK(contains(text, "lb_backend_active_connections{backend=\"B:1\"} 0\n"));
}

TEST_CASE("without a pool no per-backend gauge is rendered")
{
    metrics_sink m;
    m.connection_opened();
    CHECK(m.backend_active("a:1") == 0);
    CHECK_FALSE(contains(m.render_prometheus(), "lb_backend_active_connections{"));
}

TEST_CASE("label values are escaped")
{
    metrics_sink m;
    m.health_check_failed("we\"ird");
    CHECK(contains(m.render_prometheus(), "{backend=\"we\\\"ird\"}"));
}

TEST_CASE("metrics endpoint routing")
{
    metrics_sink m;
    m.connection_accepted();
    metrics_endpoint endpoint(m, "/metrics");

    SUBCASE("scrape path")
    {
        std::string resp = endpoint.respond("GET /metrics HTTP/1.1\r\nHost: x\r\n\r\n");
        CHECK(resp.starts_with("HTTP/1.1 200 OK\r\n"));
        CHECK(contains(resp, "text/plain; version=0.0.4"));
        CHECK(contains(resp, "lb_total_connections 1\n"));
    }

    SUBCASE("query string is ignored")
    {
        CHECK(endpoint.respond("GET /metrics?x=1 HTTP/1.1\r\n\r\n").starts_with("HTTP/1.1 200"));
    }

    SUBCASE("unknown path")
    {
        CHECK(endpoint.respond("GET /other HTTP/1.1\r\n\r\n").starts_with("HTTP/1.1 404"));
    }

    SUBCASE("other methods")
    {
        CHECK(endpoint.respond("POST /metrics HTTP/1.1\r\n\r\n").starts_with("HTTP/1.1 405"));
    }
}
