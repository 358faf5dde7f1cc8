#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

#include "../shared/scoped_fd.h"

class metrics_sink;

// Minimal HTTP/1.1 responder for Prometheus scrapes, on its own thread
class metrics_endpoint
{
public:
    metrics_endpoint(metrics_sink& sink, std::string path = "/metrics");
    ~metrics_endpoint();

    metrics_endpoint(const metrics_endpoint&) = delete;
    metrics_endpoint& operator=(const metrics_endpoint&) = delete;

    bool start(const std::string& host, uint16_t port, std::string& err);
    void stop();

    uint16_t bound_port() const { return m_bound_port; }

    // Response for one request buffer; exposed for tests
    std::string respond(std::string_view request) const;

private:
    void serve_loop();

    metrics_sink& m_sink;
    std::string m_path;
    scoped_fd m_listen_fd;
    uint16_t m_bound_port{0};
    std::atomic<bool> m_running{false};
    std::thread m_thread;
};
