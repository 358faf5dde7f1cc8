#include "metrics_endpoint.h"
#include "../balancer/metrics_sink.h"
#include "../shared/duplex_stream.h"
#include "../shared/logging.h"
#include "../shared/net_util.h"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <poll.h>
#include <arpa/inet.h>
#include <sys/socket.h>

namespace {

constexpr int accept_tick_ms = 250;
constexpr int client_timeout_ms = 2000;

std::string http_response(std::string_view status, std::string_view content_type, std::string_view body)
{
    std::string response;
    response.reserve(body.size() + 256);
    response += "HTTP/1.1 ";
    response += status;
    response += "\r\nContent-Type: ";
    response += content_type;
    response += "\r\nConnection: close\r\nContent-Length: ";
    char len_buf[24];
    auto [end, ec] = std::to_chars(len_buf, len_buf + sizeof(len_buf), body.size());
    response.append(len_buf, end - len_buf);
    response += "\r\n\r\n";
    response += body;
    return response;
}

} // namespace

metrics_endpoint::metrics_endpoint(metrics_sink& sink, std::string path)
    : m_sink(sink)
    , m_path(std::move(path))
{
}

metrics_endpoint::~metrics_endpoint()
{
    stop();
}

bool metrics_endpoint::start(const std::string& host, uint16_t port, std::string& err)
{
    m_listen_fd = net::listen_tcp(host, port, 16, true);
    if (!m_listen_fd)
    {
        err = "cannot listen on " + host + ":" + std::to_string(port) + ": " + std::strerror(errno);
        return false;
    }

    struct sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(m_listen_fd.get(), reinterpret_cast<struct sockaddr*>(&addr), &len) == 0)
        m_bound_port = ntohs(addr.sin_port);
    else
        m_bound_port = port;

    m_running.store(true, std::memory_order_release);
    m_thread = std::thread(&metrics_endpoint::serve_loop, this);
    LOG_INFO("metrics: serving %s on %s:%u", m_path.c_str(), host.c_str(),
        static_cast<unsigned>(m_bound_port));
    return true;
}

void metrics_endpoint::stop()
{
    bool was = m_running.exchange(false, std::memory_order_acq_rel);
    if (was && m_thread.joinable())
        m_thread.join();
    m_listen_fd.reset();
}

std::string metrics_endpoint::respond(std::string_view request) const
{
    if (!request.starts_with("GET "))
        return http_response("405 Method Not Allowed", "text/plain", "Method Not Allowed");

    std::string_view path = request.substr(4);
    path = path.substr(0, path.find_first_of(" \r\n"));

    // Query strings are ignored
    auto q = path.find('?');
    if (q != std::string_view::npos)
        path = path.substr(0, q);

    if (path != m_path)
        return http_response("404 Not Found", "text/plain", "Not Found");

    return http_response("200 OK", "text/plain; version=0.0.4; charset=utf-8",
        m_sink.render_prometheus());
}

void metrics_endpoint::serve_loop()
{
    logger::t_thread = "metrics";
    while (m_running.load(std::memory_order_acquire))
    {
        int ev = net::wait_fd(m_listen_fd.get(), POLLIN, accept_tick_ms);
        if (ev <= 0)
            continue;

        scoped_fd client(::accept4(m_listen_fd.get(), nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK));
        if (!client)
            continue;

        if (net::wait_fd(client.get(), POLLIN, client_timeout_ms) <= 0)
            continue;

        char buf[2048];
        ssize_t n = ::recv(client.get(), buf, sizeof(buf), 0);
        if (n <= 0)
            continue;

        // Rendered before any socket write; no lock is held while sending
        std::string response = respond(std::string_view(buf, static_cast<size_t>(n)));
        if (net::send_all(client.get(), response.data(), response.size(), client_timeout_ms) != io_status::ok)
            LOG_DEBUG("metrics: short write to scraper");
    }
}
