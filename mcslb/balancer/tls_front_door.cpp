#include "tls_front_door.h"
#include "connection_bridge.h"
#include "metrics_sink.h"
#include "rate_limiter.h"
#include "../shared/event_loop.h"
#include "../shared/logging.h"
#include "../shared/net_util.h"
#include "../shared/tls_context.h"
#include "../shared/tls_stream.h"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>
#include <arpa/inet.h>

tls_front_door::tls_front_door(tls_context& tls, connection_bridge& bridge, metrics_sink& metrics,
                               client_limiter& limiter, front_door_options opts)
    : m_tls(tls)
    , m_bridge(bridge)
    , m_metrics(metrics)
    , m_limiter(limiter)
    , m_opts(std::move(opts))
{
    m_accept_req = { this, nullptr, -1, 0, op_accept };
    m_backoff_req = { this, nullptr, -1, 0, op_timeout };
}

tls_front_door::~tls_front_door()
{
    teardown();
}

bool tls_front_door::listen(std::string& err)
{
    m_listen_fd = net::listen_tcp(m_opts.host, m_opts.port, m_opts.backlog, true);
    if (!m_listen_fd)
    {
        err = "cannot listen on " + m_opts.host + ":" + std::to_string(m_opts.port) +
              ": " + std::strerror(errno);
        return false;
    }

    struct sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(m_listen_fd.get(), reinterpret_cast<struct sockaddr*>(&addr), &len) == 0)
        m_bound_port = ntohs(addr.sin_port);
    else
        m_bound_port = m_opts.port;

    m_accept_req.fd = m_listen_fd.get();
    return true;
}

void tls_front_door::start(event_loop& loop)
{
    m_loop = &loop;

    // Multishot accept where the kernel has it (5.19+)
    m_multishot_active = loop.multishot_supported();
    m_accept_req.type = m_multishot_active ? op_multishot_accept : op_accept;
    rearm_accept();
    loop.flush();

    LOG_INFO("front door: listening on %s:%u (%s accept)", m_opts.host.c_str(),
        static_cast<unsigned>(m_bound_port), m_multishot_active ? "multishot" : "single");
}

void tls_front_door::teardown()
{
    if (!m_listen_fd)
        return;

    if (m_loop && m_loop->is_running())
    {
        m_loop->submit_cancel(&m_accept_req);
        m_loop->flush();
    }
    m_listen_fd.reset();
    m_loop = nullptr;
    LOG_INFO("front door: stopped accepting");
}

void tls_front_door::rearm_accept()
{
    if (!m_loop || !m_listen_fd)
        return;

    if (m_multishot_active)
    {
        m_loop->submit_multishot_accept(m_listen_fd.get(), &m_accept_req);
    }
    else
    {
        m_accept_addrlen = sizeof(m_accept_addr);
        m_loop->submit_accept(m_listen_fd.get(), &m_accept_addr, &m_accept_addrlen, &m_accept_req);
    }
}

void tls_front_door::on_cqe(struct io_uring_cqe* cqe)
{
    auto* req = static_cast<io_request*>(io_uring_cqe_get_data(cqe));
    if (!req || !m_loop)
        return;

    switch (req->type)
    {
        case op_accept:
        case op_multishot_accept:
            handle_accept(cqe);
            break;
        case op_timeout:
            // Backoff over, accept again
            m_backing_off = false;
            rearm_accept();
            break;
        default:
            break;
    }
}

accept_recovery classify_accept_error(int res, bool multishot)
{
    switch (-res)
    {
        case ECANCELED:
            return accept_recovery::none;
        case EINVAL:
            // Kernels 5.10 to 5.18 know IORING_OP_ACCEPT but not the multishot flag
            return multishot ? accept_recovery::single_shot : accept_recovery::back_off;
        case ECONNABORTED:
        case EINTR:
        case EAGAIN:
        case EPROTO:
        case EPERM:
        case ENETDOWN:
        case ENETUNREACH:
        case EHOSTUNREACH:
        case EHOSTDOWN:
        case ENOPROTOOPT:
        case EOPNOTSUPP:
        case ETIMEDOUT:
            return accept_recovery::rearm;
        default:
            return accept_recovery::back_off;
    }
}

void tls_front_door::start_backoff()
{
    if (m_backing_off)
        return;
    m_backing_off = true;
    m_backoff_ts.tv_sec = m_opts.accept_backoff_ms / 1000;
    m_backoff_ts.tv_nsec = static_cast<long long>(m_opts.accept_backoff_ms % 1000) * 1000000LL;
    m_loop->submit_timeout(&m_backoff_ts, &m_backoff_req);
}

void tls_front_door::handle_accept(struct io_uring_cqe* cqe)
{
    int res = cqe->res;

    if (res >= 0)
    {
        admit(res);
        // Multishot stays armed while IORING_CQE_F_MORE is set
        if (!m_backing_off && (!m_multishot_active || !(cqe->flags & IORING_CQE_F_MORE)))
            rearm_accept();
        return;
    }

    switch (classify_accept_error(res, m_multishot_active))
    {
        case accept_recovery::none:
            return;
        case accept_recovery::single_shot:
            LOG_WARN("front door: multishot accept unsupported (%s), using single accepts",
                std::strerror(-res));
            m_multishot_active = false;
            m_accept_req.type = op_accept;
            rearm_accept();
            return;
        case accept_recovery::back_off:
            // An errored multishot accept is finished too; the timer rearms it
            LOG_WARN("front door: accept failed (%s), backing off %d ms",
                std::strerror(-res), m_opts.accept_backoff_ms);
            start_backoff();
            return;
        case accept_recovery::rearm:
            LOG_DEBUG("front door: accept error (%s)", std::strerror(-res));
            if (!m_backing_off && (!m_multishot_active || !(cqe->flags & IORING_CQE_F_MORE)))
                rearm_accept();
            return;
    }
}

void tls_front_door::admit(int client_fd)
{
    scoped_fd fd(client_fd);
    std::string ip = net::peer_ip(fd.get());

    auto budget = m_limiter.admit(ip);
    if (!budget)
    {
        LOG_WARN("front door: connection rate limit exceeded for %s", ip.c_str());
        m_metrics.connection_rate_limited();
        return;
    }

    m_in_flight.fetch_add(1, std::memory_order_acq_rel);
    try
    {
        std::thread([this, fd = std::move(fd), budget = std::move(budget)]() mutable {
            logger::t_thread = "conn";
            serve(std::move(fd), std::move(budget));
            connection_done();
        }).detach();
    }
    catch (const std::system_error& e)
    {
        // The lambda (and with it the socket) is destroyed when the thread
        // cannot be created
        LOG_ERROR("front door: cannot spawn connection thread: %s", e.what());
        connection_done();
    }
}

void tls_front_door::serve(scoped_fd fd, std::shared_ptr<client_state> budget)
{
    std::string ip = net::peer_ip(fd.get());

    if (!net::set_nonblocking(fd.get()))
    {
        LOG_WARN("front door: cannot make client socket non-blocking: %s", std::strerror(errno));
        return;
    }
    net::tune_socket(fd.get());

    SSL* ssl = m_tls.create_ssl_server();
    if (!ssl)
    {
        LOG_ERROR("front door: SSL_new failed: %s", tls_context::last_error().c_str());
        m_metrics.handshake_failed();
        return;
    }

    auto stream = std::make_unique<tls_stream>(std::move(fd), ssl);
    if (!stream->handshake(m_opts.handshake_timeout_ms))
    {
        LOG_WARN("front door: TLS handshake with %s failed: %s", ip.c_str(),
            tls_context::last_error().c_str());
        m_metrics.handshake_failed();
        return;
    }

    m_metrics.connection_accepted();
    bridge_result r = m_bridge.run(std::move(stream), std::move(budget));
    LOG_DEBUG("front door: connection from %s %s", ip.c_str(), bridge_result_name(r));
}

void tls_front_door::connection_done()
{
    // Notify under the lock so wait_drained cannot miss the last wakeup
    std::lock_guard<std::mutex> lock(m_drain_mutex);
    if (m_in_flight.fetch_sub(1, std::memory_order_acq_rel) == 1)
        m_drained.notify_all();
}

bool tls_front_door::wait_drained(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_drain_mutex);
    return m_drained.wait_for(lock, timeout, [this] {
        return m_in_flight.load(std::memory_order_acquire) == 0;
    });
}
