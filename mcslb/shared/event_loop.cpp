#include "event_loop.h"
#include "logging.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

event_loop::event_loop(uint32_t queue_depth)
    : m_queue_depth(queue_depth)
{
}

event_loop::~event_loop()
{
    if (m_ring_ready)
        io_uring_queue_exit(&m_ring);
}

bool event_loop::probe_multishot(struct io_uring& ring)
{
    struct io_uring_probe* probe = io_uring_get_probe_ring(&ring);
    if (!probe)
        return false;
    bool ok = io_uring_opcode_supported(probe, IORING_OP_ACCEPT);
    io_uring_free_probe(probe);
    return ok;
}

bool event_loop::init()
{
    struct io_uring_params params{};
    params.flags = IORING_SETUP_CQSIZE;
    params.cq_entries = m_queue_depth * 4;

    int ret = io_uring_queue_init_params(m_queue_depth, &m_ring, &params);
    if (ret < 0)
        ret = io_uring_queue_init(m_queue_depth, &m_ring, 0);
    if (ret < 0)
    {
        LOG_ERROR("event loop: io_uring init failed: %s", std::strerror(-ret));
        return false;
    }
    m_ring_ready = true;
    m_multishot_supported = probe_multishot(m_ring);

    if (!arm_wake_pipe())
        return false;

    LOG_DEBUG("event loop: %u entries, multishot accept %s", m_queue_depth,
        m_multishot_supported ? "on" : "off");
    return true;
}

bool event_loop::arm_wake_pipe()
{
    int fds[2];
    if (pipe2(fds, O_NONBLOCK | O_CLOEXEC) < 0)
    {
        LOG_ERROR("event loop: wake pipe: %s", std::strerror(errno));
        return false;
    }
    m_wake_read = scoped_fd(fds[0]);
    m_wake_write = scoped_fd(fds[1]);

    m_wake_req = { nullptr, &m_wake_byte, m_wake_read.get(), 1, op_read };
    queue(&m_wake_req, [this](struct io_uring_sqe* sqe) {
        io_uring_prep_read(sqe, m_wake_read.get(), &m_wake_byte, 1, 0);
    });
    flush();
    return true;
}

// Fetch an SQE (submitting once if the ring is full), prepare it, tag it
template <typename Prep>
void event_loop::queue(io_request* req, Prep&& prep)
{
    struct io_uring_sqe* sqe = io_uring_get_sqe(&m_ring);
    if (MCSLB_UNLIKELY(!sqe))
    {
        io_uring_submit(&m_ring);
        m_pending = 0;
        sqe = io_uring_get_sqe(&m_ring);
        if (!sqe)
        {
            LOG_ERROR("event loop: submission queue exhausted");
            return;
        }
    }
    prep(sqe);
    io_uring_sqe_set_data(sqe, req);
    m_pending++;
}

void event_loop::submit_accept(int listen_fd, struct sockaddr_in* addr, socklen_t* addrlen, io_request* req)
{
    queue(req, [&](struct io_uring_sqe* sqe) {
        io_uring_prep_accept(sqe, listen_fd, reinterpret_cast<struct sockaddr*>(addr), addrlen, SOCK_CLOEXEC);
    });
}

void event_loop::submit_multishot_accept(int listen_fd, io_request* req)
{
    queue(req, [&](struct io_uring_sqe* sqe) {
        io_uring_prep_multishot_accept(sqe, listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
    });
}

void event_loop::submit_timeout(struct __kernel_timespec* ts, io_request* req)
{
    queue(req, [&](struct io_uring_sqe* sqe) { io_uring_prep_timeout(sqe, ts, 0, 0); });
}

void event_loop::submit_cancel(io_request* req)
{
    queue(nullptr, [&](struct io_uring_sqe* sqe) {
        io_uring_prep_cancel(sqe, req, IORING_ASYNC_CANCEL_ALL);
    });
}

void event_loop::flush()
{
    if (m_pending == 0)
        return;
    io_uring_submit(&m_ring);
    m_pending = 0;
}

void event_loop::run()
{
    m_running.store(true, std::memory_order_release);
    bool woken = false;

    while (!woken && m_running.load(std::memory_order_relaxed))
    {
        struct io_uring_cqe* cqe = nullptr;
        int ret = m_pending > 0 ? io_uring_submit_and_wait(&m_ring, 1) : 0;
        m_pending = 0;
        if (ret >= 0)
            ret = io_uring_wait_cqe(&m_ring, &cqe);
        if (ret == -EINTR)
            continue;
        if (ret < 0)
        {
            LOG_ERROR("event loop: wait failed: %s", std::strerror(-ret));
            break;
        }

        unsigned head;
        unsigned seen = 0;
        io_uring_for_each_cqe(&m_ring, head, cqe)
        {
            seen++;
            auto* req = static_cast<io_request*>(io_uring_cqe_get_data(cqe));
            if (MCSLB_UNLIKELY(req == &m_wake_req))
            {
                m_stop_signal = cqe->res > 0 ? static_cast<unsigned char>(m_wake_byte) : 0;
                woken = true;
                break;
            }
            if (MCSLB_LIKELY(req && req->owner))
                req->owner->on_cqe(cqe);
        }
        io_uring_cq_advance(&m_ring, seen);
    }

    m_running.store(false, std::memory_order_release);
}

void event_loop::request_stop()
{
    m_running.store(false, std::memory_order_release);
    char zero = 0;
    if (m_wake_write && ::write(m_wake_write.get(), &zero, 1) < 0 && errno != EAGAIN)
        LOG_WARN("event loop: wake write failed: %s", std::strerror(errno));
}
