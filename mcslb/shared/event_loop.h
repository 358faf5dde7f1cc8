#pragma once
#include <atomic>
#include <cstdint>
#include <liburing.h>
#include <netinet/in.h>

#include "event_loop_definitions.h"
#include "scoped_fd.h"

// io_uring loop driving the client-facing accept path and signal delivery.
// Per-connection work runs on worker threads, never on the loop thread.
class event_loop
{
public:
    explicit event_loop(uint32_t queue_depth = 256);
    ~event_loop();

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;

    bool init();

    // Dispatch completions until request_stop() or a byte on the wake pipe
    void run();
    void request_stop();

    // Signal handlers write the signal number here (async-signal-safe)
    int wake_fd() const { return m_wake_write.get(); }
    // Signal that ended run(), 0 when stopped programmatically
    int stop_signal() const { return m_stop_signal; }

    // Queued, not submitted; flush() or run() submits
    void submit_accept(int listen_fd, struct sockaddr_in* addr, socklen_t* addrlen, io_request* req);
    void submit_multishot_accept(int listen_fd, io_request* req);
    void submit_timeout(struct __kernel_timespec* ts, io_request* req);
    // Cancel everything owned by req (used on listener teardown)
    void submit_cancel(io_request* req);

    void flush();

    bool multishot_supported() const { return m_multishot_supported; }
    bool is_running() const { return m_running.load(std::memory_order_acquire); }

private:
    template <typename Prep>
    void queue(io_request* req, Prep&& prep);

    bool arm_wake_pipe();
    static bool probe_multishot(struct io_uring& ring);

    struct io_uring m_ring{};
    bool m_ring_ready{false};
    uint32_t m_queue_depth;
    uint32_t m_pending{0};
    std::atomic<bool> m_running{false};
    bool m_multishot_supported{false};

    scoped_fd m_wake_read;
    scoped_fd m_wake_write;
    io_request m_wake_req{};
    char m_wake_byte{};
    int m_stop_signal{0};
};
