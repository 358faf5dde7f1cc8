#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <liburing.h>

#include "../shared/event_loop_definitions.h"
#include "../shared/scoped_fd.h"

class event_loop;
class tls_context;
class connection_bridge;
class metrics_sink;
class client_limiter;
class client_state;

struct front_door_options
{
    std::string host{"0.0.0.0"};
    uint16_t port{64400};
    int backlog{4096};
    int handshake_timeout_ms{5000};
    int accept_backoff_ms{100};   // after EMFILE/ENFILE
};

// What the listener does after a failed accept completion (negative errno)
enum class accept_recovery : uint8_t
{
    rearm,        // transient, accept again now
    back_off,     // resources exhausted or a persistent error, retry after a pause
    single_shot,  // the kernel refused multishot accept, switch and rearm
    none          // cancelled by teardown
};

accept_recovery classify_accept_error(int res, bool multishot);

// Client-facing TLS listener. Accepts run on the io_uring loop; each
// admitted connection gets its own thread for the handshake and bridge.
class tls_front_door : public io_handler
{
public:
    tls_front_door(tls_context& tls, connection_bridge& bridge, metrics_sink& metrics,
                   client_limiter& limiter, front_door_options opts);
    ~tls_front_door() override;

    tls_front_door(const tls_front_door&) = delete;
    tls_front_door& operator=(const tls_front_door&) = delete;

    // Bind and listen; err describes the failure
    bool listen(std::string& err);

    // Arm accepts on the loop. listen() must have succeeded.
    void start(event_loop& loop);

    // Stop accepting; running connections are untouched
    void teardown();

    void on_cqe(struct io_uring_cqe* cqe) override;

    // Serve an already accepted socket on the calling thread
    void serve(scoped_fd fd, std::shared_ptr<client_state> budget);

    size_t in_flight() const { return m_in_flight.load(std::memory_order_acquire); }
    // Wait until every connection thread has finished, up to timeout
    bool wait_drained(std::chrono::milliseconds timeout);

    uint16_t bound_port() const { return m_bound_port; }
    bool listening() const { return static_cast<bool>(m_listen_fd); }

private:
    void handle_accept(struct io_uring_cqe* cqe);
    void admit(int client_fd);
    void rearm_accept();
    void start_backoff();
    void connection_done();

    tls_context& m_tls;
    connection_bridge& m_bridge;
    metrics_sink& m_metrics;
    client_limiter& m_limiter;
    front_door_options m_opts;

    event_loop* m_loop = nullptr;
    scoped_fd m_listen_fd;
    uint16_t m_bound_port = 0;
    bool m_multishot_active = false;
    bool m_backing_off = false;

    io_request m_accept_req{};
    io_request m_backoff_req{};
    struct sockaddr_in m_accept_addr{};
    socklen_t m_accept_addrlen = sizeof(m_accept_addr);
    struct __kernel_timespec m_backoff_ts{};

    std::atomic<size_t> m_in_flight{0};
    std::mutex m_drain_mutex;
    std::condition_variable m_drained;
};
