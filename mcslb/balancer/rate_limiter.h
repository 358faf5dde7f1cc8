#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

// Refilling bucket; rate <= 0 means unlimited
struct token_bucket
{
    using clock = std::chrono::steady_clock;

    double tokens{0.0};
    double rate{0.0};      // tokens per second
    double burst{0.0};     // capacity
    clock::time_point last{};

    void configure(double per_second, double capacity, clock::time_point now);
    void refill(clock::time_point now);

    bool unlimited() const { return rate <= 0.0; }

    // Take `n` tokens if all are available
    bool try_take(double n, clock::time_point now);

    // Milliseconds until at least `n` tokens are available, 0 if already
    int wait_ms(double n) const;
};

struct limiter_options
{
    double conn_rate{5.0};            // new connections per second per IP
    double conn_burst{5.0};
    double bandwidth{102400.0};       // client->backend bytes per second per IP
    double bandwidth_burst{16384.0};
};

// Per-IP budget shared by every connection from that address
class client_state
{
public:
    using clock = std::chrono::steady_clock;

    client_state(const limiter_options& opts, clock::time_point now);

    bool admit_connection(clock::time_point now);

    // Bytes that may be read right now, at most `want`. 0 means wait
    // bandwidth_wait_ms() before reading again.
    size_t bandwidth_available(size_t want);
    void consume_bandwidth(size_t n);
    int bandwidth_wait_ms();

    clock::time_point last_active() const;

private:
    mutable std::mutex m_mutex;
    token_bucket m_conn;
    token_bucket m_bandwidth;
    clock::time_point m_last_active;
};

class client_limiter
{
public:
    using clock = std::chrono::steady_clock;

    explicit client_limiter(limiter_options opts = {});

    client_limiter(const client_limiter&) = delete;
    client_limiter& operator=(const client_limiter&) = delete;

    // State for `ip` if a new connection is allowed, nullptr when rate limited
    std::shared_ptr<client_state> admit(std::string_view ip);

    // Drop clients idle for longer than `idle` with no live connection
    size_t sweep(clock::duration idle);

    size_t size() const;
    const limiter_options& options() const { return m_opts; }

private:
    limiter_options m_opts;
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<client_state>, std::less<>> m_clients;
};
