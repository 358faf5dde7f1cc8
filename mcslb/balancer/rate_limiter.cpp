#include "rate_limiter.h"

#include <algorithm>
#include <cmath>

// ─── token_bucket ───

void token_bucket::configure(double per_second, double capacity, clock::time_point now)
{
    rate = per_second;
    burst = capacity > 0.0 ? capacity : per_second;
    tokens = burst;
    last = now;
}

void token_bucket::refill(clock::time_point now)
{
    if (unlimited() || now <= last)
        return;

    double elapsed = std::chrono::duration<double>(now - last).count();
    last = now;
    tokens += elapsed * rate;
    if (tokens > burst)
        tokens = burst;
}

bool token_bucket::try_take(double n, clock::time_point now)
{
    if (unlimited())
        return true;

    refill(now);
    if (tokens < n)
        return false;

    tokens -= n;
    return true;
}

int token_bucket::wait_ms(double n) const
{
    if (unlimited() || tokens >= n)
        return 0;

    double ms = (n - tokens) / rate * 1000.0;
    return std::max(1, static_cast<int>(std::ceil(ms)));
}

// ─── client_state ───

client_state::client_state(const limiter_options& opts, clock::time_point now)
    : m_last_active(now)
{
    m_conn.configure(opts.conn_rate, opts.conn_burst, now);
    m_bandwidth.configure(opts.bandwidth, opts.bandwidth_burst, now);
}

bool client_state::admit_connection(clock::time_point now)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last_active = now;
    return m_conn.try_take(1.0, now);
}

size_t client_state::bandwidth_available(size_t want)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_bandwidth.unlimited())
        return want;

    auto now = clock::now();
    m_last_active = now;
    m_bandwidth.refill(now);
    if (m_bandwidth.tokens < 1.0)
        return 0;

    return std::min(want, static_cast<size_t>(m_bandwidth.tokens));
}

void client_state::consume_bandwidth(size_t n)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_bandwidth.unlimited())
        return;

    // May go negative when several connections of one client race
    m_bandwidth.tokens -= static_cast<double>(n);
}

int client_state::bandwidth_wait_ms()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_bandwidth.refill(clock::now());
    return m_bandwidth.wait_ms(1.0);
}

client_state::clock::time_point client_state::last_active() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_active;
}

// ─── client_limiter ───

client_limiter::client_limiter(limiter_options opts)
    : m_opts(opts)
{
}

std::shared_ptr<client_state> client_limiter::admit(std::string_view ip)
{
    auto now = clock::now();
    std::shared_ptr<client_state> state;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_clients.find(ip);
        if (it == m_clients.end())
            it = m_clients.emplace(std::string(ip), std::make_shared<client_state>(m_opts, now)).first;
        state = it->second;
    }

    if (!state->admit_connection(now))
        return nullptr;
    return state;
}

size_t client_limiter::sweep(clock::duration idle)
{
    auto cutoff = clock::now() - idle;
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_clients.begin(); it != m_clients.end(); )
    {
        // use_count() == 1: no bridge still holds the budget
        if (it->second.use_count() == 1 && it->second->last_active() < cutoff)
        {
            it = m_clients.erase(it);
            ++removed;
        }
        else
            ++it;
    }
    return removed;
}

size_t client_limiter::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_clients.size();
}
