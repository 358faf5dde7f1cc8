#include "tls_stream.h"
#include "logging.h"
#include "net_util.h"

#include <poll.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstdint>
#include <chrono>

static constexpr int TLS_IO_CHUNK = 16384;
static constexpr int CLOSE_NOTIFY_TIMEOUT_MS = 200;

tls_stream::tls_stream(scoped_fd fd, SSL* ssl)
    : m_fd(std::move(fd)), m_ssl(ssl)
{
}

tls_stream::~tls_stream()
{
    tls_context::free_ssl(m_ssl);
}

io_status tls_stream::flush_out(int timeout_ms)
{
    char buf[TLS_IO_CHUNK];
    while (tls_context::has_pending_out(m_ssl))
    {
        int n = tls_context::bio_read_out(m_ssl, buf, sizeof(buf));
        if (n < 0)
            return io_status::error;
        if (n == 0)
            break;
        io_status st = net::send_all(m_fd.get(), buf, static_cast<size_t>(n), timeout_ms);
        if (st != io_status::ok)
            return st;
    }
    return io_status::ok;
}

// Move ciphertext from the socket into the read BIO
io_status tls_stream::pull_in()
{
    char buf[TLS_IO_CHUNK];
    while (true)
    {
        ssize_t r = ::recv(m_fd.get(), buf, sizeof(buf), 0);
        if (r > 0)
        {
            if (tls_context::bio_write_in(m_ssl, buf, static_cast<int>(r)) != static_cast<int>(r))
                return io_status::error;
            return io_status::ok;
        }
        if (r == 0)
            return io_status::eof;
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return io_status::would_block;
        return (errno == ECONNRESET) ? io_status::eof : io_status::error;
    }
}

bool tls_stream::handshake(int timeout_ms)
{
    if (!m_ssl || !m_fd)
        return false;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true)
    {
        int rc = tls_context::do_handshake(m_ssl);

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0)
            return false;

        // Alerts are flushed too, so a rejected client learns why
        if (flush_out(static_cast<int>(left)) != io_status::ok)
            return false;

        if (rc == 1)
            return true;
        if (rc < 0)
            return false;

        io_status st = pull_in();
        if (st == io_status::ok)
            continue;
        if (st != io_status::would_block)
            return false;

        left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0)
            return false;

        int revents = net::wait_fd(m_fd.get(), POLLIN, static_cast<int>(left));
        if (revents <= 0)
            return false;
    }
}

io_status tls_stream::read_some(char* buf, size_t len, size_t& n)
{
    n = 0;
    int want = len > static_cast<size_t>(INT32_MAX) ? INT32_MAX : static_cast<int>(len);

    while (true)
    {
        int r = tls_context::ssl_read(m_ssl, buf, want);
        if (r > 0)
        {
            n = static_cast<size_t>(r);
            return io_status::ok;
        }
        if (r < 0)
            return tls_context::peer_closed(m_ssl) ? io_status::eof : io_status::error;

        // Post-handshake messages (session tickets, key updates) may be queued
        if (flush_out(CLOSE_NOTIFY_TIMEOUT_MS) != io_status::ok)
            return io_status::error;

        io_status st = pull_in();
        if (st == io_status::would_block)
        {
            // Whatever sits in the read BIO is an incomplete record
            m_need_socket = true;
            return st;
        }
        if (st != io_status::ok)
            return st;
        m_need_socket = false;
    }
}

io_status tls_stream::write_all(const char* data, size_t len, int timeout_ms)
{
    size_t off = 0;
    while (off < len)
    {
        size_t chunk = len - off;
        if (chunk > TLS_IO_CHUNK)
            chunk = TLS_IO_CHUNK;

        int w = tls_context::ssl_write(m_ssl, data + off, static_cast<int>(chunk));
        if (w <= 0)
            return io_status::error;
        off += static_cast<size_t>(w);

        io_status st = flush_out(timeout_ms);
        if (st != io_status::ok)
            return st;
    }
    return io_status::ok;
}

bool tls_stream::has_buffered() const
{
    if (!m_ssl)
        return false;
    if (tls_context::has_decrypted(m_ssl))
        return true;
    return !m_need_socket && tls_context::has_pending_in(m_ssl);
}

void tls_stream::close()
{
    if (!m_fd)
        return;

    if (m_ssl)
    {
        tls_context::shutdown(m_ssl);
        // Best effort: a peer that already left never sees close_notify
        if (flush_out(CLOSE_NOTIFY_TIMEOUT_MS) != io_status::ok)
            LOG_DEBUG("tls: close_notify to fd=%d not delivered", m_fd.get());
    }
    m_fd.reset();
}
