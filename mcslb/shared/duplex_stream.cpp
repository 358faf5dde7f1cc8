#include "duplex_stream.h"
#include "net_util.h"

#include <poll.h>
#include <sys/socket.h>
#include <cerrno>
#include <chrono>

namespace net {

io_status send_all(int fd, const char* data, size_t len, int timeout_ms)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t sent = 0;
    while (sent < len)
    {
        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0)
                return io_status::error;
            int revents = wait_fd(fd, POLLOUT, static_cast<int>(left));
            if (revents <= 0 || (revents & (POLLERR | POLLNVAL)))
                return io_status::error;
            continue;
        }
        return (n < 0 && errno == EPIPE) ? io_status::eof : io_status::error;
    }
    return io_status::ok;
}

} // namespace net

io_status plain_stream::read_some(char* buf, size_t len, size_t& n)
{
    n = 0;
    while (true)
    {
        ssize_t r = ::recv(m_fd.get(), buf, len, 0);
        if (r > 0)
        {
            n = static_cast<size_t>(r);
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

io_status plain_stream::write_all(const char* data, size_t len, int timeout_ms)
{
    return net::send_all(m_fd.get(), data, len, timeout_ms);
}
