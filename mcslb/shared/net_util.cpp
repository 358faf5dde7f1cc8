#include "net_util.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

// 256KB kernel buffers for bridged sockets
static constexpr int SOCK_BUF_SIZE = 256 * 1024;

// Listen hosts are resolved once at startup
static constexpr int bind_resolve_timeout_ms = 5000;

namespace net {

bool parse_endpoint(std::string_view addr, endpoint& out)
{
    auto colon = addr.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= addr.size())
        return false;

    uint32_t port = 0;
    auto port_str = addr.substr(colon + 1);
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port == 0 || port > 65535)
        return false;

    out.host = std::string(addr.substr(0, colon));
    out.port = static_cast<uint16_t>(port);
    return true;
}

namespace {

// Shared between a waiting caller and a lookup thread that may outlive it
struct lookup_state
{
    std::mutex mutex;
    std::condition_variable done_cv;
    bool done = false;
    bool found = false;
    struct in_addr addr{};
};

void run_lookup(std::shared_ptr<lookup_state> state, std::string host)
{
    struct addrinfo hints{};
    struct addrinfo* res = nullptr;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    bool found = getaddrinfo(host.c_str(), nullptr, &hints, &res) == 0 && res;
    struct in_addr addr{};
    if (found)
        addr = reinterpret_cast<struct sockaddr_in*>(res->ai_addr)->sin_addr;
    if (res)
        freeaddrinfo(res);

    std::lock_guard<std::mutex> lock(state->mutex);
    state->found = found;
    state->addr = addr;
    state->done = true;
    state->done_cv.notify_all();
}

} // namespace

bool resolve(const endpoint& ep, struct sockaddr_in& out, int timeout_ms)
{
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(ep.port);

    if (inet_pton(AF_INET, ep.host.c_str(), &out.sin_addr) == 1)
        return true;

    auto state = std::make_shared<lookup_state>();
    try
    {
        std::thread(run_lookup, state, ep.host).detach();
    }
    catch (const std::system_error&)
    {
        errno = EAGAIN;
        return false;
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    if (!state->done_cv.wait_for(lock, std::chrono::milliseconds(std::max(timeout_ms, 0)),
            [&] { return state->done; }))
    {
        errno = ETIMEDOUT;
        return false;
    }
    if (!state->found)
    {
        errno = EHOSTUNREACH;
        return false;
    }
    out.sin_addr = state->addr;
    return true;
}

bool set_nonblocking(int fd, bool enabled)
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0)
        return false;
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

scoped_fd connect_with_timeout(const endpoint& ep, int timeout_ms)
{
    auto start = std::chrono::steady_clock::now();
    struct sockaddr_in sa{};
    if (!resolve(ep, sa, timeout_ms))
        return scoped_fd{};

    auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    int left = timeout_ms - static_cast<int>(spent);
    if (left <= 0)
    {
        errno = ETIMEDOUT;
        return scoped_fd{};
    }
    return connect_with_timeout(sa, left);
}

scoped_fd connect_with_timeout(const struct sockaddr_in& sa, int timeout_ms)
{
    scoped_fd fd(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!fd)
        return scoped_fd{};

    int rc = ::connect(fd.get(), reinterpret_cast<const struct sockaddr*>(&sa), sizeof(sa));
    if (rc == 0)
        return fd;
    if (errno != EINPROGRESS)
        return scoped_fd{};

    int revents = wait_fd(fd.get(), POLLOUT, timeout_ms);
    if (revents == 0)
    {
        errno = ETIMEDOUT;
        return scoped_fd{};
    }
    if (revents < 0)
        return scoped_fd{};

    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &err, &len) < 0)
        return scoped_fd{};
    if (err != 0)
    {
        errno = err;
        return scoped_fd{};
    }
    return fd;
}

scoped_fd connect_with_timeout(std::string_view addr, int timeout_ms)
{
    endpoint ep;
    if (!parse_endpoint(addr, ep))
    {
        errno = EINVAL;
        return scoped_fd{};
    }
    return connect_with_timeout(ep, timeout_ms);
}

void tune_socket(int fd)
{
    int opt = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

    int buf_size = SOCK_BUF_SIZE;
    setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &buf_size, sizeof(buf_size));
    setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &buf_size, sizeof(buf_size));

    // TCP keepalive: detect dead peers on long-lived chat sessions
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
    int idle = 60, intvl = 10, cnt = 3;
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
}

int wait_fd(int fd, short events, int timeout_ms)
{
    struct pollfd pfd{fd, events, 0};
    while (true)
    {
        int rc = ::poll(&pfd, 1, timeout_ms);
        if (rc < 0 && errno == EINTR)
            continue;
        if (rc <= 0)
            return rc;
        return pfd.revents;
    }
}

scoped_fd listen_tcp(std::string_view host, uint16_t port, int backlog, bool nonblocking)
{
    int type = SOCK_STREAM | SOCK_CLOEXEC;
    if (nonblocking)
        type |= SOCK_NONBLOCK;

    scoped_fd fd(::socket(AF_INET, type, 0));
    if (!fd)
        return scoped_fd{};

    int opt = 1;
    setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr{};
    endpoint ep{std::string(host), port};
    if (!resolve(ep, addr, bind_resolve_timeout_ms))
    {
        errno = EADDRNOTAVAIL;
        return scoped_fd{};
    }

    if (bind(fd.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0)
        return scoped_fd{};

    if (listen(fd.get(), backlog) < 0)
        return scoped_fd{};

    return fd;
}

std::string peer_ip(int fd)
{
    struct sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0)
        return {};

    char buf[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf)))
        return {};
    return buf;
}

} // namespace net
