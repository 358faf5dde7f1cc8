#include "redis_client.h"
#include "net_util.h"

#include <poll.h>
#include <sys/socket.h>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>

bool parse_redis_url(std::string_view url, redis_url& out)
{
    constexpr std::string_view scheme = "redis://";
    if (url.substr(0, scheme.size()) != scheme)
        return false;
    url.remove_prefix(scheme.size());

    redis_url parsed;

    auto at = url.rfind('@');
    if (at != std::string_view::npos)
    {
        auto userinfo = url.substr(0, at);
        auto colon = userinfo.find(':');
        if (colon == std::string_view::npos)
        {
            parsed.password = std::string(userinfo);
        }
        else
        {
            parsed.username = std::string(userinfo.substr(0, colon));
            parsed.password = std::string(userinfo.substr(colon + 1));
        }
        url.remove_prefix(at + 1);
    }

    auto slash = url.find('/');
    std::string_view hostport = url.substr(0, slash);
    if (slash != std::string_view::npos)
    {
        auto db_str = url.substr(slash + 1);
        if (!db_str.empty())
        {
            auto [ptr, ec] = std::from_chars(db_str.data(), db_str.data() + db_str.size(), parsed.db);
            if (ec != std::errc{} || ptr != db_str.data() + db_str.size() || parsed.db < 0)
                return false;
        }
    }

    if (hostport.empty())
        return false;

    auto colon = hostport.rfind(':');
    if (colon == std::string_view::npos)
    {
        parsed.host = std::string(hostport);
    }
    else
    {
        endpoint ep;
        if (!net::parse_endpoint(hostport, ep))
            return false;
        parsed.host = ep.host;
        parsed.port = ep.port;
    }

    out = std::move(parsed);
    return true;
}

bool redis_client::connect(const redis_url& url, int timeout_ms, std::string& err)
{
    disconnect();
    m_timeout_ms = timeout_ms;

    endpoint ep{url.host, url.port};
    m_fd = net::connect_with_timeout(ep, timeout_ms);
    if (!m_fd)
    {
        err = "connect " + url.host + ":" + std::to_string(url.port) + ": " + std::strerror(errno);
        return false;
    }

    resp::reply r;
    if (!url.password.empty())
    {
        std::vector<std::string> auth{"AUTH"};
        if (!url.username.empty())
            auth.push_back(url.username);
        auth.push_back(url.password);

        if (!command(auth, r, err))
            return false;
        if (r.is_error())
        {
            err = "AUTH rejected: " + r.str;
            disconnect();
            return false;
        }
    }

    if (url.db != 0)
    {
        if (!command({"SELECT", std::to_string(url.db)}, r, err))
            return false;
        if (r.is_error())
        {
            err = "SELECT rejected: " + r.str;
            disconnect();
            return false;
        }
    }

    return true;
}

void redis_client::disconnect()
{
    m_fd.reset();
    m_rbuf.clear();
}

bool redis_client::command(const std::vector<std::string>& args, resp::reply& out, std::string& err)
{
    if (!m_fd)
    {
        err = "not connected";
        return false;
    }

    if (!send_all(resp::encode_command(args), err) || !read_reply(out, err))
    {
        disconnect();
        return false;
    }
    return true;
}

bool redis_client::send_all(std::string_view data, std::string& err)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_timeout_ms);
    size_t sent = 0;
    while (sent < data.size())
    {
        ssize_t n = ::send(m_fd.get(), data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
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
            if (left <= 0 || net::wait_fd(m_fd.get(), POLLOUT, static_cast<int>(left)) <= 0)
            {
                err = "send timed out";
                return false;
            }
            continue;
        }
        err = std::string("send: ") + std::strerror(errno);
        return false;
    }
    return true;
}

bool redis_client::read_reply(resp::reply& out, std::string& err)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_timeout_ms);
    char buf[16384];

    while (true)
    {
        if (!m_rbuf.empty())
        {
            size_t consumed = 0;
            auto r = resp::parse_reply(m_rbuf, out, consumed);
            if (r == resp::parse_result::ok)
            {
                m_rbuf.erase(0, consumed);
                return true;
            }
            if (r == resp::parse_result::error)
            {
                err = "malformed reply";
                return false;
            }
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0)
        {
            err = "reply timed out";
            return false;
        }

        int revents = net::wait_fd(m_fd.get(), POLLIN, static_cast<int>(left));
        if (revents == 0)
        {
            err = "reply timed out";
            return false;
        }
        if (revents < 0)
        {
            err = std::string("poll: ") + std::strerror(errno);
            return false;
        }

        ssize_t n = ::recv(m_fd.get(), buf, sizeof(buf), 0);
        if (n == 0)
        {
            err = "connection closed by registry";
            return false;
        }
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                continue;
            err = std::string("recv: ") + std::strerror(errno);
            return false;
        }
        m_rbuf.append(buf, static_cast<size_t>(n));
    }
}
