#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "resp.h"
#include "scoped_fd.h"

struct redis_url
{
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    std::string username;
    std::string password;
    int db = 0;
};

// redis://[[user]:password@]host[:port][/db]
bool parse_redis_url(std::string_view url, redis_url& out);

// Blocking RESP2 client. Every connect/send/receive is bounded by the
// timeout given to connect(); a failed exchange drops the connection so the
// next call reconnects from scratch.
class redis_client
{
public:
    redis_client() = default;
    ~redis_client() = default;

    redis_client(const redis_client&) = delete;
    redis_client& operator=(const redis_client&) = delete;

    bool connect(const redis_url& url, int timeout_ms, std::string& err);
    bool connected() const { return static_cast<bool>(m_fd); }
    void disconnect();

    // Send one command and wait for its reply. A RESP error reply is returned
    // as success with reply.kind == error; transport failures return false.
    bool command(const std::vector<std::string>& args, resp::reply& out, std::string& err);

private:
    bool send_all(std::string_view data, std::string& err);
    bool read_reply(resp::reply& out, std::string& err);

    scoped_fd m_fd;
    std::string m_rbuf;
    int m_timeout_ms = 1000;
};
