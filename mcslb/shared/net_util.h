#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <netinet/in.h>

#include "scoped_fd.h"

struct endpoint
{
    std::string host;
    uint16_t port = 0;
};

namespace net {

// Split "host:port" (IPv4 literal or hostname). Returns false on malformed input.
bool parse_endpoint(std::string_view addr, endpoint& out);

// Resolve to an IPv4 sockaddr. IPv4 literals are parsed in place; hostnames
// go through getaddrinfo on a helper thread and the caller waits at most
// timeout_ms (errno ETIMEDOUT). A lookup that outlives the wait finishes in
// the background and its result is dropped.
bool resolve(const endpoint& ep, struct sockaddr_in& out, int timeout_ms);

// Non-blocking connect bounded by timeout_ms. The returned socket is left in
// non-blocking mode. Empty scoped_fd on failure, errno describes the cause.
scoped_fd connect_with_timeout(const struct sockaddr_in& sa, int timeout_ms);
// Name resolution and connect share one timeout_ms budget
scoped_fd connect_with_timeout(const endpoint& ep, int timeout_ms);
scoped_fd connect_with_timeout(std::string_view addr, int timeout_ms);

bool set_nonblocking(int fd, bool enabled = true);

// TCP_NODELAY, larger kernel buffers and keepalive for bridged sockets
void tune_socket(int fd);

// Wait for events on fd until timeout_ms passes. Returns revents, 0 on timeout,
// -1 on poll error.
int wait_fd(int fd, short events, int timeout_ms);

// Listening TCP socket bound to host:port, SO_REUSEADDR set. Empty on failure.
scoped_fd listen_tcp(std::string_view host, uint16_t port, int backlog, bool nonblocking);

std::string peer_ip(int fd);

} // namespace net
