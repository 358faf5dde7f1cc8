#pragma once
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

// Owns one descriptor: sockets handed between the acceptor, bridge, probes
// and registry client, plus the loop's wake pipe. Closing a socket shuts it
// down first so a peer blocked in recv() sees EOF immediately.
class scoped_fd
{
public:
    scoped_fd() noexcept = default;
    explicit scoped_fd(int fd) noexcept : m_fd(fd) {}
    ~scoped_fd() { reset(); }

    scoped_fd(const scoped_fd&) = delete;
    scoped_fd& operator=(const scoped_fd&) = delete;

    scoped_fd(scoped_fd&& other) noexcept : m_fd(std::exchange(other.m_fd, -1)) {}
    scoped_fd& operator=(scoped_fd&& other) noexcept
    {
        if (this != &other)
            reset(std::exchange(other.m_fd, -1));
        return *this;
    }

    int get() const noexcept { return m_fd; }
    explicit operator bool() const noexcept { return m_fd >= 0; }

    void reset(int fd = -1) noexcept
    {
        int old = std::exchange(m_fd, fd);
        if (old < 0)
            return;
        ::shutdown(old, SHUT_RDWR);   // ENOTSOCK for pipes, harmless
        ::close(old);
    }

private:
    int m_fd{-1};
};
