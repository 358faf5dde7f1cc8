#pragma once
#include <cstddef>
#include <cstdint>

#include "scoped_fd.h"

enum class io_status : uint8_t { ok, would_block, eof, error };

// Bidirectional byte stream over a non-blocking socket. The bridge polls fd()
// and then drains read_some() until would_block.
class duplex_stream
{
public:
    virtual ~duplex_stream() = default;

    virtual int fd() const = 0;

    // Read whatever is available without blocking; n is set on ok
    virtual io_status read_some(char* buf, size_t len, size_t& n) = 0;

    // Write all bytes, waiting for socket space up to timeout_ms in total
    virtual io_status write_all(const char* data, size_t len, int timeout_ms) = 0;

    // Input already pulled off the socket and held in user space
    virtual bool has_buffered() const { return false; }

    // Orderly close; safe to call more than once
    virtual void close() = 0;
};

// Plaintext TCP stream, used for the backend hop
class plain_stream : public duplex_stream
{
public:
    explicit plain_stream(scoped_fd fd) : m_fd(std::move(fd)) {}

    int fd() const override { return m_fd.get(); }
    io_status read_some(char* buf, size_t len, size_t& n) override;
    io_status write_all(const char* data, size_t len, int timeout_ms) override;
    void close() override { m_fd.reset(); }

private:
    scoped_fd m_fd;
};

namespace net {

// send() everything on a non-blocking socket, bounded by timeout_ms
io_status send_all(int fd, const char* data, size_t len, int timeout_ms);

} // namespace net
