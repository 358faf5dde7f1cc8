#pragma once
#include "duplex_stream.h"
#include "tls_context.h"

// Decrypted view of an accepted TLS connection. Ciphertext moves between the
// socket and the SSL memory BIOs here; callers only ever see plaintext.
class tls_stream : public duplex_stream
{
public:
    tls_stream(scoped_fd fd, SSL* ssl);
    ~tls_stream() override;

    tls_stream(const tls_stream&) = delete;
    tls_stream& operator=(const tls_stream&) = delete;

    // Drive the server handshake to completion within timeout_ms
    bool handshake(int timeout_ms);

    int fd() const override { return m_fd.get(); }
    io_status read_some(char* buf, size_t len, size_t& n) override;
    io_status write_all(const char* data, size_t len, int timeout_ms) override;
    bool has_buffered() const override;
    void close() override;

private:
    io_status flush_out(int timeout_ms);
    io_status pull_in();

    scoped_fd m_fd;
    SSL* m_ssl;
    bool m_need_socket = false;
};
