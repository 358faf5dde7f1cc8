#pragma once
#include <string>
#include <string_view>

// Forward declare OpenSSL types to avoid pulling in headers everywhere
typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

// Server-side TLS context for the client-facing listener.
// SSL objects use memory BIO pairs; the socket I/O is driven by tls_stream.
class tls_context
{
public:
    tls_context();
    ~tls_context();

    tls_context(const tls_context&) = delete;
    tls_context& operator=(const tls_context&) = delete;

    // Load a PEM certificate chain and private key (PKCS#1, PKCS#8 or SEC1).
    // Returns false with a readable reason in err; the caller must not serve.
    bool init_server(std::string_view cert_chain_path, std::string_view key_path,
                     std::string& err);

    // New SSL in server mode (accept state), nullptr on allocation failure
    SSL* create_ssl_server() const;

    // Returns: 1 = complete, 0 = want more data, -1 = error
    static int do_handshake(SSL* ssl);

    // Returns bytes read, 0 = want more data, -1 = error/closed
    static int ssl_read(SSL* ssl, char* buf, int len);

    // Returns bytes written, 0 = want more data, -1 = error
    static int ssl_write(SSL* ssl, const char* buf, int len);

    // Encrypted bytes waiting to go out on the socket
    static int bio_read_out(SSL* ssl, char* buf, int len);

    // Encrypted bytes received from the socket
    static int bio_write_in(SSL* ssl, const char* buf, int len);

    static bool has_pending_out(SSL* ssl);

    // Decrypted or still-encrypted input buffered inside OpenSSL
    static bool has_pending_in(SSL* ssl);
    static bool has_decrypted(SSL* ssl);

    // Peer sent close_notify
    static bool peer_closed(SSL* ssl);

    // Queue our close_notify into the output BIO
    static void shutdown(SSL* ssl);

    static void free_ssl(SSL* ssl);

    // Most recent OpenSSL error of this thread, for logging
    static std::string last_error();

    bool is_initialized() const { return m_ctx != nullptr; }

private:
    SSL_CTX* m_ctx = nullptr;
};
