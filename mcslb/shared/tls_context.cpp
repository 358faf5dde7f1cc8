#include "tls_context.h"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/bio.h>

tls_context::tls_context() = default;

tls_context::~tls_context()
{
    if (m_ctx)
        SSL_CTX_free(m_ctx);
}

// Options every accepted connection inherits
static void apply_ctx_options(SSL_CTX* ctx)
{
    long opts = SSL_CTX_get_options(ctx);
    opts &= ~SSL_OP_NO_TICKET;
    opts |= SSL_OP_CIPHER_SERVER_PREFERENCE;
#if defined(SSL_OP_NO_RENEGOTIATION)
    opts |= SSL_OP_NO_RENEGOTIATION;
#endif
    SSL_CTX_set_options(ctx, opts);

    // RELEASE_BUFFERS keeps idle chat sessions cheap; ACCEPT_MOVING_WRITE_BUFFER
    // lets a retried SSL_write come from a different buffer address.
    long mode = SSL_MODE_RELEASE_BUFFERS | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER | SSL_MODE_AUTO_RETRY;
    SSL_CTX_set_mode(ctx, mode);

    SSL_CTX_set_max_send_fragment(ctx, 16384);
}

std::string tls_context::last_error()
{
    unsigned long code = ERR_get_error();
    if (code == 0)
        return "unknown error";

    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

bool tls_context::init_server(std::string_view cert_chain_path, std::string_view key_path,
                              std::string& err)
{
    const std::string cert(cert_chain_path);
    const std::string key(key_path);

    SSL_CTX* ctx = SSL_CTX_new(TLS_server_method());
    auto fail = [&](std::string what) {
        err = std::move(what);
        SSL_CTX_free(ctx);
        return false;
    };

    if (!ctx)
        return fail("cannot create TLS context: " + last_error());

    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
    SSL_CTX_set_session_cache_mode(ctx, SSL_SESS_CACHE_SERVER);
    SSL_CTX_sess_set_cache_size(ctx, 20480);
    SSL_CTX_set_timeout(ctx, 300);
    apply_ctx_options(ctx);

    // PEM_read_bio_PrivateKey underneath accepts PKCS#1, PKCS#8 and SEC1
    if (SSL_CTX_use_certificate_chain_file(ctx, cert.c_str()) <= 0)
        return fail("certificate chain " + cert + ": " + last_error());
    if (SSL_CTX_use_PrivateKey_file(ctx, key.c_str(), SSL_FILETYPE_PEM) <= 0)
        return fail("private key " + key + ": " + last_error());
    if (SSL_CTX_check_private_key(ctx) != 1)
        return fail("private key " + key + " does not match " + cert);

    if (m_ctx)
        SSL_CTX_free(m_ctx);
    m_ctx = ctx;
    return true;
}

SSL* tls_context::create_ssl_server() const
{
    if (!m_ctx)
        return nullptr;

    SSL* ssl = SSL_new(m_ctx);
    if (!ssl)
        return nullptr;

    BIO* rbio = BIO_new(BIO_s_mem());
    BIO* wbio = BIO_new(BIO_s_mem());
    if (!rbio || !wbio)
    {
        BIO_free(rbio);
        BIO_free(wbio);
        SSL_free(ssl);
        return nullptr;
    }

    BIO_set_nbio(rbio, 1);
    BIO_set_nbio(wbio, 1);

    // Empty memory BIOs report "retry" instead of EOF
    BIO_set_mem_eof_return(rbio, -1);
    BIO_set_mem_eof_return(wbio, -1);

    SSL_set_bio(ssl, rbio, wbio);
    SSL_set_accept_state(ssl);
    return ssl;
}

// >0 progress, 0 would block on the memory BIOs, -1 fatal
static int classify(SSL* ssl, int ret)
{
    if (ret > 0)
        return ret;
    switch (SSL_get_error(ssl, ret))
    {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
            return 0;
        default:
            return -1;
    }
}

static int bio_result(BIO* bio, int ret)
{
    if (ret > 0)
        return ret;
    return BIO_should_retry(bio) ? 0 : -1;
}

int tls_context::do_handshake(SSL* ssl)
{
    return classify(ssl, SSL_do_handshake(ssl));
}

int tls_context::ssl_read(SSL* ssl, char* buf, int len)
{
    return classify(ssl, SSL_read(ssl, buf, len));
}

int tls_context::ssl_write(SSL* ssl, const char* buf, int len)
{
    return classify(ssl, SSL_write(ssl, buf, len));
}

int tls_context::bio_read_out(SSL* ssl, char* buf, int len)
{
    BIO* wbio = SSL_get_wbio(ssl);
    return wbio ? bio_result(wbio, BIO_read(wbio, buf, len)) : -1;
}

int tls_context::bio_write_in(SSL* ssl, const char* buf, int len)
{
    BIO* rbio = SSL_get_rbio(ssl);
    return rbio ? bio_result(rbio, BIO_write(rbio, buf, len)) : -1;
}

bool tls_context::has_pending_out(SSL* ssl)
{
    BIO* wbio = SSL_get_wbio(ssl);
    return wbio && BIO_ctrl_pending(wbio) > 0;
}

bool tls_context::has_pending_in(SSL* ssl)
{
    if (SSL_pending(ssl) > 0)
        return true;
    BIO* rbio = SSL_get_rbio(ssl);
    return rbio && BIO_ctrl_pending(rbio) > 0;
}

bool tls_context::has_decrypted(SSL* ssl)
{
    return SSL_pending(ssl) > 0;
}

bool tls_context::peer_closed(SSL* ssl)
{
    return (SSL_get_shutdown(ssl) & SSL_RECEIVED_SHUTDOWN) != 0;
}

void tls_context::shutdown(SSL* ssl)
{
    // Only after a completed handshake; a half-open session has nothing to close
    if (SSL_is_init_finished(ssl))
        SSL_shutdown(ssl);
    ERR_clear_error();
}

void tls_context::free_ssl(SSL* ssl)
{
    if (ssl)
        SSL_free(ssl);
}
