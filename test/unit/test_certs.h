#pragma once
#include <cstdio>
#include <string>
#include <unistd.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

// Self-signed P-256 certificate for localhost, written as PEM files
struct test_certs
{
    std::string cert_path;
    std::string key_path;

    test_certs()
    {
        std::string base = "/tmp/mcslb_test_" + std::to_string(getpid());
        cert_path = base + ".cert";
        key_path = base + ".key";

        EVP_PKEY* key = EVP_EC_gen("P-256");
        X509* x = X509_new();
        X509_set_version(x, 2);
        ASN1_INTEGER_set(X509_get_serialNumber(x), 1);
        X509_gmtime_adj(X509_getm_notBefore(x), 0);
        X509_gmtime_adj(X509_getm_notAfter(x), 3600);
        X509_set_pubkey(x, key);

        X509_NAME* name = X509_get_subject_name(x);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
            reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
        X509_set_issuer_name(x, name);
        X509_sign(x, key, EVP_sha256());

        if (FILE* f = std::fopen(cert_path.c_str(), "w"))
        {
            PEM_write_X509(f, x);
            std::fclose(f);
        }
        if (FILE* f = std::fopen(key_path.c_str(), "w"))
        {
            PEM_write_PrivateKey(f, key, nullptr, nullptr, 0, nullptr, nullptr);
            std::fclose(f);
        }

        X509_free(x);
        EVP_PKEY_free(key);
    }

    ~test_certs()
    {
        unlink(cert_path.c_str());
        unlink(key_path.c_str());
    }
};

// Blocking TLS client over an already connected socket
struct test_tls_client
{
    SSL_CTX* ctx = nullptr;
    SSL* ssl = nullptr;

    explicit test_tls_client(int fd)
    {
        ctx = SSL_CTX_new(TLS_client_method());
        SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
        ssl = SSL_new(ctx);
        SSL_set_fd(ssl, fd);
    }

    ~test_tls_client()
    {
        SSL_free(ssl);
        SSL_CTX_free(ctx);
    }

    bool connect() { return SSL_connect(ssl) == 1; }

    bool write(const std::string& data)
    {
        return SSL_write(ssl, data.data(), static_cast<int>(data.size())) == static_cast<int>(data.size());
    }

    // Read exactly n bytes, empty on failure
    std::string read(size_t n)
    {
        std::string out(n, '\0');
        size_t got = 0;
        while (got < n)
        {
            int r = SSL_read(ssl, out.data() + got, static_cast<int>(n - got));
            if (r <= 0)
                return {};
            got += static_cast<size_t>(r);
        }
        return out;
    }
};
