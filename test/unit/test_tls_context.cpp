#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "mcslb/shared/tls_context.h"
#include "mcslb/shared/tls_stream.h"
#include "mcslb/shared/net_util.h"
#include "test_certs.h"

#include <chrono>
#include <poll.h>
#include <sys/socket.h>
#include <thread>

TEST_CASE("certificate loading")
{
    tls_context ctx;
    std::string err;

    SUBCASE("missing certificate is an error")
    {
        CHECK_FALSE(ctx.init_server("/nonexistent/server.cert", "/nonexistent/server.key", err));
        CHECK(err.find("/nonexistent/server.cert") != std::string::npos);
        CHECK_FALSE(ctx.is_initialized());
    }

    SUBCASE("missing key is an error")
    {
        test_certs certs;
        CHECK_FALSE(ctx.init_server(certs.cert_path, "/nonexistent/server.key", err));
        CHECK_FALSE(ctx.is_initialized());
    }

    SUBCASE("valid PEM pair")
    {
        test_certs certs;
        REQUIRE(ctx.init_server(certs.cert_path, certs.key_path, err));
        CHECK(ctx.is_initialized());

        SSL* ssl = ctx.create_ssl_server();
        CHECK(ssl != nullptr);
        tls_context::free_ssl(ssl);
    }
}

TEST_CASE("tls_stream over a socket pair")
{
    test_certs certs;
    tls_context ctx;
    std::string err;
    REQUIRE(ctx.init_server(certs.cert_path, certs.key_path, err));

    int sv[2];
    REQUIRE(socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);
    scoped_fd server_fd(sv[0]);
    scoped_fd client_fd(sv[1]);
    REQUIRE(net::set_nonblocking(server_fd.get()));

    SUBCASE("handshake and echo")
    {
        std::string reply;
        std::thread client([&] {
            test_tls_client c(client_fd.get());
            if (!c.connect() || !c.write("hello"))
                return;
            reply = c.read(5);
        });

        tls_stream stream(std::move(server_fd), ctx.create_ssl_server());
        REQUIRE(stream.handshake(2000));

        char buf[64];
        size_t got = 0;
        size_t n = 0;
        while (got < 5)
        {
            if (!stream.has_buffered())
                REQUIRE(net::wait_fd(stream.fd(), POLLIN, 2000) > 0);
            io_status st = stream.read_some(buf + got, sizeof(buf) - got, n);
            if (st == io_status::would_block)
                continue;
            REQUIRE(st == io_status::ok);
            got += n;
        }
        CHECK(std::string(buf, got) == "hello");

        CHECK(stream.write_all("world", 5, 2000) == io_status::ok);
        client.join();
        CHECK(reply == "world");
        stream.close();
    }

    SUBCASE("close after the peer left returns promptly")
    {
        std::thread client([&] {
            test_tls_client c(client_fd.get());
            c.connect();
        });

        tls_stream stream(std::move(server_fd), ctx.create_ssl_server());
        REQUIRE(stream.handshake(2000));
        client.join();
        client_fd.reset();

        auto start = std::chrono::steady_clock::now();
        stream.close();
        CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(1000));
        CHECK(stream.fd() < 0);
    }

    SUBCASE("silent client times out")
    {
        tls_stream stream(std::move(server_fd), ctx.create_ssl_server());
        CHECK_FALSE(stream.handshake(200));
    }

    SUBCASE("garbage instead of a client hello")
    {
        const char junk[] = "GET / HTTP/1.1\r\n\r\n";
        REQUIRE(::send(client_fd.get(), junk, sizeof(junk) - 1, 0) > 0);

        tls_stream stream(std::move(server_fd), ctx.create_ssl_server());
        CHECK_FALSE(stream.handshake(2000));
    }
}
