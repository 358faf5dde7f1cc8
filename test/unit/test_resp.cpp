#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "mcslb/shared/resp.h"
#include "mcslb/shared/redis_client.h"
#include "mcslb/shared/net_util.h"
#include "mcslb/balancer/registry_client.h"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <thread>

TEST_CASE("RESP command encoding")
{
    CHECK(resp::encode_command({"PING"}) == "*1\r\n$4\r\nPING\r\n");
    CHECK(resp::encode_command(std::vector<std::string>{"GET", "k"}) == "*2\r\n$3\r\nGET\r\n$1\r\nk\r\n");
    CHECK(resp::encode_command({"SET", ""}) == "*2\r\n$3\r\nSET\r\n$0\r\n\r\n");
}

TEST_CASE("RESP reply parsing")
{
    resp::reply r;
    size_t consumed = 0;

    SUBCASE("simple string")
    {
        std::string buf = "+OK\r\n";
        CHECK(resp::parse_reply(buf, r, consumed) == resp::parse_result::ok);
        CHECK(r.kind == resp::reply::simple);
        CHECK(r.str == "OK");
        CHECK(consumed == buf.size());
    }

    SUBCASE("error reply")
    {
        std::string buf = "-WRONGTYPE Operation against a key\r\n";
        CHECK(resp::parse_reply(buf, r, consumed) == resp::parse_result::ok);
        CHECK(r.is_error());
        CHECK(r.str == "WRONGTYPE Operation against a key");
    }

    SUBCASE("integer")
    {
        std::string buf = ":-42\r\n";
        CHECK(resp::parse_reply(buf, r, consumed) == resp::parse_result::ok);
        CHECK(r.kind == resp::reply::integer);
        CHECK(r.integer_value == -42);
    }

    SUBCASE("nil bulk and nil array")
    {
        CHECK(resp::parse_reply("$-1\r\n", r, consumed) == resp::parse_result::ok);
        CHECK(r.kind == resp::reply::nil);
        CHECK(resp::parse_reply("*-1\r\n", r, consumed) == resp::parse_result::ok);
        CHECK(r.kind == resp::reply::nil);
    }

    SUBCASE("bulk with embedded CRLF")
    {
        std::string buf = "$4\r\na\r\nb\r\n";
        CHECK(resp::parse_reply(buf, r, consumed) == resp::parse_result::ok);
        CHECK(r.str == "a\r\nb");
    }

    SUBCASE("SCAN style nested array")
    {
        std::string buf = "*2\r\n$2\r\n17\r\n*2\r\n$18\r\nmcs:node:a.b.c.d:1\r\n$17\r\nmcs:node:host:900\r\n";
        REQUIRE(resp::parse_reply(buf, r, consumed) == resp::parse_result::ok);
        REQUIRE(r.is_array());
        REQUIRE(r.elements.size() == 2);
        CHECK(r.elements[0].str == "17");
        REQUIRE(r.elements[1].is_array());
        CHECK(r.elements[1].elements.size() == 2);
        CHECK(r.elements[1].elements[1].str == "mcs:node:host:900");
        CHECK(consumed == buf.size());
    }

    SUBCASE("incomplete input")
    {
        CHECK(resp::parse_reply("", r, consumed) == resp::parse_result::incomplete);
        CHECK(resp::parse_reply("+OK", r, consumed) == resp::parse_result::incomplete);
        CHECK(resp::parse_reply("$5\r\nhel", r, consumed) == resp::parse_result::incomplete);
        CHECK(resp::parse_reply("*2\r\n$1\r\na\r\n", r, consumed) == resp::parse_result::incomplete);
    }

    SUBCASE("malformed input")
    {
        CHECK(resp::parse_reply("?x\r\n", r, consumed) == resp::parse_result::error);
        CHECK(resp::parse_reply(":abc\r\n", r, consumed) == resp::parse_result::error);
        CHECK(resp::parse_reply("$3\r\nabcd\r\n", r, consumed) == resp::parse_result::error);
        CHECK(resp::parse_reply("*1\r\n*1\r\n*1\r\n*1\r\n*1\r\n*1\r\n:1\r\n", r, consumed) == resp::parse_result::error);
    }

    SUBCASE("pipelined replies consume one at a time")
    {
        std::string buf = ":1\r\n:2\r\n";
        REQUIRE(resp::parse_reply(buf, r, consumed) == resp::parse_result::ok);
        CHECK(r.integer_value == 1);
        CHECK(consumed == 4);
    }
}

TEST_CASE("redis URL parsing")
{
    redis_url u;

    SUBCASE("defaults")
    {
        REQUIRE(parse_redis_url("redis://127.0.0.1", u));
        CHECK(u.host == "127.0.0.1");
        CHECK(u.port == 6379);
        CHECK(u.password.empty());
        CHECK(u.db == 0);
    }

    SUBCASE("password, port and db")
    {
        REQUIRE(parse_redis_url("redis://:s3cret@cache.local:6380/2", u));
        CHECK(u.host == "cache.local");
        CHECK(u.port == 6380);
        CHECK(u.username.empty());
        CHECK(u.password == "s3cret");
        CHECK(u.db == 2);
    }

    SUBCASE("ACL user")
    {
        REQUIRE(parse_redis_url("redis://lb:pw@10.1.2.3:6379", u));
        CHECK(u.username == "lb");
        CHECK(u.password == "pw");
    }

    SUBCASE("rejects bad input")
    {
        CHECK_FALSE(parse_redis_url("http://127.0.0.1:6379", u));
        CHECK_FALSE(parse_redis_url("redis://", u));
        CHECK_FALSE(parse_redis_url("redis://host:notaport", u));
        CHECK_FALSE(parse_redis_url("redis://host:6379/x", u));
    }
}

// One-connection server answering each command with the next canned reply
struct scripted_redis
{
    scoped_fd listener;
    uint16_t port = 0;
    std::vector<std::string> replies;
    std::vector<std::vector<std::string>> received;
    std::thread thread;

    explicit scripted_redis(std::vector<std::string> canned)
        : replies(std::move(canned))
    {
        listener = net::listen_tcp("127.0.0.1", 0, 4, false);
        struct sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        getsockname(listener.get(), reinterpret_cast<struct sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);

        thread = std::thread([this] { serve(); });
    }

    ~scripted_redis()
    {
        if (thread.joinable())
            thread.join();
    }

    void serve()
    {
        scoped_fd conn(::accept(listener.get(), nullptr, nullptr));
        if (!conn)
            return;

        std::string buf;
        char chunk[4096];
        for (const auto& reply : replies)
        {
            resp::reply cmd;
            size_t consumed = 0;
            while (resp::parse_reply(buf, cmd, consumed) != resp::parse_result::ok)
            {
                ssize_t n = ::recv(conn.get(), chunk, sizeof(chunk), 0);
                if (n <= 0)
                    return;
                buf.append(chunk, static_cast<size_t>(n));
            }
            buf.erase(0, consumed);

            std::vector<std::string> args;
            for (const auto& e : cmd.elements)
                args.push_back(e.str);
            received.push_back(std::move(args));

            if (::send(conn.get(), reply.data(), reply.size(), MSG_NOSIGNAL) < 0)
                return;
        }
    }
};

TEST_CASE("redis_client against a scripted server")
{
    SUBCASE("AUTH and SELECT precede commands")
    {
        scripted_redis server({"+OK\r\n", "+OK\r\n", "+PONG\r\n"});

        redis_url u;
        REQUIRE(parse_redis_url("redis://:pw@127.0.0.1:" + std::to_string(server.port) + "/3", u));

        redis_client client;
        std::string err;
        REQUIRE(client.connect(u, 1000, err));

        resp::reply r;
        REQUIRE(client.command({"PING"}, r, err));
        CHECK(r.str == "PONG");

        client.disconnect();
        server.thread.join();
        REQUIRE(server.received.size() == 3);
        CHECK(server.received[0] == std::vector<std::string>{"AUTH", "pw"});
        CHECK(server.received[1] == std::vector<std::string>{"SELECT", "3"});
    }

    SUBCASE("zset registry source")
    {
        scripted_redis server({
            "*4\r\n$12\r\n10.0.0.1:700\r\n$10\r\n1700000000\r\n$7\r\nbad-one\r\n$10\r\n1700000001\r\n"
        });

        redis_registry_options opts;
        opts.url.port = server.port;
        redis_registry_source source(opts);

        std::vector<registry_entry> entries;
        std::string err;
        REQUIRE(source.fetch(entries, err));
        REQUIRE(entries.size() == 1);
        CHECK(entries[0].address == "10.0.0.1:700");
        CHECK(entries[0].metadata == "1700000000");

        server.thread.join();
        REQUIRE(server.received.size() == 1);
        CHECK(server.received[0][0] == "ZRANGEBYSCORE");
        CHECK(server.received[0][1] == "mcs:node");
        CHECK(server.received[0][3] == "+inf");
    }

    SUBCASE("keys registry source follows the SCAN cursor")
    {
        scripted_redis server({
            "*2\r\n$1\r\n5\r\n*1\r\n$15\r\nmcs:node:a:1000\r\n",
            "*2\r\n$1\r\n0\r\n*1\r\n$15\r\nmcs:node:b:2000\r\n"
        });

        redis_registry_options opts;
        opts.url.port = server.port;
        opts.mode = registry_mode::keys;
        redis_registry_source source(opts);

        std::vector<registry_entry> entries;
        std::string err;
        REQUIRE(source.fetch(entries, err));
        REQUIRE(entries.size() == 2);
        CHECK(entries[0].address == "a:1000");
        CHECK(entries[1].address == "b:2000");

        server.thread.join();
        REQUIRE(server.received.size() == 2);
        CHECK(server.received[1][1] == "5");
        CHECK(server.received[1][3] == "mcs:node:*");
    }

    SUBCASE("error reply fails the fetch")
    {
        scripted_redis server({"-WRONGTYPE Operation against a key holding the wrong kind of value\r\n"});

        redis_registry_options opts;
        opts.url.port = server.port;
        redis_registry_source source(opts);

        std::vector<registry_entry> entries;
        std::string err;
        CHECK_FALSE(source.fetch(entries, err));
        CHECK(entries.empty());
        CHECK(err.find("WRONGTYPE") != std::string::npos);
    }

    SUBCASE("unreachable registry")
    {
        scoped_fd probe = net::listen_tcp("127.0.0.1", 0, 1, false);
        struct sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        getsockname(probe.get(), reinterpret_cast<struct sockaddr*>(&addr), &len);
        uint16_t dead_port = ntohs(addr.sin_port);
        probe.reset();

        redis_registry_options opts;
        opts.url.port = dead_port;
        opts.timeout_ms = 200;
        redis_registry_source source(opts);

        std::vector<registry_entry> entries;
        std::string err;
        CHECK_FALSE(source.fetch(entries, err));
        CHECK_FALSE(err.empty());
    }
}
