#include <asset_relay/http_server.h>
#include <asset_relay/routes.h>

#include <catch2/catch.hpp>

#include "test_support.h"

#include <cerrno>
#include <iterator>
#include <sstream>
#include <thread>

using namespace asset_relay;
using test_support::parse_response;
using test_support::parsed_response;
using test_support::temp_dir;

namespace
{

// server running on an ephemeral loopback port for the lifetime of the object
class running_server
{
public:
    running_server(const std::string & root, std::ostream & log)
        : server_(test_support::test_config(root, log))
    {
        install_relay_routes(server_);
        server_.listen();

        thread_ = std::thread([this]() { server_.serve_forever(); });
    }

    ~running_server()
    {
        server_.stop();
        thread_.join();
    }

    int port() const { return server_.port(); }

private:
    http_server server_;
    std::thread thread_;
};

std::string round_trip(int port, const std::string & raw_request)
{
    tcp_client_stream conn("127.0.0.1", port);

    conn << raw_request;
    conn.shutdown_output();

    return std::string(std::istreambuf_iterator<char>(conn),
        std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("the server answers over TCP", "[socket]")
{
    temp_dir root;
    root.write_file("index.html", "<h1>The Machine of Worlds</h1>");
    std::ostringstream log;

    running_server server(root.path(), log);

    SECTION("static file")
    {
        parsed_response resp = parse_response(
            round_trip(server.port(), "GET /index.html HTTP/1.1\r\nHost: localhost\r\n\r\n"));

        CHECK(resp.status == 200);
        CHECK(resp.body == "<h1>The Machine of Worlds</h1>");
        CHECK(resp.header("access-control-allow-origin") == "*");
    }

    SECTION("console relay, then a request after a failed one")
    {
        const std::string good = "{\"level\":\"warn\",\"args\":[\"low\",\"fps\"]}";
        std::ostringstream req;
        req << "POST /__console__ HTTP/1.1\r\n"
            << "Content-Length: " << good.size() << "\r\n\r\n"
            << good;

        CHECK(parse_response(round_trip(server.port(), req.str())).status == 204);

        CHECK(parse_response(round_trip(server.port(),
            "POST /__console__ HTTP/1.1\r\nContent-Length: 8\r\n\r\nnot-json")).status == 500);

        CHECK(parse_response(round_trip(server.port(),
            "GET /index.html HTTP/1.1\r\n\r\n")).status == 200);
    }

    SECTION("unknown endpoint with an unread body")
    {
        parsed_response resp = parse_response(round_trip(server.port(),
            "POST /does-not-exist HTTP/1.1\r\nContent-Length: 11\r\n\r\nhello world"));

        CHECK(resp.status == 404);
        CHECK(resp.body.find("Endpoint not found") != std::string::npos);
    }
}

TEST_CASE("binding an occupied port fails", "[socket]")
{
    temp_dir root;
    std::ostringstream log;
    running_server first(root.path(), log);

    server_config config = test_support::test_config(root.path(), log);
    config.port = first.port();

    http_server second(config);

    try
    {
        second.listen();
        FAIL("listen on an occupied port succeeded");
    }
    catch (const socket_runtime_error & e)
    {
        CHECK(e.errornumber() == EADDRINUSE);
        CHECK(std::string(e.what()).find("Address already in use") != std::string::npos);
    }
}
