#include <asset_relay/static_files.h>

#include <catch2/catch.hpp>

#include "test_support.h"

#include <ctime>

using namespace asset_relay;
using test_support::temp_dir;

namespace
{

request make_get(const std::string & target)
{
    request req;
    req.method = "GET";
    req.target = target;
    req.path = target.substr(0, target.find('?'));
    req.version = "HTTP/1.1";
    req.request_line = "GET " + target + " HTTP/1.1";

    return req;
}

} // namespace

TEST_CASE("MIME type follows the file extension", "[static]")
{
    CHECK(file_mime_type("/srv/index.html") == "text/html");
    CHECK(file_mime_type("/srv/js/Game.js") == "text/javascript");
    CHECK(file_mime_type("/srv/style.CSS") == "text/css");
    CHECK(file_mime_type("/srv/sprites/hero.png") == "image/png");
    CHECK(file_mime_type("/srv/data/world.json") == "application/json");
    CHECK(file_mime_type("/srv/README") == "application/octet-stream");
    CHECK(file_mime_type("/srv/v1.2/README") == "application/octet-stream");
    CHECK(file_mime_type("/srv/archive.xyz") == "application/octet-stream");
}

TEST_CASE("request targets map into the asset root", "[static]")
{
    static_files files("/srv/game/");

    CHECK(files.translate_path("/") == "/srv/game/");
    CHECK(files.translate_path("/js/Game.js?v=3#top") == "/srv/game/js/Game.js");
    CHECK(files.translate_path("/a/./b/../c.txt") == "/srv/game/a/c.txt");
    CHECK(files.translate_path("/sub/") == "/srv/game/sub/");
    CHECK(files.translate_path("/my%20save.json") == "/srv/game/my save.json");
    CHECK(files.translate_path("/a+b.txt") == "/srv/game/a+b.txt");

    SECTION("parent references never leave the root")
    {
        CHECK(files.translate_path("/../../etc/passwd") == "/srv/game/etc/passwd");
        CHECK(files.translate_path("/%2e%2e/%2E%2E/etc/passwd") == "/srv/game/etc/passwd");
    }

    SECTION("an encoded NUL maps to no file at all")
    {
        CHECK(files.translate_path("/index.html%00.png").empty());
    }
}

TEST_CASE("existing files are served byte for byte", "[static]")
{
    temp_dir root;
    const std::string content("\x89PNG\r\n\x1a\n\0\x01\x02", 11);
    root.write_file("hero.png", content);

    static_files files(root.path());
    response resp = files.serve(make_get("/hero.png"));

    CHECK(resp.status == 200);
    CHECK(resp.body == content);
    CHECK(resp.header("Content-Type") == "image/png");
    CHECK(resp.header("Last-Modified").empty() == false);
    CHECK(resp.error_message.empty());
}

TEST_CASE("missing files give 404", "[static]")
{
    temp_dir root;
    root.write_file("index.html", "<html></html>");

    static_files files(root.path());

    response resp = files.serve(make_get("/nope.js"));
    CHECK(resp.status == 404);
    CHECK(resp.error_message == "File not found");
    CHECK(resp.body.find("Error code: 404") != std::string::npos);

    SECTION("a file name with a trailing slash is not a file")
    {
        CHECK(files.serve(make_get("/index.html/")).status == 404);
    }

    SECTION("an encoded NUL does not cut the file name short")
    {
        response nul = files.serve(make_get("/index.html%00.png"));

        CHECK(nul.status == 404);
        CHECK(nul.header("Content-Type") == "text/html;charset=utf-8");
    }
}

TEST_CASE("directories are served through their index page", "[static]")
{
    temp_dir root;
    root.make_dir("level1");
    root.write_file("level1/index.html", "<h1>level 1</h1>");

    static_files files(root.path());

    SECTION("without trailing slash the client is redirected")
    {
        response resp = files.serve(make_get("/level1?seed=7"));

        CHECK(resp.status == 301);
        CHECK(resp.header("Location") == "/level1/?seed=7");
        CHECK(resp.body.empty());
    }

    SECTION("with trailing slash the index page is returned")
    {
        response resp = files.serve(make_get("/level1/"));

        CHECK(resp.status == 200);
        CHECK(resp.body == "<h1>level 1</h1>");
        CHECK(resp.header("Content-Type") == "text/html");
    }
}

TEST_CASE("directories without index page are listed", "[static]")
{
    temp_dir root;
    root.make_dir("assets");
    root.make_dir("assets/Sounds");
    root.write_file("assets/b.png", "b");
    root.write_file("assets/a&b.txt", "ab");

    static_files files(root.path());
    response resp = files.serve(make_get("/assets/"));

    CHECK(resp.status == 200);
    CHECK(resp.header("Content-Type") == "text/html; charset=utf-8");
    CHECK(resp.body.find("<title>Directory listing for /assets/</title>") != std::string::npos);
    CHECK(resp.body.find("<li><a href=\"Sounds/\">Sounds/</a></li>") != std::string::npos);
    CHECK(resp.body.find("<li><a href=\"a%26b.txt\">a&amp;b.txt</a></li>") != std::string::npos);

    // case-insensitive order: a&b.txt, b.png, Sounds/
    std::size_t first = resp.body.find("a%26b.txt");
    std::size_t second = resp.body.find("b.png");
    std::size_t third = resp.body.find("Sounds/");
    CHECK(first < second);
    CHECK(second < third);
}

TEST_CASE("If-Modified-Since allows a 304 answer", "[static]")
{
    temp_dir root;
    root.write_file("Game.js", "var game = {};");

    static_files files(root.path());
    request req = make_get("/Game.js");

    SECTION("file not modified since the given date")
    {
        req.headers["if-modified-since"] = http_date(std::time(NULL) + 3600);

        response resp = files.serve(req);
        CHECK(resp.status == 304);
        CHECK(resp.body.empty());
    }

    SECTION("file modified after the given date")
    {
        req.headers["if-modified-since"] = "Sun, 06 Nov 1994 08:49:37 GMT";

        CHECK(files.serve(req).status == 200);
    }

    SECTION("If-None-Match takes precedence")
    {
        req.headers["if-modified-since"] = http_date(std::time(NULL) + 3600);
        req.headers["if-none-match"] = "\"abc\"";

        CHECK(files.serve(req).status == 200);
    }

    SECTION("ill-formed dates are ignored")
    {
        req.headers["if-modified-since"] = "yesterday";

        CHECK(files.serve(req).status == 200);
    }
}

TEST_CASE("HTTP dates use the IMF-fixdate format", "[static]")
{
    CHECK(http_date(784111777) == "Sun, 06 Nov 1994 08:49:37 GMT");

    std::time_t t = 0;
    REQUIRE(parse_http_date("Sun, 06 Nov 1994 08:49:37 GMT", t));
    CHECK(t == 784111777);

    CHECK_FALSE(parse_http_date("Sunday, 06-Nov-94 08:49:37 GMT", t));
}

TEST_CASE("percent escapes are decoded", "[static]")
{
    CHECK(percent_decode("/a%2Fb%20c") == "/a/b c");
    CHECK(percent_decode("100%") == "100%");
    CHECK(percent_decode("%zz%4") == "%zz%4");
    CHECK(path_encode("my save.json") == "my%20save.json");
}
