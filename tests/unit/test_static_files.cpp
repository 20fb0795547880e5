// Gangway Static Files Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include "../../src/core/socket.hpp"
#include "../../src/gateway/static_files.hpp"
#include "../../src/http/parser.hpp"

using namespace gangway;
using namespace gangway::gateway;

namespace fs = std::filesystem;

namespace {

// Scratch document root, removed on destruction
struct StaticRoot {
    fs::path root;

    StaticRoot() {
        root = fs::temp_directory_path() /
               ("gangway_static_" + std::to_string(::getpid()) + "_" +
                std::to_string(reinterpret_cast<uintptr_t>(this)));
        fs::create_directories(root / "docs");
        fs::create_directories(root / "site");
        fs::create_directories(root / "empty dir");
        write("hello.txt", "Hello, world!\n");
        write("app.wasm", std::string("\0asm\x01\0\0\0", 8));
        write("docs/guide.html", "<h1>guide</h1>");
        write("docs/a&b.txt", "amp");
        write("site/index.html", "<h1>home</h1>");
    }

    ~StaticRoot() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void write(const std::string& relative, const std::string& content) const {
        std::ofstream out(root / relative, std::ios::binary);
        out << content;
    }
};

// Keeps the raw bytes alive for the request's views
struct ParsedRequest {
    std::unique_ptr<std::string> raw;
    http::Request request;
};

ParsedRequest make_request(std::string_view method, std::string_view target,
                           std::string_view extra_headers = {}) {
    ParsedRequest parsed;
    parsed.raw = std::make_unique<std::string>();
    *parsed.raw += method;
    *parsed.raw += ' ';
    *parsed.raw += target;
    *parsed.raw += " HTTP/1.1\r\nHost: localhost\r\n";
    *parsed.raw += extra_headers;
    *parsed.raw += "\r\n";

    auto request = http::parse_http_request(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(parsed.raw->data()), parsed.raw->size()));
    REQUIRE(request.has_value());
    parsed.request = *request;
    return parsed;
}

StaticFileHandler make_handler(const StaticRoot& site, bool listing = true) {
    StaticFilesOptions options;
    options.root = site.root;
    options.directory_listing = listing;
    return StaticFileHandler(options);
}

std::string read_all(int fd) {
    std::string out;
    std::array<char, 4096> buf{};
    for (;;) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) {
            break;
        }
        out.append(buf.data(), static_cast<size_t>(n));
    }
    return out;
}

}  // namespace

TEST_CASE("percent_decode", "[static][path]") {
    REQUIRE(percent_decode("/a%20b") == "/a b");
    REQUIRE(percent_decode("%2e%2E") == "..");
    REQUIRE(percent_decode("100%") == "100%");
    REQUIRE(percent_decode("%zz") == "%zz");
    REQUIRE(percent_decode("a+b") == "a+b");
}

TEST_CASE("percent_encode_segment", "[static][path]") {
    REQUIRE(percent_encode_segment("plain-name_1.txt") == "plain-name_1.txt");
    REQUIRE(percent_encode_segment("a b&c") == "a%20b%26c");
}

TEST_CASE("translate_path - Maps targets under the root", "[static][path]") {
    fs::path root = "/srv/www";

    auto simple = translate_path(root, "/css/site.css?v=3");
    REQUIRE(simple.has_value());
    REQUIRE(simple->path == root / "css" / "site.css");
    REQUIRE_FALSE(simple->trailing_slash);

    auto dir = translate_path(root, "/docs/");
    REQUIRE(dir.has_value());
    REQUIRE(dir->path == root / "docs");
    REQUIRE(dir->trailing_slash);

    auto dots = translate_path(root, "/a/./b/../c");
    REQUIRE(dots.has_value());
    REQUIRE(dots->path == root / "a" / "c");

    auto encoded = translate_path(root, "/my%20file.txt");
    REQUIRE(encoded.has_value());
    REQUIRE(encoded->path == root / "my file.txt");

    auto bare = translate_path(root, "/");
    REQUIRE(bare.has_value());
    REQUIRE(bare->path == root);
}

TEST_CASE("translate_path - Refuses to escape the root", "[static][path]") {
    fs::path root = "/srv/www";

    REQUIRE_FALSE(translate_path(root, "/../etc/passwd").has_value());
    REQUIRE_FALSE(translate_path(root, "/a/../../etc/passwd").has_value());
    REQUIRE_FALSE(translate_path(root, "/%2e%2e/etc/passwd").has_value());
    REQUIRE_FALSE(translate_path(root, "/a%00b").has_value());
}

TEST_CASE("StaticFileHandler - Serves existing file", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site);

    auto req = make_request("GET", "/hello.txt");
    auto reply = handler.resolve(req.request);

    REQUIRE(reply.response.status == http::StatusCode::OK);
    REQUIRE(reply.response.get_header("Content-Type") == "text/plain");
    REQUIRE(reply.response.get_header("Content-Length") == "14");
    REQUIRE(reply.response.has_header("Last-Modified"));
    REQUIRE(reply.response.get_header("Server") == "gangway/1.0");
    REQUIRE(reply.response.get_header("Connection") == "close");
    REQUIRE(reply.body_file.has_value());
    REQUIRE(reply.file_size == 14);
}

TEST_CASE("StaticFileHandler - WebAssembly content type", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site);

    auto req = make_request("GET", "/app.wasm");
    auto reply = handler.resolve(req.request);

    REQUIRE(reply.response.status == http::StatusCode::OK);
    REQUIRE(reply.response.get_header("Content-Type") == "application/wasm");
    REQUIRE(reply.file_size == 8);
}

TEST_CASE("StaticFileHandler - Missing file is 404", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site);

    auto req = make_request("GET", "/nope.html");
    auto reply = handler.resolve(req.request);

    REQUIRE(reply.response.status == http::StatusCode::NotFound);
    REQUIRE(reply.response.body.find("File not found") != std::string::npos);
    REQUIRE_FALSE(reply.body_file.has_value());
}

TEST_CASE("StaticFileHandler - Trailing slash on a file is 404", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site);

    auto req = make_request("GET", "/hello.txt/");
    REQUIRE(handler.resolve(req.request).response.status == http::StatusCode::NotFound);
}

TEST_CASE("StaticFileHandler - Escaping the root is 403", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site);

    auto req = make_request("GET", "/../hello.txt");
    REQUIRE(handler.resolve(req.request).response.status == http::StatusCode::Forbidden);
}

TEST_CASE("StaticFileHandler - Directory without slash redirects", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site);

    auto req = make_request("GET", "/docs?sort=name");
    auto reply = handler.resolve(req.request);

    REQUIRE(reply.response.status == http::StatusCode::MovedPermanently);
    REQUIRE(reply.response.get_header("Location") == "/docs/?sort=name");
    REQUIRE(reply.response.get_header("Content-Length") == "0");
}

TEST_CASE("StaticFileHandler - Directory index file", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site);

    auto req = make_request("GET", "/site/");
    auto reply = handler.resolve(req.request);

    REQUIRE(reply.response.status == http::StatusCode::OK);
    REQUIRE(reply.response.get_header("Content-Type") == "text/html");
    REQUIRE(reply.file_size == 13);
}

TEST_CASE("StaticFileHandler - Directory listing", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site);

    auto req = make_request("GET", "/docs/");
    auto reply = handler.resolve(req.request);

    REQUIRE(reply.response.status == http::StatusCode::OK);
    REQUIRE(reply.response.get_header("Content-Type") == "text/html; charset=utf-8");
    const auto& body = reply.response.body;
    REQUIRE(body.find("Directory listing for /docs/") != std::string::npos);
    REQUIRE(body.find("href=\"guide.html\"") != std::string::npos);
    REQUIRE(body.find("href=\"a%26b.txt\"") != std::string::npos);
    REQUIRE(body.find(">a&amp;b.txt<") != std::string::npos);
    REQUIRE(body.find("a&amp;b.txt") < body.find("guide.html"));
}

TEST_CASE("StaticFileHandler - Root listing marks directories", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site);

    auto req = make_request("GET", "/");
    auto reply = handler.resolve(req.request);

    REQUIRE(reply.response.status == http::StatusCode::OK);
    REQUIRE(reply.response.body.find("href=\"empty%20dir/\"") != std::string::npos);
    REQUIRE(reply.response.body.find(">docs/<") != std::string::npos);
}

TEST_CASE("StaticFileHandler - Listing disabled is 403", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site, false);

    auto req = make_request("GET", "/docs/");
    REQUIRE(handler.resolve(req.request).response.status == http::StatusCode::Forbidden);

    // Index files are still served
    auto index = make_request("GET", "/site/");
    REQUIRE(handler.resolve(index.request).response.status == http::StatusCode::OK);
}

TEST_CASE("StaticFileHandler - Unsupported method is 501", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site);

    auto req = make_request("POST", "/hello.txt");
    auto reply = handler.resolve(req.request);

    REQUIRE(reply.response.status == http::StatusCode::NotImplemented);
    REQUIRE(reply.response.body.find("POST") != std::string::npos);
}

TEST_CASE("StaticFileHandler - If-Modified-Since", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site);

    SECTION("not modified since a later date") {
        auto req = make_request("GET", "/hello.txt",
                                "If-Modified-Since: Fri, 01 Jan 2100 00:00:00 GMT\r\n");
        auto reply = handler.resolve(req.request);
        REQUIRE(reply.response.status == http::StatusCode::NotModified);
        REQUIRE_FALSE(reply.body_file.has_value());
    }

    SECTION("modified since an earlier date") {
        auto req = make_request("GET", "/hello.txt",
                                "If-Modified-Since: Thu, 01 Jan 1970 00:00:00 GMT\r\n");
        REQUIRE(handler.resolve(req.request).response.status == http::StatusCode::OK);
    }

    SECTION("ignored when If-None-Match is present") {
        auto req = make_request("GET", "/hello.txt",
                                "If-None-Match: \"abc\"\r\n"
                                "If-Modified-Since: Fri, 01 Jan 2100 00:00:00 GMT\r\n");
        REQUIRE(handler.resolve(req.request).response.status == http::StatusCode::OK);
    }

    SECTION("ignored when malformed") {
        auto req = make_request("GET", "/hello.txt", "If-Modified-Since: yesterday\r\n");
        REQUIRE(handler.resolve(req.request).response.status == http::StatusCode::OK);
    }
}

TEST_CASE("StaticFileHandler - Serve writes head and body", "[static]") {
    StaticRoot site;
    StaticFilesOptions options;
    options.root = site.root;
    options.chunk_size = 4;  // Force several body writes
    StaticFileHandler handler(options);

    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

    std::error_code ec;
    http::StatusCode status;
    {
        core::Socket client(fds[0]);
        auto req = make_request("GET", "/hello.txt");
        status = handler.serve(client, req.request, std::chrono::milliseconds(1000), ec);
    }

    REQUIRE_FALSE(ec);
    REQUIRE(status == http::StatusCode::OK);

    std::string wire = read_all(fds[1]);
    ::close(fds[1]);

    REQUIRE(wire.starts_with("HTTP/1.1 200 OK\r\n"));
    REQUIRE(wire.ends_with("\r\n\r\nHello, world!\n"));
}

TEST_CASE("StaticFileHandler - Body transfer stops with the server", "[static]") {
    StaticRoot site;
    std::atomic<bool> running{false};
    StaticFilesOptions options;
    options.root = site.root;
    options.chunk_size = 4;
    options.running = &running;
    StaticFileHandler handler(options);

    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

    std::error_code ec;
    http::StatusCode status;
    {
        core::Socket client(fds[0]);
        auto req = make_request("GET", "/hello.txt");
        status = handler.serve(client, req.request, std::chrono::milliseconds(1000), ec);
    }

    REQUIRE(ec == std::errc::operation_canceled);
    REQUIRE(status == http::StatusCode::OK);

    // Head went out, body did not
    std::string wire = read_all(fds[1]);
    ::close(fds[1]);
    REQUIRE(wire.starts_with("HTTP/1.1 200 OK\r\n"));
    REQUIRE(wire.ends_with("\r\n\r\n"));
}

TEST_CASE("StaticFileHandler - HEAD sends headers only", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site);

    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

    std::error_code ec;
    {
        core::Socket client(fds[0]);
        auto req = make_request("HEAD", "/hello.txt");
        auto status = handler.serve(client, req.request, std::chrono::milliseconds(1000), ec);
        REQUIRE(status == http::StatusCode::OK);
    }
    REQUIRE_FALSE(ec);

    std::string wire = read_all(fds[1]);
    ::close(fds[1]);

    REQUIRE(wire.find("Content-Length: 14\r\n") != std::string::npos);
    REQUIRE(wire.ends_with("\r\n\r\n"));
    REQUIRE(wire.find("Hello") == std::string::npos);
}

TEST_CASE("StaticFileHandler - Error responses go out whole", "[static]") {
    StaticRoot site;
    auto handler = make_handler(site);

    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

    std::error_code ec;
    {
        core::Socket client(fds[0]);
        auto req = make_request("GET", "/missing");
        auto status = handler.serve(client, req.request, std::chrono::milliseconds(1000), ec);
        REQUIRE(status == http::StatusCode::NotFound);
    }

    std::string wire = read_all(fds[1]);
    ::close(fds[1]);

    REQUIRE(wire.starts_with("HTTP/1.1 404 Not Found\r\n"));
    REQUIRE(wire.find("File not found") != std::string::npos);
}
