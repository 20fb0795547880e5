// Gangway HTTP Layer Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>

#include "../../src/http/http.hpp"
#include "../../src/http/parser.hpp"

using namespace gangway::http;

namespace {

std::span<const uint8_t> as_bytes(std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

}  // namespace

TEST_CASE("HTTP method conversion", "[http][method]") {
    REQUIRE(to_string(Method::GET) == "GET");
    REQUIRE(to_string(Method::HEAD) == "HEAD");
    REQUIRE(to_string(Method::POST) == "POST");

    REQUIRE(parse_method("GET") == Method::GET);
    REQUIRE(parse_method("HEAD") == Method::HEAD);
    REQUIRE(parse_method("BREW") == Method::UNKNOWN);
}

TEST_CASE("HTTP version conversion", "[http][version]") {
    REQUIRE(to_string(Version::HTTP_1_0) == "HTTP/1.0");
    REQUIRE(to_string(Version::HTTP_1_1) == "HTTP/1.1");
    REQUIRE(to_string(Version::UNKNOWN) == "UNKNOWN");
}

TEST_CASE("Header name comparison (case-insensitive)", "[http][headers]") {
    REQUIRE(header_name_equals("Upgrade", "upgrade"));
    REQUIRE(header_name_equals("SEC-WEBSOCKET-KEY", "Sec-WebSocket-Key"));
    REQUIRE_FALSE(header_name_equals("Upgrade", "Upgrade-Insecure-Requests"));
}

TEST_CASE("Trim strips spaces and tabs only", "[http][headers]") {
    REQUIRE(trim("  websocket\t") == "websocket");
    REQUIRE(trim("") == "");
    REQUIRE(trim(" \t ") == "");
    REQUIRE(trim("a b") == "a b");
}

TEST_CASE("Parse simple GET request", "[http][parser]") {
    std::string_view raw =
        "GET /index.html?lang=en HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "User-Agent: test\r\n"
        "\r\n";

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(as_bytes(raw), request);

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(consumed == raw.size());
    REQUIRE(request.method == Method::GET);
    REQUIRE(request.method_name == "GET");
    REQUIRE(request.uri == "/index.html?lang=en");
    REQUIRE(request.path == "/index.html");
    REQUIRE(request.query == "lang=en");
    REQUIRE(request.version == Version::HTTP_1_1);
    REQUIRE(request.headers.size() == 2);
    REQUIRE(request.get_header("host") == "example.com");
    REQUIRE(request.get_header("user-agent") == "test");
}

TEST_CASE("Parse keeps headers in received order with duplicates", "[http][parser]") {
    std::string_view raw =
        "GET /chat HTTP/1.1\r\n"
        "X-Trace: one\r\n"
        "Host: localhost\r\n"
        "X-Trace: two\r\n"
        "\r\n";

    auto request = parse_http_request(as_bytes(raw));
    REQUIRE(request.has_value());
    REQUIRE(request->headers.size() == 3);
    REQUIRE(request->headers[0].name == "X-Trace");
    REQUIRE(request->headers[0].value == "one");
    REQUIRE(request->headers[1].name == "Host");
    REQUIRE(request->headers[2].value == "two");

    // find_header returns the first match
    REQUIRE(request->get_header("x-trace") == "one");
}

TEST_CASE("Parse keeps headers with empty values", "[http][parser]") {
    std::string_view raw =
        "GET / HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "X-Empty:\r\n"
        "Accept: */*\r\n"
        "\r\n";

    auto request = parse_http_request(as_bytes(raw));
    REQUIRE(request.has_value());
    REQUIRE(request->headers.size() == 3);
    REQUIRE(request->headers[1].name == "X-Empty");
    REQUIRE(request->headers[1].value.empty());
    REQUIRE(request->has_header("x-empty"));
    REQUIRE(request->get_header("Accept") == "*/*");
}

TEST_CASE("Parse WebSocket upgrade request", "[http][parser]") {
    std::string_view raw =
        "GET /ws HTTP/1.1\r\n"
        "Host: localhost:8080\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
        "Sec-WebSocket-Version: 13\r\n"
        "\r\n";

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(as_bytes(raw), request);

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(consumed == raw.size());
    REQUIRE(request.method_name == "GET");
    REQUIRE(request.version_major == 1);
    REQUIRE(request.version_minor == 1);
    REQUIRE(request.get_header("upgrade") == "websocket");
    REQUIRE(request.get_header("sec-websocket-key") == "dGhlIHNhbXBsZSBub25jZQ==");
}

TEST_CASE("Parse stops at end of head and leaves trailing bytes", "[http][parser]") {
    std::string head =
        "GET /ws HTTP/1.1\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "\r\n";
    std::string raw = head + "\x81\x05hello";

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(as_bytes(raw), request);

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(consumed == head.size());
}

TEST_CASE("Parse HTTP/1.0 request version digits", "[http][parser]") {
    std::string_view raw = "HEAD /file.txt HTTP/1.0\r\n\r\n";

    auto request = parse_http_request(as_bytes(raw));
    REQUIRE(request.has_value());
    REQUIRE(request->method == Method::HEAD);
    REQUIRE(request->method_name == "HEAD");
    REQUIRE(request->version == Version::HTTP_1_0);
    REQUIRE(request->version_major == 1);
    REQUIRE(request->version_minor == 0);
    REQUIRE(request->headers.empty());
}

TEST_CASE("Parse incomplete request", "[http][parser]") {
    std::string_view raw =
        "GET /hello HTTP/1.1\r\n"
        "Host: example.com\r\n";

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(as_bytes(raw), request);

    REQUIRE(result == ParseResult::Incomplete);
}

TEST_CASE("Parse request after reset with more data", "[http][parser]") {
    std::string buffer = "GET /a HTTP/1.1\r\nHost: x\r\n";

    Parser parser;
    Request request;
    REQUIRE(parser.parse_request(as_bytes(buffer), request).first == ParseResult::Incomplete);

    buffer += "\r\n";
    parser.reset();
    request = Request{};
    auto [result, consumed] = parser.parse_request(as_bytes(buffer), request);

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(consumed == buffer.size());
    REQUIRE(request.path == "/a");
    REQUIRE(request.headers.size() == 1);
}

TEST_CASE("Parse malformed request", "[http][parser]") {
    std::string_view raw = "NOT A VALID REQUEST\r\n\r\n";

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(as_bytes(raw), request);

    REQUIRE(result == ParseResult::Error);
    REQUIRE_FALSE(parser.error_message().empty());
}

TEST_CASE("find_head_end locates the blank line", "[http][parser]") {
    REQUIRE(find_head_end("GET / HTTP/1.1\r\nHost: a\r\n\r\nbody") == 27);
    REQUIRE(find_head_end("GET / HTTP/1.1\nHost: a\n\nbody") == 24);
    REQUIRE(find_head_end("GET / HTTP/1.1\r\nHost: a\r\n") == std::string_view::npos);
    REQUIRE(find_head_end("") == std::string_view::npos);
}

TEST_CASE("Response serialization", "[http][response]") {
    Response response;
    response.status = StatusCode::NotFound;
    response.add_header("Server", "gangway/1.0");
    response.set_content_type("text/plain");
    response.body = "missing";
    response.set_content_length(response.body.size());

    std::string wire = serialize(response);
    REQUIRE(wire.starts_with("HTTP/1.1 404 Not Found\r\n"));
    REQUIRE(wire.find("Server: gangway/1.0\r\n") != std::string::npos);
    REQUIRE(wire.find("Content-Type: text/plain\r\n") != std::string::npos);
    REQUIRE(wire.find("Content-Length: 7\r\n") != std::string::npos);
    REQUIRE(wire.ends_with("\r\n\r\nmissing"));

    std::string head = serialize_head(response);
    REQUIRE(head.ends_with("\r\n\r\n"));
    REQUIRE(head.find("missing") == std::string::npos);
}

TEST_CASE("Response header replace and lookup", "[http][response]") {
    Response response;
    response.add_header("X-A", "1");
    response.add_header("x-a", "2");
    REQUIRE(response.headers.size() == 2);
    REQUIRE(response.get_header("X-A") == "1");

    response.set_header("X-A", "3");
    REQUIRE(response.headers.size() == 1);
    REQUIRE(response.get_header("x-a") == "3");

    REQUIRE_FALSE(response.find_header("Missing").has_value());
    REQUIRE(response.get_header("Missing", "none") == "none");
}

TEST_CASE("Reason phrases", "[http][status]") {
    REQUIRE(to_reason_phrase(StatusCode::OK) == "OK");
    REQUIRE(to_reason_phrase(StatusCode::NotModified) == "Not Modified");
    REQUIRE(to_reason_phrase(StatusCode::BadGateway) == "Bad Gateway");
    REQUIRE(to_reason_phrase(StatusCode::NotImplemented) == "Not Implemented");
    REQUIRE(to_reason_phrase(StatusCode::RequestHeaderFieldsTooLarge) ==
            "Request Header Fields Too Large");
}

TEST_CASE("HTTP date formatting", "[http][date]") {
    REQUIRE(format_http_date(784111777) == "Sun, 06 Nov 1994 08:49:37 GMT");
    REQUIRE(format_http_date(0) == "Thu, 01 Jan 1970 00:00:00 GMT");
}

TEST_CASE("HTTP date parsing", "[http][date]") {
    auto parsed = parse_http_date("Sun, 06 Nov 1994 08:49:37 GMT");
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == 784111777);

    REQUIRE(parse_http_date("  Thu, 01 Jan 1970 00:00:00 GMT ") == std::optional<std::time_t>(0));

    REQUIRE_FALSE(parse_http_date("Sunday, 06-Nov-94 08:49:37 GMT").has_value());
    REQUIRE_FALSE(parse_http_date("Sun, 06 Foo 1994 08:49:37 GMT").has_value());
    REQUIRE_FALSE(parse_http_date("garbage").has_value());
}
