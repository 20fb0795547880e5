/*
 * Copyright 2026 Gangway Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Gangway HTTP Protocol - Header
// Request views into the receive buffer, owned responses

#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gangway::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP version
enum class Version : uint8_t { HTTP_1_0, HTTP_1_1, UNKNOWN };

/// HTTP status codes
enum class StatusCode : uint16_t {
    // 1xx Informational
    Continue = 100,
    SwitchingProtocols = 101,

    // 2xx Success
    OK = 200,
    NoContent = 204,

    // 3xx Redirection
    MovedPermanently = 301,
    Found = 302,
    NotModified = 304,

    // 4xx Client Error
    BadRequest = 400,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,
    URITooLong = 414,
    RequestHeaderFieldsTooLarge = 431,

    // 5xx Server Error
    InternalServerError = 500,
    NotImplemented = 501,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504,
};

/// HTTP header (name-value pair)
/// Both name and value are views into the request buffer (zero-copy)
struct Header {
    std::string_view name;
    std::string_view value;
};

/// HTTP request head (zero-copy, all views into the receive buffer)
struct Request {
    Method method = Method::UNKNOWN;
    Version version = Version::HTTP_1_1;

    // Method token and version digits exactly as received; the WebSocket
    // relay replays them to the backend
    std::string_view method_name;
    uint8_t version_major = 1;
    uint8_t version_minor = 1;

    std::string_view uri;    // Raw request target
    std::string_view path;   // URI without query string
    std::string_view query;  // Query string (if present)

    // Headers in received order
    std::vector<Header> headers;

    // Helper: Find first header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;
};

/// HTTP response (owns its headers and body)
struct Response {
    Version version = Version::HTTP_1_1;
    StatusCode status = StatusCode::OK;

    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    // Append header (duplicates allowed)
    void add_header(std::string_view name, std::string_view value);

    // Replace all headers with this name by a single one
    void set_header(std::string_view name, std::string_view value);

    [[nodiscard]] std::optional<std::string_view> find_header(std::string_view name) const noexcept;

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    void set_content_length(size_t length);
    void set_content_type(std::string_view content_type);
};

/// Status line plus headers plus blank line
[[nodiscard]] std::string serialize_head(const Response& response);

/// Head followed by the body
[[nodiscard]] std::string serialize(const Response& response);

// Conversion functions

[[nodiscard]] std::string_view to_string(Method method) noexcept;

[[nodiscard]] Method parse_method(std::string_view str) noexcept;

[[nodiscard]] std::string_view to_string(Version version) noexcept;

[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// Strip leading and trailing spaces and tabs
[[nodiscard]] std::string_view trim(std::string_view value) noexcept;

/// RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
[[nodiscard]] std::string format_http_date(std::time_t time);

/// Parse an IMF-fixdate; nullopt if malformed
[[nodiscard]] std::optional<std::time_t> parse_http_date(std::string_view value);

}  // namespace gangway::http
