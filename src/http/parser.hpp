// Gangway HTTP Parser - Header
// Zero-copy request-head parser wrapping llhttp

#pragma once

#include "http.hpp"

#include <llhttp.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

namespace gangway::http {

/// Parse result
enum class ParseResult : uint8_t {
    Complete,      // Request head fully parsed
    Incomplete,    // Need more data
    Error          // Parse error
};

/// HTTP/1.x request head parser (wraps llhttp)
///
/// Parsing stops once the header block is complete; any bytes after it (a
/// request body, or early WebSocket frames from an eager client) are left
/// unconsumed for the caller.
class Parser {
public:
    Parser();
    ~Parser();

    // Non-copyable, movable
    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;
    Parser(Parser&&) noexcept;
    Parser& operator=(Parser&&) noexcept;

    /// Parse a request head from the start of data
    /// Returns ParseResult and, on Complete, the size of the head in bytes
    /// On Complete, populates 'request' with zero-copy views into 'data'
    [[nodiscard]] std::pair<ParseResult, size_t> parse_request(
        std::span<const uint8_t> data,
        Request& request);

    /// Reset parser state for a fresh parse
    void reset();

    /// Get last error message
    [[nodiscard]] std::string_view error_message() const noexcept;

    /// Get last llhttp error
    [[nodiscard]] llhttp_errno_t error_code() const noexcept;

private:
    // llhttp callbacks
    static int on_message_begin(llhttp_t* parser);
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value_complete(llhttp_t* parser);
    static int on_headers_complete(llhttp_t* parser);

    llhttp_t parser_;
    llhttp_settings_t settings_;

    // Parsing context (used by callbacks)
    struct Context {
        Request* request = nullptr;

        std::string_view current_header_field;
        std::string_view current_header_value;
        bool headers_complete = false;
        llhttp_errno_t error = HPE_OK;
    };

    Context ctx_;
};

/// Offset just past the blank line ending the header block, or npos
[[nodiscard]] size_t find_head_end(std::string_view data) noexcept;

/// Helper: Parse entire HTTP request head (convenience wrapper)
/// Returns std::nullopt on error or incomplete input
[[nodiscard]] std::optional<Request> parse_http_request(std::span<const uint8_t> data);

} // namespace gangway::http
