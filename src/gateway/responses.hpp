// Gangway Responses - Header
// Canned responses and the common header set

#pragma once

#include <chrono>
#include <string_view>
#include <system_error>

#include "../core/socket.hpp"
#include "../http/http.hpp"

namespace gangway::gateway {

inline constexpr std::string_view kServerName = "gangway/1.0";

/// Server, Date and Connection: close. Every response goes out with these.
void add_standard_headers(http::Response& response);

/// Small HTML error page for status, with optional detail line
[[nodiscard]] http::Response make_error_response(http::StatusCode status,
                                                 std::string_view detail = {});

/// Serialize and write the whole response; head_only drops the body (HEAD)
[[nodiscard]] std::error_code send_response(core::Socket& socket, const http::Response& response,
                                            bool head_only, std::chrono::milliseconds timeout);

/// Escape &, <, >, " and ' for HTML text and attribute values
[[nodiscard]] std::string html_escape(std::string_view text);

}  // namespace gangway::gateway
