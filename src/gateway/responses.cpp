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

// Gangway Responses - Implementation

#include "responses.hpp"

#include <fmt/format.h>

#include <ctime>
#include <string>

namespace gangway::gateway {

void add_standard_headers(http::Response& response) {
    response.set_header("Server", kServerName);
    response.set_header("Date", http::format_http_date(std::time(nullptr)));
    response.set_header("Connection", "close");
}

std::string html_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default: out += c; break;
        }
    }
    return out;
}

http::Response make_error_response(http::StatusCode status, std::string_view detail) {
    http::Response response;
    response.status = status;

    auto code = static_cast<int>(status);
    auto reason = http::to_reason_phrase(status);
    std::string message = detail.empty() ? std::string(reason) : html_escape(detail);

    response.body = fmt::format(
        "<!DOCTYPE HTML>\n"
        "<html lang=\"en\">\n"
        "<head>\n"
        "<meta charset=\"utf-8\">\n"
        "<title>{} {}</title>\n"
        "</head>\n"
        "<body>\n"
        "<h1>{} {}</h1>\n"
        "<p>{}</p>\n"
        "</body>\n"
        "</html>\n",
        code, reason, code, reason, message);

    add_standard_headers(response);
    response.set_content_type("text/html; charset=utf-8");
    response.set_content_length(response.body.size());
    return response;
}

std::error_code send_response(core::Socket& socket, const http::Response& response,
                              bool head_only, std::chrono::milliseconds timeout) {
    if (head_only) {
        return socket.write_all(http::serialize_head(response), timeout);
    }
    return socket.write_all(http::serialize(response), timeout);
}

}  // namespace gangway::gateway
