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

// Gangway HTTP Protocol - Implementation

#include "http.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <string>

namespace gangway::http {

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? header->value : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

// Response helper methods

void Response::add_header(std::string_view name, std::string_view value) {
    headers.emplace_back(std::string(name), std::string(value));
}

void Response::set_header(std::string_view name, std::string_view value) {
    std::erase_if(headers, [name](const auto& h) { return header_name_equals(h.first, name); });
    add_header(name, value);
}

std::optional<std::string_view> Response::find_header(std::string_view name) const noexcept {
    for (const auto& [hdr_name, hdr_value] : headers) {
        if (header_name_equals(hdr_name, name)) {
            return std::string_view(hdr_value);
        }
    }
    return std::nullopt;
}

std::string_view Response::get_header(std::string_view name,
                                      std::string_view default_value) const noexcept {
    return find_header(name).value_or(default_value);
}

bool Response::has_header(std::string_view name) const noexcept {
    return find_header(name).has_value();
}

void Response::set_content_length(size_t length) {
    char buffer[32];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), length);
    set_header("Content-Length", std::string_view(buffer, result.ptr - buffer));
}

void Response::set_content_type(std::string_view content_type) {
    set_header("Content-Type", content_type);
}

std::string serialize_head(const Response& response) {
    std::string out;

    size_t estimated_size = 64;
    for (const auto& [name, value] : response.headers) {
        estimated_size += name.size() + value.size() + 4;  // ": \r\n"
    }
    out.reserve(estimated_size);

    out += to_string(response.version);
    out += ' ';
    out += std::to_string(static_cast<int>(response.status));
    out += ' ';
    out += to_reason_phrase(response.status);
    out += "\r\n";

    for (const auto& [name, value] : response.headers) {
        out += name;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    out += "\r\n";

    return out;
}

std::string serialize(const Response& response) {
    std::string out = serialize_head(response);
    out += response.body;
    return out;
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::CONNECT:
            return "CONNECT";
        case Method::TRACE:
            return "TRACE";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    if (str == "GET")
        return Method::GET;
    if (str == "POST")
        return Method::POST;
    if (str == "PUT")
        return Method::PUT;
    if (str == "DELETE")
        return Method::DELETE;
    if (str == "HEAD")
        return Method::HEAD;
    if (str == "OPTIONS")
        return Method::OPTIONS;
    if (str == "PATCH")
        return Method::PATCH;
    if (str == "CONNECT")
        return Method::CONNECT;
    if (str == "TRACE")
        return Method::TRACE;
    return Method::UNKNOWN;
}

std::string_view to_string(Version version) noexcept {
    switch (version) {
        case Version::HTTP_1_0:
            return "HTTP/1.0";
        case Version::HTTP_1_1:
            return "HTTP/1.1";
        case Version::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Continue:
            return "Continue";
        case StatusCode::SwitchingProtocols:
            return "Switching Protocols";
        case StatusCode::OK:
            return "OK";
        case StatusCode::NoContent:
            return "No Content";
        case StatusCode::MovedPermanently:
            return "Moved Permanently";
        case StatusCode::Found:
            return "Found";
        case StatusCode::NotModified:
            return "Not Modified";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::Forbidden:
            return "Forbidden";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::MethodNotAllowed:
            return "Method Not Allowed";
        case StatusCode::RequestTimeout:
            return "Request Timeout";
        case StatusCode::URITooLong:
            return "URI Too Long";
        case StatusCode::RequestHeaderFieldsTooLarge:
            return "Request Header Fields Too Large";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::NotImplemented:
            return "Not Implemented";
        case StatusCode::BadGateway:
            return "Bad Gateway";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
        case StatusCode::GatewayTimeout:
            return "Gateway Timeout";
    }
    return "Unknown";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

std::string_view trim(std::string_view value) noexcept {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

// HTTP dates

namespace {

constexpr std::array<std::string_view, 7> kDayNames = {"Sun", "Mon", "Tue", "Wed",
                                                        "Thu", "Fri", "Sat"};
constexpr std::array<std::string_view, 12> kMonthNames = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

bool parse_digits(std::string_view text, int& out) noexcept {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

}  // namespace

std::string format_http_date(std::time_t time) {
    std::tm tm{};
    gmtime_r(&time, &tm);
    return fmt::format("{}, {:02} {} {:04} {:02}:{:02}:{:02} GMT", kDayNames[tm.tm_wday],
                       tm.tm_mday, kMonthNames[tm.tm_mon], tm.tm_year + 1900, tm.tm_hour,
                       tm.tm_min, tm.tm_sec);
}

std::optional<std::time_t> parse_http_date(std::string_view value) {
    // "Sun, 06 Nov 1994 08:49:37 GMT"
    value = trim(value);
    if (value.size() != 29 || value[3] != ',' || value[4] != ' ' || value[7] != ' ' ||
        value[11] != ' ' || value[16] != ' ' || value[19] != ':' || value[22] != ':' ||
        value.substr(25) != " GMT") {
        return std::nullopt;
    }

    std::tm tm{};
    auto month_it = std::find(kMonthNames.begin(), kMonthNames.end(), value.substr(8, 3));
    if (month_it == kMonthNames.end()) {
        return std::nullopt;
    }
    tm.tm_mon = static_cast<int>(month_it - kMonthNames.begin());

    int year = 0;
    if (!parse_digits(value.substr(5, 2), tm.tm_mday) || !parse_digits(value.substr(12, 4), year) ||
        !parse_digits(value.substr(17, 2), tm.tm_hour) ||
        !parse_digits(value.substr(20, 2), tm.tm_min) ||
        !parse_digits(value.substr(23, 2), tm.tm_sec)) {
        return std::nullopt;
    }
    tm.tm_year = year - 1900;

    if (tm.tm_mday < 1 || tm.tm_mday > 31 || tm.tm_hour > 23 || tm.tm_min > 59 ||
        tm.tm_sec > 60) {
        return std::nullopt;
    }

    return timegm(&tm);
}

}  // namespace gangway::http
