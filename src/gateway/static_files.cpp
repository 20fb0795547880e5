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

// Gangway Static Files - Implementation

#include "static_files.hpp"

#include <sys/stat.h>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <utility>

#include "mime_types.hpp"
#include "responses.hpp"

namespace gangway::gateway {

namespace fs = std::filesystem;

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool iless(const std::string& a, const std::string& b) {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                        [](unsigned char x, unsigned char y) {
                                            return std::tolower(x) < std::tolower(y);
                                        });
}

StaticReply with_standard_headers(http::Response response) {
    add_standard_headers(response);
    StaticReply reply;
    reply.response = std::move(response);
    return reply;
}

StaticReply error_reply(http::StatusCode status, std::string_view detail = {}) {
    StaticReply reply;
    reply.response = make_error_response(status, detail);
    return reply;
}

}  // namespace

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }

    return out;
}

std::string percent_encode_segment(std::string_view text) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());

    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }

    return out;
}

std::optional<TranslatedPath> translate_path(const fs::path& root, std::string_view target) {
    size_t cut = target.find_first_of("?#");
    if (cut != std::string_view::npos) {
        target = target.substr(0, cut);
    }

    TranslatedPath result;
    result.trailing_slash = http::trim(target).ends_with('/');

    std::string decoded = percent_decode(target);

    std::vector<std::string_view> segments;
    std::string_view rest = decoded;
    while (!rest.empty()) {
        size_t slash = rest.find('/');
        std::string_view segment = rest.substr(0, slash);
        rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash + 1);

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment.find('\0') != std::string_view::npos) {
            return std::nullopt;
        }
        if (segment == "..") {
            if (segments.empty()) {
                return std::nullopt;
            }
            segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    result.path = root;
    for (auto segment : segments) {
        result.path /= fs::path(std::string(segment));
    }

    return result;
}

// ============================
// StaticFileHandler
// ============================

StaticFileHandler::StaticFileHandler(StaticFilesOptions options) : options_(std::move(options)) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = 64 * 1024;
    }
}

StaticReply StaticFileHandler::resolve(const http::Request& request) const {
    if (request.method != http::Method::GET && request.method != http::Method::HEAD) {
        return error_reply(http::StatusCode::NotImplemented,
                           fmt::format("Unsupported method ('{}')", request.method_name));
    }

    auto translated = translate_path(options_.root, request.uri);
    if (!translated) {
        return error_reply(http::StatusCode::Forbidden, "Path escapes the document root");
    }

    std::error_code ec;
    auto status = fs::status(translated->path, ec);

    if (!ec && fs::is_directory(status)) {
        if (!translated->trailing_slash) {
            // Redirect so relative links inside the page resolve
            std::string location{request.path};
            location += '/';
            if (!request.query.empty()) {
                location += '?';
                location += request.query;
            }
            http::Response response;
            response.status = http::StatusCode::MovedPermanently;
            response.set_header("Location", location);
            response.set_content_length(0);
            return with_standard_headers(std::move(response));
        }

        for (const auto& index : options_.index_files) {
            fs::path candidate = translated->path / index;
            std::error_code index_ec;
            if (fs::is_regular_file(candidate, index_ec)) {
                return file_reply(request, candidate);
            }
        }

        if (!options_.directory_listing) {
            return error_reply(http::StatusCode::Forbidden, "Directory listing is disabled");
        }
        return directory_reply(request, translated->path);
    }

    if (ec || !fs::is_regular_file(status) || translated->trailing_slash) {
        return error_reply(http::StatusCode::NotFound, "File not found");
    }

    return file_reply(request, translated->path);
}

StaticReply StaticFileHandler::file_reply(const http::Request& request,
                                          const fs::path& path) const {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return error_reply(http::StatusCode::NotFound, "File not found");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return error_reply(http::StatusCode::NotFound, "File not found");
    }

    std::time_t mtime = st.st_mtime;

    // If-None-Match takes precedence; without ETags it never matches
    if (!request.has_header("If-None-Match")) {
        if (const auto* ims = request.find_header("If-Modified-Since")) {
            auto since = http::parse_http_date(ims->value);
            if (since && mtime <= *since) {
                http::Response response;
                response.status = http::StatusCode::NotModified;
                response.set_header("Last-Modified", http::format_http_date(mtime));
                return with_standard_headers(std::move(response));
            }
        }
    }

    http::Response response;
    response.status = http::StatusCode::OK;
    response.set_content_type(mime_type_for(path.filename().string()));
    response.set_content_length(static_cast<size_t>(st.st_size));
    response.set_header("Last-Modified", http::format_http_date(mtime));

    StaticReply reply = with_standard_headers(std::move(response));
    reply.body_file = std::move(file);
    reply.file_size = static_cast<uint64_t>(st.st_size);
    return reply;
}

StaticReply StaticFileHandler::directory_reply(const http::Request& request,
                                               const fs::path& dir) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return error_reply(http::StatusCode::NotFound, "No permission to list directory");
    }

    struct Entry {
        std::string name;
        bool is_dir;
    };
    std::vector<Entry> entries;

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return error_reply(http::StatusCode::NotFound, "No permission to list directory");
        }
        std::error_code type_ec;
        entries.push_back({it->path().filename().string(), it->is_directory(type_ec)});
    }
    if (ec) {
        return error_reply(http::StatusCode::NotFound, "No permission to list directory");
    }

    std::sort(entries.begin(), entries.end(),
              [](const Entry& a, const Entry& b) { return iless(a.name, b.name); });

    std::string title = "Directory listing for " + html_escape(percent_decode(request.path));

    std::string body;
    body += "<!DOCTYPE HTML>\n<html lang=\"en\">\n<head>\n<meta charset=\"utf-8\">\n";
    body += fmt::format("<title>{}</title>\n</head>\n<body>\n<h1>{}</h1>\n<hr>\n<ul>\n", title,
                        title);
    for (const auto& entry : entries) {
        std::string display = entry.name;
        std::string link = percent_encode_segment(entry.name);
        if (entry.is_dir) {
            display += '/';
            link += '/';
        }
        body += fmt::format("<li><a href=\"{}\">{}</a></li>\n", link, html_escape(display));
    }
    body += "</ul>\n<hr>\n</body>\n</html>\n";

    http::Response response;
    response.status = http::StatusCode::OK;
    response.set_content_type("text/html; charset=utf-8");
    response.set_content_length(body.size());
    response.body = std::move(body);
    return with_standard_headers(std::move(response));
}

http::StatusCode StaticFileHandler::serve(core::Socket& client, const http::Request& request,
                                          std::chrono::milliseconds write_timeout,
                                          std::error_code& error_out) const {
    StaticReply reply = resolve(request);
    bool head_only = request.method == http::Method::HEAD;
    http::StatusCode status = reply.response.status;

    if (!reply.body_file) {
        error_out = send_response(client, reply.response, head_only, write_timeout);
        return status;
    }

    error_out = client.write_all(http::serialize_head(reply.response), write_timeout);
    if (error_out || head_only) {
        return status;
    }

    std::vector<char> chunk(options_.chunk_size);
    uint64_t remaining = reply.file_size;
    while (remaining > 0) {
        if (options_.running != nullptr && !options_.running->load(std::memory_order_relaxed)) {
            error_out = std::make_error_code(std::errc::operation_canceled);
            return status;
        }
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, chunk.size()));
        reply.body_file->read(chunk.data(), static_cast<std::streamsize>(want));
        auto got = static_cast<size_t>(reply.body_file->gcount());
        if (got == 0) {
            // File shrank after stat; Content-Length can no longer be honoured
            error_out = std::make_error_code(std::errc::io_error);
            return status;
        }
        error_out = client.write_all(
            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(chunk.data()), got),
            write_timeout);
        if (error_out) {
            return status;
        }
        remaining -= got;
    }

    return status;
}

}  // namespace gangway::gateway
