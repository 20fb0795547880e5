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

// Gangway Static Files - Header
// GET/HEAD file serving from a document root, with directory indexes

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../core/socket.hpp"
#include "../http/http.hpp"

namespace gangway::gateway {

struct StaticFilesOptions {
    std::filesystem::path root = "/app/static";
    std::vector<std::string> index_files = {"index.html", "index.htm"};
    bool directory_listing = true;
    size_t chunk_size = 64 * 1024;  // File body streaming granularity

    // Checked before each body chunk; a file transfer is abandoned when it
    // reads false. nullptr = always send the whole file.
    const std::atomic<bool>* running = nullptr;
};

/// A response ready to send. When body_file is set, its bytes follow the
/// head instead of response.body.
struct StaticReply {
    http::Response response;
    std::optional<std::ifstream> body_file;
    uint64_t file_size = 0;
};

/// Request target mapped under the document root
struct TranslatedPath {
    std::filesystem::path path;
    bool trailing_slash = false;
};

/// Decode %XX escapes; malformed escapes are kept literally
[[nodiscard]] std::string percent_decode(std::string_view text);

/// Escape a single path segment for use in an href
[[nodiscard]] std::string percent_encode_segment(std::string_view text);

/// Map a raw request target to a path under root. Query and fragment are
/// dropped, escapes decoded, "." and empty segments skipped, ".." resolved
/// against earlier segments. nullopt if ".." would climb above the root or a
/// segment contains a NUL byte.
[[nodiscard]] std::optional<TranslatedPath> translate_path(const std::filesystem::path& root,
                                                           std::string_view target);

class StaticFileHandler {
public:
    explicit StaticFileHandler(StaticFilesOptions options);

    /// Decide the reply for a request without touching the socket
    [[nodiscard]] StaticReply resolve(const http::Request& request) const;

    /// Resolve and write the reply. Returns the status sent; error_out is set
    /// when the client could not be written to, or to operation_canceled when
    /// the running flag cleared mid-body.
    [[nodiscard]] http::StatusCode serve(core::Socket& client, const http::Request& request,
                                         std::chrono::milliseconds write_timeout,
                                         std::error_code& error_out) const;

    [[nodiscard]] const StaticFilesOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] StaticReply file_reply(const http::Request& request,
                                         const std::filesystem::path& path) const;
    [[nodiscard]] StaticReply directory_reply(const http::Request& request,
                                              const std::filesystem::path& dir) const;

    StaticFilesOptions options_;
};

}  // namespace gangway::gateway
