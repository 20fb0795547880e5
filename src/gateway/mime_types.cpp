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

// Gangway MIME Types - Implementation

#include "mime_types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "../core/containers.hpp"

namespace gangway::gateway {

namespace {

const core::fast_map<std::string_view, std::string_view>& mime_table() {
    static const core::fast_map<std::string_view, std::string_view> table = {
        // Documents
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"txt", "text/plain"},
        {"csv", "text/csv"},
        {"md", "text/markdown"},
        {"xml", "text/xml"},

        // Scripts and application data
        {"js", "text/javascript"},
        {"mjs", "text/javascript"},
        {"json", "application/json"},
        {"map", "application/json"},
        {"wasm", "application/wasm"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"webmanifest", "application/manifest+json"},

        // Images
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"svg", "image/svg+xml"},
        {"ico", "image/vnd.microsoft.icon"},
        {"webp", "image/webp"},
        {"avif", "image/avif"},
        {"bmp", "image/bmp"},

        // Fonts
        {"woff", "font/woff"},
        {"woff2", "font/woff2"},
        {"ttf", "font/ttf"},
        {"otf", "font/otf"},

        // Audio / video
        {"mp3", "audio/mpeg"},
        {"ogg", "audio/ogg"},
        {"wav", "audio/wav"},
        {"mp4", "video/mp4"},
        {"webm", "video/webm"},
    };
    return table;
}

}  // namespace

std::string_view mime_type_for(std::string_view filename) {
    size_t slash = filename.find_last_of('/');
    if (slash != std::string_view::npos) {
        filename.remove_prefix(slash + 1);
    }

    size_t dot = filename.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == filename.size()) {
        return kDefaultMimeType;
    }

    std::string ext{filename.substr(dot + 1)};
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& table = mime_table();
    auto it = table.find(std::string_view(ext));
    return it != table.end() ? it->second : kDefaultMimeType;
}

}  // namespace gangway::gateway
