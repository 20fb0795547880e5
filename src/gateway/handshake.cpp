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

// Gangway Handshake Forwarder - Implementation

#include "handshake.hpp"

#include <fmt/format.h>

namespace gangway::gateway {

std::string build_handshake(const http::Request& request) {
    std::string out;

    size_t estimated_size = request.method_name.size() + request.uri.size() + 16;
    for (const auto& header : request.headers) {
        estimated_size += header.name.size() + header.value.size() + 4;
    }
    out.reserve(estimated_size);

    out += fmt::format("{} {} HTTP/{}.{}\r\n", request.method_name, request.uri,
                       request.version_major, request.version_minor);

    for (const auto& header : request.headers) {
        out += header.name;
        out += ": ";
        out += header.value;
        out += "\r\n";
    }
    out += "\r\n";

    return out;
}

std::error_code forward_handshake(core::Socket& backend, const http::Request& request,
                                  std::span<const uint8_t> pending,
                                  std::chrono::milliseconds write_timeout) {
    std::string head = build_handshake(request);

    if (auto ec = backend.write_all(head, write_timeout); ec) {
        return ec;
    }

    if (!pending.empty()) {
        if (auto ec = backend.write_all(pending, write_timeout); ec) {
            return ec;
        }
    }

    return {};
}

}  // namespace gangway::gateway
