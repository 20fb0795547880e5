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

// Gangway Request Classifier - Header
// Decides whether a request is relayed to the WebSocket backend or served locally

#pragma once

#include <cstdint>
#include <string_view>

#include "../http/http.hpp"

namespace gangway::gateway {

enum class Route : uint8_t {
    StaticFiles,  // Served from the static root
    Relay         // Handed to the WebSocket byte relay
};

/// True when the first Upgrade header equals "websocket" (case-insensitive,
/// surrounding whitespace ignored). No other handshake header is inspected.
[[nodiscard]] bool is_websocket_upgrade(const http::Request& request) noexcept;

/// Route for a parsed request head; the method does not matter
[[nodiscard]] Route classify(const http::Request& request) noexcept;

[[nodiscard]] std::string_view to_string(Route route) noexcept;

}  // namespace gangway::gateway
