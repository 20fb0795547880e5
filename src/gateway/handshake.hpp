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

// Gangway Handshake Forwarder - Header
// Replays the client's upgrade request head to the backend, byte for byte

#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <system_error>

#include "../core/socket.hpp"
#include "../http/http.hpp"

namespace gangway::gateway {

/// "<METHOD> <target> HTTP/<major>.<minor>\r\n", then "<Name>: <Value>\r\n"
/// for each header in received order, then "\r\n". Nothing is added,
/// dropped or rewritten.
[[nodiscard]] std::string build_handshake(const http::Request& request);

/// Write the rebuilt head, then any bytes the client sent after it
[[nodiscard]] std::error_code forward_handshake(core::Socket& backend,
                                                const http::Request& request,
                                                std::span<const uint8_t> pending,
                                                std::chrono::milliseconds write_timeout);

}  // namespace gangway::gateway
