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

// Gangway WebSocket Proxy - Header
// Upgrade request -> backend connect -> handshake replay -> byte relay

#pragma once

#include <quill/Logger.h>

#include <chrono>
#include <cstdint>
#include <span>
#include <string_view>

#include "../core/socket.hpp"
#include "../http/http.hpp"
#include "backend.hpp"
#include "relay.hpp"

namespace gangway::gateway {

struct ProxyOutcome {
    // 101 once the session was relayed (the backend's own reply passes through
    // untouched), 502 when setup failed
    http::StatusCode status = http::StatusCode::SwitchingProtocols;
    RelayStats stats;
};

class WebSocketProxy {
public:
    WebSocketProxy(BackendConnector connector, ByteRelay relay,
                   std::chrono::milliseconds write_timeout, quill::Logger* logger);

    /// Take over the client connection for one upgrade request. `pending` holds
    /// client bytes already read past the request head. The client socket is
    /// closed when this returns.
    [[nodiscard]] ProxyOutcome handle(core::Socket client, const http::Request& request,
                                      std::span<const uint8_t> pending,
                                      std::string_view correlation_id) const;

    [[nodiscard]] const BackendConnector& connector() const noexcept { return connector_; }

private:
    void reject(core::Socket& client, std::string_view detail) const;

    BackendConnector connector_;
    ByteRelay relay_;
    std::chrono::milliseconds write_timeout_;
    quill::Logger* logger_;
};

}  // namespace gangway::gateway
