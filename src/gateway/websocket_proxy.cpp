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

// Gangway WebSocket Proxy - Implementation

#include "websocket_proxy.hpp"

#include <exception>
#include <string>

#include "../core/logging.hpp"
#include "handshake.hpp"
#include "responses.hpp"

namespace gangway::gateway {

WebSocketProxy::WebSocketProxy(BackendConnector connector, ByteRelay relay,
                               std::chrono::milliseconds write_timeout, quill::Logger* logger)
    : connector_(std::move(connector)),
      relay_(relay),
      write_timeout_(write_timeout),
      logger_(logger) {}

void WebSocketProxy::reject(core::Socket& client, std::string_view detail) const {
    auto response = make_error_response(http::StatusCode::BadGateway, detail);
    if (auto ec = send_response(client, response, false, write_timeout_); ec) {
        LOG_WARNING(logger_, "Could not deliver 502 to client: {}", ec.message());
    }
    client.close();
}

ProxyOutcome WebSocketProxy::handle(core::Socket client, const http::Request& request,
                                    std::span<const uint8_t> pending,
                                    std::string_view correlation_id) const {
    ProxyOutcome outcome;
    const auto& backend_address = connector_.address();
    core::Socket backend;

    try {
        std::error_code ec;
        backend = connector_.connect(ec);
        if (ec) {
            LOG_ERROR_CTX(logger_, "WebSocket backend connect failed", correlation_id,
                          ec.value(), ec.message());
            outcome.status = http::StatusCode::BadGateway;
            reject(client, "Cannot connect to backend");
            return outcome;
        }

        LOG_BACKEND(logger_, "connected", backend_address.host, backend_address.port,
                    correlation_id);

        if (auto fwd_ec = forward_handshake(backend, request, pending, write_timeout_); fwd_ec) {
            LOG_ERROR_CTX(logger_, "WebSocket handshake forwarding failed", correlation_id,
                          fwd_ec.value(), fwd_ec.message());
            outcome.status = http::StatusCode::BadGateway;
            reject(client, "Cannot forward upgrade request to backend");
            return outcome;
        }
    } catch (const std::exception& e) {
        LOG_ERROR_CTX(logger_, "WebSocket proxy setup failed", correlation_id,
                      static_cast<int>(ProxyErrc::handshake_failed), std::string(e.what()));
        outcome.status = http::StatusCode::BadGateway;
        reject(client, "Proxy error");
        return outcome;
    }

    LOG_INFO(logger_, "WebSocket relay opened: path={}, backend={}:{}, correlation_id={}",
             request.path, backend_address.host, backend_address.port, correlation_id);

    outcome.stats = relay_.run(std::move(client), std::move(backend));

    LOG_INFO(logger_,
             "WebSocket relay closed: client_to_backend={}, backend_to_client={}, "
             "stopped={}, correlation_id={}",
             outcome.stats.client_to_backend_bytes, outcome.stats.backend_to_client_bytes,
             outcome.stats.stopped, correlation_id);

    return outcome;
}

}  // namespace gangway::gateway
