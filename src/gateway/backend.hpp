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

// Gangway Backend Connector - Header
// Single-attempt blocking connect to the fixed WebSocket backend

#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

#include "../core/socket.hpp"

namespace gangway::gateway {

/// Relay setup failures that are not plain errno values
enum class ProxyErrc {
    resolve_failed = 1,    // Backend host did not resolve
    connect_failed,        // Every resolved address refused or failed
    handshake_failed,      // Could not replay the upgrade request
};

class ProxyErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "proxy";
    }

    [[nodiscard]] std::string message(int ev) const override;
};

[[nodiscard]] const ProxyErrorCategory& proxy_category() noexcept;

[[nodiscard]] std::error_code make_error_code(ProxyErrc e) noexcept;

struct BackendAddress {
    std::string host = "127.0.0.1";
    uint16_t port = 8081;
};

/// Opens TCP connections to one backend address. No retry, no backoff.
class BackendConnector {
public:
    explicit BackendConnector(BackendAddress address) : address_(std::move(address)) {}

    /// Connect (blocking). On failure returns a closed Socket and sets error_out.
    [[nodiscard]] core::Socket connect(std::error_code& error_out) const;

    [[nodiscard]] const BackendAddress& address() const noexcept { return address_; }

private:
    BackendAddress address_;
};

}  // namespace gangway::gateway

template <>
struct std::is_error_code_enum<gangway::gateway::ProxyErrc> : std::true_type {};
