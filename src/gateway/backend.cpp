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

// Gangway Backend Connector - Implementation

#include "backend.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <memory>

namespace gangway::gateway {

std::string ProxyErrorCategory::message(int ev) const {
    switch (static_cast<ProxyErrc>(ev)) {
        case ProxyErrc::resolve_failed:
            return "backend address did not resolve";
        case ProxyErrc::connect_failed:
            return "backend connection failed";
        case ProxyErrc::handshake_failed:
            return "upgrade request could not be forwarded to backend";
    }
    return "unknown proxy error";
}

const ProxyErrorCategory& proxy_category() noexcept {
    static ProxyErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ProxyErrc e) noexcept {
    return std::error_code(static_cast<int>(e), proxy_category());
}

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const noexcept {
        if (info) {
            freeaddrinfo(info);
        }
    }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

}  // namespace

core::Socket BackendConnector::connect(std::error_code& error_out) const {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    std::string port = std::to_string(address_.port);
    addrinfo* raw = nullptr;
    if (getaddrinfo(address_.host.c_str(), port.c_str(), &hints, &raw) != 0 || raw == nullptr) {
        error_out = ProxyErrc::resolve_failed;
        return core::Socket{};
    }
    AddrInfoPtr results(raw);

    // Last errno wins when every address fails
    std::error_code last_error = ProxyErrc::connect_failed;

    for (addrinfo* ai = results.get(); ai != nullptr; ai = ai->ai_next) {
        core::Socket socket(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
        if (!socket.is_open()) {
            last_error = std::error_code(errno, std::system_category());
            continue;
        }

        if (::connect(socket.fd(), ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = std::error_code(errno, std::system_category());
            continue;
        }

        // Small interactive frames: disable Nagle
        if (auto ec = core::set_nodelay(socket.fd()); ec) {
            last_error = ec;
            continue;
        }

        error_out.clear();
        return socket;
    }

    error_out = last_error;
    return core::Socket{};
}

}  // namespace gangway::gateway
