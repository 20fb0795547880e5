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

// Gangway Server - Header
// Accept loop with one thread per connection

#pragma once

#include <quill/Logger.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <system_error>

#include "../control/config.hpp"

namespace gangway::core {

/// Process-wide run flag; signal handlers clear it to stop every Server
extern std::atomic<bool> g_server_running;

/// Single-port server: static files plus WebSocket relay.
///
/// start() binds the listener, run() accepts until stop() or
/// g_server_running goes false, then waits up to shutdown_timeout for open
/// sessions. Each accepted connection is handled on its own detached thread
/// that shares ownership of the handler state, so sessions may outlive the
/// Server object.
class Server {
public:
    explicit Server(control::Config config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Bind and listen; create the TLS context when enabled
    [[nodiscard]] std::error_code start();

    /// Accept loop; returns after stop and drain
    [[nodiscard]] std::error_code run();

    /// Async-signal-safe
    void stop() noexcept;

    /// Bound port (useful with listen_port 0); 0 before start()
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    [[nodiscard]] size_t active_connections() const;

private:
    struct Shared;

    void dispatch(int client_fd);

    std::shared_ptr<Shared> shared_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
};

}  // namespace gangway::core
