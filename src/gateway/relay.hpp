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

// Gangway Byte Relay - Header
// Bidirectional opaque byte pump between a client and a backend socket

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include "../core/socket.hpp"

namespace gangway::gateway {

struct RelayOptions {
    std::chrono::milliseconds poll_interval{1000};  // Readiness wait per iteration, capped at 60s
    size_t chunk_size = 4096;                       // Max bytes per read
    std::chrono::milliseconds write_timeout{30000}; // Longest stall on a full partner

    // Checked once per iteration; relay tears down when it reads false.
    // nullptr = run until the peers close.
    const std::atomic<bool>* running = nullptr;
};

struct RelayStats {
    uint64_t client_to_backend_bytes = 0;
    uint64_t backend_to_client_bytes = 0;
    uint64_t iterations = 0;
    bool stopped = false;  // Ended by RelayOptions::running, not by the peers
};

/// Pumps bytes between a client and a backend until both sockets are closed.
///
/// Each socket's partner is fixed when the relay starts (client <-> backend).
/// Per readiness round:
/// - sockets reporting an error condition are closed;
/// - data read from a socket is written in full to its partner; if the
///   partner is gone or the write fails, both sockets are closed;
/// - EOF on either side closes both;
/// - a read error closes only the socket that failed.
/// The sockets are owned by the call and closed on every exit path.
class ByteRelay {
public:
    explicit ByteRelay(RelayOptions options) : options_(options) {}

    [[nodiscard]] RelayStats run(core::Socket client, core::Socket backend) const;

    [[nodiscard]] const RelayOptions& options() const noexcept { return options_; }

private:
    RelayOptions options_;
};

}  // namespace gangway::gateway
