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

// Connection Registry - Header
// Tracks live client sessions for admission control and shutdown drain

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "containers.hpp"

namespace gangway::core {

/// Thread-safe set of live sessions, keyed by a registry-assigned id.
///
/// Each connection thread registers on entry and unregisters on exit
/// (see Registration). The accept loop uses try_register() for admission
/// control; shutdown waits on wait_until_empty().
class ConnectionRegistry {
public:
    explicit ConnectionRegistry(size_t max_connections) : max_connections_(max_connections) {}

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /// Admit a session from `peer`; nullopt when at capacity
    [[nodiscard]] std::optional<uint64_t> try_register(std::string peer);

    void unregister(uint64_t id);

    /// Block until no sessions remain or timeout expires. True if drained.
    [[nodiscard]] bool wait_until_empty(std::chrono::milliseconds timeout);

    [[nodiscard]] size_t count() const;

    [[nodiscard]] size_t capacity() const noexcept { return max_connections_; }

    /// Unregisters on destruction (RAII for connection threads)
    class Registration {
    public:
        Registration(ConnectionRegistry& registry, uint64_t id) noexcept
            : registry_(&registry), id_(id) {}
        ~Registration() {
            if (registry_) {
                registry_->unregister(id_);
            }
        }

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        Registration(Registration&& other) noexcept
            : registry_(other.registry_), id_(other.id_) {
            other.registry_ = nullptr;
        }
        Registration& operator=(Registration&&) = delete;

        [[nodiscard]] uint64_t id() const noexcept { return id_; }

    private:
        ConnectionRegistry* registry_;
        uint64_t id_;
    };

private:
    size_t max_connections_;
    uint64_t next_id_ = 1;

    mutable std::mutex mutex_;
    std::condition_variable drained_;
    fast_map<uint64_t, std::string> sessions_;  // id -> peer address
};

}  // namespace gangway::core
