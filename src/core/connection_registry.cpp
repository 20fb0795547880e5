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

// Connection Registry - Implementation

#include "connection_registry.hpp"

namespace gangway::core {

std::optional<uint64_t> ConnectionRegistry::try_register(std::string peer) {
    std::lock_guard lock(mutex_);
    if (sessions_.size() >= max_connections_) {
        return std::nullopt;
    }
    uint64_t id = next_id_++;
    sessions_.emplace(id, std::move(peer));
    return id;
}

void ConnectionRegistry::unregister(uint64_t id) {
    std::lock_guard lock(mutex_);
    sessions_.erase(id);
    if (sessions_.empty()) {
        drained_.notify_all();
    }
}

bool ConnectionRegistry::wait_until_empty(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return drained_.wait_for(lock, timeout, [this] { return sessions_.empty(); });
}

size_t ConnectionRegistry::count() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

}  // namespace gangway::core
