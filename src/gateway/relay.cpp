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

// Gangway Byte Relay - Implementation

#include "relay.hpp"

#include <poll.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <vector>

#include "../core/logging.hpp"

namespace gangway::gateway {

namespace {

// Upper bound on one readiness wait, so the running flag is always rechecked
constexpr std::chrono::milliseconds kMaxPollInterval{60000};

constexpr size_t kClient = 0;
constexpr size_t kBackend = 1;

// Fixed partner mapping: client <-> backend
constexpr size_t partner_of(size_t index) noexcept {
    return 1 - index;
}

}  // namespace

RelayStats ByteRelay::run(core::Socket client, core::Socket backend) const {
    RelayStats stats;
    auto* logger = logging::get_current_logger();

    std::array<core::Socket, 2> sockets{std::move(client), std::move(backend)};
    std::array<uint64_t*, 2> forwarded{&stats.client_to_backend_bytes,
                                       &stats.backend_to_client_bytes};

    for (auto& socket : sockets) {
        if (!socket.is_open()) {
            continue;
        }
        if (auto ec = socket.set_nonblocking(); ec) {
            LOG_ERROR(logger, "Relay setup failed: cannot set non-blocking mode: {}", ec.message());
            return stats;  // Both sockets closed by RAII
        }
    }

    std::vector<uint8_t> buffer(options_.chunk_size > 0 ? options_.chunk_size : 4096);

    while (sockets[kClient].is_open() || sockets[kBackend].is_open()) {
        if (options_.running != nullptr && !options_.running->load(std::memory_order_relaxed)) {
            stats.stopped = true;
            break;
        }

        std::array<pollfd, 2> fds{};
        std::array<size_t, 2> slot_owner{};
        nfds_t nfds = 0;
        bool tls_buffered = false;

        for (size_t i = 0; i < sockets.size(); ++i) {
            if (!sockets[i].is_open()) {
                continue;
            }
            fds[nfds].fd = sockets[i].fd();
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            slot_owner[nfds] = i;
            ++nfds;
            tls_buffered = tls_buffered || sockets[i].has_buffered_data();
        }

        // Decrypted TLS bytes are invisible to poll(); don't sleep on them
        auto wait = std::min(options_.poll_interval, kMaxPollInterval);
        int timeout_ms = tls_buffered ? 0 : core::to_poll_timeout(wait);
        int ready = ::poll(fds.data(), nfds, timeout_ms);
        ++stats.iterations;

        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(logger, "Relay poll failed: {}",
                      std::error_code(errno, std::system_category()).message());
            break;
        }

        // Error conditions first: those sockets leave the watched set
        for (nfds_t slot = 0; slot < nfds; ++slot) {
            if (fds[slot].revents & (POLLERR | POLLNVAL)) {
                sockets[slot_owner[slot]].close();
            }
        }

        for (nfds_t slot = 0; slot < nfds; ++slot) {
            size_t i = slot_owner[slot];
            if (!sockets[i].is_open()) {
                continue;
            }

            bool readable = (fds[slot].revents & (POLLIN | POLLHUP)) != 0 ||
                            sockets[i].has_buffered_data();
            if (!readable) {
                continue;
            }

            auto result = sockets[i].read_some(buffer);
            size_t partner = partner_of(i);

            switch (result.status) {
                case core::IoStatus::Data: {
                    if (!sockets[partner].is_open()) {
                        sockets[i].close();
                        break;
                    }
                    auto ec = sockets[partner].write_all(
                        std::span<const uint8_t>(buffer.data(), result.bytes),
                        options_.write_timeout);
                    if (ec) {
                        LOG_DEBUG(logger, "Relay write failed: {}", ec.message());
                        sockets[i].close();
                        sockets[partner].close();
                        break;
                    }
                    *forwarded[i] += result.bytes;
                    break;
                }
                case core::IoStatus::Eof:
                    sockets[i].close();
                    sockets[partner].close();
                    break;
                case core::IoStatus::Error:
                    LOG_DEBUG(logger, "Relay read failed: {}", result.error.message());
                    sockets[i].close();
                    break;
                case core::IoStatus::WouldBlock:
                    break;
            }
        }
    }

    return stats;
}

}  // namespace gangway::gateway
