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

// Gangway Server - Implementation

#include "server.hpp"

#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include "../gateway/access_log.hpp"
#include "../gateway/classifier.hpp"
#include "../gateway/responses.hpp"
#include "../gateway/static_files.hpp"
#include "../gateway/websocket_proxy.hpp"
#include "../http/parser.hpp"
#include "connection_registry.hpp"
#include "logging.hpp"
#include "socket.hpp"
#include "tls.hpp"

namespace gangway::core {

std::atomic<bool> g_server_running{true};

namespace {

// Upper bound on how long the accept loop and request intake go without
// checking the run flags
constexpr std::chrono::milliseconds kStopCheckInterval{200};

// Admission rejections are written from the accept thread; keep them short
constexpr std::chrono::milliseconds kRejectWriteTimeout{100};

gateway::StaticFilesOptions make_static_options(const control::StaticFilesConfig& config,
                                                const std::atomic<bool>* running) {
    gateway::StaticFilesOptions options;
    options.root = config.root;
    options.index_files = config.index_files;
    options.directory_listing = config.directory_listing;
    options.running = running;
    return options;
}

gateway::RelayOptions make_relay_options(const control::Config& config,
                                         const std::atomic<bool>* running) {
    gateway::RelayOptions options;
    options.poll_interval = std::chrono::milliseconds(config.relay.poll_interval_ms);
    options.chunk_size = config.relay.chunk_size;
    options.write_timeout = std::chrono::milliseconds(config.server.write_timeout);
    options.running = running;
    return options;
}

}  // namespace

enum class IntakeStatus : uint8_t {
    Complete,
    Closed,     // Peer went away (or read error) before a full head arrived
    TimedOut,
    TooLarge,
    Malformed,
    Stopped     // Server shutting down
};

struct Server::Shared {
    explicit Shared(control::Config cfg)
        : config(std::move(cfg)),
          logger(logging::get_current_logger()),
          static_files(make_static_options(config.static_files, &running)),
          proxy(gateway::BackendConnector({config.backend.host, config.backend.port}),
                gateway::ByteRelay(make_relay_options(config, &running)),
                std::chrono::milliseconds(config.server.write_timeout), logger),
          access_log(logger, config.logging.log_requests, config.logging.exclude_paths),
          registry(config.server.max_connections) {}

    [[nodiscard]] bool is_running() const noexcept {
        return running.load(std::memory_order_relaxed) &&
               g_server_running.load(std::memory_order_relaxed);
    }

    IntakeStatus read_request_head(Socket& client, std::vector<uint8_t>& buffer,
                                   http::Request& request, size_t& head_size) const;

    void handle_connection(Socket client, const std::string& peer);

    std::atomic<bool> running{true};
    control::Config config;
    quill::Logger* logger;
    std::optional<TlsContext> tls;
    gateway::StaticFileHandler static_files;
    gateway::WebSocketProxy proxy;
    gateway::AccessLog access_log;
    ConnectionRegistry registry;
};

IntakeStatus Server::Shared::read_request_head(Socket& client, std::vector<uint8_t>& buffer,
                                               http::Request& request,
                                               size_t& head_size) const {
    const size_t max_header_size = config.server.max_header_size;
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config.server.read_timeout);

    http::Parser parser;
    std::array<uint8_t, 4096> chunk{};
    bool have_new_data = false;

    for (;;) {
        if (have_new_data) {
            have_new_data = false;

            // Reparse from the start so every view points into the final buffer
            parser.reset();
            request = http::Request{};
            auto [result, consumed] = parser.parse_request(buffer, request);

            if (result == http::ParseResult::Complete) {
                if (consumed > max_header_size) {
                    return IntakeStatus::TooLarge;
                }
                head_size = consumed;
                return IntakeStatus::Complete;
            }
            if (result == http::ParseResult::Error) {
                LOG_DEBUG(logger, "Malformed request head: {}", parser.error_message());
                return IntakeStatus::Malformed;
            }
            if (buffer.size() > max_header_size) {
                return IntakeStatus::TooLarge;
            }
        }

        if (!is_running()) {
            return IntakeStatus::Stopped;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return IntakeStatus::TimedOut;
        }

        auto wait = std::min<std::chrono::milliseconds>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now),
            kStopCheckInterval);
        if (!client.wait_readable(wait)) {
            continue;
        }

        auto result = client.read_some(chunk);
        switch (result.status) {
            case IoStatus::Data:
                buffer.insert(buffer.end(), chunk.begin(), chunk.begin() + result.bytes);
                have_new_data = true;
                break;
            case IoStatus::WouldBlock:
                break;
            case IoStatus::Eof:
                return IntakeStatus::Closed;
            case IoStatus::Error:
                LOG_DEBUG(logger, "Client read failed: {}", result.error.message());
                return IntakeStatus::Closed;
        }
    }
}

void Server::Shared::handle_connection(Socket client, const std::string& peer) {
    const auto start_time = std::chrono::steady_clock::now();
    const std::string correlation_id = logging::generate_correlation_id();
    const std::chrono::milliseconds write_timeout(config.server.write_timeout);

    auto elapsed_us = [&start_time]() -> uint64_t {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
                                         std::chrono::steady_clock::now() - start_time)
                                         .count());
    };

    try {
        if (client.is_tls()) {
            if (auto ec = client.tls_accept(std::chrono::milliseconds(config.server.read_timeout));
                ec) {
                LOG_WARNING(logger, "TLS handshake failed: client={}, error={}, correlation_id={}",
                            peer, ec.message(), correlation_id);
                return;
            }
            LOG_DEBUG(logger, "TLS established: client={}, version={}, correlation_id={}", peer,
                      client.tls_version(), correlation_id);
        }

        std::vector<uint8_t> buffer;
        http::Request request;
        size_t head_size = 0;

        switch (read_request_head(client, buffer, request, head_size)) {
            case IntakeStatus::Complete:
                break;
            case IntakeStatus::TooLarge: {
                auto response = gateway::make_error_response(
                    http::StatusCode::RequestHeaderFieldsTooLarge);
                if (auto ec = gateway::send_response(client, response, false, write_timeout); ec) {
                    LOG_DEBUG(logger, "Could not send 431: {}", ec.message());
                }
                LOG_WARNING(logger, "Request head too large: client={}, correlation_id={}", peer,
                            correlation_id);
                return;
            }
            case IntakeStatus::Malformed: {
                auto response = gateway::make_error_response(http::StatusCode::BadRequest);
                if (auto ec = gateway::send_response(client, response, false, write_timeout); ec) {
                    LOG_DEBUG(logger, "Could not send 400: {}", ec.message());
                }
                LOG_WARNING(logger, "Malformed request: client={}, correlation_id={}", peer,
                            correlation_id);
                return;
            }
            case IntakeStatus::Closed:
            case IntakeStatus::TimedOut:
            case IntakeStatus::Stopped:
                LOG_DEBUG(logger, "Connection closed before request: client={}, correlation_id={}",
                          peer, correlation_id);
                return;
        }

        uint16_t status = 0;
        switch (gateway::classify(request)) {
            case gateway::Route::Relay: {
                auto pending = std::span<const uint8_t>(buffer).subspan(head_size);
                auto outcome = proxy.handle(std::move(client), request, pending, correlation_id);
                status = static_cast<uint16_t>(outcome.status);
                break;
            }
            case gateway::Route::StaticFiles: {
                std::error_code ec;
                status = static_cast<uint16_t>(
                    static_files.serve(client, request, write_timeout, ec));
                if (ec) {
                    LOG_DEBUG(logger, "Static response incomplete: path={}, error={}",
                              request.path, ec.message());
                }
                break;
            }
        }

        access_log.record(gateway::RequestRecord{request.method_name, request.path, status,
                                                 elapsed_us(), peer, correlation_id});
    } catch (const std::exception& e) {
        LOG_ERROR_CTX(logger, "Connection handler failed", correlation_id, 0,
                      std::string(e.what()));
    }
}

// ============================
// Server
// ============================

Server::Server(control::Config config)
    : shared_(std::make_shared<Shared>(std::move(config))) {}

Server::~Server() {
    stop();
    if (listen_fd_ >= 0) {
        close_fd(listen_fd_);
        listen_fd_ = -1;
    }
}

void Server::stop() noexcept {
    shared_->running.store(false);
}

size_t Server::active_connections() const {
    return shared_->registry.count();
}

std::error_code Server::start() {
    const auto& server_config = shared_->config.server;

    if (server_config.tls_enabled) {
        std::error_code tls_ec;
        TlsCredentials credentials{server_config.tls_certificate_path,
                                   server_config.tls_private_key_path};
        shared_->tls = TlsContext::create(credentials, tls_ec);
        if (!shared_->tls) {
            LOG_ERROR(shared_->logger, "Failed to create TLS context: {}", tls_ec.message());
            return tls_ec;
        }
    }

    listen_fd_ = create_listening_socket(server_config.listen_address, server_config.listen_port,
                                         static_cast<int>(server_config.backlog));
    if (listen_fd_ < 0) {
        std::error_code ec(errno, std::system_category());
        LOG_ERROR(shared_->logger, "Failed to listen on {}:{}: {}", server_config.listen_address,
                  server_config.listen_port, ec.message());
        return ec;
    }

    port_ = local_port(listen_fd_);

    LOG_INFO(shared_->logger,
             "Listening on {}:{} (tls={}), static_root={}, backend={}:{}",
             server_config.listen_address, port_, server_config.tls_enabled,
             shared_->config.static_files.root, shared_->config.backend.host,
             shared_->config.backend.port);

    return {};
}

void Server::dispatch(int client_fd) {
    SslPtr ssl;
    if (shared_->tls) {
        ssl = shared_->tls->accept_session(client_fd);
        if (!ssl) {
            LOG_ERROR(shared_->logger, "Failed to create SSL object: {}",
                      make_tls_error().message());
            close_fd(client_fd);
            return;
        }
    }
    Socket client(client_fd, std::move(ssl));

    std::string peer = peer_address(client.fd());

    auto id = shared_->registry.try_register(peer);
    if (!id) {
        LOG_WARNING(shared_->logger, "Connection limit reached ({}), rejecting client={}",
                    shared_->registry.capacity(), peer);
        if (!client.is_tls()) {
            auto response = gateway::make_error_response(http::StatusCode::ServiceUnavailable);
            if (auto ec = gateway::send_response(client, response, false, kRejectWriteTimeout);
                ec) {
                LOG_DEBUG(shared_->logger, "Could not send 503: {}", ec.message());
            }
        }
        return;
    }

    ConnectionRegistry::Registration registration(shared_->registry, *id);

    try {
        std::thread([shared = shared_, registration = std::move(registration),
                     client = std::move(client), peer = std::move(peer)]() mutable {
            shared->handle_connection(std::move(client), peer);
        }).detach();
    } catch (const std::system_error& e) {
        LOG_ERROR(shared_->logger, "Failed to spawn connection thread: {}", std::string(e.what()));
    }
}

std::error_code Server::run() {
    if (listen_fd_ < 0) {
        return std::make_error_code(std::errc::not_connected);
    }

    std::error_code result;

    while (shared_->is_running()) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        int rc = ::poll(&pfd, 1, static_cast<int>(kStopCheckInterval.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            result = std::error_code(errno, std::system_category());
            LOG_ERROR(shared_->logger, "Accept poll failed: {}", result.message());
            break;
        }
        if (rc == 0) {
            continue;
        }

        // Drain the accept queue
        for (;;) {
            int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
            if (client_fd < 0) {
                if (errno == EINTR || errno == ECONNABORTED) {
                    continue;
                }
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    LOG_WARNING(shared_->logger, "accept failed: {}",
                                std::error_code(errno, std::system_category()).message());
                }
                break;
            }
            dispatch(client_fd);
        }
    }

    shared_->running.store(false);
    close_fd(listen_fd_);
    listen_fd_ = -1;

    auto shutdown_timeout = std::chrono::milliseconds(shared_->config.server.shutdown_timeout);
    size_t open_sessions = shared_->registry.count();
    if (open_sessions > 0) {
        LOG_INFO(shared_->logger, "Waiting for {} open connections to finish", open_sessions);
    }
    if (!shared_->registry.wait_until_empty(shutdown_timeout)) {
        LOG_WARNING(shared_->logger, "Shutdown timeout: {} connections still open",
                    shared_->registry.count());
    }

    LOG_INFO(shared_->logger, "Server stopped");
    return result;
}

}  // namespace gangway::core
