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

// Gangway TLS - Header
// Listener-side TLS termination for HTTP/1.1 and relayed WebSocket streams

#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>

namespace gangway::core {

/// Errors from the OpenSSL error queue; the value is the packed ERR code
class TlsErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "tls";
    }

    [[nodiscard]] std::string message(int ev) const override;
};

[[nodiscard]] const TlsErrorCategory& tls_category() noexcept;

/// Pop the oldest queued OpenSSL error (generic TLS error if the queue is empty)
[[nodiscard]] std::error_code make_tls_error() noexcept;

struct OpenSslFree {
    void operator()(SSL* ssl) const noexcept { SSL_free(ssl); }
    void operator()(SSL_CTX* ctx) const noexcept { SSL_CTX_free(ctx); }
};

using SslPtr = std::unique_ptr<SSL, OpenSslFree>;
using SslCtxPtr = std::unique_ptr<SSL_CTX, OpenSslFree>;

/// Where the listener finds its credentials
struct TlsCredentials {
    std::string certificate_chain;  // PEM, leaf first
    std::string private_key;        // PEM
};

/// Server context shared by every accepted connection
class TlsContext {
public:
    /// Load and cross-check the credentials. TLS 1.2 is the floor.
    [[nodiscard]] static std::optional<TlsContext> create(const TlsCredentials& credentials,
                                                          std::error_code& error_out);

    /// SSL object in accept state bound to an accepted socket, nullptr on failure
    [[nodiscard]] SslPtr accept_session(int client_fd) const;

    [[nodiscard]] SSL_CTX* native_handle() const noexcept { return ctx_.get(); }

private:
    explicit TlsContext(SslCtxPtr ctx) : ctx_(std::move(ctx)) {}

    SslCtxPtr ctx_;
};

/// Where a non-blocking SSL call left the session
enum class TlsStatus : uint8_t {
    Ok,         // Call made progress
    WantRead,   // Retry once the socket is readable
    WantWrite,  // Retry once the socket is writable
    Closed,     // close_notify, or the TCP stream ended without one
    Error       // See TlsResult::error
};

struct TlsResult {
    int value = 0;  // Return value of the SSL call (bytes for read/write)
    TlsStatus status = TlsStatus::Ok;
    std::error_code error;
};

// Each call clears the thread's error queue first so the result only
// reflects this call.
[[nodiscard]] TlsResult ssl_accept_step(SSL* ssl) noexcept;
[[nodiscard]] TlsResult ssl_read_some(SSL* ssl, std::span<uint8_t> buffer) noexcept;
[[nodiscard]] TlsResult ssl_write_some(SSL* ssl, std::span<const uint8_t> data) noexcept;

/// Load the SSL library before any context is created
[[nodiscard]] std::error_code initialize_openssl() noexcept;

} // namespace gangway::core
