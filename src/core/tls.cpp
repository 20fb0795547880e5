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

// Gangway TLS - Implementation

#include "tls.hpp"

#include <cerrno>
#include <climits>
#include <cstddef>

namespace gangway::core {

std::string TlsErrorCategory::message(int ev) const {
    char buf[256];
    ERR_error_string_n(static_cast<unsigned long>(ev), buf, sizeof(buf));
    return std::string(buf);
}

const TlsErrorCategory& tls_category() noexcept {
    static TlsErrorCategory instance;
    return instance;
}

std::error_code make_tls_error() noexcept {
    unsigned long err = ERR_get_error();
    return std::error_code(err == 0 ? 1 : static_cast<int>(err), tls_category());
}

namespace {

// Map the return value of SSL_accept/SSL_read/SSL_write. Must run before
// anything else touches errno or the error queue.
TlsResult classify(SSL* ssl, int rc) noexcept {
    TlsResult result;
    result.value = rc;
    if (rc > 0) {
        return result;
    }

    int saved_errno = errno;
    switch (SSL_get_error(ssl, rc)) {
        case SSL_ERROR_WANT_READ:
            result.status = TlsStatus::WantRead;
            break;
        case SSL_ERROR_WANT_WRITE:
            result.status = TlsStatus::WantWrite;
            break;
        case SSL_ERROR_ZERO_RETURN:
            result.status = TlsStatus::Closed;
            break;
        case SSL_ERROR_SYSCALL:
            if (saved_errno == 0) {
                result.status = TlsStatus::Closed;
            } else {
                result.status = TlsStatus::Error;
                result.error = std::error_code(saved_errno, std::system_category());
            }
            break;
        default:
            result.status = TlsStatus::Error;
            result.error = make_tls_error();
            break;
    }
    return result;
}

int clamp_length(size_t size) noexcept {
    return size > INT_MAX ? INT_MAX : static_cast<int>(size);
}

}  // namespace

std::optional<TlsContext> TlsContext::create(const TlsCredentials& credentials,
                                             std::error_code& error_out) {
    ERR_clear_error();

    SslCtxPtr ctx(SSL_CTX_new(TLS_server_method()));
    if (!ctx) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);

    // Relay writes forward whatever one read returned, from a reused buffer
    SSL_CTX_set_mode(ctx.get(),
                     SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Browsers drop WebSocket connections without close_notify all the time
    SSL_CTX_set_options(ctx.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    // Every connection ends with Connection: close; resumption buys nothing
    SSL_CTX_set_session_cache_mode(ctx.get(), SSL_SESS_CACHE_OFF);

    if (SSL_CTX_use_certificate_chain_file(ctx.get(), credentials.certificate_chain.c_str()) !=
            1 ||
        SSL_CTX_use_PrivateKey_file(ctx.get(), credentials.private_key.c_str(),
                                    SSL_FILETYPE_PEM) != 1 ||
        SSL_CTX_check_private_key(ctx.get()) != 1) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    return TlsContext(std::move(ctx));
}

SslPtr TlsContext::accept_session(int client_fd) const {
    SslPtr ssl(SSL_new(ctx_.get()));
    if (!ssl || SSL_set_fd(ssl.get(), client_fd) != 1) {
        return nullptr;
    }
    SSL_set_accept_state(ssl.get());
    return ssl;
}

TlsResult ssl_accept_step(SSL* ssl) noexcept {
    ERR_clear_error();
    errno = 0;
    return classify(ssl, SSL_accept(ssl));
}

TlsResult ssl_read_some(SSL* ssl, std::span<uint8_t> buffer) noexcept {
    ERR_clear_error();
    errno = 0;
    return classify(ssl, SSL_read(ssl, buffer.data(), clamp_length(buffer.size())));
}

TlsResult ssl_write_some(SSL* ssl, std::span<const uint8_t> data) noexcept {
    ERR_clear_error();
    errno = 0;
    return classify(ssl, SSL_write(ssl, data.data(), clamp_length(data.size())));
}

std::error_code initialize_openssl() noexcept {
    if (OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                         nullptr) != 1) {
        return make_tls_error();
    }
    return {};
}

}  // namespace gangway::core
