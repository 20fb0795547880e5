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

// Gangway Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstring>
#include <string>

namespace gangway::core {

int create_listening_socket(std::string_view address, uint16_t port, int backlog) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return -1;
    }

    // SO_REUSEADDR - allows binding to same address immediately after restart
    if (auto ec = set_reuseaddr(fd); ec) {
        close_fd(fd);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    std::string addr_str{address};
    if (inet_pton(AF_INET, addr_str.c_str(), &addr.sin_addr) <= 0) {
        close_fd(fd);
        return -1;
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close_fd(fd);
        return -1;
    }

    if (listen(fd, backlog) < 0) {
        close_fd(fd);
        return -1;
    }

    if (auto ec = set_nonblocking(fd); ec) {
        close_fd(fd);
        return -1;
    }

    return fd;
}

uint16_t local_port(int fd) noexcept {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::error_code set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return std::error_code(errno, std::system_category());
    }

    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::error_code(errno, std::system_category());
    }

    return {};
}

std::error_code set_reuseaddr(int fd) {
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

std::error_code set_nodelay(int fd) {
    int flag = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

void close_fd(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

int to_poll_timeout(std::chrono::milliseconds timeout) noexcept {
    auto count = timeout.count();
    if (count <= 0) {
        return 0;
    }
    return count > INT_MAX ? INT_MAX : static_cast<int>(count);
}

std::string peer_address(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return "unknown";
    }

    char host[INET6_ADDRSTRLEN] = {};
    uint16_t port = 0;
    if (addr.ss_family == AF_INET) {
        auto* in = reinterpret_cast<sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
    } else if (addr.ss_family == AF_INET6) {
        auto* in6 = reinterpret_cast<sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
    } else {
        return "unknown";
    }

    return std::string(host) + ":" + std::to_string(port);
}

// ============================
// Socket
// ============================

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept
    : fd_(other.fd_), ssl_(std::move(other.ssl_)) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        ssl_ = std::move(other.ssl_);
        other.fd_ = -1;
    }
    return *this;
}

void Socket::close() noexcept {
    if (ssl_) {
        // Best effort close_notify; never on a session that failed its handshake
        if (SSL_is_init_finished(ssl_.get())) {
            ERR_clear_error();
            (void)SSL_shutdown(ssl_.get());
        }
        ssl_.reset();
    }
    if (fd_ >= 0) {
        close_fd(fd_);
        fd_ = -1;
    }
}

std::error_code Socket::set_nonblocking() noexcept {
    if (fd_ < 0) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    return core::set_nonblocking(fd_);
}

bool Socket::wait_for(short events, std::chrono::milliseconds timeout) const noexcept {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = events;

    for (;;) {
        int rc = ::poll(&pfd, 1, to_poll_timeout(timeout));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        // Error and hangup conditions also count: the next I/O call reports them
        return rc > 0;
    }
}

bool Socket::wait_readable(std::chrono::milliseconds timeout) const noexcept {
    if (has_buffered_data()) {
        return true;
    }
    return wait_for(POLLIN, timeout);
}

bool Socket::has_buffered_data() const noexcept {
    return ssl_ && SSL_pending(ssl_.get()) > 0;
}

IoResult Socket::read_some(std::span<uint8_t> buffer) noexcept {
    IoResult result;

    if (fd_ < 0) {
        result.status = IoStatus::Error;
        result.error = std::make_error_code(std::errc::bad_file_descriptor);
        return result;
    }

    if (ssl_) {
        auto tls = ssl_read_some(ssl_.get(), buffer);
        switch (tls.status) {
            case TlsStatus::Ok:
                result.bytes = static_cast<size_t>(tls.value);
                break;
            case TlsStatus::WantRead:
            case TlsStatus::WantWrite:
                result.status = IoStatus::WouldBlock;
                break;
            case TlsStatus::Closed:
                result.status = IoStatus::Eof;
                break;
            case TlsStatus::Error:
                result.status = IoStatus::Error;
                result.error = tls.error;
                break;
        }
        return result;
    }

    for (;;) {
        ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), 0);
        if (n > 0) {
            result.bytes = static_cast<size_t>(n);
            return result;
        }
        if (n == 0) {
            result.status = IoStatus::Eof;
            return result;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            result.status = IoStatus::WouldBlock;
            return result;
        }
        result.status = IoStatus::Error;
        result.error = std::error_code(errno, std::system_category());
        return result;
    }
}

std::error_code Socket::write_all(std::string_view data,
                                  std::chrono::milliseconds timeout) noexcept {
    return write_all(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size()),
        timeout);
}

std::error_code Socket::write_all(std::span<const uint8_t> data,
                                  std::chrono::milliseconds timeout) noexcept {
    if (fd_ < 0) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }

    size_t written = 0;
    while (written < data.size()) {
        auto remaining = data.subspan(written);

        if (ssl_) {
            auto tls = ssl_write_some(ssl_.get(), remaining);
            short wait_events = POLLOUT;
            switch (tls.status) {
                case TlsStatus::Ok:
                    written += static_cast<size_t>(tls.value);
                    continue;
                case TlsStatus::WantRead:
                    wait_events = POLLIN;
                    break;
                case TlsStatus::WantWrite:
                    break;
                case TlsStatus::Closed:
                    return std::make_error_code(std::errc::broken_pipe);
                case TlsStatus::Error:
                    return tls.error;
            }
            if (!wait_for(wait_events, timeout)) {
                return std::make_error_code(std::errc::timed_out);
            }
            continue;
        }

        // MSG_NOSIGNAL: a vanished peer is an error code, not SIGPIPE
        ssize_t n = ::send(fd_, remaining.data(), remaining.size(), MSG_NOSIGNAL);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!wait_for(POLLOUT, timeout)) {
                return std::make_error_code(std::errc::timed_out);
            }
            continue;
        }
        return std::error_code(n < 0 ? errno : EPIPE, std::system_category());
    }

    return {};
}

std::string_view Socket::tls_version() const noexcept {
    return ssl_ ? SSL_get_version(ssl_.get()) : "";
}

std::error_code Socket::tls_accept(std::chrono::milliseconds timeout) noexcept {
    if (!ssl_) {
        return {};
    }

    for (;;) {
        auto step = ssl_accept_step(ssl_.get());
        switch (step.status) {
            case TlsStatus::Ok:
                return {};
            case TlsStatus::WantRead:
                if (!wait_for(POLLIN, timeout)) {
                    return std::make_error_code(std::errc::timed_out);
                }
                break;
            case TlsStatus::WantWrite:
                if (!wait_for(POLLOUT, timeout)) {
                    return std::make_error_code(std::errc::timed_out);
                }
                break;
            case TlsStatus::Closed:
                // Client hung up mid-handshake
                return std::make_error_code(std::errc::connection_aborted);
            case TlsStatus::Error:
                return step.error;
        }
    }
}

}  // namespace gangway::core
