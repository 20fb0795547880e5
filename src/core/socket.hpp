// Gangway Socket Utilities - Header

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "tls.hpp"

namespace gangway::core {

/// Create non-blocking listening socket (IPv4)
[[nodiscard]] int create_listening_socket(
    std::string_view address,
    uint16_t port,
    int backlog = 128);

/// Port a bound socket actually listens on (resolves port 0)
[[nodiscard]] uint16_t local_port(int fd) noexcept;

[[nodiscard]] std::error_code set_nonblocking(int fd);
[[nodiscard]] std::error_code set_reuseaddr(int fd);
[[nodiscard]] std::error_code set_nodelay(int fd);

void close_fd(int fd);

/// Convert a wait duration to a poll(2) timeout. Negative durations become 0
/// and durations past INT_MAX ms are clamped, so the result never means "forever".
[[nodiscard]] int to_poll_timeout(std::chrono::milliseconds timeout) noexcept;

/// Outcome of a single read attempt
enum class IoStatus : uint8_t {
    Data,        // bytes > 0
    WouldBlock,  // spurious readiness, nothing to read yet
    Eof,         // orderly close by peer
    Error        // see IoResult::error
};

struct IoResult {
    size_t bytes = 0;
    IoStatus status = IoStatus::Data;
    std::error_code error;
};

/// Owning handle for a connected stream socket, optionally wrapped in TLS.
/// Closing (explicitly or on destruction) releases the SSL object and the fd.
class Socket {
public:
    Socket() noexcept = default;
    explicit Socket(int fd) noexcept : fd_(fd) {}
    Socket(int fd, SslPtr ssl) noexcept : fd_(fd), ssl_(std::move(ssl)) {}
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] bool is_tls() const noexcept { return ssl_ != nullptr; }

    /// Read at most buffer.size() bytes
    [[nodiscard]] IoResult read_some(std::span<uint8_t> buffer) noexcept;

    /// Write every byte, waiting for writability (up to timeout per wait) on
    /// short writes. Returns errc::timed_out if the peer stops draining.
    [[nodiscard]] std::error_code write_all(std::span<const uint8_t> data,
                                            std::chrono::milliseconds timeout) noexcept;
    [[nodiscard]] std::error_code write_all(std::string_view data,
                                            std::chrono::milliseconds timeout) noexcept;

    /// Decrypted bytes already held by the TLS layer (always false for plain sockets)
    [[nodiscard]] bool has_buffered_data() const noexcept;

    /// Wait until a read would make progress. False on timeout.
    [[nodiscard]] bool wait_readable(std::chrono::milliseconds timeout) const noexcept;

    /// Negotiated protocol version ("TLSv1.3"), empty for plain sockets
    [[nodiscard]] std::string_view tls_version() const noexcept;

    /// Run the server-side TLS handshake on a non-blocking socket
    [[nodiscard]] std::error_code tls_accept(std::chrono::milliseconds timeout) noexcept;

    [[nodiscard]] std::error_code set_nonblocking() noexcept;

    void close() noexcept;

private:
    [[nodiscard]] bool wait_for(short events, std::chrono::milliseconds timeout) const noexcept;

    int fd_ = -1;
    SslPtr ssl_;
};

/// "host:port" of the peer, or "unknown"
[[nodiscard]] std::string peer_address(int fd);

} // namespace gangway::core
