#pragma once

/// @file tcp.hpp
/// @brief Blocking TCP sockets with connect and I/O timeouts
///
/// Failures are reported as std::unexpected(errno). A receive or send
/// that runs into its timeout reports ETIMEDOUT.

#include <rivet/log/macros.hpp>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <expected>
#include <string>
#include <string_view>

namespace rivet::net {

/// TCP socket options
struct tcp_options {
    bool reuse_addr = true;      ///< SO_REUSEADDR
    bool no_delay = true;        ///< TCP_NODELAY (disable Nagle's algorithm)
    bool keep_alive = false;     ///< SO_KEEPALIVE
    int backlog = 128;           ///< Listen backlog
};

/// IPv4 address wrapper for listeners
struct ipv4_address {
    uint32_t addr = INADDR_ANY;
    uint16_t port = 0;

    ipv4_address() = default;

    explicit ipv4_address(uint16_t p) : port(p) {}

    /// Numeric address; an empty string or "0.0.0.0" binds every interface.
    /// "localhost" maps to the loopback address.
    ipv4_address(std::string_view ip, uint16_t p) : port(p) {
        if (ip.empty() || ip == "0.0.0.0") {
            addr = htonl(INADDR_ANY);
        } else if (ip == "localhost") {
            addr = htonl(INADDR_LOOPBACK);
        } else if (inet_pton(AF_INET, std::string(ip).c_str(), &addr) != 1) {
            RIVET_LOG_ERROR("Not an IPv4 address: {}", ip);
            addr = htonl(INADDR_ANY);
        }
    }

    explicit ipv4_address(const sockaddr_in& sa)
        : addr(sa.sin_addr.s_addr), port(ntohs(sa.sin_port)) {}

    sockaddr_in to_sockaddr() const {
        sockaddr_in sa{};
        sa.sin_family = AF_INET;
        sa.sin_addr.s_addr = addr;
        sa.sin_port = htons(port);
        return sa;
    }

    std::string to_string() const {
        char buf[INET_ADDRSTRLEN];
        in_addr in{};
        in.s_addr = addr;
        inet_ntop(AF_INET, &in, buf, sizeof(buf));
        return std::string(buf) + ":" + std::to_string(port);
    }
};

/// Connected TCP socket
class tcp_stream {
public:
    tcp_stream() = default;

    explicit tcp_stream(int fd) : fd_(fd) {}

    tcp_stream(tcp_stream&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    tcp_stream& operator=(tcp_stream&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    ~tcp_stream() {
        close();
    }

    tcp_stream(const tcp_stream&) = delete;
    tcp_stream& operator=(const tcp_stream&) = delete;

    bool is_valid() const noexcept { return fd_ >= 0; }
    int fd() const noexcept { return fd_; }

    /// Receive up to length bytes; 0 means the peer closed
    std::expected<size_t, int> read(void* buffer, size_t length) {
        for (;;) {
            ssize_t n = ::recv(fd_, buffer, length, 0);
            if (n >= 0) return static_cast<size_t>(n);
            if (errno == EINTR) continue;
            return std::unexpected(errno == EAGAIN || errno == EWOULDBLOCK ? ETIMEDOUT : errno);
        }
    }

    /// Send the whole buffer
    std::expected<void, int> write_all(std::string_view data) {
        while (!data.empty()) {
            ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                return std::unexpected(errno == EAGAIN || errno == EWOULDBLOCK ? ETIMEDOUT : errno);
            }
            data.remove_prefix(static_cast<size_t>(n));
        }
        return {};
    }

    /// Apply SO_RCVTIMEO / SO_SNDTIMEO (zero = wait forever)
    bool set_timeouts(std::chrono::milliseconds recv_timeout,
                      std::chrono::milliseconds send_timeout) {
        auto to_timeval = [](std::chrono::milliseconds ms) {
            timeval tv{};
            tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
            tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
            return tv;
        };
        auto rtv = to_timeval(recv_timeout);
        auto stv = to_timeval(send_timeout);
        return setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &rtv, sizeof(rtv)) == 0 &&
               setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &stv, sizeof(stv)) == 0;
    }

    bool set_no_delay(bool enable) {
        int flag = enable ? 1 : 0;
        return setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == 0;
    }

    bool set_keep_alive(bool enable) {
        int flag = enable ? 1 : 0;
        return setsockopt(fd_, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag)) == 0;
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

namespace detail {

inline bool set_blocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

/// Non-blocking connect bounded by timeout; returns 0 or an errno
inline int connect_with_timeout(int fd, const sockaddr* sa, socklen_t len,
                                std::chrono::milliseconds timeout) {
    if (!set_blocking(fd, false)) return errno;

    if (::connect(fd, sa, len) < 0) {
        if (errno != EINPROGRESS) return errno;

        pollfd pfd{fd, POLLOUT, 0};
        int wait_ms = timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1;
        int rc;
        do {
            rc = ::poll(&pfd, 1, wait_ms);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) return errno;
        if (rc == 0) return ETIMEDOUT;

        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) return errno;
        if (so_error != 0) return so_error;
    }

    return set_blocking(fd, true) ? 0 : errno;
}

} // namespace detail

/// Resolve host and connect to the first address that accepts
inline std::expected<tcp_stream, int> tcp_connect(std::string_view host, uint16_t port,
                                                  std::chrono::milliseconds timeout,
                                                  const tcp_options& opts = {}) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    std::string host_str(host);
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host_str.c_str(), port_str.c_str(), &hints, &result);
    if (rc != 0 || !result) {
        RIVET_LOG_ERROR("Failed to resolve hostname {}: {}", host, gai_strerror(rc));
        return std::unexpected(EHOSTUNREACH);
    }

    int last_error = ECONNREFUSED;
    for (auto* ai = result; ai; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno;
            continue;
        }

        int err = detail::connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout);
        if (err != 0) {
            last_error = err;
            ::close(fd);
            continue;
        }

        freeaddrinfo(result);
        tcp_stream stream(fd);
        if (opts.no_delay) stream.set_no_delay(true);
        if (opts.keep_alive) stream.set_keep_alive(true);
        RIVET_LOG_DEBUG("Connected to {}:{}", host, port);
        return stream;
    }

    freeaddrinfo(result);
    return std::unexpected(last_error);
}

/// TCP listener for accepting connections
class tcp_listener {
public:
    /// Create, bind and listen. Port 0 picks an ephemeral port; see
    /// local_address() for the one assigned.
    static std::expected<tcp_listener, int> bind(const ipv4_address& addr,
                                                 const tcp_options& opts = {}) {
        int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            return std::unexpected(errno);
        }

        if (opts.reuse_addr) {
            int flag = 1;
            setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag));
        }

        auto sa = addr.to_sockaddr();
        if (::bind(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) < 0 ||
            ::listen(fd, opts.backlog) < 0) {
            int err = errno;
            ::close(fd);
            return std::unexpected(err);
        }

        sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len);

        tcp_listener listener(fd, ipv4_address(bound), opts);
        RIVET_LOG_INFO("TCP listener bound to {}", listener.local_addr_.to_string());
        return listener;
    }

    tcp_listener(tcp_listener&& other) noexcept
        : fd_(other.fd_), local_addr_(other.local_addr_), opts_(other.opts_) {
        other.fd_ = -1;
    }

    tcp_listener& operator=(tcp_listener&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            local_addr_ = other.local_addr_;
            opts_ = other.opts_;
            other.fd_ = -1;
        }
        return *this;
    }

    ~tcp_listener() {
        close();
    }

    tcp_listener(const tcp_listener&) = delete;
    tcp_listener& operator=(const tcp_listener&) = delete;

    bool is_valid() const noexcept { return fd_ >= 0; }
    int fd() const noexcept { return fd_; }

    const ipv4_address& local_address() const noexcept { return local_addr_; }

    /// Block until a client connects
    std::expected<tcp_stream, int> accept() {
        sockaddr_in peer{};
        socklen_t len = sizeof(peer);
        int client;
        do {
            client = ::accept4(fd_, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
        } while (client < 0 && errno == EINTR);
        if (client < 0) return std::unexpected(errno);

        tcp_stream stream(client);
        if (opts_.no_delay) stream.set_no_delay(true);
        if (opts_.keep_alive) stream.set_keep_alive(true);
        RIVET_LOG_DEBUG("Accepted connection from {}", ipv4_address(peer).to_string());
        return stream;
    }

    /// Wake a thread blocked in accept(); the listener stays open
    void shutdown() noexcept {
        if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
            RIVET_LOG_DEBUG("TCP listener closed");
        }
    }

private:
    tcp_listener(int fd, const ipv4_address& addr, const tcp_options& opts)
        : fd_(fd), local_addr_(addr), opts_(opts) {}

    int fd_ = -1;
    ipv4_address local_addr_;
    tcp_options opts_;
};

} // namespace rivet::net
