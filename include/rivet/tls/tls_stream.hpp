#pragma once

#include <rivet/log/macros.hpp>
#include <rivet/net/tcp.hpp>
#include <rivet/tls/tls_context.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cerrno>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rivet::tls {

/// Blocking TLS client stream over a connected TCP socket.
/// Timeouts come from the socket's SO_RCVTIMEO / SO_SNDTIMEO.
class tls_stream {
public:
    /// Takes ownership of the TCP stream
    tls_stream(net::tcp_stream tcp, tls_context& ctx)
        : tcp_(std::move(tcp)) {
        ssl_ = SSL_new(ctx.native_handle());
        if (!ssl_) {
            throw std::runtime_error("Failed to create SSL object: " + get_ssl_error());
        }
        SSL_set_fd(ssl_, tcp_.fd());
        SSL_set_connect_state(ssl_);
    }

    ~tls_stream() {
        if (ssl_) SSL_free(ssl_);
    }

    tls_stream(const tls_stream&) = delete;
    tls_stream& operator=(const tls_stream&) = delete;

    tls_stream(tls_stream&& other) noexcept
        : tcp_(std::move(other.tcp_))
        , ssl_(other.ssl_)
        , hostname_(std::move(other.hostname_))
        , last_error_(std::move(other.last_error_)) {
        other.ssl_ = nullptr;
    }

    tls_stream& operator=(tls_stream&& other) noexcept {
        if (this != &other) {
            if (ssl_) SSL_free(ssl_);
            tcp_ = std::move(other.tcp_);
            ssl_ = other.ssl_;
            hostname_ = std::move(other.hostname_);
            last_error_ = std::move(other.last_error_);
            other.ssl_ = nullptr;
        }
        return *this;
    }

    /// Send SNI and check the certificate against this host name
    void set_hostname(std::string_view hostname) {
        hostname_ = std::string(hostname);
        SSL_set_tlsext_host_name(ssl_, hostname_.c_str());
        X509_VERIFY_PARAM* param = SSL_get0_param(ssl_);
        X509_VERIFY_PARAM_set1_host(param, hostname_.c_str(), hostname_.size());
    }

    /// Run the client handshake. On failure last_error() says why.
    bool handshake() {
        ERR_clear_error();
        int ret = SSL_connect(ssl_);
        if (ret == 1) {
            RIVET_LOG_DEBUG("TLS handshake complete (protocol: {}, cipher: {})",
                            SSL_get_version(ssl_), SSL_get_cipher_name(ssl_));
            return true;
        }

        long verify_err = SSL_get_verify_result(ssl_);
        if (verify_err != X509_V_OK) {
            last_error_ = std::string("certificate verification failed: ") +
                          X509_verify_cert_error_string(verify_err);
        } else {
            last_error_ = describe(SSL_get_error(ssl_, ret));
        }
        RIVET_LOG_ERROR("TLS handshake with {} failed: {}", hostname_, last_error_);
        return false;
    }

    /// Receive up to length bytes; 0 means the peer closed
    std::expected<size_t, int> read(void* buffer, size_t length) {
        ERR_clear_error();
        errno = 0;
        int ret = SSL_read(ssl_, buffer, static_cast<int>(length));
        if (ret > 0) return static_cast<size_t>(ret);

        int err = SSL_get_error(ssl_, ret);
        if (err == SSL_ERROR_ZERO_RETURN) return size_t{0};
        // Peers that close without close_notify; treated as EOF
        if (err == SSL_ERROR_SYSCALL && errno == 0) return size_t{0};
        return std::unexpected(to_errno(err));
    }

    /// Send the whole buffer
    std::expected<void, int> write_all(std::string_view data) {
        while (!data.empty()) {
            ERR_clear_error();
            int ret = SSL_write(ssl_, data.data(), static_cast<int>(data.size()));
            if (ret <= 0) {
                return std::unexpected(to_errno(SSL_get_error(ssl_, ret)));
            }
            data.remove_prefix(static_cast<size_t>(ret));
        }
        return {};
    }

    /// Send close_notify
    void shutdown() {
        if (ssl_) SSL_shutdown(ssl_);
    }

    const std::string& last_error() const noexcept { return last_error_; }

    net::tcp_stream& tcp() noexcept { return tcp_; }

private:
    int to_errno(int ssl_error) {
        last_error_ = describe(ssl_error);
        switch (ssl_error) {
            case SSL_ERROR_WANT_READ:
            case SSL_ERROR_WANT_WRITE:
                return ETIMEDOUT;
            case SSL_ERROR_SYSCALL:
                return errno != 0 ? (errno == EAGAIN || errno == EWOULDBLOCK ? ETIMEDOUT : errno)
                                  : EIO;
            default:
                return EPROTO;
        }
    }

    static std::string describe(int ssl_error) {
        switch (ssl_error) {
            case SSL_ERROR_WANT_READ: return "timed out waiting for data";
            case SSL_ERROR_WANT_WRITE: return "timed out sending data";
            case SSL_ERROR_SYSCALL: return "I/O error on the TLS connection";
            case SSL_ERROR_SSL: return get_ssl_error();
            default: return "TLS error " + std::to_string(ssl_error);
        }
    }

    net::tcp_stream tcp_;
    SSL* ssl_ = nullptr;
    std::string hostname_;
    std::string last_error_;
};

} // namespace rivet::tls
