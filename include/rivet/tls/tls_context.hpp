#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <rivet/log/macros.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace rivet::tls {

/// TLS verification mode
enum class verify_mode {
    none,  ///< Accept any certificate
    peer,  ///< Verify the server certificate chain and host name
};

/// Most recent OpenSSL error on this thread as text
inline std::string get_ssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
}

/// Client-side SSL_CTX wrapper
class tls_context {
public:
    /// TLS 1.2 or newer; no compression
    tls_context() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) {
            throw std::runtime_error("Failed to create SSL context: " + get_ssl_error());
        }
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        SSL_CTX_set_options(ctx_, SSL_OP_NO_COMPRESSION);
        SSL_CTX_set_mode(ctx_, SSL_MODE_AUTO_RETRY);
    }

    ~tls_context() {
        if (ctx_) SSL_CTX_free(ctx_);
    }

    tls_context(const tls_context&) = delete;
    tls_context& operator=(const tls_context&) = delete;

    tls_context(tls_context&& other) noexcept
        : ctx_(other.ctx_), verify_(other.verify_) {
        other.ctx_ = nullptr;
    }

    tls_context& operator=(tls_context&& other) noexcept {
        if (this != &other) {
            if (ctx_) SSL_CTX_free(ctx_);
            ctx_ = other.ctx_;
            verify_ = other.verify_;
            other.ctx_ = nullptr;
        }
        return *this;
    }

    /// Trust the CA certificates in a PEM file and/or hashed directory
    bool load_verify_locations(const std::string& ca_file, const std::string& ca_path = {}) {
        if (SSL_CTX_load_verify_locations(ctx_,
                                          ca_file.empty() ? nullptr : ca_file.c_str(),
                                          ca_path.empty() ? nullptr : ca_path.c_str()) != 1) {
            RIVET_LOG_ERROR("Failed to load CA certificates: {}", get_ssl_error());
            return false;
        }
        return true;
    }

    /// Trust the system CA store, trying the common distribution
    /// locations before OpenSSL's compiled-in default
    bool use_default_verify_paths() {
        static const struct {
            const char* file;
            const char* dir;
        } ca_locations[] = {
            {"/etc/ssl/certs/ca-certificates.crt", "/etc/ssl/certs"},     // Debian/Ubuntu
            {"/etc/pki/tls/certs/ca-bundle.crt", "/etc/pki/tls/certs"},   // Fedora/RHEL
            {"/etc/ssl/ca-bundle.pem", "/etc/ssl/certs"},                 // OpenSUSE
            {"/etc/ssl/cert.pem", "/etc/ssl/certs"},                      // Alpine
        };

        for (const auto& loc : ca_locations) {
            if (SSL_CTX_load_verify_locations(ctx_, loc.file, loc.dir) == 1) {
                RIVET_LOG_DEBUG("Loaded CA certificates from {}", loc.file);
                return true;
            }
        }
        ERR_clear_error();

        if (SSL_CTX_set_default_verify_paths(ctx_) == 1) {
            return true;
        }
        RIVET_LOG_WARNING("Failed to load system CA certificates");
        return false;
    }

    void set_verify_mode(verify_mode mode) {
        verify_ = mode;
        SSL_CTX_set_verify(ctx_, mode == verify_mode::peer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE,
                           nullptr);
        SSL_CTX_set_verify_depth(ctx_, 10);
    }

    verify_mode get_verify_mode() const noexcept { return verify_; }

    SSL_CTX* native_handle() noexcept { return ctx_; }

    /// Client context that verifies peers against the system CA store
    static tls_context make_client(verify_mode mode = verify_mode::peer) {
        tls_context ctx;
        if (mode == verify_mode::peer) ctx.use_default_verify_paths();
        ctx.set_verify_mode(mode);
        return ctx;
    }

private:
    SSL_CTX* ctx_ = nullptr;
    verify_mode verify_ = verify_mode::none;
};

} // namespace rivet::tls
