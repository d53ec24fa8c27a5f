#pragma once

/// @file http_server.hpp
/// @brief Blocking HTTP front end for an rpc::server
///
/// Serves one connection at a time, one request per connection.
/// POST bodies go to rpc::server::run; a GET yields the documentation
/// page or, with ?introspection, the manifest.
///
/// Usage:
/// @code
/// rpc::server rpc;
/// rpc.add_method("echo", [](rpc::value v) { return v; });
/// http::rpc_http_server front(rpc, {.port = 8080});
/// if (front.bind()) front.serve();   // until front.stop()
/// @endcode

#include <rivet/http/http_common.hpp>
#include <rivet/http/http_message.hpp>
#include <rivet/http/http_parser.hpp>
#include <rivet/log/macros.hpp>
#include <rivet/net/tcp.hpp>
#include <rivet/rpc/rpc_server.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace rivet::http {

/// HTTP front end configuration
struct server_config {
    std::string bind_address;                        ///< Empty = all interfaces
    uint16_t port = 8080;                            ///< 0 = ephemeral
    int backlog = 128;                               ///< Listen backlog
    std::chrono::milliseconds read_timeout{30000};   ///< Per-read timeout
    size_t max_request_size = 10 * 1024 * 1024;      ///< Max request body size (10MB)
    size_t read_buffer_size = 8192;                  ///< Read buffer size
    bool enable_logging = true;                      ///< Log requests
};

/// Accept loop dispatching HTTP requests to an rpc::server
class rpc_http_server {
public:
    rpc_http_server(rpc::server& rpc, server_config config = {})
        : rpc_(rpc), config_(std::move(config)) {}

    rpc_http_server(const rpc_http_server&) = delete;
    rpc_http_server& operator=(const rpc_http_server&) = delete;

    /// Bind and listen; returns the errno on failure
    std::expected<void, int> bind() {
        net::tcp_options opts;
        opts.backlog = config_.backlog;
        auto listener = net::tcp_listener::bind(
            net::ipv4_address(config_.bind_address, config_.port), opts);
        if (!listener) {
            RIVET_LOG_ERROR("Failed to bind RPC server: {}", strerror(listener.error()));
            return std::unexpected(listener.error());
        }
        listener_.emplace(std::move(*listener));
        stopped_ = false;
        return {};
    }

    /// Bound port, 0 before bind()
    uint16_t port() const noexcept {
        return listener_ ? listener_->local_address().port : 0;
    }

    /// Serve until stop() is called. bind() must have succeeded.
    void serve() {
        if (!listener_) {
            RIVET_LOG_ERROR("serve() called before bind()");
            return;
        }
        RIVET_LOG_INFO("RPC server listening on {}", listener_->local_address().to_string());

        while (!stopped_) {
            auto stream = listener_->accept();
            if (!stream) {
                if (stopped_) break;
                RIVET_LOG_ERROR("Accept error: {}", strerror(stream.error()));
                continue;
            }
            handle_connection(*stream);
        }

        listener_->close();
        RIVET_LOG_INFO("RPC server stopped");
    }

    /// Make serve() return; safe to call from another thread
    void stop() {
        stopped_ = true;
        if (listener_) listener_->shutdown();
    }

    bool is_running() const noexcept { return listener_ && !stopped_; }

    const server_config& config() const noexcept { return config_; }

private:
    void handle_connection(net::tcp_stream& stream) {
        stream.set_timeouts(config_.read_timeout, config_.read_timeout);

        std::vector<char> buffer(config_.read_buffer_size);
        request_parser parser;
        parser.set_max_body_size(config_.max_request_size);

        while (!parser.is_complete() && !parser.has_error()) {
            auto n = stream.read(buffer.data(), buffer.size());
            if (!n) {
                RIVET_LOG_WARNING("Read error: {}", strerror(n.error()));
                if (n.error() == ETIMEDOUT) send(stream, response::error(status::request_timeout));
                return;
            }
            if (*n == 0) return;
            parser.parse(std::string_view(buffer.data(), *n));
        }

        if (parser.has_error()) {
            RIVET_LOG_WARNING("Bad request: {}", parser.error_message());
            send(stream, response::error(status::bad_request));
            return;
        }

        auto req = request::from_parser(parser);
        if (config_.enable_logging) {
            RIVET_LOG_INFO("{} {} ({} bytes)", method_to_string(req.get_method()), req.path(),
                           req.body().size());
        }

        send(stream, dispatch(req));
    }

    response dispatch(const request& req) {
        switch (req.get_method()) {
            case method::POST:
            case method::GET:
            case method::HEAD:
                break;
            default: {
                auto resp = response::error(status::method_not_allowed);
                resp.set_header("Allow", "GET, HEAD, POST");
                return resp;
            }
        }

        rpc::run_result out;
        try {
            auto body = req.get_method() == method::POST ? req.body() : std::string_view();
            out = rpc_.run(body, req.query());
        } catch (const std::exception& e) {
            RIVET_LOG_ERROR("RPC dispatch failed: {}", e.what());
            return response::error(status::internal_server_error);
        }

        response resp(status::ok, std::move(out.body), out.content_type);
        if (req.get_method() == method::HEAD) {
            auto length = resp.body().size();
            resp = response(status::ok);
            resp.get_headers().set_content_type(out.content_type);
            resp.get_headers().set_content_length(length);
        }
        return resp;
    }

    static void send(net::tcp_stream& stream, response resp) {
        resp.set_header("Connection", "close");
        if (auto sent = stream.write_all(resp.serialize()); !sent) {
            RIVET_LOG_WARNING("Failed to send response: {}", strerror(sent.error()));
        }
    }

    rpc::server& rpc_;
    server_config config_;
    std::optional<net::tcp_listener> listener_;
    std::atomic<bool> stopped_{false};
};

} // namespace rivet::http
