#pragma once

/// @file rpc_error.hpp
/// @brief Error codes and exception types for the RPC layer
///
/// Codes above -100 are the library's own; the -32xxx range follows the
/// XML-RPC fault code interoperability conventions so remote peers can
/// tell parse failures from application failures.

#include <stdexcept>
#include <string>

namespace rivet::rpc {

/// RPC error codes, also used as fault codes on the wire
enum class error_code : int {
    success = 0,
    method_not_found = -1,
    invalid_batch_argument = -2,
    recursive_batch = -3,
    transport_unreachable = -4,
    codec_unavailable = -5,
    not_a_datetime = -6,
    unknown_service_type = -7,
    no_request_payload = -8,
    parse_error = -32700,
    invalid_request = -32600,
    invalid_params = -32602,
    internal_error = -32603,
    application_error = -32500,
};

/// Convert error code to string
inline const char* error_code_str(error_code code) {
    switch (code) {
        case error_code::success: return "success";
        case error_code::method_not_found: return "method not found";
        case error_code::invalid_batch_argument: return "invalid batch argument";
        case error_code::recursive_batch: return "recursive batch";
        case error_code::transport_unreachable: return "transport unreachable";
        case error_code::codec_unavailable: return "codec unavailable";
        case error_code::not_a_datetime: return "not a datetime";
        case error_code::unknown_service_type: return "unknown service type";
        case error_code::no_request_payload: return "no request payload";
        case error_code::parse_error: return "parse error";
        case error_code::invalid_request: return "invalid request";
        case error_code::invalid_params: return "invalid method parameters";
        case error_code::internal_error: return "internal error";
        case error_code::application_error: return "application error";
        default: return "unknown error";
    }
}

constexpr int to_int(error_code code) noexcept {
    return static_cast<int>(code);
}

/// Base of every exception thrown by the RPC layer.
/// Carries an integer code: an error_code for local failures, the
/// peer's faultCode for remote_fault.
class error : public std::runtime_error {
public:
    error(error_code code, const std::string& message)
        : std::runtime_error(message), code_(to_int(code)) {}

    error(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    int code() const noexcept { return code_; }

private:
    int code_;
};

/// No codec for the requested dialect or character encoding
class configuration_error : public error {
public:
    explicit configuration_error(const std::string& message)
        : error(error_code::codec_unavailable, message) {}
};

/// A caller handed the library something it cannot use
class invalid_argument : public error {
public:
    using error::error;
};

/// A value was read as a type it does not hold
class type_error : public error {
public:
    explicit type_error(const std::string& message)
        : error(error_code::invalid_params, message) {}
};

/// Malformed XML or a document that is not a valid envelope
class parse_error : public error {
public:
    explicit parse_error(const std::string& message)
        : error(error_code::parse_error, message) {}
};

/// The endpoint could not be reached or answered with a non-2xx status
class transport_error : public error {
public:
    transport_error(const std::string& message, std::string detail,
                    int system_error = 0, int http_status = 0)
        : error(error_code::transport_unreachable, message)
        , detail_(std::move(detail))
        , system_error_(system_error)
        , http_status_(http_status) {}

    /// Underlying cause (strerror text, TLS error string, status line)
    const std::string& detail() const noexcept { return detail_; }

    /// errno value, 0 when the failure was not a system call
    int system_error() const noexcept { return system_error_; }

    /// HTTP status, 0 when no response was received
    int http_status() const noexcept { return http_status_; }

private:
    std::string detail_;
    int system_error_;
    int http_status_;
};

/// A fault returned by the remote peer, raised on request
class remote_fault : public error {
public:
    using error::error;
};

} // namespace rivet::rpc
