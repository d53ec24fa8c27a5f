#pragma once

/// @file codec.hpp
/// @brief Abstract envelope codec
///
/// A codec turns a method name plus arguments into request bytes and
/// back, and does the same for responses. The client and server never
/// look inside the bytes; swapping the codec swaps the wire format.

#include "options.hpp"
#include "rpc_types.hpp"
#include "value.hpp"

#include <string>
#include <string_view>

namespace rivet::rpc {

/// A decoded request envelope
struct method_call {
    std::string name;
    params args;
};

/// Envelope codec interface. Decoders throw parse_error on malformed
/// input; encoders throw rpc::error (internal_error) for content the
/// wire format cannot carry.
class codec {
public:
    virtual ~codec() = default;

    /// Dialect this codec speaks
    virtual dialect version() const noexcept = 0;

    /// MIME type for the HTTP Content-Type header
    virtual std::string_view content_type() const noexcept = 0;

    virtual std::string encode_request(std::string_view method, const params& args) const = 0;
    virtual method_call decode_request(std::string_view payload) const = 0;

    /// A fault-shaped value is written as a fault envelope
    virtual std::string encode_response(const value& result) const = 0;
    virtual std::string encode_fault(const fault& f) const = 0;

    /// A fault envelope decodes to a fault-shaped struct
    virtual value decode_response(std::string_view payload) const = 0;
};

} // namespace rivet::rpc
