#pragma once

/// @file transport.hpp
/// @brief Abstract request/response transport

#include <string>
#include <string_view>

namespace rivet::rpc {

/// Posts an encoded request to an endpoint and returns the encoded
/// response. Implementations throw transport_error when the endpoint
/// cannot be reached.
class transport {
public:
    virtual ~transport() = default;

    virtual std::string post(std::string_view url, std::string_view request,
                             std::string_view content_type) = 0;
};

} // namespace rivet::rpc
