#pragma once

/// @file rpc_protocol.hpp
/// @brief Protocol constants and codec selection

#include "codec.hpp"
#include "options.hpp"
#include "rpc_error.hpp"
#include "xmlrpc_codec.hpp"

#include <memory>
#include <string_view>

namespace rivet::rpc {

/// Reserved namespace of protocol built-ins
inline constexpr std::string_view system_namespace = "system";

/// Method name of the batched call
inline constexpr std::string_view batch_method = "system.multiCall";

/// Struct keys of one batch entry
inline constexpr std::string_view batch_method_key = "methodName";
inline constexpr std::string_view batch_params_key = "params";

inline bool is_system_method(std::string_view name) noexcept {
    return name.size() > system_namespace.size() &&
           name.starts_with(system_namespace) &&
           name[system_namespace.size()] == '.';
}

/// Join a namespace path and a method name with '.'
inline std::string qualify(std::string_view path, std::string_view name) {
    if (path.empty()) return std::string(name);
    std::string out;
    out.reserve(path.size() + 1 + name.size());
    out.append(path).append(".").append(name);
    return out;
}

/// Create the codec for a set of output options.
/// @throws configuration_error if no codec exists for the dialect or
///         the character encoding is not UTF-8
inline std::shared_ptr<codec> make_codec(const output_options& options) {
    std::string enc;
    for (char c : options.encoding) {
        enc += static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
    }
    if (enc != "utf-8" && enc != "utf8") {
        throw configuration_error(
            fmt::format("No codec available for character encoding '{}'", options.encoding));
    }

    switch (options.version) {
        case dialect::xmlrpc:
        case dialect::auto_detect:
            return std::make_shared<xmlrpc_codec>(options);
        default:
            throw configuration_error(
                fmt::format("No codec available for protocol dialect '{}'",
                            dialect_name(options.version)));
    }
}

} // namespace rivet::rpc
