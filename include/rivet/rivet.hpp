#pragma once

/// Rivet XML-RPC Library - Main Header
///
/// Version: 1.0.0
///
/// This header provides convenient access to all Rivet components.

// Version information
#define RIVET_VERSION_MAJOR 1
#define RIVET_VERSION_MINOR 0
#define RIVET_VERSION_PATCH 0

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

// Utilities
#include "util/base64.hpp"

// XML
#include "xml/xml_format.hpp"

// Networking
#include "net/tcp.hpp"
#include "tls/tls_context.hpp"
#include "tls/tls_stream.hpp"

// HTTP
#include "http/http.hpp"

// RPC
#include "rpc/rpc.hpp"

#include <tuple>

/// Root namespace for the Rivet library
namespace rivet {

/// Get library version string
inline const char* version() noexcept {
    return "1.0.0";
}

/// Get library version as tuple
inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(RIVET_VERSION_MAJOR, RIVET_VERSION_MINOR, RIVET_VERSION_PATCH);
}

} // namespace rivet
