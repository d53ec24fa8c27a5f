#pragma once

/// @file rpc.hpp
/// @brief Umbrella header for the Rivet XML-RPC layer
///
/// ## Quick Start
///
/// @code
/// #include <rivet/rpc/rpc.hpp>
///
/// // Server side
/// rivet::rpc::server server;
/// server.add_method("add", [](int a, int b) { return a + b; },
///                   "Sum of two integers", {"int", "int", "int"});
/// auto response = server.handle(request_xml);
///
/// // Client side
/// rivet::rpc::client client("http://localhost:8080/");
/// auto sum = client.call("add", 2, 3).get().as_int();
///
/// // Batched
/// rivet::rpc::value a, b;
/// client["system"].call("multiCall",
///     client.call("add", 1, 2).bind(a),
///     client.call("add", 3, 4).bind(b));
/// @endcode

#include "value.hpp"
#include "rpc_error.hpp"
#include "rpc_types.hpp"
#include "options.hpp"
#include "codec.hpp"
#include "xmlrpc_codec.hpp"
#include "rpc_protocol.hpp"
#include "introspection.hpp"
#include "runtime.hpp"
#include "call.hpp"
#include "transport.hpp"
#include "service.hpp"
#include "documentor.hpp"
#include "rpc_server.hpp"
#include "rpc_client.hpp"
