#pragma once

/// @file http.hpp
/// @brief HTTP transport and front end for Rivet
///
/// - HTTP/1.1 message parsing and serialization
/// - TLS/HTTPS client connections via OpenSSL
/// - Blocking POST transport for rpc::client
/// - Blocking accept loop serving an rpc::server

#include <rivet/http/http_common.hpp>
#include <rivet/http/http_parser.hpp>
#include <rivet/http/http_message.hpp>
#include <rivet/http/http_transport.hpp>
#include <rivet/http/http_server.hpp>
