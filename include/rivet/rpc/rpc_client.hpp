#pragma once

/// @file rpc_client.hpp
/// @brief Namespace-proxying XML-RPC client with batched calls
///
/// A client is the root of a tree of namespace nodes. Each node
/// qualifies method names with its path, so
/// `client["files"]["meta"].call("size", path)` calls "files.meta.size".
///
/// Accessing the root-level "system" node opens a batch scope: calls
/// made while it is open are not sent but return deferred descriptors,
/// which the enclosing system.multiCall sends in one round trip.
///
/// Usage:
/// @code
/// rpc::client client("http://localhost:8080/");
/// rpc::value a, b;
/// auto results = client["system"].call("multiCall",
///     client.call("getTitle").bind(a),
///     client["files"].call("size", "README").bind(b)).get();
/// @endcode

#include "call.hpp"
#include "codec.hpp"
#include "options.hpp"
#include "rpc_error.hpp"
#include "rpc_protocol.hpp"
#include "rpc_types.hpp"
#include "transport.hpp"
#include "value.hpp"

#include <rivet/http/http_transport.hpp>
#include <rivet/log/macros.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rivet::rpc {

// ============================================================================
// Configuration and shared state
// ============================================================================

/// Client configuration
struct client_options {
    output_options output;                        ///< Request encoding options
    std::shared_ptr<rpc::transport> transport;    ///< Default: http::http_transport
    std::shared_ptr<rpc::codec> codec;            ///< Default: make_codec(output)
    bool throw_on_fault = false;                  ///< Throw remote_fault on a fault response
    bool auto_decode = true;                      ///< Decode base64/dateTime batch results
};

/// State shared by every node of one client tree
struct client_session {
    std::string url;
    std::shared_ptr<rpc::transport> transport;
    std::shared_ptr<rpc::codec> codec;
    bool throw_on_fault = false;
    bool auto_decode = true;

    /// Open batch scopes; see namespace_node::child
    int batch_depth = 0;
    /// Serial of the most recent system.multiCall
    uint64_t batch_serial = 0;

    std::string last_request;
    std::string last_response;
};

// ============================================================================
// Namespace node
// ============================================================================

/// One node of the client namespace tree
class namespace_node {
public:
    namespace_node(const namespace_node&) = delete;
    namespace_node& operator=(const namespace_node&) = delete;
    virtual ~namespace_node() = default;

    /// Child namespace, created on first access and cached. Every
    /// access to the root-level "system" node opens a batch scope.
    namespace_node& child(std::string_view name) {
        if (path_.empty() && name == system_namespace) {
            ++session_->batch_depth;
        }
        auto it = children_.find(name);
        if (it == children_.end()) {
            it = children_.emplace(std::string(name),
                                   std::unique_ptr<namespace_node>(
                                       new namespace_node(session_, qualify(path_, name))))
                     .first;
        }
        return *it->second;
    }

    namespace_node& operator[](std::string_view name) { return child(name); }

    /// Call `name` in this namespace.
    /// Returns a deferred reply inside a batch scope, the decoded result
    /// otherwise.
    /// @throws invalid_argument for a malformed batch
    /// @throws transport_error if the server cannot be reached
    /// @throws parse_error for a malformed response
    /// @throws remote_fault on a fault response when throw_on_fault is set
    reply invoke(std::string_view name, std::vector<argument> args) {
        auto method = qualify(path_, name);
        auto& s = *session_;
        bool batch = method == batch_method;

        if (s.batch_depth > 0 && path_ == system_namespace && !batch) {
            --s.batch_depth;
        }
        if (s.batch_depth > 0 && !batch) {
            RIVET_LOG_DEBUG("Deferring {} (batch depth {})", method, s.batch_depth);
            auto deferred_args = to_params(method, args);
            return reply(std::make_shared<rpc::call>(std::move(method), std::move(deferred_args)));
        }
        if (batch) {
            s.batch_depth = 0;
            return reply(run_batch(args));
        }
        return reply(send(method, to_params(method, args)));
    }

    template<typename... Args>
    reply call(std::string_view name, Args&&... args) {
        std::vector<argument> list;
        list.reserve(sizeof...(Args));
        (list.emplace_back(std::forward<Args>(args)), ...);
        return invoke(name, std::move(list));
    }

    /// Send the descriptors as one system.multiCall and return the
    /// results in the same order
    value multi_call(const std::vector<call_ptr>& calls) {
        session_->batch_depth = 0;
        std::vector<argument> args(calls.begin(), calls.end());
        return run_batch(args);
    }

    /// Dotted namespace path; empty at the root
    const std::string& path() const noexcept { return path_; }

    client_session& session() noexcept { return *session_; }
    const client_session& session() const noexcept { return *session_; }

    int batch_depth() const noexcept { return session_->batch_depth; }

    /// Encoded text of the most recent request and response
    const std::string& last_request() const noexcept { return session_->last_request; }
    const std::string& last_response() const noexcept { return session_->last_response; }

protected:
    namespace_node(std::shared_ptr<client_session> session, std::string path)
        : session_(std::move(session)), path_(std::move(path)) {}

private:
    static params to_params(std::string_view method, const std::vector<argument>& args) {
        params out;
        out.reserve(args.size());
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i].is_call()) {
                throw invalid_argument(
                    error_code::invalid_batch_argument,
                    fmt::format("Argument {} of {} is a deferred call; only {} accepts calls",
                                i, method, batch_method));
            }
            out.push_back(args[i].get());
        }
        return out;
    }

    /// Entry {methodName, params} for a descriptor-shaped struct, or
    /// nullopt if the value has no string methodName
    static std::optional<value> entry_from_struct(const value& v) {
        if (!v.is_struct()) return std::nullopt;
        const value* name = v.find(batch_method_key);
        if (!name || !name->is_string()) return std::nullopt;

        value::array args;
        if (const value* p = v.find(batch_params_key)) {
            if (p->is_array()) args = p->as_array();
            else args.push_back(*p);
        }
        return value(value::structure{
            {std::string(batch_method_key), *name},
            {std::string(batch_params_key), value(std::move(args))},
        });
    }

    value run_batch(const std::vector<argument>& args) {
        auto& s = *session_;
        uint64_t serial = ++s.batch_serial;

        // A single array argument is the list of calls itself
        std::vector<argument> items;
        if (args.size() == 1 && !args[0].is_call() && args[0].get().is_array()) {
            const auto& list = args[0].get().as_array();
            items.assign(list.begin(), list.end());
        } else {
            items = args;
        }

        value::array entries;
        std::vector<call_ptr> owners;       // descriptor per entry, null for structs
        std::vector<size_t> slots;          // entry per item
        std::unordered_map<const rpc::call*, size_t> seen;

        for (size_t i = 0; i < items.size(); ++i) {
            const auto& item = items[i];
            if (item.is_call()) {
                const auto& c = item.descriptor();
                if (!c) {
                    throw invalid_argument(error_code::invalid_batch_argument,
                                           fmt::format("Argument {} is not a valid call", i));
                }
                if (auto it = seen.find(c.get()); it != seen.end()) {
                    slots.push_back(it->second);
                    continue;
                }
                if (c->enrolled()) {
                    throw invalid_argument(
                        error_code::invalid_batch_argument,
                        fmt::format("Argument {} ({}) belongs to an earlier batch", i, c->method()));
                }
                seen.emplace(c.get(), entries.size());
                slots.push_back(entries.size());
                owners.push_back(c);
                entries.push_back(c->encode());
            } else {
                auto entry = entry_from_struct(item.get());
                if (!entry) {
                    throw invalid_argument(error_code::invalid_batch_argument,
                                           fmt::format("Argument {} is not a valid call", i));
                }
                slots.push_back(entries.size());
                owners.emplace_back();
                entries.push_back(std::move(*entry));
            }
        }

        RIVET_LOG_DEBUG("Sending batch #{} with {} calls", serial, entries.size());
        size_t expected = entries.size();
        value response = send(std::string(batch_method), params{value(std::move(entries))});
        if (is_fault(response)) {
            return response;
        }
        if (!response.is_array() || response.size() != expected) {
            throw parse_error(fmt::format("Batch response has {} entries, expected {}",
                                          response.is_array() ? response.size() : 0, expected));
        }

        // Unwrap and decode every entry before binding any of them
        value::array results;
        results.reserve(expected);
        for (size_t n = 0; n < expected; ++n) {
            value element = std::move(response.as_array()[n]);
            if (element.is_array() && element.size() == 1) {
                element = value(element[0]);
            }
            if (s.auto_decode) {
                element = decode_scalar(std::move(element));
            }
            results.push_back(std::move(element));
        }

        // Enrolled only once the batch has answered, so a failed round
        // trip can be retried with the same descriptors
        for (size_t n = 0; n < expected; ++n) {
            if (!owners[n]) continue;
            owners[n]->enroll(serial, n);
            owners[n]->complete(results[n]);
        }

        value::array aligned;
        aligned.reserve(slots.size());
        for (size_t slot : slots) {
            aligned.push_back(results[slot]);
        }
        return value(std::move(aligned));
    }

    /// Binary becomes its bytes, datetime its unix timestamp. A datetime
    /// the client cannot read stays as received.
    static value decode_scalar(value element) {
        if (element.is_binary()) return binary_string(element);
        if (element.is_datetime()) {
            if (auto seconds = element.as_datetime().try_timestamp()) return *seconds;
        }
        return element;
    }

    value send(const std::string& method, const params& args) {
        auto& s = *session_;
        auto request = s.codec->encode_request(method, args);
        s.last_request = request;
        s.last_response.clear();

        RIVET_LOG_DEBUG("Calling {} at {}", method, s.url);
        auto response = s.transport->post(s.url, request, s.codec->content_type());
        s.last_response = response;

        value result = s.codec->decode_response(response);
        if (s.throw_on_fault && is_fault(result)) {
            auto f = fault::from_value(result);
            throw remote_fault(f->code, f->message);
        }
        return result;
    }

    std::shared_ptr<client_session> session_;
    std::string path_;
    std::map<std::string, std::unique_ptr<namespace_node>, std::less<>> children_;
};

// ============================================================================
// Client
// ============================================================================

/// Root node bound to one endpoint
class client : public namespace_node {
public:
    /// @throws configuration_error if no codec exists for the output options
    explicit client(std::string url, client_options options = {})
        : namespace_node(make_session(std::move(url), std::move(options)), std::string()) {}

    const std::string& url() const noexcept { return session().url; }

private:
    static std::shared_ptr<client_session> make_session(std::string url, client_options options) {
        auto s = std::make_shared<client_session>();
        s->url = std::move(url);
        s->codec = options.codec ? std::move(options.codec) : make_codec(options.output);
        s->transport = options.transport ? std::move(options.transport)
                                         : std::make_shared<http::http_transport>();
        s->throw_on_fault = options.throw_on_fault;
        s->auto_decode = options.auto_decode;
        RIVET_LOG_DEBUG("Client for {} ({})", s->url, dialect_name(s->codec->version()));
        return s;
    }
};

} // namespace rivet::rpc
