#pragma once

/// @file rpc_server.hpp
/// @brief XML-RPC method registry and dispatcher
///
/// The server maps qualified names to handlers, answers system.multiCall
/// itself and hands the other system.* built-ins to the protocol
/// runtime. It never touches a socket: feed request bytes to handle()
/// or run() and send back what they return.
///
/// Usage:
/// @code
/// rpc::server server;
/// server.add_method("echo", [](rpc::value v) { return v; });
/// server.add_service(files, "files");
/// auto out = server.run(request_body, query_string);
/// @endcode

#include "codec.hpp"
#include "documentor.hpp"
#include "introspection.hpp"
#include "options.hpp"
#include "rpc_error.hpp"
#include "rpc_protocol.hpp"
#include "rpc_types.hpp"
#include "runtime.hpp"
#include "service.hpp"
#include "value.hpp"

#include <rivet/http/http_common.hpp>
#include <rivet/log/macros.hpp>
#include <rivet/xml/xml_format.hpp>

#include <algorithm>
#include <exception>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rivet::rpc {

// ============================================================================
// Configuration
// ============================================================================

/// Server configuration
struct server_options {
    output_options output{.version = dialect::auto_detect};  ///< Response encoding
    std::shared_ptr<rpc::documentor> documentor;  ///< Default: html_documentor
    bool enable_documentor = true;                ///< false: no documentation page
    std::string name = "Rivet: Simple RPC Server";  ///< Title of the default documentor
    std::string css;                              ///< Stylesheet of the default documentor
    std::string root;                             ///< Endpoint URL the documentor links to
    std::shared_ptr<rpc::codec> codec;            ///< Default: make_codec(output)
};

/// Response of server::run
struct run_result {
    std::string body;
    std::string content_type;
};

/// Whether a service key reads as a number: optional surrounding
/// whitespace and sign, digits with an optional fraction, an optional
/// exponent ("7", "-1", "1.5", " 2e3 ")
inline bool is_numeric_key(std::string_view key) noexcept {
    auto space = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
    };
    auto digit = [](char c) { return c >= '0' && c <= '9'; };
    while (!key.empty() && space(key.front())) key.remove_prefix(1);
    while (!key.empty() && space(key.back())) key.remove_suffix(1);

    size_t i = 0;
    if (i < key.size() && (key[i] == '+' || key[i] == '-')) ++i;
    size_t digits = 0;
    while (i < key.size() && digit(key[i])) { ++i; ++digits; }
    if (i < key.size() && key[i] == '.') {
        ++i;
        while (i < key.size() && digit(key[i])) { ++i; ++digits; }
    }
    if (digits == 0) return false;
    if (i < key.size() && (key[i] == 'e' || key[i] == 'E')) {
        ++i;
        if (i < key.size() && (key[i] == '+' || key[i] == '-')) ++i;
        size_t exponent = 0;
        while (i < key.size() && digit(key[i])) { ++i; ++exponent; }
        if (exponent == 0) return false;
    }
    return i == key.size();
}

/// Introspection manifest of a set of registered methods
template<typename Registry>
manifest build_manifest(const Registry& registry) {
    std::vector<method_description> list;
    list.reserve(registry.size());
    for (const auto& [name, entry] : registry) {
        list.push_back(method_description{name, entry.description, entry.signature});
    }
    return manifest(std::move(list));
}

// ============================================================================
// Server
// ============================================================================

/// Method registry and request dispatcher
class server {
public:
    /// @throws configuration_error if no codec exists for the output options
    explicit server(server_options options = {})
        : options_(std::move(options))
        , codec_(options_.codec ? options_.codec : make_codec(options_.output))
        , runtime_(codec_) {
        if (options_.enable_documentor) {
            documentor_ = options_.documentor;
            if (!documentor_) {
                html_documentor_options doc;
                doc.name = options_.name;
                doc.css = options_.css;
                doc.root = options_.root;
                doc.version = options_.output.version;
                documentor_ = std::make_shared<html_documentor>(std::move(doc));
            }
        }
        runtime_.set_introspection([this] {
            return documentor_ ? documentor_->method_data() : introspect();
        });
    }

    server(const server&) = delete;
    server& operator=(const server&) = delete;

    // ------------------------------------------------------------------------
    // Registration
    // ------------------------------------------------------------------------

    /// Register a procedure. An existing name is replaced.
    /// @throws invalid_argument if the name is empty or there is no handler
    void add_method(method_entry entry) {
        if (entry.name.empty() || !entry.handler) {
            throw invalid_argument(error_code::unknown_service_type,
                                   fmt::format("Cannot register '{}': a method needs a name "
                                               "and a handler", entry.name));
        }
        auto it = methods_.find(entry.name);
        if (it != methods_.end()) {
            RIVET_LOG_DEBUG("Replacing method {}", entry.name);
            it->second = std::move(entry);
        } else {
            RIVET_LOG_DEBUG("Registered method {}", entry.name);
            auto name = entry.name;
            methods_.emplace(std::move(name), std::move(entry));
        }
    }

    template<typename F>
    void add_method(std::string name, F&& fn, std::string description = {},
                    std::vector<std::string> signature = {}) {
        add_method(method_entry{std::move(name), make_handler(std::forward<F>(fn)),
                                std::move(description), std::move(signature)});
    }

    /// Register every method of a service. A key becomes the prefix
    /// "key." unless it is empty or numeric (see is_numeric_key); names
    /// starting with '_' are skipped.
    void add_service(const service& svc, std::string_view key = {}) {
        bool prefixed = !key.empty() && !is_numeric_key(key);
        for (const auto& entry : svc.methods()) {
            if (entry.name.starts_with('_')) continue;
            method_entry copy = entry;
            if (prefixed) copy.name = qualify(key, entry.name);
            add_method(std::move(copy));
        }
    }

    void add_services(const std::vector<std::pair<std::string, service>>& services) {
        for (const auto& [key, svc] : services) {
            add_service(svc, key);
        }
    }

    // ------------------------------------------------------------------------
    // Dispatch
    // ------------------------------------------------------------------------

    /// Run one procedure. Handler exceptions and fault-shaped return
    /// values come back as faults.
    rpc_result<value> call(std::string_view method, const params& args = {}) {
        auto it = methods_.find(method);
        if (it != methods_.end()) {
            return invoke(it->second, args);
        }
        if (!is_system_method(method)) {
            RIVET_LOG_WARNING("Procedure {} not found", method);
            return rpc_result<value>(fault(error_code::method_not_found,
                                           fmt::format("Procedure {} not found.", method)));
        }
        if (method == batch_method) {
            return rpc_result<value>(recursion_fault());
        }
        return delegate(method, args);
    }

    /// Decode a request envelope, dispatch it and encode the response.
    /// Malformed input produces a fault envelope, never an exception.
    std::string handle(std::string_view request) {
        snapshot();

        method_call req;
        try {
            req = codec_->decode_request(request);
        } catch (const parse_error& e) {
            RIVET_LOG_WARNING("Rejected request: {}", e.what());
            return codec_->encode_fault(fault(e.code(), e.what()));
        }

        RIVET_LOG_DEBUG("Request {} with {} params", req.name, req.args.size());
        rpc_result<value> result = req.name == batch_method
                                       ? rpc_result<value>(multi_call(req.args))
                                       : call(req.name, req.args);
        try {
            if (!result.ok()) {
                return codec_->encode_fault(result.error());
            }
            return codec_->encode_response(*result);
        } catch (const error& e) {
            RIVET_LOG_ERROR("Cannot encode the answer to {}: {}", req.name, e.what());
            return codec_->encode_fault(
                fault(error_code::internal_error, "Response could not be encoded"));
        }
    }

    /// Answer one HTTP exchange: a request body is handled, the
    /// "introspection" query returns the manifest, anything else gets
    /// the documentation page.
    run_result run(std::string_view body, std::string_view query = {}) {
        snapshot();
        if (!body.empty()) {
            return {handle(body), std::string(codec_->content_type())};
        }
        if (http::parse_query_string(query).contains("introspection")) {
            auto xml = documentor_ ? documentor_->introspection() : introspect().to_xml();
            return {std::move(xml), std::string(http::mime::text_xml)};
        }
        if (documentor_) {
            return {documentor_->handle(*this), std::string(http::mime::text_html)};
        }
        return {codec_->encode_fault(fault(error_code::no_request_payload, "No request xml found.")),
                std::string(codec_->content_type())};
    }

    // ------------------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------------------

    /// Live manifest of the registered methods
    manifest introspect() const { return build_manifest(methods_); }

    std::vector<std::string> method_names() const {
        std::vector<std::string> names;
        names.reserve(methods_.size());
        for (const auto& [name, entry] : methods_) names.push_back(name);
        return names;
    }

    bool has_method(std::string_view name) const { return methods_.find(name) != methods_.end(); }

    const server_options& options() const noexcept { return options_; }
    const codec& get_codec() const noexcept { return *codec_; }

    /// Null when the documentor is disabled
    documentor* get_documentor() const noexcept { return documentor_.get(); }

private:
    static fault recursion_fault() {
        return fault(error_code::recursive_batch, "Cannot recurse system.multiCall");
    }

    void snapshot() {
        if (documentor_) documentor_->set_method_data(introspect());
    }

    rpc_result<value> invoke(const method_entry& entry, const params& args) {
        try {
            value result = entry.handler(args);
            if (auto f = fault::from_value(result)) {
                return rpc_result<value>(std::move(*f));
            }
            return rpc_result<value>(std::move(result));
        } catch (const error& e) {
            RIVET_LOG_WARNING("{} failed: {}", entry.name, e.what());
            return rpc_result<value>(fault(e.code(), e.what()));
        } catch (const std::exception& e) {
            RIVET_LOG_ERROR("{} threw: {}", entry.name, e.what());
            return rpc_result<value>(fault(error_code::application_error, e.what()));
        }
    }

    /// Run a built-in through the protocol runtime
    rpc_result<value> delegate(std::string_view method, const params& args) {
        auto response = runtime_.process(codec_->encode_request(method, args));
        try {
            value result = codec_->decode_response(response);
            if (auto f = fault::from_value(result)) {
                return rpc_result<value>(std::move(*f));
            }
            return rpc_result<value>(std::move(result));
        } catch (const parse_error& e) {
            RIVET_LOG_ERROR("Protocol runtime answered {} with a malformed response: {}",
                            method, e.what());
            return rpc_result<value>(fault(error_code::internal_error, e.what()));
        }
    }

    /// system.multiCall: one result per entry, in order. A nested
    /// system.multiCall fails the whole batch before anything runs.
    value multi_call(const params& args) {
        if (args.size() != 1 || !args[0].is_array()) {
            return make_fault(error_code::invalid_batch_argument,
                              "Illegal or no params set for system.multiCall");
        }
        const auto& entries = args[0].as_array();
        for (const auto& entry : entries) {
            const value* name = entry.is_struct() ? entry.find(batch_method_key) : nullptr;
            if (name && name->is_string() && name->as_string() == batch_method) {
                RIVET_LOG_WARNING("Rejected nested {}", batch_method);
                return recursion_fault().to_value();
            }
        }

        value::array results;
        results.reserve(entries.size());
        for (size_t i = 0; i < entries.size(); ++i) {
            const auto& entry = entries[i];
            const value* name = entry.is_struct() ? entry.find(batch_method_key) : nullptr;
            if (!name || !name->is_string()) {
                results.push_back(make_fault(error_code::invalid_request,
                                             fmt::format("Batch entry {} has no methodName", i)));
                continue;
            }

            params call_args;
            if (const value* p = entry.find(batch_params_key)) {
                if (p->is_array()) call_args = p->as_array();
                else call_args.push_back(*p);
            }

            auto result = call(name->as_string(), call_args);
            if (result.ok()) {
                results.push_back(value::array{std::move(*result)});
            } else {
                results.push_back(result.error().to_value());
            }
        }
        return value(std::move(results));
    }

    server_options options_;
    std::shared_ptr<codec> codec_;
    protocol_runtime runtime_;
    std::shared_ptr<documentor> documentor_;
    std::map<std::string, method_entry, std::less<>> methods_;
};

// ============================================================================
// html_documentor (needs the complete server)
// ============================================================================

inline std::string html_documentor::handle(server& srv) {
    auto esc = [](std::string_view text) { return xml::escape_text(text, xml::escaping::markup); };

    std::string page = "<html><head><title>" + esc(options_.name) + "</title>";
    if (!options_.css.empty()) {
        page += "<link rel=\"stylesheet\" type=\"text/css\" href=\"" +
                xml::escape_attribute(options_.css) + "\">";
    }
    page += "</head><body><h1>" + esc(options_.name) + "</h1>";
    page += "<p>" + dialect_blurb(options_.version) + "</p>";
    page += "<ul><li><a href=\"" + xml::escape_attribute(options_.root) +
            "?introspection\">Introspection Description</a></li></ul>";

    auto names = srv.call("system.listMethods");
    if (!names.ok()) {
        RIVET_LOG_ERROR("Documentor could not list methods: {}", names.error().message);
        return page + "</body></html>";
    }
    if (!names->is_array()) {
        RIVET_LOG_ERROR("Documentor could not list methods: got {}", names->type_name());
        return page + "</body></html>";
    }

    for (const auto& name : names->as_array()) {
        if (!name.is_string()) continue;
        page += "<h2>" + esc(name.as_string()) + "( ";
        auto sig = srv.call("system.methodSignature", {name});
        if (sig.ok() && sig->is_array() && sig->size() > 0 && (*sig)[0].is_array()) {
            std::string types;
            for (const auto& t : (*sig)[0].as_array()) {
                if (!types.empty()) types += " , ";
                types += t.is_string() ? t.as_string() : t.dump();
            }
            page += esc(types);
        }
        page += " )</h2>";

        auto help = srv.call("system.methodHelp", {name});
        page += "<p>";
        if (help.ok() && help->is_string()) page += esc(help->as_string());
        page += "</p>";
    }
    page += "</body></html>";
    return page;
}

} // namespace rivet::rpc
