#pragma once

/// @file runtime.hpp
/// @brief Protocol runtime answering the system.* built-ins
///
/// The runtime works on encoded envelopes: the server re-encodes a call
/// it cannot resolve itself and hands the bytes here, the same way an
/// external protocol library would be driven. Procedure descriptions
/// come from an introspection callback.

#include "codec.hpp"
#include "introspection.hpp"
#include "rpc_protocol.hpp"
#include "rpc_types.hpp"

#include <rivet/log/macros.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rivet::rpc {

class protocol_runtime {
public:
    using introspection_fn = std::function<manifest()>;

    explicit protocol_runtime(std::shared_ptr<codec> c)
        : codec_(std::move(c)) {}

    /// Source of user procedure descriptions
    void set_introspection(introspection_fn fn) {
        introspection_ = std::move(fn);
    }

    /// Descriptions of the built-in procedures
    static const std::vector<method_description>& builtins() {
        static const std::vector<method_description> list = {
            {"system.describeMethods",
             "Fully describes the methods implemented by this XML-RPC server.",
             {"struct"}},
            {"system.getCapabilities",
             "Returns a struct describing the XML-RPC specifications supported by this server.",
             {"struct"}},
            {"system.listMethods",
             "This method lists all the methods that the XML-RPC server knows how to dispatch.",
             {"array"}},
            {"system.methodHelp",
             "Returns help text if defined for the method passed, otherwise returns an empty string.",
             {"string", "string"}},
            {"system.methodSignature",
             "Returns an array of known signatures (an array of arrays) for the method name passed. "
             "If no signatures are known, returns a none-array (test for type != array to detect "
             "missing signature).",
             {"array", "string"}},
            {std::string(batch_method),
             "Boxcar multiple RPC calls in one request. Each entry is a struct with methodName "
             "and params; the result holds one single-element array or fault per entry.",
             {"array", "array"}},
        };
        return list;
    }

    /// Process an encoded request and return the encoded response
    std::string process(std::string_view request) const {
        method_call call;
        try {
            call = codec_->decode_request(request);
        } catch (const parse_error& e) {
            return codec_->encode_fault(fault(error_code::parse_error, e.what()));
        }

        RIVET_LOG_DEBUG("runtime: {}", call.name);
        auto result = dispatch(call);
        if (!result.ok()) return codec_->encode_fault(result.error());
        return codec_->encode_response(*result);
    }

    /// User procedures plus built-ins
    manifest full_manifest() const {
        std::vector<method_description> all;
        if (introspection_) all = introspection_().methods();
        for (const auto& b : builtins()) {
            bool shadowed = false;
            for (const auto& m : all) {
                if (m.name == b.name) shadowed = true;
            }
            if (!shadowed) all.push_back(b);
        }
        return manifest(std::move(all));
    }

private:
    rpc_result<value> dispatch(const method_call& call) const {
        try {
            if (call.name == "system.listMethods") return list_methods();
            if (call.name == "system.methodHelp") return method_help(call.args);
            if (call.name == "system.methodSignature") return method_signature(call.args);
            if (call.name == "system.describeMethods") return describe_methods();
            if (call.name == "system.getCapabilities") return capabilities();
        } catch (const error& e) {
            return rpc_result<value>(fault(e.code(), e.what()));
        }
        return rpc_result<value>(fault(error_code::method_not_found,
                                       fmt::format("Procedure {} not found.", call.name)));
    }

    rpc_result<value> list_methods() const {
        value::array names;
        for (const auto& m : full_manifest().methods()) {
            names.emplace_back(m.name);
        }
        return rpc_result<value>(value(std::move(names)));
    }

    /// Look up the single method-name argument of methodHelp/methodSignature
    rpc_result<method_description> lookup(const params& args) const {
        if (args.size() != 1 || !args[0].is_string()) {
            return rpc_result<method_description>(
                fault(error_code::invalid_params, "Expected one string parameter: a method name"));
        }
        auto m = full_manifest();
        const auto* found = m.find(args[0].as_string());
        if (!found) {
            return rpc_result<method_description>(
                fault(error_code::method_not_found,
                      fmt::format("Procedure {} not found.", args[0].as_string())));
        }
        return rpc_result<method_description>(*found);
    }

    rpc_result<value> method_help(const params& args) const {
        auto m = lookup(args);
        if (!m) return rpc_result<value>(m.error());
        return rpc_result<value>(value(m->purpose));
    }

    static value signature_value(const method_description& m) {
        if (m.signature.empty()) return "undef";
        value::array types;
        for (const auto& t : m.signature) types.emplace_back(t);
        return value::array{value(std::move(types))};
    }

    rpc_result<value> method_signature(const params& args) const {
        auto m = lookup(args);
        if (!m) return rpc_result<value>(m.error());
        return rpc_result<value>(signature_value(*m));
    }

    rpc_result<value> describe_methods() const {
        value::array list;
        for (const auto& m : full_manifest().methods()) {
            list.emplace_back(value::structure{
                {"name", m.name},
                {"purpose", m.purpose},
                {"signatures", signature_value(m)},
            });
        }
        return rpc_result<value>(value(value::structure{{"methodList", std::move(list)}}));
    }

    static rpc_result<value> capabilities() {
        auto spec = [](const char* url, int version) {
            return value(value::structure{{"specUrl", url}, {"specVersion", version}});
        };
        return rpc_result<value>(value(value::structure{
            {"faults_interop",
             spec("http://xmlrpc-epi.sourceforge.net/specs/rfc.fault_codes.php", 20010516)},
            {"introspection",
             spec("http://xmlrpc-epi.sourceforge.net/specs/rfc.introspection.php", 20010516)},
            {"xmlrpc", spec("http://www.xmlrpc.com/spec", 1)},
        }));
    }

    std::shared_ptr<codec> codec_;
    introspection_fn introspection_;
};

} // namespace rivet::rpc
