#pragma once

/// @file xmlrpc_codec.hpp
/// @brief XML-RPC envelope codec on top of xmlrpc-c
///
/// xmlrpc-c generates and parses the envelopes; this codec converts
/// between rpc::value and xmlrpc_c::value and applies the output
/// options to what xmlrpc-c writes. Integers outside the 32-bit range
/// travel as <i8>, nil as <nil/>; the "ex:" forms are accepted on input.
///
/// Request, pretty layout:
/// @code
/// <?xml version="1.0" encoding="UTF-8"?>
/// <methodCall>
///   <methodName>examples.echo</methodName>
///   <params>
///     <param><value><i4>1</i4></value></param>
///   </params>
/// </methodCall>
/// @endcode

#include "codec.hpp"

#include <rivet/xml/xml_format.hpp>

#include <xmlrpc-c/base.hpp>
#include <xmlrpc-c/girerr.hpp>
#include <xmlrpc-c/xml.hpp>

#include <cstdint>
#include <ctime>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace rivet::rpc {

// ============================================================================
// Value conversion
// ============================================================================

/// Convert to the xmlrpc-c representation.
/// @throws girerr::error if xmlrpc-c refuses the content
inline xmlrpc_c::value to_xmlrpc_c(const value& v) {
    switch (v.type()) {
        case value_type::nil:
            return xmlrpc_c::value_nil();
        case value_type::boolean:
            return xmlrpc_c::value_boolean(v.as_bool());
        case value_type::integer: {
            auto i = v.as_int();
            if (i >= std::numeric_limits<int32_t>::min() &&
                i <= std::numeric_limits<int32_t>::max()) {
                return xmlrpc_c::value_int(static_cast<int>(i));
            }
            return xmlrpc_c::value_i8(static_cast<xmlrpc_int64>(i));
        }
        case value_type::double_:
            return xmlrpc_c::value_double(v.as_double());
        case value_type::string:
            return xmlrpc_c::value_string(v.as_string());
        case value_type::binary: {
            const auto& bytes = v.as_binary().bytes;
            return xmlrpc_c::value_bytestring(
                std::vector<unsigned char>(bytes.begin(), bytes.end()));
        }
        case value_type::datetime: {
            const auto& dt = v.as_datetime();
            if (auto seconds = dt.try_timestamp()) {
                return xmlrpc_c::value_datetime(static_cast<time_t>(*seconds));
            }
            return xmlrpc_c::value_datetime(dt.iso8601());
        }
        case value_type::array: {
            std::vector<xmlrpc_c::value> items;
            items.reserve(v.size());
            for (const auto& item : v.as_array()) {
                items.push_back(to_xmlrpc_c(item));
            }
            return xmlrpc_c::value_array(items);
        }
        case value_type::structure: {
            std::map<std::string, xmlrpc_c::value> members;
            for (const auto& [key, member] : v.as_struct()) {
                members.emplace(key, to_xmlrpc_c(member));
            }
            return xmlrpc_c::value_struct(members);
        }
    }
    return xmlrpc_c::value_nil();
}

/// Convert from the xmlrpc-c representation.
/// @throws parse_error for types with no XML-RPC wire form
inline value from_xmlrpc_c(const xmlrpc_c::value& v) {
    switch (v.type()) {
        case xmlrpc_c::value::TYPE_INT:
            return static_cast<int64_t>(static_cast<int>(xmlrpc_c::value_int(v)));
        case xmlrpc_c::value::TYPE_I8:
            return static_cast<int64_t>(static_cast<xmlrpc_int64>(xmlrpc_c::value_i8(v)));
        case xmlrpc_c::value::TYPE_BOOLEAN:
            return static_cast<bool>(xmlrpc_c::value_boolean(v));
        case xmlrpc_c::value::TYPE_DOUBLE:
            return static_cast<double>(xmlrpc_c::value_double(v));
        case xmlrpc_c::value::TYPE_STRING:
            return static_cast<std::string>(xmlrpc_c::value_string(v));
        case xmlrpc_c::value::TYPE_NIL:
            return value{};
        case xmlrpc_c::value::TYPE_BYTESTRING: {
            auto bytes = xmlrpc_c::value_bytestring(v).vectorUcharValue();
            return binary{std::string(bytes.begin(), bytes.end())};
        }
        case xmlrpc_c::value::TYPE_DATETIME:
            return make_datetime(
                static_cast<int64_t>(static_cast<time_t>(xmlrpc_c::value_datetime(v))));
        case xmlrpc_c::value::TYPE_ARRAY: {
            value::array items;
            for (const auto& item : xmlrpc_c::value_array(v).vectorValueValue()) {
                items.push_back(from_xmlrpc_c(item));
            }
            return items;
        }
        case xmlrpc_c::value::TYPE_STRUCT: {
            value::structure members;
            std::map<std::string, xmlrpc_c::value> native = xmlrpc_c::value_struct(v);
            for (const auto& [key, member] : native) {
                members.insert_or_assign(key, from_xmlrpc_c(member));
            }
            return members;
        }
        default:
            throw parse_error(fmt::format("Unsupported xmlrpc-c value type {}",
                                          static_cast<int>(v.type())));
    }
}

// ============================================================================
// Codec
// ============================================================================

class xmlrpc_codec : public codec {
public:
    explicit xmlrpc_codec(output_options options = {})
        : options_(std::move(options)) {}

    dialect version() const noexcept override { return dialect::xmlrpc; }

    std::string_view content_type() const noexcept override { return "text/xml"; }

    const output_options& options() const noexcept { return options_; }

    std::string encode_request(std::string_view method, const params& args) const override {
        try {
            xmlrpc_c::paramList list;
            for (const auto& arg : args) {
                list.add(to_xmlrpc_c(arg));
            }
            std::string xml;
            xmlrpc_c::xml::generateCall(std::string(method), list, &xml);
            return finish(xml);
        } catch (const girerr::error& e) {
            throw error(error_code::internal_error,
                        fmt::format("Cannot encode call to {}: {}", method, e.what()));
        }
    }

    std::string encode_response(const value& result) const override {
        if (auto f = fault::from_value(result)) {
            return encode_fault(*f);
        }
        try {
            std::string xml;
            xmlrpc_c::xml::generateResponse(xmlrpc_c::rpcOutcome(to_xmlrpc_c(result)), &xml);
            return finish(xml);
        } catch (const girerr::error& e) {
            throw error(error_code::internal_error,
                        fmt::format("Cannot encode response: {}", e.what()));
        }
    }

    std::string encode_fault(const fault& f) const override {
        try {
            std::string xml;
            xmlrpc_c::fault native(f.message, static_cast<xmlrpc_c::fault::code_t>(f.code));
            xmlrpc_c::xml::generateResponse(xmlrpc_c::rpcOutcome(native), &xml);
            return finish(xml);
        } catch (const girerr::error& e) {
            throw error(error_code::internal_error,
                        fmt::format("Cannot encode fault {}: {}", f.code, e.what()));
        }
    }

    method_call decode_request(std::string_view payload) const override {
        std::string name;
        xmlrpc_c::paramList list;
        try {
            xmlrpc_c::xml::parseCall(std::string(payload), &name, &list);
        } catch (const girerr::error& e) {
            throw parse_error(fmt::format("Malformed XML: {}", e.what()));
        }
        if (name.empty()) {
            throw parse_error("Request has no <methodName>");
        }

        method_call call;
        call.name = std::move(name);
        call.args.reserve(list.size());
        for (unsigned int i = 0; i < list.size(); ++i) {
            call.args.push_back(from_xmlrpc_c(list[i]));
        }
        return call;
    }

    value decode_response(std::string_view payload) const override {
        xmlrpc_c::rpcOutcome outcome;
        try {
            xmlrpc_c::xml::parseResponse(std::string(payload), &outcome);
        } catch (const girerr::error& e) {
            throw parse_error(fmt::format("Malformed XML: {}", e.what()));
        }
        if (!outcome.succeeded()) {
            auto native = outcome.getFault();
            return make_fault(static_cast<int>(native.getCode()), native.getDescription());
        }
        return from_xmlrpc_c(outcome.getResult());
    }

private:
    /// Apply the escaping and layout options to xmlrpc-c output
    std::string finish(const std::string& generated) const {
        auto extra = options_.escape & ~xml::escaping::markup;
        if (extra == xml::escaping::none) {
            return xml::relayout(generated, options_.layout);
        }
        return xml::relayout(xml::escape_text(generated, extra), options_.layout);
    }

    output_options options_;
};

} // namespace rivet::rpc
