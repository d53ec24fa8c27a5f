#pragma once

/// @file options.hpp
/// @brief Output options shared by the client and server codecs

#include <rivet/xml/xml_format.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace rivet::rpc {

using xml::escaping;
using xml::verbosity;

/// Protocol dialect. Only XML-RPC has a codec; the other tags are
/// recognised so configuration can name them and be refused.
enum class dialect {
    xmlrpc,
    simple,
    soap_1_1,
    auto_detect,  ///< Whatever dialect a codec exists for (XML-RPC)
};

inline const char* dialect_name(dialect d) {
    switch (d) {
        case dialect::xmlrpc: return "xmlrpc";
        case dialect::simple: return "simple";
        case dialect::soap_1_1: return "soap 1.1";
        case dialect::auto_detect: return "auto";
        default: return "unknown";
    }
}

inline std::optional<dialect> parse_dialect(std::string_view name) {
    if (name == "xmlrpc") return dialect::xmlrpc;
    if (name == "simple") return dialect::simple;
    if (name == "soap 1.1") return dialect::soap_1_1;
    if (name == "auto") return dialect::auto_detect;
    return std::nullopt;
}

inline std::optional<verbosity> parse_verbosity(std::string_view name) {
    if (name == "no_white_space") return verbosity::no_white_space;
    if (name == "newlines_only") return verbosity::newlines_only;
    if (name == "pretty") return verbosity::pretty;
    return std::nullopt;
}

/// Parse a comma separated list of "markup", "non-ascii" and "non-print"
inline std::optional<escaping> parse_escaping(std::string_view list) {
    escaping flags = escaping::none;
    while (!list.empty()) {
        auto comma = list.find(',');
        auto item = list.substr(0, comma);
        while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
        while (!item.empty() && item.back() == ' ') item.remove_suffix(1);

        if (item == "markup") flags = flags | escaping::markup;
        else if (item == "non-ascii") flags = flags | escaping::non_ascii;
        else if (item == "non-print") flags = flags | escaping::non_print;
        else if (!item.empty()) return std::nullopt;

        if (comma == std::string_view::npos) break;
        list.remove_prefix(comma + 1);
    }
    return flags;
}

/// How requests and responses are written
struct output_options {
    verbosity layout = verbosity::pretty;
    /// Markup is always escaped in envelopes; the other flags add
    /// numeric references on top
    escaping escape = escaping::markup;
    dialect version = dialect::xmlrpc;
    std::string encoding = "utf-8";

    /// Set an option by its textual name ("verbosity", "escaping",
    /// "version", "encoding"). Returns false for an unknown option or
    /// an unparsable value, leaving the options unchanged.
    bool set(std::string_view option, std::string_view val) {
        if (option == "verbosity") {
            auto v = parse_verbosity(val);
            if (!v) return false;
            layout = *v;
        } else if (option == "escaping") {
            auto e = parse_escaping(val);
            if (!e) return false;
            escape = *e;
        } else if (option == "version") {
            auto d = parse_dialect(val);
            if (!d) return false;
            version = *d;
        } else if (option == "encoding") {
            if (val.empty()) return false;
            encoding = std::string(val);
        } else {
            return false;
        }
        return true;
    }
};

} // namespace rivet::rpc
