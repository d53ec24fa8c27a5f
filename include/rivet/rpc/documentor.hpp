#pragma once

/// @file documentor.hpp
/// @brief Human-readable server documentation
///
/// The server hands the documentor a manifest snapshot on every request.
/// A GET without payload renders the documentation page; the
/// introspection query returns the manifest as XML.

#include "introspection.hpp"
#include "options.hpp"

#include <string>

namespace rivet::rpc {

class server;

/// Documentation generator interface
class documentor {
public:
    virtual ~documentor() = default;

    /// Replace the method snapshot
    virtual void set_method_data(manifest methods) = 0;

    /// Snapshot set by the last set_method_data
    virtual const manifest& method_data() const = 0;

    /// Render the documentation page for `srv`
    virtual std::string handle(server& srv) = 0;

    /// Introspection XML of the snapshot
    virtual std::string introspection() const = 0;
};

/// Options of the default HTML documentor
struct html_documentor_options {
    std::string name = "Rivet: Simple RPC Server";
    std::string css;                          ///< Stylesheet URL (empty = none)
    dialect version = dialect::auto_detect;   ///< Dialect described on the page
    std::string root;                         ///< Endpoint URL, prefix of the introspection link
};

/// Default documentor: one HTML page listing every procedure with its
/// signature and help text, gathered through the system.* built-ins
class html_documentor : public documentor {
public:
    explicit html_documentor(html_documentor_options options = {})
        : options_(std::move(options)) {}

    void set_method_data(manifest methods) override { methods_ = std::move(methods); }
    const manifest& method_data() const override { return methods_; }

    /// Defined in rpc_server.hpp
    std::string handle(server& srv) override;

    std::string introspection() const override { return methods_.to_xml(); }

    const html_documentor_options& options() const noexcept { return options_; }

    /// Sentence naming the dialect the server speaks. Only XML-RPC has a
    /// codec, so automatic detection describes XML-RPC too.
    static std::string dialect_blurb(dialect d) {
        switch (d) {
            case dialect::xmlrpc:
            case dialect::auto_detect:
                return "This server implements the "
                       "<a href=\"http://www.xmlrpc.com/spec\">XML-RPC specification</a>";
            case dialect::simple:
            case dialect::soap_1_1:
                break;
        }
        return {};
    }

private:
    html_documentor_options options_;
    manifest methods_;
};

} // namespace rivet::rpc
