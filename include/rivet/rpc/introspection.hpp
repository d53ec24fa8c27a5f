#pragma once

/// @file introspection.hpp
/// @brief Machine-readable description of a server's procedures

#include <rivet/xml/xml_format.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace rivet::rpc {

/// One procedure as seen by introspection
struct method_description {
    std::string name;
    std::string purpose;
    /// XML-RPC type names, return type first; empty when unknown
    std::vector<std::string> signature;
};

/// Snapshot of every registered procedure, sorted by name
class manifest {
public:
    manifest() = default;
    explicit manifest(std::vector<method_description> methods)
        : methods_(std::move(methods)) {
        std::sort(methods_.begin(), methods_.end(),
                  [](const auto& a, const auto& b) { return a.name < b.name; });
    }

    const std::vector<method_description>& methods() const noexcept { return methods_; }
    bool empty() const noexcept { return methods_.empty(); }
    size_t size() const noexcept { return methods_.size(); }

    const method_description* find(std::string_view name) const {
        auto it = std::lower_bound(methods_.begin(), methods_.end(), name,
                                   [](const auto& m, std::string_view n) { return m.name < n; });
        if (it == methods_.end() || it->name != name) return nullptr;
        return &*it;
    }

    /// Render the introspection document:
    /// <introspection version='1.0'><methodList><methodDescription name='...'>
    /// <purpose>...</purpose>[<signatures>...]</methodDescription>...
    std::string to_xml() const {
        std::string out = "<?xml version='1.0' ?><introspection version='1.0'><methodList>";
        for (const auto& m : methods_) {
            out += "<methodDescription name='";
            out += xml::escape_attribute(m.name);
            out += "'><purpose>";
            out += xml::escape_text(m.purpose, xml::escaping::markup);
            out += "</purpose>";
            if (!m.signature.empty()) {
                out += "<signatures><signature><returns><value type='";
                out += xml::escape_attribute(m.signature.front());
                out += "'/></returns><params>";
                for (size_t i = 1; i < m.signature.size(); ++i) {
                    out += "<value type='";
                    out += xml::escape_attribute(m.signature[i]);
                    out += "'/>";
                }
                out += "</params></signature></signatures>";
            }
            out += "</methodDescription>";
        }
        out += "</methodList></introspection>";
        return out;
    }

private:
    std::vector<method_description> methods_;
};

} // namespace rivet::rpc
