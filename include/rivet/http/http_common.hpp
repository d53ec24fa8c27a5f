#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rivet::http {

/// HTTP methods the RPC endpoint distinguishes
enum class method {
    GET,
    HEAD,
    POST,
    OPTIONS,
    other,
};

inline constexpr std::string_view method_to_string(method m) noexcept {
    switch (m) {
        case method::GET:     return "GET";
        case method::HEAD:    return "HEAD";
        case method::POST:    return "POST";
        case method::OPTIONS: return "OPTIONS";
        case method::other:   return "OTHER";
    }
    return "OTHER";
}

inline method string_to_method(std::string_view str) noexcept {
    if (str == "GET")     return method::GET;
    if (str == "HEAD")    return method::HEAD;
    if (str == "POST")    return method::POST;
    if (str == "OPTIONS") return method::OPTIONS;
    return method::other;
}

/// HTTP status codes used by the client and server
enum class status : uint16_t {
    ok = 200,
    no_content = 204,
    bad_request = 400,
    not_found = 404,
    method_not_allowed = 405,
    request_timeout = 408,
    payload_too_large = 413,
    unsupported_media_type = 415,
    internal_server_error = 500,
    not_implemented = 501,
    service_unavailable = 503,
    http_version_not_supported = 505,
};

inline constexpr std::string_view status_reason(status s) noexcept {
    switch (s) {
        case status::ok: return "OK";
        case status::no_content: return "No Content";
        case status::bad_request: return "Bad Request";
        case status::not_found: return "Not Found";
        case status::method_not_allowed: return "Method Not Allowed";
        case status::request_timeout: return "Request Timeout";
        case status::payload_too_large: return "Payload Too Large";
        case status::unsupported_media_type: return "Unsupported Media Type";
        case status::internal_server_error: return "Internal Server Error";
        case status::not_implemented: return "Not Implemented";
        case status::service_unavailable: return "Service Unavailable";
        case status::http_version_not_supported: return "HTTP Version Not Supported";
    }
    return "Unknown";
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

/// HTTP header fields. Lookup ignores case; serialization keeps the
/// order in which fields were first set.
class headers {
public:
    using field = std::pair<std::string, std::string>;
    using const_iterator = std::vector<field>::const_iterator;

    headers() = default;

    /// Set a header (overwrites existing)
    void set(std::string_view name, std::string_view val) {
        if (auto* f = find(name)) {
            f->second = std::string(val);
        } else {
            fields_.emplace_back(std::string(name), std::string(val));
        }
    }

    /// Add a header (appends with comma if exists)
    void add(std::string_view name, std::string_view val) {
        if (auto* f = find(name)) {
            f->second += ", ";
            f->second += val;
        } else {
            fields_.emplace_back(std::string(name), std::string(val));
        }
    }

    /// Get a header value (or empty if not found)
    std::string_view get(std::string_view name) const {
        for (const auto& [key, val] : fields_) {
            if (iequals(key, name)) return val;
        }
        return {};
    }

    bool contains(std::string_view name) const {
        return std::any_of(fields_.begin(), fields_.end(),
                           [&](const field& f) { return iequals(f.first, name); });
    }

    void remove(std::string_view name) {
        std::erase_if(fields_, [&](const field& f) { return iequals(f.first, name); });
    }

    /// Content-Length, nullopt when absent or malformed
    std::optional<size_t> content_length() const {
        auto val = get("Content-Length");
        if (val.empty()) return std::nullopt;
        size_t len = 0;
        auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), len);
        if (ec != std::errc{} || ptr != val.data() + val.size()) return std::nullopt;
        return len;
    }

    void set_content_length(size_t len) {
        set("Content-Length", std::to_string(len));
    }

    std::string_view content_type() const {
        return get("Content-Type");
    }

    void set_content_type(std::string_view type) {
        set("Content-Type", type);
    }

    bool is_chunked() const {
        auto te = get("Transfer-Encoding");
        std::string lower;
        for (char c : te) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return lower.find("chunked") != std::string::npos;
    }

    void clear() { fields_.clear(); }
    size_t size() const noexcept { return fields_.size(); }
    bool empty() const noexcept { return fields_.empty(); }

    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }

    /// "Name: value\r\n" per field
    std::string serialize() const {
        std::string result;
        for (const auto& [name, val] : fields_) {
            result += name;
            result += ": ";
            result += val;
            result += "\r\n";
        }
        return result;
    }

private:
    field* find(std::string_view name) {
        for (auto& f : fields_) {
            if (iequals(f.first, name)) return &f;
        }
        return nullptr;
    }

    std::vector<field> fields_;
};

/// URL components of an RPC endpoint
struct url {
    std::string scheme;     ///< http or https
    std::string host;       ///< hostname or address literal
    uint16_t port = 0;      ///< port (0 = scheme default)
    std::string path;       ///< path including leading /
    std::string query;      ///< query string (without ?)
    std::string userinfo;   ///< username:password

    std::string path_with_query() const {
        std::string p = path.empty() ? "/" : path;
        if (!query.empty()) p += "?" + query;
        return p;
    }

    /// Host header value
    std::string authority() const {
        std::string result = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        if (port != 0 && port != default_port()) {
            result += ":" + std::to_string(port);
        }
        return result;
    }

    uint16_t effective_port() const {
        return port != 0 ? port : default_port();
    }

    uint16_t default_port() const {
        return scheme == "https" ? 443 : 80;
    }

    bool is_secure() const {
        return scheme == "https";
    }

    /// Parse an absolute http/https URL. A missing scheme means http.
    /// Fragments are dropped. Returns nullopt for any other scheme, an
    /// empty host or a malformed port.
    static std::optional<url> parse(std::string_view str) {
        url result;

        auto scheme_end = str.find("://");
        if (scheme_end == std::string_view::npos) {
            result.scheme = "http";
        } else {
            for (char c : str.substr(0, scheme_end)) {
                result.scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            str.remove_prefix(scheme_end + 3);
        }
        if (result.scheme != "http" && result.scheme != "https") {
            return std::nullopt;
        }

        if (auto frag_pos = str.find('#'); frag_pos != std::string_view::npos) {
            str = str.substr(0, frag_pos);
        }
        if (auto query_pos = str.find('?'); query_pos != std::string_view::npos) {
            result.query = std::string(str.substr(query_pos + 1));
            str = str.substr(0, query_pos);
        }
        if (auto path_pos = str.find('/'); path_pos != std::string_view::npos) {
            result.path = std::string(str.substr(path_pos));
            str = str.substr(0, path_pos);
        } else {
            result.path = "/";
        }
        if (auto at_pos = str.find('@'); at_pos != std::string_view::npos) {
            result.userinfo = std::string(str.substr(0, at_pos));
            str.remove_prefix(at_pos + 1);
        }

        std::string_view port_str;
        if (!str.empty() && str.front() == '[') {
            auto bracket_end = str.find(']');
            if (bracket_end == std::string_view::npos) return std::nullopt;
            result.host = std::string(str.substr(1, bracket_end - 1));
            str.remove_prefix(bracket_end + 1);
            if (!str.empty()) {
                if (str.front() != ':') return std::nullopt;
                port_str = str.substr(1);
            }
        } else if (auto colon_pos = str.rfind(':'); colon_pos != std::string_view::npos) {
            result.host = std::string(str.substr(0, colon_pos));
            port_str = str.substr(colon_pos + 1);
        } else {
            result.host = std::string(str);
        }

        if (!port_str.empty()) {
            auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(),
                                             result.port);
            if (ec != std::errc{} || ptr != port_str.data() + port_str.size()) {
                return std::nullopt;
            }
        }

        if (result.host.empty()) return std::nullopt;
        return result;
    }
};

/// Decode %XX escapes and '+' as space
inline std::string url_decode(std::string_view str) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hex(str[i + 1]);
            int lo = hex(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += str[i] == '+' ? ' ' : str[i];
    }
    return result;
}

/// Parse a query string into key-value pairs; a bare key maps to ""
inline std::map<std::string, std::string> parse_query_string(std::string_view query) {
    std::map<std::string, std::string> result;

    while (!query.empty()) {
        auto amp_pos = query.find('&');
        auto pair = query.substr(0, amp_pos);

        auto eq_pos = pair.find('=');
        if (eq_pos != std::string_view::npos) {
            result[url_decode(pair.substr(0, eq_pos))] = url_decode(pair.substr(eq_pos + 1));
        } else if (!pair.empty()) {
            result[url_decode(pair)] = "";
        }

        if (amp_pos == std::string_view::npos) break;
        query.remove_prefix(amp_pos + 1);
    }

    return result;
}

/// MIME types used by the RPC endpoint
namespace mime {
    inline constexpr std::string_view text_plain = "text/plain";
    inline constexpr std::string_view text_html = "text/html";
    inline constexpr std::string_view text_xml = "text/xml";
}

} // namespace rivet::http
