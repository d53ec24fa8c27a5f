#pragma once

/// @file value.hpp
/// @brief Dynamically typed XML-RPC value
///
/// A value holds one of the nine XML-RPC data types. Arrays and structs
/// nest values recursively. Values compare by content.
///
/// @code
/// rpc::value v = rpc::value::structure{
///     {"name", "widget"},
///     {"sizes", rpc::value::array{1, 2, 3}},
/// };
/// int64_t first = v["sizes"][0].as_int();
/// @endcode

#include "rpc_error.hpp"

#include <fmt/format.h>

#include <concepts>
#include <cstdint>
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace rivet::rpc {

/// Value type tags, in variant order
enum class value_type {
    nil,
    boolean,
    integer,
    double_,
    string,
    binary,
    datetime,
    array,
    structure,
};

/// XML-RPC type name used in signatures and on the wire
inline const char* value_type_name(value_type type) {
    switch (type) {
        case value_type::nil: return "nil";
        case value_type::boolean: return "boolean";
        case value_type::integer: return "int";
        case value_type::double_: return "double";
        case value_type::string: return "string";
        case value_type::binary: return "base64";
        case value_type::datetime: return "dateTime.iso8601";
        case value_type::array: return "array";
        case value_type::structure: return "struct";
        default: return "unknown";
    }
}

/// Opaque byte blob, encoded as <base64>
struct binary {
    std::string bytes;

    bool operator==(const binary&) const = default;
};

/// Point in time, encoded as <dateTime.iso8601> (YYYYMMDDTHH:MM:SS, UTC)
class datetime {
public:
    datetime() = default;

    /// Wrap the textual form as received; validated by timestamp()
    explicit datetime(std::string iso8601) : text_(std::move(iso8601)) {}

    /// Build from seconds since the epoch
    static datetime from_timestamp(int64_t seconds) {
        std::time_t t = static_cast<std::time_t>(seconds);
        std::tm tm{};
        gmtime_r(&t, &tm);
        return datetime(fmt::format("{:04d}{:02d}{:02d}T{:02d}:{:02d}:{:02d}",
                                    tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                                    tm.tm_hour, tm.tm_min, tm.tm_sec));
    }

    const std::string& iso8601() const noexcept { return text_; }

    /// Seconds since the epoch. Accepts the compact form and the
    /// dashed form (YYYY-MM-DDTHH:MM:SS) with an optional trailing 'Z'.
    int64_t timestamp() const {
        auto seconds = try_timestamp();
        if (!seconds) {
            throw invalid_argument(error_code::not_a_datetime,
                                   fmt::format("Malformed datetime '{}'", text_));
        }
        return *seconds;
    }

    /// As timestamp(), nullopt for text it cannot read (offsets,
    /// fractional seconds)
    std::optional<int64_t> try_timestamp() const {
        std::string digits;
        for (char c : text_) {
            if (c != '-' && c != ':') digits += c;
        }
        if (!digits.empty() && digits.back() == 'Z') digits.pop_back();

        // YYYYMMDDTHHMMSS
        if (digits.size() != 15 || digits[8] != 'T') return std::nullopt;
        for (size_t i = 0; i < digits.size(); ++i) {
            if (i != 8 && (digits[i] < '0' || digits[i] > '9')) return std::nullopt;
        }
        auto field = [&](size_t pos, size_t len) {
            int v = 0;
            for (size_t i = pos; i < pos + len; ++i) v = v * 10 + (digits[i] - '0');
            return v;
        };

        std::tm tm{};
        tm.tm_year = field(0, 4) - 1900;
        tm.tm_mon = field(4, 2) - 1;
        tm.tm_mday = field(6, 2);
        tm.tm_hour = field(9, 2);
        tm.tm_min = field(11, 2);
        tm.tm_sec = field(13, 2);
        return static_cast<int64_t>(timegm(&tm));
    }

    bool operator==(const datetime&) const = default;

private:
    std::string text_;
};

/// Dynamically typed RPC value
class value {
public:
    using array = std::vector<value>;
    using structure = std::map<std::string, value, std::less<>>;

    value() = default;
    value(std::nullptr_t) {}
    value(bool b) : data_(b) {}

    template<typename T>
        requires std::integral<T> && (!std::same_as<T, bool>)
    value(T i) : data_(static_cast<int64_t>(i)) {}

    template<std::floating_point T>
    value(T d) : data_(static_cast<double>(d)) {}

    value(const char* s) : data_(std::string(s)) {}
    value(std::string s) : data_(std::move(s)) {}
    value(std::string_view s) : data_(std::string(s)) {}
    value(binary b) : data_(std::move(b)) {}
    value(datetime d) : data_(std::move(d)) {}
    value(array a) : data_(std::move(a)) {}
    value(structure s) : data_(std::move(s)) {}

    value_type type() const noexcept {
        return static_cast<value_type>(data_.index());
    }

    const char* type_name() const { return value_type_name(type()); }

    bool is_nil() const noexcept { return type() == value_type::nil; }
    bool is_bool() const noexcept { return type() == value_type::boolean; }
    bool is_int() const noexcept { return type() == value_type::integer; }
    bool is_double() const noexcept { return type() == value_type::double_; }
    bool is_string() const noexcept { return type() == value_type::string; }
    bool is_binary() const noexcept { return type() == value_type::binary; }
    bool is_datetime() const noexcept { return type() == value_type::datetime; }
    bool is_array() const noexcept { return type() == value_type::array; }
    bool is_struct() const noexcept { return type() == value_type::structure; }

    bool as_bool() const { return get<bool>("boolean"); }
    int64_t as_int() const { return get<int64_t>("int"); }

    /// Integers widen to double
    double as_double() const {
        if (is_int()) return static_cast<double>(std::get<int64_t>(data_));
        return get<double>("double");
    }

    const std::string& as_string() const { return get<std::string>("string"); }
    const binary& as_binary() const { return get<binary>("base64"); }
    const datetime& as_datetime() const { return get<datetime>("dateTime.iso8601"); }
    const array& as_array() const { return get<array>("array"); }
    array& as_array() { return get<array>("array"); }
    const structure& as_struct() const { return get<structure>("struct"); }
    structure& as_struct() { return get<structure>("struct"); }

    /// Element count of an array or struct, 0 otherwise
    size_t size() const noexcept {
        if (auto* a = std::get_if<array>(&data_)) return a->size();
        if (auto* s = std::get_if<structure>(&data_)) return s->size();
        return 0;
    }

    const value& operator[](size_t index) const {
        const auto& a = as_array();
        if (index >= a.size()) {
            throw type_error(fmt::format("Array index {} out of range ({} elements)",
                                         index, a.size()));
        }
        return a[index];
    }

    const value& operator[](std::string_view key) const {
        const value* member = find(key);
        if (!member) {
            throw type_error(fmt::format("Struct has no member '{}'", key));
        }
        return *member;
    }

    /// Struct member lookup, nullptr if absent or not a struct
    const value* find(std::string_view key) const {
        auto* s = std::get_if<structure>(&data_);
        if (!s) return nullptr;
        auto it = s->find(key);
        return it == s->end() ? nullptr : &it->second;
    }

    bool contains(std::string_view key) const { return find(key) != nullptr; }

    /// Compact single-line rendering for logs and diagnostics
    std::string dump() const {
        std::string out;
        dump_to(out);
        return out;
    }

    bool operator==(const value&) const = default;

private:
    template<typename T>
    const T& get(const char* expected) const {
        if (auto* p = std::get_if<T>(&data_)) return *p;
        throw type_error(fmt::format("Expected {}, got {}", expected, type_name()));
    }

    template<typename T>
    T& get(const char* expected) {
        if (auto* p = std::get_if<T>(&data_)) return *p;
        throw type_error(fmt::format("Expected {}, got {}", expected, type_name()));
    }

    void dump_to(std::string& out) const {
        switch (type()) {
            case value_type::nil: out += "nil"; break;
            case value_type::boolean: out += as_bool() ? "true" : "false"; break;
            case value_type::integer: out += fmt::to_string(as_int()); break;
            case value_type::double_: out += fmt::format("{}", as_double()); break;
            case value_type::string: out += fmt::format("\"{}\"", as_string()); break;
            case value_type::binary:
                out += fmt::format("<{} bytes>", as_binary().bytes.size());
                break;
            case value_type::datetime: out += as_datetime().iso8601(); break;
            case value_type::array: {
                out += '[';
                bool first = true;
                for (const auto& item : as_array()) {
                    if (!first) out += ", ";
                    first = false;
                    item.dump_to(out);
                }
                out += ']';
                break;
            }
            case value_type::structure: {
                out += '{';
                bool first = true;
                for (const auto& [key, member] : as_struct()) {
                    if (!first) out += ", ";
                    first = false;
                    out += key;
                    out += ": ";
                    member.dump_to(out);
                }
                out += '}';
                break;
            }
        }
    }

    std::variant<std::monostate, bool, int64_t, double, std::string,
                 binary, datetime, array, structure> data_;
};

/// Positional call arguments
using params = std::vector<value>;

// ============================================================================
// Convenience constructors and conversions
// ============================================================================

/// Build a fault-shaped struct {faultCode, faultString}
inline value make_fault(int code, std::string message) {
    return value::structure{
        {"faultCode", code},
        {"faultString", std::move(message)},
    };
}

inline value make_fault(error_code code, std::string message) {
    return make_fault(to_int(code), std::move(message));
}

/// True for a struct carrying both faultCode and faultString
inline bool is_fault(const value& v) {
    return v.is_struct() && v.contains("faultCode") && v.contains("faultString");
}

inline value make_datetime(int64_t seconds) {
    return datetime::from_timestamp(seconds);
}

/// Seconds since the epoch of a datetime value
inline int64_t timestamp(const value& v) {
    if (!v.is_datetime()) {
        throw invalid_argument(error_code::not_a_datetime,
                               "Variable is not of type datetime");
    }
    return v.as_datetime().timestamp();
}

inline value make_binary(std::string bytes) {
    return binary{std::move(bytes)};
}

/// Raw bytes of a binary value
inline const std::string& binary_string(const value& v) {
    return v.as_binary().bytes;
}

// ============================================================================
// Native type mapping for typed handlers
// ============================================================================

template<typename T>
struct is_vector : std::false_type {};

template<typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template<typename T>
struct is_string_map : std::false_type {};

template<typename V, typename C, typename A>
struct is_string_map<std::map<std::string, V, C, A>> : std::true_type {};

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

/// Convert a value to a native type, throwing type_error on mismatch
template<typename T>
T from_value(const value& v) {
    if constexpr (std::is_same_v<T, value>) {
        return v;
    } else if constexpr (std::is_same_v<T, bool>) {
        return v.as_bool();
    } else if constexpr (std::is_integral_v<T>) {
        return static_cast<T>(v.as_int());
    } else if constexpr (std::is_floating_point_v<T>) {
        return static_cast<T>(v.as_double());
    } else if constexpr (std::is_same_v<T, std::string>) {
        return v.as_string();
    } else if constexpr (std::is_same_v<T, binary>) {
        return v.as_binary();
    } else if constexpr (std::is_same_v<T, datetime>) {
        return v.as_datetime();
    } else if constexpr (std::is_same_v<T, value::structure>) {
        return v.as_struct();
    } else if constexpr (is_optional<T>::value) {
        if (v.is_nil()) return std::nullopt;
        return from_value<typename T::value_type>(v);
    } else if constexpr (is_vector<T>::value) {
        T out;
        for (const auto& item : v.as_array()) {
            out.push_back(from_value<typename T::value_type>(item));
        }
        return out;
    } else if constexpr (is_string_map<T>::value) {
        T out;
        for (const auto& [key, member] : v.as_struct()) {
            out.emplace(key, from_value<typename T::mapped_type>(member));
        }
        return out;
    } else {
        static_assert(sizeof(T) == 0, "type has no XML-RPC mapping");
    }
}

/// Convert a native type to a value
template<typename T>
value to_value(T&& native) {
    using U = std::remove_cvref_t<T>;
    if constexpr (std::is_constructible_v<value, T>) {
        return value(std::forward<T>(native));
    } else if constexpr (is_optional<U>::value) {
        if (!native) return value{};
        return to_value(*std::forward<T>(native));
    } else if constexpr (is_vector<U>::value) {
        value::array out;
        out.reserve(native.size());
        for (auto& item : native) out.push_back(to_value(item));
        return out;
    } else if constexpr (is_string_map<U>::value) {
        value::structure out;
        for (auto& [key, member] : native) out.emplace(key, to_value(member));
        return out;
    } else {
        static_assert(sizeof(U) == 0, "type has no XML-RPC mapping");
    }
}

} // namespace rivet::rpc
