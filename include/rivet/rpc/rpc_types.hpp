#pragma once

/// @file rpc_types.hpp
/// @brief Fault record and the result type used at the dispatch boundary

#include "rpc_error.hpp"
#include "value.hpp"

#include <optional>
#include <string>
#include <utility>

namespace rivet::rpc {

/// A remote procedure fault: {faultCode, faultString} on the wire
struct fault {
    int code = 0;
    std::string message;

    fault() = default;
    fault(int c, std::string msg) : code(c), message(std::move(msg)) {}
    fault(error_code c, std::string msg) : code(to_int(c)), message(std::move(msg)) {}

    value to_value() const { return make_fault(code, message); }

    /// Read a fault-shaped struct. A faultCode that is not an integer
    /// is reported as internal_error.
    static std::optional<fault> from_value(const value& v) {
        if (!is_fault(v)) return std::nullopt;
        const value& c = v["faultCode"];
        const value& s = v["faultString"];
        return fault(c.is_int() ? static_cast<int>(c.as_int()) : to_int(error_code::internal_error),
                     s.is_string() ? s.as_string() : s.dump());
    }

    bool operator==(const fault&) const = default;
};

/// RPC call result: a value or a fault
template<typename T>
class rpc_result {
public:
    rpc_result() = default;

    /// Construct success result
    explicit rpc_result(T val)
        : value_(std::move(val)) {}

    /// Construct fault result
    explicit rpc_result(fault f)
        : fault_(std::move(f)) {}

    /// Check if successful
    bool ok() const noexcept { return !fault_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    /// Get the fault (default-constructed if successful)
    const fault& error() const noexcept {
        static const fault none;
        return fault_ ? *fault_ : none;
    }

    /// Get value (throws remote_fault if this is a fault)
    T& value() & {
        if (!ok()) throw_fault();
        return value_;
    }
    const T& value() const& {
        if (!ok()) throw_fault();
        return value_;
    }
    T&& value() && {
        if (!ok()) throw_fault();
        return std::move(value_);
    }

    /// Get value or default
    template<typename U>
    T value_or(U&& default_value) const& {
        return ok() ? value_ : static_cast<T>(std::forward<U>(default_value));
    }

    /// Access value (undefined if fault)
    T* operator->() { return &value_; }
    const T* operator->() const { return &value_; }
    T& operator*() & { return value_; }
    const T& operator*() const& { return value_; }
    T&& operator*() && { return std::move(value_); }

private:
    [[noreturn]] void throw_fault() const {
        throw remote_fault(fault_->code, fault_->message);
    }

    T value_{};
    std::optional<fault> fault_;
};

} // namespace rivet::rpc
