#pragma once

/// @file call.hpp
/// @brief Deferred call descriptors and the argument/reply wrappers
///
/// Inside a batch scope a client call is not sent; it returns a
/// descriptor instead. The descriptors are handed to system.multiCall,
/// which enrolls each one at a position in the batch and, once the
/// response arrives, stores the result in the descriptor and in the
/// variable bound to it.
///
/// @code
/// rpc::value title, size;
/// client.child("system").call("multiCall",
///     client.call("getTitle").bind(title),
///     client["files"].call("size", "README").bind(size));
/// @endcode

#include "rpc_error.hpp"
#include "value.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace rivet::rpc {

class namespace_node;

/// One deferred remote call
class call {
public:
    call(std::string method, params args)
        : method_(std::move(method)), args_(std::move(args)) {}

    call(const call&) = delete;
    call& operator=(const call&) = delete;

    const std::string& method() const noexcept { return method_; }
    const params& args() const noexcept { return args_; }

    /// Position in the batch, set at enrollment
    std::optional<size_t> index() const noexcept { return index_; }

    bool enrolled() const noexcept { return batch_ != 0; }
    bool completed() const noexcept { return result_.has_value(); }

    /// Result after the batch response was decoded
    const std::optional<value>& result() const noexcept { return result_; }

    /// Also store the result in `target` when the batch completes.
    /// The variable must outlive the batch call.
    call& bind(value& target) noexcept {
        target_ = &target;
        return *this;
    }

    /// Batch entry {methodName, params}
    value encode() const {
        return value::structure{
            {"methodName", method_},
            {"params", value::array(args_)},
        };
    }

private:
    friend class namespace_node;

    uint64_t batch() const noexcept { return batch_; }

    void enroll(uint64_t batch, size_t index) noexcept {
        batch_ = batch;
        index_ = index;
    }

    void complete(value result) {
        if (target_) *target_ = result;
        result_ = std::move(result);
    }

    std::string method_;
    params args_;
    std::optional<size_t> index_;
    uint64_t batch_ = 0;
    std::optional<value> result_;
    value* target_ = nullptr;
};

using call_ptr = std::shared_ptr<call>;

/// Build a descriptor by hand, outside any batch scope
inline call_ptr encode_call(std::string method, params args = {}) {
    return std::make_shared<call>(std::move(method), std::move(args));
}

/// Result of a client invocation: a value, or a descriptor when the
/// call was deferred into a batch
class reply {
public:
    reply(value v) : data_(std::move(v)) {}
    reply(call_ptr c) : data_(std::move(c)) {}

    bool deferred() const noexcept { return std::holds_alternative<call_ptr>(data_); }

    /// The descriptor of a deferred call, null otherwise
    call_ptr descriptor() const {
        if (auto* c = std::get_if<call_ptr>(&data_)) return *c;
        return nullptr;
    }

    /// The value of a completed call
    const value& get() const& {
        if (auto* v = std::get_if<value>(&data_)) return *v;
        throw invalid_argument(error_code::invalid_batch_argument,
                               fmt::format("Call to {} is deferred until the batch runs",
                                           std::get<call_ptr>(data_)->method()));
    }

    value get() && {
        if (auto* v = std::get_if<value>(&data_)) return std::move(*v);
        return std::as_const(*this).get();
    }

    /// Deferred: bind the descriptor's result to `target`.
    /// Immediate: assign the value to `target` now.
    reply& bind(value& target) {
        if (auto* c = std::get_if<call_ptr>(&data_)) {
            (*c)->bind(target);
        } else {
            target = std::get<value>(data_);
        }
        return *this;
    }

private:
    std::variant<value, call_ptr> data_;
};

/// A client call argument: a value, or a descriptor for system.multiCall
class argument {
public:
    template<typename T>
        requires std::constructible_from<value, T>
    argument(T&& v) : data_(value(std::forward<T>(v))) {}

    argument(call_ptr c) : data_(std::move(c)) {}

    argument(const reply& r) {
        if (r.deferred()) data_ = r.descriptor();
        else data_ = r.get();
    }

    bool is_call() const noexcept { return std::holds_alternative<call_ptr>(data_); }

    const call_ptr& descriptor() const { return std::get<call_ptr>(data_); }
    const value& get() const { return std::get<value>(data_); }

private:
    std::variant<value, call_ptr> data_;
};

} // namespace rivet::rpc
