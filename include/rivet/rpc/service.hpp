#pragma once

/// @file service.hpp
/// @brief Method handlers and service descriptors
///
/// A handler is anything callable. Handlers taking a single `params`
/// argument see the raw argument list; any other signature is typed:
/// each argument is converted with from_value and the result with
/// to_value.
///
/// @code
/// rpc::service files;
/// files.add("size", [](const std::string& path) { return file_size(path); },
///           "Size of a file in bytes", {"int", "string"});
/// files.add("stat", &store, &file_store::stat);
/// server.add_service(files, "files");
/// @endcode

#include "rpc_error.hpp"
#include "value.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace rivet::rpc {

/// Type-erased procedure
using method_handler = std::function<value(const params&)>;

namespace detail {

template<typename F>
struct callable_traits : callable_traits<decltype(&F::operator())> {};

template<typename R, typename... A>
struct callable_traits<R(A...)> {
    using result_type = R;
    using args_tuple = std::tuple<A...>;
};

template<typename R, typename... A>
struct callable_traits<R (*)(A...)> : callable_traits<R(A...)> {};

template<typename R, typename... A>
struct callable_traits<R (*)(A...) noexcept> : callable_traits<R(A...)> {};

template<typename C, typename R, typename... A>
struct callable_traits<R (C::*)(A...)> : callable_traits<R(A...)> {};

template<typename C, typename R, typename... A>
struct callable_traits<R (C::*)(A...) const> : callable_traits<R(A...)> {};

template<typename C, typename R, typename... A>
struct callable_traits<R (C::*)(A...) noexcept> : callable_traits<R(A...)> {};

template<typename C, typename R, typename... A>
struct callable_traits<R (C::*)(A...) const noexcept> : callable_traits<R(A...)> {};

/// True when the handler takes the raw argument list
template<typename Tuple>
constexpr bool is_raw_signature() {
    if constexpr (std::tuple_size_v<Tuple> == 1) {
        return std::is_same_v<std::remove_cvref_t<std::tuple_element_t<0, Tuple>>, params>;
    } else {
        return false;
    }
}

template<typename R, typename Invoke, typename... A>
value invoke_and_convert(Invoke& inv, A&&... args) {
    if constexpr (std::is_void_v<R>) {
        inv(std::forward<A>(args)...);
        return value{};
    } else {
        return to_value(inv(std::forward<A>(args)...));
    }
}

template<typename R, typename Tuple, typename Invoke, size_t... I>
value invoke_typed(Invoke& inv, const params& args, std::index_sequence<I...>) {
    return invoke_and_convert<R>(
        inv, from_value<std::remove_cvref_t<std::tuple_element_t<I, Tuple>>>(args[I])...);
}

/// Wrap an invoker whose parameter list is Tuple and result R
template<typename R, typename Tuple, typename Invoke>
method_handler wrap(Invoke inv) {
    return [inv = std::move(inv)](const params& args) mutable -> value {
        if constexpr (is_raw_signature<Tuple>()) {
            return invoke_and_convert<R>(inv, args);
        } else {
            constexpr size_t arity = std::tuple_size_v<Tuple>;
            if (args.size() != arity) {
                throw invalid_argument(error_code::invalid_params,
                                       fmt::format("Expected {} parameters, got {}",
                                                   arity, args.size()));
            }
            return invoke_typed<R, Tuple>(inv, args, std::make_index_sequence<arity>{});
        }
    };
}

} // namespace detail

/// Build a handler from a function, function pointer or lambda.
/// Generic lambdas are not supported; the signature must be concrete.
template<typename F>
method_handler make_handler(F&& fn) {
    using fn_type = std::decay_t<F>;
    using traits = detail::callable_traits<fn_type>;
    return detail::wrap<typename traits::result_type, typename traits::args_tuple>(
        fn_type(std::forward<F>(fn)));
}

/// Build a handler calling a member function on `object`.
/// The object must outlive the handler.
template<typename T, typename M>
    requires std::is_member_function_pointer_v<M>
method_handler make_handler(T* object, M method) {
    using traits = detail::callable_traits<M>;
    auto inv = [object, method](auto&&... args) -> decltype(auto) {
        return std::invoke(method, object, std::forward<decltype(args)>(args)...);
    };
    return detail::wrap<typename traits::result_type, typename traits::args_tuple>(inv);
}

/// One registered procedure
struct method_entry {
    std::string name;
    method_handler handler;
    std::string description;
    /// XML-RPC type names, return type first; empty when unknown
    std::vector<std::string> signature;
};

/// Explicit list of procedures registered together under one prefix
class service {
public:
    service() = default;

    service& add(method_entry entry) {
        methods_.push_back(std::move(entry));
        return *this;
    }

    template<typename F>
    service& add(std::string name, F&& fn, std::string description = {},
                 std::vector<std::string> signature = {}) {
        return add(method_entry{std::move(name), make_handler(std::forward<F>(fn)),
                                std::move(description), std::move(signature)});
    }

    template<typename T, typename M>
        requires std::is_member_function_pointer_v<M>
    service& add(std::string name, T* object, M method, std::string description = {},
                 std::vector<std::string> signature = {}) {
        return add(method_entry{std::move(name), make_handler(object, method),
                                std::move(description), std::move(signature)});
    }

    const std::vector<method_entry>& methods() const noexcept { return methods_; }
    bool empty() const noexcept { return methods_.empty(); }

private:
    std::vector<method_entry> methods_;
};

} // namespace rivet::rpc
