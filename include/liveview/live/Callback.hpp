#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

namespace LV::Live {

// Server-side handler reachable from the client. Receives the positional arguments as a
// JSON array, empty when the client sent none.
using Callback = std::function<void(nlohmann::json const& args)>;

namespace detail {

template <typename... Args, typename Fn, std::size_t... I>
void invoke_with_args(Fn& fn, nlohmann::json const& args, std::index_sequence<I...>) {
    constexpr std::size_t arity = sizeof...(Args);
    if constexpr (arity > 0) {
        if (!args.is_array()) {
            throw std::invalid_argument("callback arguments must be a JSON array");
        }
        if (args.size() < arity) {
            throw std::invalid_argument("callback expects " + std::to_string(arity) + " argument(s), got "
                                        + std::to_string(args.size()));
        }
    }
    fn(args.at(I).template get<std::decay_t<Args>>()...);
}

} // namespace detail

// Adapts a typed handler to a Callback. Arguments are converted with nlohmann::json's get<T>();
// a conversion failure throws, which dispatch reports as a failed invocation.
template <typename... Args, typename Fn>
auto make_callback(Fn&& fn) -> Callback {
    return [handler = std::forward<Fn>(fn)](nlohmann::json const& args) mutable {
        detail::invoke_with_args<Args...>(handler, args, std::index_sequence_for<Args...>{});
    };
}

} // namespace LV::Live
