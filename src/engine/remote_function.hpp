/**
 * @file remote_function.hpp
 * @brief Named payload references accepted by Engine::submit.
 * @author Dimitris Kafetzis
 *
 * A RemoteFunction wraps a callable with a fixed signature and a name used
 * in logs and error messages. It is a distinct type from the callable it
 * wraps: submission only accepts RemoteFunctions, so "is this a task
 * payload?" is answered at compile time.
 *
 *   auto increment = remote("increment", [](int x) { return x + 1; });
 *   auto add = remote<int(int, int)>("add", std::plus<int>{});
 */

#pragma once

#include "core/concepts.hpp"
#include "core/types.hpp"
#include "workload/task.hpp"

#include <any>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace task_fabric {

namespace detail {

// Signature of most function-like types: free functions, function pointers,
// and classes with a single non-template call operator (lambdas).
template <typename T>
struct strip_class {};
template <typename C, typename R, typename... A>
struct strip_class<R (C::*)(A...)> { using type = R(A...); };
template <typename C, typename R, typename... A>
struct strip_class<R (C::*)(A...) const> { using type = R(A...); };
template <typename C, typename R, typename... A>
struct strip_class<R (C::*)(A...) noexcept> { using type = R(A...); };
template <typename C, typename R, typename... A>
struct strip_class<R (C::*)(A...) const noexcept> { using type = R(A...); };

template <typename T>
struct signature_of {
    using type = typename strip_class<decltype(&T::operator())>::type;
};
template <typename R, typename... A>
struct signature_of<R(A...)> { using type = R(A...); };
template <typename R, typename... A>
struct signature_of<R (*)(A...)> { using type = R(A...); };
template <typename R, typename... A>
struct signature_of<R (*)(A...) noexcept> { using type = R(A...); };

template <typename F>
using signature_t = typename signature_of<std::decay_t<F>>::type;

}  // namespace detail

template <typename Signature>
class RemoteFunction;

/**
 * @brief Payload reference with signature R(Args...).
 */
template <typename R, typename... Args>
class RemoteFunction<R(Args...)> {
    static_assert(StorableValue<R>, "remote functions must return a copyable value");
    static_assert((StorableValue<std::decay_t<Args>> && ...),
                  "remote function parameters must be copyable values");
    static_assert(((!std::is_lvalue_reference_v<Args>
                    || std::is_const_v<std::remove_reference_t<Args>>) && ...),
                  "remote function parameters cannot be non-const references");

public:
    using result_type = R;
    static constexpr size_t arity = sizeof...(Args);

    RemoteFunction() = default;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(fn_); }

    /// Lower to the untyped payload form run by the worker pool.
    [[nodiscard]] Payload erase() const {
        return [fn = fn_, name = name_](std::vector<Value>& args) -> Value {
            if (args.size() != sizeof...(Args)) {
                throw std::invalid_argument(name + " expects " + std::to_string(sizeof...(Args))
                                            + " arguments, got " + std::to_string(args.size()));
            }
            return invoke(fn, args, std::index_sequence_for<Args...>{});
        };
    }

private:
    template <typename Signature, typename F>
    friend RemoteFunction<Signature> remote(std::string name, F&& callable);

    RemoteFunction(std::string name, std::function<R(Args...)> fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    template <size_t... I>
    static Value invoke(const std::function<R(Args...)>& fn,
                        std::vector<Value>& args,
                        std::index_sequence<I...>) {
        return Value{fn(std::move(std::any_cast<std::decay_t<Args>&>(args[I]))...)};
    }

    std::string name_;
    std::function<R(Args...)> fn_;
};

/**
 * @brief Wrap a callable as a payload reference with an explicit signature.
 */
template <typename Signature, typename F>
RemoteFunction<Signature> remote(std::string name, F&& callable) {
    return RemoteFunction<Signature>(std::move(name), std::forward<F>(callable));
}

/**
 * @brief Wrap a callable as a payload reference, deducing its signature.
 *
 * Works for function pointers and lambdas with a single call operator. Use
 * the explicit-signature overload for generic lambdas and function objects.
 */
template <typename F>
    requires (!std::is_function_v<F>)
auto remote(std::string name, F&& callable) {
    return remote<detail::signature_t<F>>(std::move(name), std::forward<F>(callable));
}

}  // namespace task_fabric
