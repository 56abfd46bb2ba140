/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for TaskFabric's submission interface.
 * @author Dimitris Kafetzis
 *
 * Defines the compile-time constraints on what may be submitted: only
 * RemoteFunction payload references (never plain callables), and arguments
 * that are either values convertible to the parameter type or typed handles
 * to futures of exactly that type.
 */

#pragma once

#include <concepts>
#include <type_traits>

namespace task_fabric {

// Forward declarations
template <typename T>
class ObjectRef;

template <typename Signature>
class RemoteFunction;

// ─────────────────────────────────────────────
// Type Traits
// ─────────────────────────────────────────────

template <typename T>
struct is_object_ref : std::false_type {};

template <typename T>
struct is_object_ref<ObjectRef<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_object_ref_v = is_object_ref<std::remove_cvref_t<T>>::value;

template <typename T>
struct is_remote_function : std::false_type {};

template <typename Signature>
struct is_remote_function<RemoteFunction<Signature>> : std::true_type {};

// ─────────────────────────────────────────────
// RemotePayload
// ─────────────────────────────────────────────

/**
 * @concept RemotePayload
 * @brief A payload reference created by remote(); plain lambdas do not qualify.
 */
template <typename T>
concept RemotePayload = is_remote_function<std::remove_cvref_t<T>>::value;

// ─────────────────────────────────────────────
// ArgumentFor
// ─────────────────────────────────────────────

/**
 * @concept ArgumentFor
 * @brief Arg may be passed for a parameter of type Param.
 *
 * Either a handle to a future of the parameter's decayed type, or a literal
 * convertible to it.
 */
template <typename Arg, typename Param>
concept ArgumentFor =
    std::same_as<std::remove_cvref_t<Arg>, ObjectRef<std::decay_t<Param>>>
    || (!is_object_ref_v<Arg> && std::convertible_to<Arg, std::decay_t<Param>>);

/**
 * @concept StorableValue
 * @brief Values that can live in the FutureStore (type-erased, copyable).
 */
template <typename T>
concept StorableValue =
    std::is_object_v<T> && std::copy_constructible<T> && !std::is_void_v<T>;

}  // namespace task_fabric
