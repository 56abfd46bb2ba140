/**
 * @file parallel_patterns.hpp
 * @brief Fan-out / fan-in helpers built on Engine::submit.
 * @author Dimitris Kafetzis
 *
 * None of these helpers block: they submit tasks and return handles. Call
 * Engine::get or Engine::get_many on the result to wait.
 *
 *   map_parallel          one task per input, handles in input order
 *   reduce_parallel       left fold, critical path n-1
 *   reduce_parallel_tree  pairwise levels, critical path ceil(log2 n)
 *
 * The tree form requires the combining function to be associative and
 * commutative. An empty input is rejected with an Error.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "engine/engine.hpp"
#include "engine/object_ref.hpp"
#include "engine/remote_function.hpp"

#include <concepts>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace task_fabric {

// ─────────────────────────────────────────────
// Map
// ─────────────────────────────────────────────

/**
 * @brief Submit fn(input) for every input. Inputs may be values or ObjectRefs.
 *
 * If a submission is rejected the error is returned; tasks already
 * submitted keep running.
 */
template <typename R, typename P, typename In>
    requires ArgumentFor<const In&, P>
Result<std::vector<ObjectRef<R>>> map_parallel(Engine& engine,
                                               const RemoteFunction<R(P)>& fn,
                                               const std::vector<In>& inputs) {
    std::vector<ObjectRef<R>> refs;
    refs.reserve(inputs.size());
    for (const auto& input : inputs) {
        auto ref = engine.submit(fn, input);
        if (!ref) return ref.error();
        refs.push_back(*ref);
    }
    return refs;
}

// ─────────────────────────────────────────────
// Reduce
// ─────────────────────────────────────────────

/// A binary combining function over T, whatever its parameter qualifiers.
template <typename T, typename A, typename B>
concept CombinerOver =
    std::same_as<std::decay_t<A>, T> && std::same_as<std::decay_t<B>, T>;

namespace detail {

template <typename T>
Result<std::vector<ObjectRef<T>>> put_all(Engine& engine, const std::vector<T>& values) {
    std::vector<ObjectRef<T>> refs;
    refs.reserve(values.size());
    for (const auto& value : values) {
        auto ref = engine.put(value);
        if (!ref) return ref.error();
        refs.push_back(*ref);
    }
    return refs;
}

inline Error empty_reduce(const std::string& helper, const std::string& fn_name) {
    return Error{helper + " of '" + fn_name + "' over an empty sequence"};
}

}  // namespace detail

/**
 * @brief Chain reduce: ((x0 + x1) + x2) + ... with one task per step.
 */
template <typename T, typename A, typename B>
    requires CombinerOver<T, A, B>
Result<ObjectRef<T>> reduce_parallel(Engine& engine,
                                     const RemoteFunction<T(A, B)>& fn,
                                     const std::vector<ObjectRef<T>>& items) {
    if (items.empty()) {
        return detail::empty_reduce("reduce_parallel", fn.name());
    }

    ObjectRef<T> accumulated = items.front();
    for (size_t i = 1; i < items.size(); ++i) {
        auto next = engine.submit(fn, accumulated, items[i]);
        if (!next) return next.error();
        accumulated = *next;
    }
    return accumulated;
}

template <typename T, typename A, typename B>
    requires CombinerOver<T, A, B>
Result<ObjectRef<T>> reduce_parallel(Engine& engine,
                                     const RemoteFunction<T(A, B)>& fn,
                                     const std::vector<T>& values) {
    if (values.empty()) {
        return detail::empty_reduce("reduce_parallel", fn.name());
    }
    auto refs = detail::put_all(engine, values);
    if (!refs) return refs.error();
    return reduce_parallel(engine, fn, *refs);
}

/**
 * @brief Tree reduce: combine adjacent pairs level by level.
 *
 * An odd element at the end of a level is carried unchanged to the next.
 * Siblings on one level are independent, so up to n/2 combines can run at
 * once.
 */
template <typename T, typename A, typename B>
    requires CombinerOver<T, A, B>
Result<ObjectRef<T>> reduce_parallel_tree(Engine& engine,
                                          const RemoteFunction<T(A, B)>& fn,
                                          const std::vector<ObjectRef<T>>& items) {
    if (items.empty()) {
        return detail::empty_reduce("reduce_parallel_tree", fn.name());
    }

    std::vector<ObjectRef<T>> level = items;
    while (level.size() > 1) {
        std::vector<ObjectRef<T>> next;
        next.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i + 1 < level.size(); i += 2) {
            auto combined = engine.submit(fn, level[i], level[i + 1]);
            if (!combined) return combined.error();
            next.push_back(*combined);
        }
        if (level.size() % 2 == 1) {
            next.push_back(level.back());
        }
        level = std::move(next);
    }
    return level.front();
}

template <typename T, typename A, typename B>
    requires CombinerOver<T, A, B>
Result<ObjectRef<T>> reduce_parallel_tree(Engine& engine,
                                          const RemoteFunction<T(A, B)>& fn,
                                          const std::vector<T>& values) {
    if (values.empty()) {
        return detail::empty_reduce("reduce_parallel_tree", fn.name());
    }
    auto refs = detail::put_all(engine, values);
    if (!refs) return refs.error();
    return reduce_parallel_tree(engine, fn, *refs);
}

}  // namespace task_fabric
