/**
 * @file task.hpp
 * @brief Untyped task representation shared by the scheduler components.
 * @author Dimitris Kafetzis
 *
 * A Task is one deferred invocation of a type-erased payload. Its arguments
 * are either literal values or handles to futures produced by earlier tasks.
 * The typed front-end (RemoteFunction / ObjectRef) lowers into this form.
 */

#pragma once

#include "core/types.hpp"

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace task_fabric {

/// Type-erased payload: receives resolved argument values, returns one value
/// or throws to signal failure.
using Payload = std::function<Value(std::vector<Value>&)>;

/// A task argument: a literal value or a future still to be resolved.
using Argument = std::variant<Value, FutureId>;

/**
 * @brief A single unit of deferred work.
 */
struct Task {
    TaskId id;
    std::string name;
    Payload function;
    std::vector<Argument> args;
    SteadyTime submitted_at{};
};

[[nodiscard]] inline bool is_future(const Argument& arg) noexcept {
    return std::holds_alternative<FutureId>(arg);
}

/// Number of argument entries that reference a future.
[[nodiscard]] inline size_t count_future_args(const Task& task) noexcept {
    size_t n = 0;
    for (const auto& arg : task.args) {
        if (is_future(arg)) ++n;
    }
    return n;
}

/// Human-readable label used in logs: "name#slot.generation".
[[nodiscard]] inline std::string describe(const Task& task) {
    return task.name + "#" + to_string(task.id);
}

}  // namespace task_fabric
