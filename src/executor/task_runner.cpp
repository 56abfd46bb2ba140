/**
 * @file task_runner.cpp
 * @brief TaskRunner implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/task_runner.hpp"
#include "core/result.hpp"

#include <chrono>
#include <exception>

namespace task_fabric {

ExecutionResult TaskRunner::execute(Task& task) {
    std::vector<Value> values;
    values.reserve(task.args.size());
    for (auto& arg : task.args) {
        auto* value = std::get_if<Value>(&arg);
        if (!value) {
            throw InvariantViolation("task " + describe(task)
                                     + " dispatched with an unresolved future argument");
        }
        values.push_back(std::move(*value));
    }

    auto start = std::chrono::steady_clock::now();
    ExecutionResult result{
        .task_id = task.id,
        .task_name = task.name,
        .final_state = TaskState::Resolved,
        .actual_duration = Duration{0},
        .value = {},
        .error_message = std::nullopt
    };

    try {
        result.value = task.function(values);
    } catch (const std::exception& e) {
        result.final_state = TaskState::Failed;
        result.error_message = task.name + " failed: " + e.what();
    } catch (...) {
        result.final_state = TaskState::Failed;
        result.error_message = task.name + " failed: unknown exception";
    }

    auto end = std::chrono::steady_clock::now();
    result.actual_duration = std::chrono::duration_cast<Duration>(end - start);
    return result;
}

}  // namespace task_fabric
