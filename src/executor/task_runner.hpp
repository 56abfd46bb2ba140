/**
 * @file task_runner.hpp
 * @brief Runs one ready task's payload and captures its outcome.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "workload/task.hpp"

#include <optional>
#include <string>

namespace task_fabric {

struct ExecutionResult {
    TaskId task_id;
    std::string task_name;
    TaskState final_state;
    Duration actual_duration;
    Value value;                                ///< Set when final_state == Resolved
    std::optional<std::string> error_message;   ///< Set when final_state == Failed
};

/**
 * @brief Executes a task's payload with its resolved arguments.
 *
 * Payload failures (anything thrown) are converted into a Failed result and
 * never escape. A task that still holds an unresolved future argument is an
 * engine bug and raises InvariantViolation.
 */
class TaskRunner {
public:
    ExecutionResult execute(Task& task);
};

}  // namespace task_fabric
