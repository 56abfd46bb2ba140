/**
 * @file dependency_tracker.hpp
 * @brief Tracks unresolved future arguments of registered tasks.
 * @author Dimitris Kafetzis
 *
 * A task is held here from registration until its last future argument
 * resolves, at which point it is handed to the ready callback with every
 * argument replaced by its value. A task with a Failed dependency is handed
 * to the failure callback instead and never becomes ready.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "store/future_store.hpp"
#include "workload/task.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace task_fabric {

class DependencyTracker {
public:
    using ReadyCallback = std::function<void(Task)>;
    using FailureCallback = std::function<void(TaskId, const Error&)>;

    DependencyTracker(FutureStore& store, Logger& logger);

    DependencyTracker(const DependencyTracker&) = delete;
    DependencyTracker& operator=(const DependencyTracker&) = delete;

    void on_ready(ReadyCallback callback);
    void on_dependency_failed(FailureCallback callback);

    /**
     * @brief Scan the task's arguments and subscribe it to pending futures.
     *
     * Hands the task to the ready callback before returning when nothing is
     * pending, and to the failure callback when a dependency already failed
     * or can no longer be found in the store.
     */
    void register_task(Task task);

    /// Listener for FutureStore resolutions.
    void on_resolved(const Resolution& resolution, const std::vector<TaskId>& subscribers);

    /// Tasks registered but not yet ready or failed.
    [[nodiscard]] size_t waiting_count() const;

    /// Remaining unresolved dependency count, or nullopt if not waiting.
    [[nodiscard]] std::optional<size_t> unresolved_count(TaskId id) const;

private:
    struct WaitingTask {
        Task task;
        /// Distinct future → argument indices it fills. Immutable after registration.
        std::vector<std::pair<FutureId, std::vector<size_t>>> dependencies;
        std::atomic<size_t> unresolved{0};
        std::atomic<bool> retired{false};
    };

    [[nodiscard]] std::shared_ptr<WaitingTask> lookup(TaskId id) const;
    void fill(WaitingTask& waiting, FutureId dependency, const Value& value);
    void release_one(const std::shared_ptr<WaitingTask>& waiting);
    void retire_failed(const std::shared_ptr<WaitingTask>& waiting, const Error& error);
    void erase(TaskId id);

    FutureStore& store_;
    Logger& logger_;
    ReadyCallback ready_callback_;
    FailureCallback failure_callback_;

    std::unordered_map<TaskId, std::shared_ptr<WaitingTask>> waiting_;
    mutable std::mutex mutex_;
};

}  // namespace task_fabric
