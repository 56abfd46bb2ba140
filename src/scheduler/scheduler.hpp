/**
 * @file scheduler.hpp
 * @brief Submission, ready-queue admission and dispatch of tasks.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/worker_pool.hpp"
#include "scheduler/dependency_tracker.hpp"
#include "store/future_store.hpp"
#include "workload/task.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace task_fabric {

class MetricsCollector;

// ─────────────────────────────────────────────
// Scheduler Statistics
// ─────────────────────────────────────────────

struct SchedulerStats {
    uint64_t submitted = 0;
    uint64_t completed = 0;            ///< Payload returned a value
    uint64_t failed = 0;               ///< Payload threw
    uint64_t propagated_failures = 0;  ///< Failed without running (failed dependency)
    size_t peak_concurrency = 0;
    size_t queued = 0;                 ///< In the ready queue right now
    size_t running = 0;                ///< Occupying a worker slot right now
    size_t waiting = 0;                ///< Blocked on dependencies right now
};

/**
 * @brief The control loop tying store, tracker and worker pool together.
 *
 * Admission decisions (ready-queue mutation and free-slot accounting) are
 * serialised by one mutex. No callback into the store or tracker is made
 * while it is held, because resolutions re-enter the scheduler.
 */
class Scheduler {
public:
    Scheduler(FutureStore& store,
              DependencyTracker& tracker,
              WorkerPool& pool,
              Logger& logger,
              MetricsCollector* metrics = nullptr);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Accept a task and return the handle of the future it produces.
     *
     * Never waits for execution. Fails synchronously (allocating nothing) if
     * the payload is empty, an argument names an unknown or stale future, or
     * the scheduler has been stopped.
     */
    Result<FutureId> submit(std::string name, Payload function, std::vector<Argument> args);

    /// Block until every submitted task has resolved or failed.
    void drain();

    /// Reject further submissions, drain, and release the workers. Idempotent.
    void stop();

    [[nodiscard]] bool is_stopped() const;
    [[nodiscard]] SchedulerStats stats() const;
    [[nodiscard]] std::optional<TaskState> task_state(TaskId id) const;
    [[nodiscard]] size_t pool_size() const noexcept;

    /**
     * @brief Drop the recorded state of a task whose future was released.
     *
     * A task that has not reached Resolved or Failed yet is dropped as soon
     * as it does.
     */
    void forget(TaskId id);

private:
    void enqueue_ready(Task task);
    void on_dependency_failed(TaskId id, const Error& error);
    void fail_without_running(TaskId id, const Error& error);
    void on_slot_freed(const ExecutionResult& result);

    void dispatch_locked();
    void transition_locked(TaskId id, TaskState to);
    void retire_locked();

    FutureStore& store_;
    DependencyTracker& tracker_;
    WorkerPool& pool_;
    Logger& logger_;
    MetricsCollector* metrics_;

    std::deque<Task> ready_queue_;
    std::unordered_map<TaskId, TaskState> states_;
    std::unordered_set<TaskId> released_;   ///< Forgotten before reaching a final state
    size_t free_slots_;
    size_t running_{0};
    uint64_t outstanding_{0};
    bool stopped_{false};

    SchedulerStats stats_;
    mutable std::mutex mutex_;
    std::condition_variable drained_cv_;
};

}  // namespace task_fabric
