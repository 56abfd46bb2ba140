/**
 * @file worker_pool.hpp
 * @brief Fixed set of std::jthread execution slots for ready tasks.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "executor/task_runner.hpp"
#include "store/future_store.hpp"
#include "workload/task.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace task_fabric {

/**
 * @brief Worker pool with one thread per slot.
 *
 * The scheduler hands over a task only when it knows a slot is free, so the
 * hand-off queue never holds more tasks than there are idle threads. Each
 * worker runs the payload, records the outcome in the FutureStore, then
 * reports the freed slot through the completion callback.
 */
class WorkerPool {
public:
    using CompletionCallback = std::function<void(const ExecutionResult&)>;

    WorkerPool(FutureStore& store, Logger& logger, size_t num_slots = 0);
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void on_complete(CompletionCallback callback);

    /// Queue a ready task for the next idle worker. Never blocks the caller.
    void submit_for_execution(Task task);

    /// Finish queued work and join all workers. Idempotent.
    void stop();

    [[nodiscard]] size_t busy_count() const noexcept;
    [[nodiscard]] size_t peak_busy_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t slot_count() const noexcept;
    [[nodiscard]] bool is_busy(size_t slot) const noexcept;

private:
    struct WorkerSlot {
        std::atomic<bool> busy{false};
    };

    void worker_loop(std::stop_token stop, size_t slot);
    void run_in_slot(size_t slot, Task& task);

    FutureStore& store_;
    Logger& logger_;
    TaskRunner runner_;
    CompletionCallback completion_callback_;

    std::vector<WorkerSlot> slots_;
    std::vector<std::jthread> workers_;
    std::queue<Task> handoff_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;

    std::atomic<size_t> busy_{0};
    std::atomic<size_t> peak_busy_{0};
};

}  // namespace task_fabric
