/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/worker_pool.hpp"

namespace task_fabric {

WorkerPool::WorkerPool(FutureStore& store, Logger& logger, size_t num_slots)
    : store_(store), logger_(logger) {
    if (num_slots == 0) {
        num_slots = std::thread::hardware_concurrency();
        if (num_slots == 0) num_slots = 4;  // fallback
    }

    slots_ = std::vector<WorkerSlot>(num_slots);
    workers_.reserve(num_slots);
    for (size_t i = 0; i < num_slots; ++i) {
        workers_.emplace_back([this, i](std::stop_token stop) {
            worker_loop(stop, i);
        });
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::on_complete(CompletionCallback callback) {
    completion_callback_ = std::move(callback);
}

void WorkerPool::submit_for_execution(Task task) {
    {
        std::lock_guard lock(queue_mutex_);
        handoff_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
}

void WorkerPool::stop() {
    // Request stop on all jthreads first
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    // Wake all threads so they can observe the stop request
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void WorkerPool::worker_loop(std::stop_token stop, size_t slot) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !handoff_queue_.empty(); });

            // Queued work is finished even after a stop request.
            if (handoff_queue_.empty()) {
                if (stop.stop_requested()) return;
                continue;
            }

            task = std::move(handoff_queue_.front());
            handoff_queue_.pop();
        }

        run_in_slot(slot, task);
    }
}

void WorkerPool::run_in_slot(size_t slot, Task& task) {
    slots_[slot].busy.store(true);
    auto now_busy = busy_.fetch_add(1) + 1;
    auto peak = peak_busy_.load();
    while (now_busy > peak && !peak_busy_.compare_exchange_weak(peak, now_busy)) {}

    auto result = runner_.execute(task);

    if (result.final_state == TaskState::Resolved) {
        logger_.debug("Task " + describe(task) + " resolved in "
                      + std::to_string(result.actual_duration.count()) + "us");
        store_.resolve(task.id, result.value);
    } else {
        logger_.warn("Task " + describe(task) + " failed: " + *result.error_message);
        store_.fail(task.id, Error{*result.error_message, task.id});
    }

    --busy_;
    slots_[slot].busy.store(false);

    if (completion_callback_) {
        completion_callback_(result);
    }
}

size_t WorkerPool::busy_count() const noexcept {
    return busy_.load();
}

size_t WorkerPool::peak_busy_count() const noexcept {
    return peak_busy_.load();
}

size_t WorkerPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return handoff_queue_.size();
}

size_t WorkerPool::slot_count() const noexcept {
    return slots_.size();
}

bool WorkerPool::is_busy(size_t slot) const noexcept {
    return slot < slots_.size() && slots_[slot].busy.load();
}

}  // namespace task_fabric
