/**
 * @file dependency_tracker.cpp
 * @brief DependencyTracker implementation.
 * @author Dimitris Kafetzis
 *
 * Each waiting task carries an atomic count of distinct unresolved futures
 * plus one registration guard, so a dependency resolving on another thread
 * while registration is still subscribing cannot drive the count to zero
 * early. Whichever thread takes the count to zero, or first observes a
 * failed dependency, retires the task via the single-shot `retired` flag.
 */

#include "scheduler/dependency_tracker.hpp"

#include <algorithm>

namespace task_fabric {

DependencyTracker::DependencyTracker(FutureStore& store, Logger& logger)
    : store_(store), logger_(logger) {}

void DependencyTracker::on_ready(ReadyCallback callback) {
    ready_callback_ = std::move(callback);
}

void DependencyTracker::on_dependency_failed(FailureCallback callback) {
    failure_callback_ = std::move(callback);
}

// ─────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────

void DependencyTracker::register_task(Task task) {
    auto waiting = std::make_shared<WaitingTask>();

    for (size_t i = 0; i < task.args.size(); ++i) {
        const auto* dep = std::get_if<FutureId>(&task.args[i]);
        if (!dep) continue;

        auto it = std::find_if(waiting->dependencies.begin(), waiting->dependencies.end(),
                               [dep](const auto& entry) { return entry.first == *dep; });
        if (it == waiting->dependencies.end()) {
            waiting->dependencies.emplace_back(*dep, std::vector<size_t>{i});
        } else {
            it->second.push_back(i);
        }
    }

    const TaskId id = task.id;
    waiting->task = std::move(task);
    waiting->unresolved.store(waiting->dependencies.size() + 1, std::memory_order_relaxed);

    {
        std::lock_guard lock(mutex_);
        waiting_.emplace(id, waiting);
    }

    if (logger_.enabled(LogLevel::Debug)) {
        logger_.debug("Registered " + describe(waiting->task) + " with "
                      + std::to_string(waiting->dependencies.size()) + " future dependencies");
    }

    for (const auto& [dep, indices] : waiting->dependencies) {
        auto sub = store_.subscribe(dep, id);
        if (!sub) {
            retire_failed(waiting, Error{sub.error().message, dep});
            return;
        }

        switch (sub->state) {
            case FutureState::Pending:
                break;
            case FutureState::Failed:
                retire_failed(waiting, *sub->error);
                return;
            case FutureState::Ready:
                fill(*waiting, dep, sub->value);
                release_one(waiting);
                break;
        }
    }

    // Drop the registration guard.
    release_one(waiting);
}

// ─────────────────────────────────────────────
// Resolution
// ─────────────────────────────────────────────

void DependencyTracker::on_resolved(const Resolution& resolution,
                                    const std::vector<TaskId>& subscribers) {
    for (const auto& subscriber : subscribers) {
        auto waiting = lookup(subscriber);
        if (!waiting) continue;     // already retired through another dependency

        if (resolution.state == FutureState::Failed) {
            retire_failed(waiting, *resolution.error);
            continue;
        }

        fill(*waiting, resolution.id, resolution.value);
        release_one(waiting);
    }
}

void DependencyTracker::fill(WaitingTask& waiting, FutureId dependency, const Value& value) {
    for (const auto& [dep, indices] : waiting.dependencies) {
        if (dep != dependency) continue;
        for (size_t index : indices) {
            waiting.task.args[index] = value;
        }
        return;
    }
}

void DependencyTracker::release_one(const std::shared_ptr<WaitingTask>& waiting) {
    if (waiting->unresolved.fetch_sub(1, std::memory_order_acq_rel) != 1) return;
    if (waiting->retired.exchange(true)) return;

    erase(waiting->task.id);
    if (ready_callback_) {
        ready_callback_(std::move(waiting->task));
    }
}

void DependencyTracker::retire_failed(const std::shared_ptr<WaitingTask>& waiting,
                                      const Error& error) {
    if (waiting->retired.exchange(true)) return;

    const TaskId id = waiting->task.id;
    erase(id);
    logger_.debug("Dependency of " + describe(waiting->task) + " failed: " + error.message);
    if (failure_callback_) {
        failure_callback_(id, error);
    }
}

// ─────────────────────────────────────────────
// Bookkeeping
// ─────────────────────────────────────────────

std::shared_ptr<DependencyTracker::WaitingTask> DependencyTracker::lookup(TaskId id) const {
    std::lock_guard lock(mutex_);
    auto it = waiting_.find(id);
    if (it == waiting_.end()) return nullptr;
    return it->second;
}

void DependencyTracker::erase(TaskId id) {
    std::lock_guard lock(mutex_);
    waiting_.erase(id);
}

size_t DependencyTracker::waiting_count() const {
    std::lock_guard lock(mutex_);
    return waiting_.size();
}

std::optional<size_t> DependencyTracker::unresolved_count(TaskId id) const {
    auto waiting = lookup(id);
    if (!waiting) return std::nullopt;
    return waiting->unresolved.load(std::memory_order_acquire);
}

}  // namespace task_fabric
