/**
 * @file scheduler.cpp
 * @brief Scheduler implementation: FIFO ready queue over a bounded pool.
 * @author Dimitris Kafetzis
 */

#include "scheduler/scheduler.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <utility>

namespace task_fabric {

namespace {

[[nodiscard]] bool is_terminal(TaskState state) noexcept {
    return state == TaskState::Resolved || state == TaskState::Failed;
}

/// Dependents queued by the propagation running on this thread, if any.
struct Propagation {
    const Scheduler* owner = nullptr;
    std::deque<std::pair<TaskId, Error>>* pending = nullptr;
};

thread_local Propagation propagation;

class PropagationScope {
public:
    PropagationScope(const Scheduler* owner, std::deque<std::pair<TaskId, Error>>* pending)
        : saved_(propagation) {
        propagation = Propagation{owner, pending};
    }
    ~PropagationScope() { propagation = saved_; }

    PropagationScope(const PropagationScope&) = delete;
    PropagationScope& operator=(const PropagationScope&) = delete;

private:
    Propagation saved_;
};

}  // namespace

Scheduler::Scheduler(FutureStore& store,
                     DependencyTracker& tracker,
                     WorkerPool& pool,
                     Logger& logger,
                     MetricsCollector* metrics)
    : store_(store)
    , tracker_(tracker)
    , pool_(pool)
    , logger_(logger)
    , metrics_(metrics)
    , free_slots_(pool.slot_count()) {
    tracker_.on_ready([this](Task task) { enqueue_ready(std::move(task)); });
    tracker_.on_dependency_failed([this](TaskId id, const Error& error) {
        on_dependency_failed(id, error);
    });
    pool_.on_complete([this](const ExecutionResult& result) { on_slot_freed(result); });
}

// ─────────────────────────────────────────────
// Submission
// ─────────────────────────────────────────────

Result<FutureId> Scheduler::submit(std::string name, Payload function,
                                   std::vector<Argument> args) {
    if (!function) {
        return Error{"submit of '" + name + "': payload is empty"};
    }
    for (size_t i = 0; i < args.size(); ++i) {
        const auto* dep = std::get_if<FutureId>(&args[i]);
        if (dep && !store_.contains(*dep)) {
            return Error{"submit of '" + name + "': argument " + std::to_string(i)
                         + " references unknown or stale future " + to_string(*dep)};
        }
    }

    Task task{
        .id = FutureId{},
        .name = std::move(name),
        .function = std::move(function),
        .args = std::move(args),
        .submitted_at = std::chrono::steady_clock::now()
    };
    const bool has_dependencies = count_future_args(task) > 0;

    {
        std::lock_guard lock(mutex_);
        if (stopped_) {
            return Error{"submit of '" + task.name + "': engine is stopped"};
        }
        task.id = store_.allocate();
        states_.emplace(task.id, TaskState::Registered);
        if (has_dependencies) {
            transition_locked(task.id, TaskState::Pending);
        }
        ++outstanding_;
        ++stats_.submitted;
    }

    const FutureId id = task.id;
    tracker_.register_task(std::move(task));
    return id;
}

// ─────────────────────────────────────────────
// Admission & Dispatch
// ─────────────────────────────────────────────

void Scheduler::enqueue_ready(Task task) {
    std::lock_guard lock(mutex_);
    transition_locked(task.id, TaskState::Ready);
    ready_queue_.push_back(std::move(task));
    dispatch_locked();
}

void Scheduler::dispatch_locked() {
    while (free_slots_ > 0 && !ready_queue_.empty()) {
        Task task = std::move(ready_queue_.front());
        ready_queue_.pop_front();

        --free_slots_;
        ++running_;
        stats_.peak_concurrency = std::max(stats_.peak_concurrency, running_);
        transition_locked(task.id, TaskState::Executing);

        if (logger_.enabled(LogLevel::Debug)) {
            logger_.debug("Dispatching " + describe(task) + " ("
                          + std::to_string(ready_queue_.size()) + " still queued)");
        }
        pool_.submit_for_execution(std::move(task));
    }
}

void Scheduler::on_slot_freed(const ExecutionResult& result) {
    std::lock_guard lock(mutex_);
    ++free_slots_;
    --running_;

    if (result.final_state == TaskState::Resolved) {
        ++stats_.completed;
    } else {
        ++stats_.failed;
    }
    transition_locked(result.task_id, result.final_state);

    if (metrics_) {
        metrics_->record_task_event(result.task_id, result.task_name,
                                    result.final_state, result.actual_duration);
    }

    retire_locked();
    dispatch_locked();
}

/**
 * Failing a future notifies its subscribers, which lands back here for each
 * dependent. Those nested calls only queue the dependent; the outermost call
 * on the thread fails them one at a time, so the stack stays flat however
 * long the chain of dependents is.
 */
void Scheduler::on_dependency_failed(TaskId id, const Error& error) {
    if (propagation.owner == this) {
        propagation.pending->emplace_back(id, error);
        return;
    }

    std::deque<std::pair<TaskId, Error>> pending;
    PropagationScope scope(this, &pending);

    fail_without_running(id, error);
    while (!pending.empty()) {
        auto [next, next_error] = std::move(pending.front());
        pending.pop_front();
        fail_without_running(next, next_error);
    }
}

void Scheduler::fail_without_running(TaskId id, const Error& error) {
    {
        std::lock_guard lock(mutex_);
        ++stats_.propagated_failures;
        transition_locked(id, TaskState::Failed);
    }

    store_.fail(id, error);

    if (metrics_) {
        metrics_->record_task_event(id, "dependency_failed", TaskState::Failed, Duration{0});
    }

    std::lock_guard lock(mutex_);
    retire_locked();
}

void Scheduler::transition_locked(TaskId id, TaskState to) {
    auto it = states_.find(id);
    if (it == states_.end()) {
        auto message = "task " + to_string(id) + " unknown to scheduler on transition to "
                       + std::string{to_string(to)};
        logger_.error("Invariant violation: " + message);
        throw InvariantViolation(message);
    }

    const TaskState from = it->second;
    if (is_terminal(from) || static_cast<uint8_t>(to) <= static_cast<uint8_t>(from)) {
        auto message = "task " + to_string(id) + " cannot move from "
                       + std::string{to_string(from)} + " to " + std::string{to_string(to)};
        logger_.error("Invariant violation: " + message);
        throw InvariantViolation(message);
    }
    it->second = to;

    if (is_terminal(to) && released_.erase(id) > 0) {
        states_.erase(it);
    }
}

void Scheduler::retire_locked() {
    if (--outstanding_ == 0) {
        drained_cv_.notify_all();
    }
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void Scheduler::drain() {
    std::unique_lock lock(mutex_);
    drained_cv_.wait(lock, [this] { return outstanding_ == 0; });
}

void Scheduler::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
    }
    drain();
    pool_.stop();
    logger_.info("Scheduler stopped after " + std::to_string(stats().submitted) + " tasks");
}

bool Scheduler::is_stopped() const {
    std::lock_guard lock(mutex_);
    return stopped_;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

SchedulerStats Scheduler::stats() const {
    std::lock_guard lock(mutex_);
    SchedulerStats snapshot = stats_;
    snapshot.queued = ready_queue_.size();
    snapshot.running = running_;
    snapshot.waiting = tracker_.waiting_count();
    return snapshot;
}

std::optional<TaskState> Scheduler::task_state(TaskId id) const {
    std::lock_guard lock(mutex_);
    auto it = states_.find(id);
    if (it == states_.end()) return std::nullopt;
    return it->second;
}

void Scheduler::forget(TaskId id) {
    std::lock_guard lock(mutex_);
    auto it = states_.find(id);
    if (it == states_.end()) return;
    if (is_terminal(it->second)) {
        states_.erase(it);
    } else {
        released_.insert(id);
    }
}

size_t Scheduler::pool_size() const noexcept {
    return pool_.slot_count();
}

}  // namespace task_fabric
