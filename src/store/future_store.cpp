/**
 * @file future_store.cpp
 * @brief FutureStore implementation.
 * @author Dimitris Kafetzis
 */

#include "store/future_store.hpp"

#include <algorithm>
#include <chrono>

namespace task_fabric {

FutureStore::FutureStore(Logger& logger) : logger_(logger) {}

void FutureStore::on_resolved(ResolutionCallback callback) {
    listener_ = std::move(callback);
}

// ─────────────────────────────────────────────
// Arena Access
// ─────────────────────────────────────────────

FutureStore::FutureRecord* FutureStore::find(FutureId id) const {
    if (id.is_null()) return nullptr;
    std::shared_lock lock(table_mutex_);
    if (id.slot >= records_.size()) return nullptr;
    // std::deque never relocates existing elements on growth, so the pointer
    // stays valid after the table lock is released.
    return const_cast<FutureRecord*>(&records_[id.slot]);
}

bool FutureStore::matches(const FutureRecord& rec, FutureId id) noexcept {
    return rec.in_use && rec.generation == id.generation;
}

Result<Value> FutureStore::outcome_locked(const FutureRecord& rec) {
    if (rec.state == FutureState::Failed) {
        return *rec.error;
    }
    return rec.value;
}

void FutureStore::violation(const std::string& message) const {
    logger_.error("Invariant violation: " + message);
    throw InvariantViolation(message);
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

FutureId FutureStore::allocate() {
    std::unique_lock lock(table_mutex_);

    uint32_t slot;
    if (!free_slots_.empty()) {
        slot = free_slots_.back();
        free_slots_.pop_back();
    } else {
        slot = static_cast<uint32_t>(records_.size());
        records_.emplace_back();
    }

    auto& rec = records_[slot];
    std::lock_guard record_lock(rec.mutex);
    rec.in_use = true;
    rec.state = FutureState::Pending;
    rec.value.reset();
    rec.error.reset();
    rec.subscribers.clear();
    ++live_;
    return FutureId{slot, rec.generation};
}

void FutureStore::resolve(FutureId id, Value value) {
    complete(id, FutureState::Ready, std::move(value), std::nullopt);
}

void FutureStore::fail(FutureId id, Error error) {
    complete(id, FutureState::Failed, Value{}, std::move(error));
}

void FutureStore::complete(FutureId id, FutureState state,
                           Value value, std::optional<Error> error) {
    auto* rec = find(id);
    if (!rec) {
        violation("completion of unknown future " + to_string(id));
    }

    std::vector<TaskId> subscribers;
    {
        std::lock_guard lock(rec->mutex);
        if (!matches(*rec, id)) {
            violation("completion of stale future " + to_string(id));
        }
        if (rec->state != FutureState::Pending) {
            violation("future " + to_string(id) + " completed twice (already "
                      + std::string{to_string(rec->state)} + ")");
        }
        rec->state = state;
        if (state == FutureState::Ready) {
            rec->value = value;
        } else {
            rec->error = error;
        }
        subscribers.swap(rec->subscribers);
    }
    rec->cv.notify_all();

    {
        std::lock_guard lock(completion_mutex_);
        ++completion_epoch_;
    }
    completion_cv_.notify_all();

    if (listener_) {
        listener_(Resolution{id, state, value, error}, std::move(subscribers));
    }
}

Result<void> FutureStore::release(FutureId id) {
    auto* rec = find(id);
    if (!rec) return Error{"release of unknown future " + to_string(id)};

    {
        std::lock_guard lock(rec->mutex);
        if (!matches(*rec, id)) {
            return Error{"release of stale future " + to_string(id)};
        }
        if (rec->state == FutureState::Pending) {
            return Error{"cannot release pending future " + to_string(id)};
        }
        rec->in_use = false;
        ++rec->generation;
        rec->value.reset();
        rec->error.reset();
    }

    std::unique_lock lock(table_mutex_);
    free_slots_.push_back(id.slot);
    --live_;
    return {};
}

// ─────────────────────────────────────────────
// Subscription
// ─────────────────────────────────────────────

Result<Subscription> FutureStore::subscribe(FutureId id, TaskId subscriber) {
    auto* rec = find(id);
    if (!rec) return Error{"unknown future " + to_string(id)};

    std::lock_guard lock(rec->mutex);
    if (!matches(*rec, id)) return Error{"stale future " + to_string(id)};

    Subscription sub;
    sub.state = rec->state;
    switch (rec->state) {
        case FutureState::Pending:
            rec->subscribers.push_back(subscriber);
            break;
        case FutureState::Ready:
            sub.value = rec->value;
            break;
        case FutureState::Failed:
            sub.error = rec->error;
            break;
    }
    return sub;
}

// ─────────────────────────────────────────────
// Retrieval
// ─────────────────────────────────────────────

Result<Value> FutureStore::get(FutureId id) const {
    auto* rec = find(id);
    if (!rec) return Error{"unknown future " + to_string(id)};

    std::unique_lock lock(rec->mutex);
    if (!matches(*rec, id)) return Error{"stale future " + to_string(id)};

    // A Pending record cannot be released, so the generation is stable here.
    rec->cv.wait(lock, [rec] { return rec->state != FutureState::Pending; });
    return outcome_locked(*rec);
}

Result<Value> FutureStore::get_for(FutureId id, Duration timeout) const {
    auto* rec = find(id);
    if (!rec) return Error{"unknown future " + to_string(id)};

    std::unique_lock lock(rec->mutex);
    if (!matches(*rec, id)) return Error{"stale future " + to_string(id)};

    bool done = rec->cv.wait_for(lock, timeout, [rec] {
        return rec->state != FutureState::Pending;
    });
    if (!done) {
        return Error{"timed out waiting for future " + to_string(id)};
    }
    return outcome_locked(*rec);
}

Result<std::vector<Value>> FutureStore::get_many(const std::vector<FutureId>& ids) const {
    std::vector<Result<Value>> outcomes;
    outcomes.reserve(ids.size());
    for (const auto& id : ids) {
        outcomes.push_back(get(id));
    }

    std::vector<Value> values;
    values.reserve(ids.size());
    for (auto& outcome : outcomes) {
        if (!outcome) return outcome.error();
        values.push_back(std::move(outcome).value());
    }
    return values;
}

Result<WaitResult> FutureStore::wait(const std::vector<FutureId>& ids,
                                     size_t num_returns,
                                     Duration timeout) const {
    num_returns = std::min(num_returns, ids.size());
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        uint64_t epoch;
        {
            std::lock_guard lock(completion_mutex_);
            epoch = completion_epoch_;
        }

        WaitResult result;
        for (size_t i = 0; i < ids.size(); ++i) {
            auto state = state_of(ids[i]);
            if (!state) return state.error();
            if (*state == FutureState::Pending) {
                result.pending.push_back(i);
            } else {
                result.ready.push_back(i);
            }
        }

        if (result.ready.size() >= num_returns
            || std::chrono::steady_clock::now() >= deadline) {
            return result;
        }

        std::unique_lock lock(completion_mutex_);
        completion_cv_.wait_until(lock, deadline, [&] {
            return completion_epoch_ != epoch;
        });
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

Result<FutureState> FutureStore::state_of(FutureId id) const {
    auto* rec = find(id);
    if (!rec) return Error{"unknown future " + to_string(id)};

    std::lock_guard lock(rec->mutex);
    if (!matches(*rec, id)) return Error{"stale future " + to_string(id)};
    return rec->state;
}

bool FutureStore::contains(FutureId id) const {
    return state_of(id).has_value();
}

size_t FutureStore::live_count() const noexcept {
    std::shared_lock lock(table_mutex_);
    return live_;
}

size_t FutureStore::slot_count() const noexcept {
    std::shared_lock lock(table_mutex_);
    return records_.size();
}

}  // namespace task_fabric
