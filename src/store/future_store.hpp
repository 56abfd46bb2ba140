/**
 * @file future_store.hpp
 * @brief Arena of future records addressed by generation-checked handles.
 * @author Dimitris Kafetzis
 *
 * The FutureStore owns the state and eventual value of every task result.
 * Each record has its own mutex and condition variable, so resolution and
 * retrieval of distinct futures never contend. The arena table itself is
 * guarded by a shared mutex taken only to grow, recycle, or index slots.
 *
 * Resolution and subscription share the per-record mutex: a subscriber is
 * either recorded while the future is still Pending (and will be handed to
 * the resolution callback), or it observes the final state directly. No
 * notification can be missed in between.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace task_fabric {

/**
 * @brief Outcome of one future leaving Pending, handed to the listener.
 */
struct Resolution {
    FutureId id;
    FutureState state;
    const Value& value;                  ///< Meaningful when state == Ready
    const std::optional<Error>& error;   ///< Set when state == Failed
};

/**
 * @brief Result of subscribing a task to a future.
 *
 * If the future had already left Pending, the task was NOT recorded and
 * the final value or error is returned instead.
 */
struct Subscription {
    FutureState state = FutureState::Pending;
    Value value;
    std::optional<Error> error;
};

/**
 * @brief Result of a multi-future wait.
 */
struct WaitResult {
    std::vector<size_t> ready;     ///< Indices (into the input) that left Pending
    std::vector<size_t> pending;   ///< Indices still Pending at return
};

class FutureStore {
public:
    using ResolutionCallback =
        std::function<void(const Resolution&, std::vector<TaskId> subscribers)>;

    explicit FutureStore(Logger& logger);

    FutureStore(const FutureStore&) = delete;
    FutureStore& operator=(const FutureStore&) = delete;

    /// Register the callback invoked (outside any record lock) on every resolution.
    void on_resolved(ResolutionCallback callback);

    // ── Lifecycle ─────────────────────────────
    [[nodiscard]] FutureId allocate();
    void resolve(FutureId id, Value value);
    void fail(FutureId id, Error error);
    Result<void> release(FutureId id);

    // ── Subscription ──────────────────────────
    Result<Subscription> subscribe(FutureId id, TaskId subscriber);

    // ── Retrieval ─────────────────────────────
    Result<Value> get(FutureId id) const;
    Result<Value> get_for(FutureId id, Duration timeout) const;
    Result<std::vector<Value>> get_many(const std::vector<FutureId>& ids) const;
    Result<WaitResult> wait(const std::vector<FutureId>& ids,
                            size_t num_returns,
                            Duration timeout) const;

    // ── Queries ───────────────────────────────
    [[nodiscard]] Result<FutureState> state_of(FutureId id) const;
    [[nodiscard]] bool contains(FutureId id) const;
    [[nodiscard]] size_t live_count() const noexcept;
    [[nodiscard]] size_t slot_count() const noexcept;

private:
    struct FutureRecord {
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        uint32_t generation = 0;
        bool in_use = false;
        FutureState state = FutureState::Pending;
        Value value;
        std::optional<Error> error;
        std::vector<TaskId> subscribers;
    };

    [[nodiscard]] FutureRecord* find(FutureId id) const;
    [[nodiscard]] static bool matches(const FutureRecord& rec, FutureId id) noexcept;
    static Result<Value> outcome_locked(const FutureRecord& rec);

    void complete(FutureId id, FutureState state, Value value, std::optional<Error> error);
    [[noreturn]] void violation(const std::string& message) const;

    Logger& logger_;
    ResolutionCallback listener_;

    std::deque<FutureRecord> records_;
    std::vector<uint32_t> free_slots_;
    size_t live_{0};
    mutable std::shared_mutex table_mutex_;

    // Store-wide completion epoch, used by multi-future wait().
    mutable std::mutex completion_mutex_;
    mutable std::condition_variable completion_cv_;
    uint64_t completion_epoch_{0};
};

}  // namespace task_fabric
