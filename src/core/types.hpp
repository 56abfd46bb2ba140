/**
 * @file types.hpp
 * @brief Fundamental types used throughout TaskFabric.
 * @author Dimitris Kafetzis
 *
 * Defines FutureId, the type-erased Value, task/future state enums and other
 * shared vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <any>
#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>

namespace task_fabric {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/**
 * @brief Opaque, generation-checked handle to a future in the FutureStore.
 *
 * `slot` indexes the store's arena; `generation` is bumped every time the
 * slot is recycled, so handles to released futures are detected as stale.
 */
struct FutureId {
    static constexpr uint32_t kNullSlot = std::numeric_limits<uint32_t>::max();

    uint32_t slot{kNullSlot};
    uint32_t generation{0};

    [[nodiscard]] constexpr bool is_null() const noexcept { return slot == kNullSlot; }

    auto operator<=>(const FutureId&) const = default;
};

/// A task is identified by the future it produces.
using TaskId = FutureId;

[[nodiscard]] inline std::string to_string(const FutureId& id) {
    if (id.is_null()) return "null";
    return std::to_string(id.slot) + "." + std::to_string(id.generation);
}

/// Type-erased, copyable task value. Immutable once stored.
using Value = std::any;

// ─────────────────────────────────────────────
// Future State
// ─────────────────────────────────────────────

enum class FutureState : uint8_t {
    Pending,       ///< Producing task has not finished
    Ready,         ///< Value available
    Failed         ///< Error recorded
};

[[nodiscard]] constexpr std::string_view to_string(FutureState state) noexcept {
    switch (state) {
        case FutureState::Pending: return "pending";
        case FutureState::Ready:   return "ready";
        case FutureState::Failed:  return "failed";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Task State
// ─────────────────────────────────────────────

enum class TaskState : uint8_t {
    Registered,    ///< Accepted by submit, not yet scanned
    Pending,       ///< Waiting for dependencies
    Ready,         ///< All dependencies met, in the ready queue
    Executing,     ///< Occupying a worker slot
    Resolved,      ///< Finished successfully
    Failed         ///< Payload failed or a dependency failed
};

/**
 * @brief Convert TaskState to string representation.
 */
[[nodiscard]] constexpr std::string_view to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::Registered: return "registered";
        case TaskState::Pending:    return "pending";
        case TaskState::Ready:      return "ready";
        case TaskState::Executing:  return "executing";
        case TaskState::Resolved:   return "resolved";
        case TaskState::Failed:     return "failed";
    }
    return "unknown";
}

}  // namespace task_fabric

template <>
struct std::hash<task_fabric::FutureId> {
    size_t operator()(const task_fabric::FutureId& id) const noexcept {
        return std::hash<uint64_t>{}(
            (static_cast<uint64_t>(id.generation) << 32) | id.slot);
    }
};
