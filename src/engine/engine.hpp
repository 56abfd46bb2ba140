/**
 * @file engine.hpp
 * @brief Top-level Engine facade. Owns the store, tracker, pool and scheduler.
 * @author Dimitris Kafetzis
 *
 * Provides the typed entry points:
 *   1. submit()   non-blocking task submission returning an ObjectRef
 *   2. get()      blocking retrieval (get_many / get_for / wait variants)
 *   3. put()      place a literal value as an already-ready future
 *
 * There is no process-wide runtime: an Engine is constructed with its pool
 * size, passed by reference to whoever submits work, and drains in-flight
 * tasks before releasing its workers on destruction.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/object_ref.hpp"
#include "engine/remote_function.hpp"
#include "executor/worker_pool.hpp"
#include "scheduler/dependency_tracker.hpp"
#include "scheduler/scheduler.hpp"
#include "store/future_store.hpp"
#include "telemetry/metrics_collector.hpp"
#include "workload/lineage.hpp"
#include "workload/task.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace task_fabric {

struct EngineStats {
    SchedulerStats scheduler;
    size_t live_futures = 0;
    size_t pool_size = 0;
};

class Engine {
public:
    struct Options {
        EngineConfig config;
        std::unique_ptr<ILogSink> log_sink;       ///< nullptr = discard logs
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;   ///< nullptr = no metrics
    };

    explicit Engine(Options opts);
    /// Engine with `pool_size` workers and logging discarded.
    explicit Engine(size_t pool_size);
    ~Engine();

    // Non-copyable, non-movable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ── Submission ───────────────────────────
    template <typename R, typename... Params, typename... CallArgs>
        requires (sizeof...(Params) == sizeof...(CallArgs))
                 && (ArgumentFor<CallArgs, Params> && ...)
    Result<ObjectRef<R>> submit(const RemoteFunction<R(Params...)>& fn, CallArgs&&... args);

    /// Plain callables must be wrapped with remote() before submission.
    template <typename F, typename... CallArgs>
        requires (!RemotePayload<F>)
    void submit(F&& fn, CallArgs&&... args) = delete;

    template <typename T>
        requires StorableValue<std::decay_t<T>>
    Result<ObjectRef<std::decay_t<T>>> put(T&& value);

    // ── Retrieval ────────────────────────────
    template <typename T>
    Result<T> get(const ObjectRef<T>& ref) const;

    template <typename T>
    Result<T> get_for(const ObjectRef<T>& ref, Duration timeout) const;

    template <typename T>
    Result<std::vector<T>> get_many(const std::vector<ObjectRef<T>>& refs) const;

    template <typename T>
    Result<WaitResult> wait(const std::vector<ObjectRef<T>>& refs,
                            size_t num_returns,
                            Duration timeout) const;

    template <typename T>
    Result<void> release(const ObjectRef<T>& ref);

    // ── Introspection ────────────────────────
    template <typename T>
    [[nodiscard]] std::optional<TaskState> task_state(const ObjectRef<T>& ref) const {
        return scheduler_.task_state(ref.id());
    }

    template <typename T>
    [[nodiscard]] Result<size_t> critical_path_length(const ObjectRef<T>& ref) const;

    [[nodiscard]] const LineageGraph& lineage() const noexcept { return lineage_; }
    /// Tasks submitted over the engine's lifetime (put values excluded).
    [[nodiscard]] size_t task_count() const { return lineage_.task_count(); }
    [[nodiscard]] EngineStats stats() const;
    [[nodiscard]] size_t pool_size() const noexcept { return scheduler_.pool_size(); }
    [[nodiscard]] uint64_t id() const noexcept { return id_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    Logger& logger() noexcept { return logger_; }

    // ── Lifecycle ────────────────────────────
    /// Block until every submitted task has finished.
    void drain();
    /// Reject new work, drain, release workers. Called by the destructor.
    void shutdown();
    [[nodiscard]] bool is_running() const { return !scheduler_.is_stopped(); }

private:
    template <typename Param, typename Arg>
    void lower_argument(std::vector<Argument>& out, std::optional<Error>& invalid, Arg&& arg) const;

    Result<void> check_ref(FutureId id, uint64_t engine_id) const;
    Result<FutureId> submit_erased(const std::string& name, Payload payload,
                                   std::vector<Argument> args);
    Result<FutureId> put_erased(Value value);
    Result<void> release_erased(FutureId id);

    template <typename T>
    static Result<T> unwrap(const Value& value, FutureId id);

    EngineConfig config_;
    uint64_t id_;
    Logger logger_;
    std::unique_ptr<MetricsCollector> metrics_;

    FutureStore store_;
    DependencyTracker tracker_;
    WorkerPool pool_;
    Scheduler scheduler_;
    LineageGraph lineage_;
};

// ── Template implementations ─────────────────

template <typename R, typename... Params, typename... CallArgs>
    requires (sizeof...(Params) == sizeof...(CallArgs))
             && (ArgumentFor<CallArgs, Params> && ...)
Result<ObjectRef<R>> Engine::submit(const RemoteFunction<R(Params...)>& fn, CallArgs&&... args) {
    if (!fn.valid()) {
        return Error{"submit: remote function is empty"};
    }

    std::vector<Argument> lowered;
    lowered.reserve(sizeof...(CallArgs));
    std::optional<Error> invalid;
    (lower_argument<Params>(lowered, invalid, std::forward<CallArgs>(args)), ...);
    if (invalid) {
        return Error{"submit of '" + fn.name() + "': " + invalid->message};
    }

    auto id = submit_erased(fn.name(), fn.erase(), std::move(lowered));
    if (!id) return id.error();
    return ObjectRef<R>(*id, id_);
}

template <typename Param, typename Arg>
void Engine::lower_argument(std::vector<Argument>& out, std::optional<Error>& invalid,
                            Arg&& arg) const {
    const size_t index = out.size();
    if constexpr (is_object_ref_v<Arg>) {
        if (!invalid) {
            if (auto checked = check_ref(arg.id(), arg.engine_id()); !checked) {
                invalid = Error{"argument " + std::to_string(index) + ": "
                                + checked.error().message};
            }
        }
        out.emplace_back(std::in_place_type<FutureId>, arg.id());
    } else {
        out.emplace_back(std::in_place_type<Value>,
                         std::decay_t<Param>(std::forward<Arg>(arg)));
    }
}

template <typename T>
    requires StorableValue<std::decay_t<T>>
Result<ObjectRef<std::decay_t<T>>> Engine::put(T&& value) {
    using Stored = std::decay_t<T>;
    auto id = put_erased(Value{Stored(std::forward<T>(value))});
    if (!id) return id.error();
    return ObjectRef<Stored>(*id, id_);
}

template <typename T>
Result<T> Engine::unwrap(const Value& value, FutureId id) {
    if (const auto* typed = std::any_cast<T>(&value)) {
        return *typed;
    }
    return Error{"future " + to_string(id) + " holds a value of unexpected type "
                 + value.type().name(), id};
}

template <typename T>
Result<T> Engine::get(const ObjectRef<T>& ref) const {
    if (auto checked = check_ref(ref.id(), ref.engine_id()); !checked) {
        return checked.error();
    }
    auto value = store_.get(ref.id());
    if (!value) return value.error();
    return unwrap<T>(*value, ref.id());
}

template <typename T>
Result<T> Engine::get_for(const ObjectRef<T>& ref, Duration timeout) const {
    if (auto checked = check_ref(ref.id(), ref.engine_id()); !checked) {
        return checked.error();
    }
    auto value = store_.get_for(ref.id(), timeout);
    if (!value) return value.error();
    return unwrap<T>(*value, ref.id());
}

template <typename T>
Result<std::vector<T>> Engine::get_many(const std::vector<ObjectRef<T>>& refs) const {
    std::vector<FutureId> ids;
    ids.reserve(refs.size());
    for (const auto& ref : refs) {
        if (auto checked = check_ref(ref.id(), ref.engine_id()); !checked) {
            return checked.error();
        }
        ids.push_back(ref.id());
    }

    auto values = store_.get_many(ids);
    if (!values) return values.error();

    std::vector<T> typed;
    typed.reserve(values->size());
    for (size_t i = 0; i < values->size(); ++i) {
        auto item = unwrap<T>((*values)[i], ids[i]);
        if (!item) return item.error();
        typed.push_back(std::move(*item));
    }
    return typed;
}

template <typename T>
Result<WaitResult> Engine::wait(const std::vector<ObjectRef<T>>& refs,
                                size_t num_returns,
                                Duration timeout) const {
    std::vector<FutureId> ids;
    ids.reserve(refs.size());
    for (const auto& ref : refs) {
        if (auto checked = check_ref(ref.id(), ref.engine_id()); !checked) {
            return checked.error();
        }
        ids.push_back(ref.id());
    }
    return store_.wait(ids, num_returns, timeout);
}

template <typename T>
Result<void> Engine::release(const ObjectRef<T>& ref) {
    if (auto checked = check_ref(ref.id(), ref.engine_id()); !checked) {
        return checked.error();
    }
    return release_erased(ref.id());
}

template <typename T>
Result<size_t> Engine::critical_path_length(const ObjectRef<T>& ref) const {
    if (auto checked = check_ref(ref.id(), ref.engine_id()); !checked) {
        return checked.error();
    }
    auto length = lineage_.critical_path_length(ref.id());
    if (!length) return Error{"no lineage recorded for " + to_string(ref.id())};
    return *length;
}

}  // namespace task_fabric
