/**
 * @file engine.cpp
 * @brief Engine implementation: component wiring and type-erased entry points.
 * @author Dimitris Kafetzis
 */

#include "engine/engine.hpp"

#include "telemetry/json_sink.hpp"

#include <atomic>

namespace task_fabric {

namespace {

std::atomic<uint64_t> next_engine_id{1};

std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

std::unique_ptr<MetricsCollector> make_metrics(std::unique_ptr<ILogSink> sink) {
    if (!sink) return nullptr;
    return std::make_unique<MetricsCollector>(std::move(sink));
}

Engine::Options options_for(size_t pool_size) {
    Engine::Options opts;
    opts.config.pool_size = static_cast<uint32_t>(pool_size);
    return opts;
}

}  // namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Engine::Engine(Options opts)
    : config_(std::move(opts.config))
    , id_(next_engine_id.fetch_add(1))
    , logger_(or_null_sink(std::move(opts.log_sink)), opts.log_level)
    , metrics_(make_metrics(std::move(opts.metrics_sink)))
    , store_(logger_)
    , tracker_(store_, logger_)
    , pool_(store_, logger_, config_.pool_size)
    , scheduler_(store_, tracker_, pool_, logger_, metrics_.get()) {
    store_.on_resolved([this](const Resolution& resolution, std::vector<TaskId> subscribers) {
        tracker_.on_resolved(resolution, subscribers);
    });

    logger_.info("Engine '" + config_.name + "' started with "
                 + std::to_string(pool_.slot_count()) + " workers");
}

Engine::Engine(size_t pool_size)
    : Engine(options_for(pool_size)) {}

Engine::~Engine() {
    shutdown();
}

// ─────────────────────────────────────────────
// Type-erased entry points
// ─────────────────────────────────────────────

Result<void> Engine::check_ref(FutureId id, uint64_t engine_id) const {
    if (id.is_null()) {
        return Error{"null object reference"};
    }
    if (engine_id != id_) {
        return Error{"object reference " + to_string(id) + " belongs to another engine", id};
    }
    return Result<void>{};
}

Result<FutureId> Engine::submit_erased(const std::string& name, Payload payload,
                                       std::vector<Argument> args) {
    std::vector<FutureId> dependencies;
    for (const auto& arg : args) {
        if (const auto* dep = std::get_if<FutureId>(&arg)) {
            dependencies.push_back(*dep);
        }
    }

    auto id = scheduler_.submit(name, std::move(payload), std::move(args));
    if (!id) {
        logger_.warn(id.error().message);
        return id;
    }

    lineage_.add_task(*id, name, dependencies);
    if (logger_.enabled(LogLevel::Debug)) {
        logger_.debug("Submitted " + name + "#" + to_string(*id) + " with "
                      + std::to_string(dependencies.size()) + " future arguments");
    }
    return id;
}

Result<FutureId> Engine::put_erased(Value value) {
    if (scheduler_.is_stopped()) {
        return Error{"put: engine is stopped"};
    }
    const FutureId id = store_.allocate();
    lineage_.add_value(id);
    store_.resolve(id, std::move(value));
    return id;
}

Result<void> Engine::release_erased(FutureId id) {
    auto released = store_.release(id);
    if (!released) return released;

    scheduler_.forget(id);
    lineage_.remove(id);
    return released;
}

// ─────────────────────────────────────────────
// Introspection & Lifecycle
// ─────────────────────────────────────────────

EngineStats Engine::stats() const {
    return EngineStats{
        .scheduler = scheduler_.stats(),
        .live_futures = store_.live_count(),
        .pool_size = pool_.slot_count()
    };
}

void Engine::drain() {
    scheduler_.drain();
}

void Engine::shutdown() {
    if (scheduler_.is_stopped()) return;

    scheduler_.stop();
    if (metrics_) {
        metrics_->record_scheduler_stats(scheduler_.stats());
        metrics_->flush();
    }
    logger_.info("Engine '" + config_.name + "' shut down");
    logger_.flush();
}

}  // namespace task_fabric
