/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include "scheduler/scheduler.hpp"

#include <chrono>
#include <sstream>

namespace task_fabric {

namespace {

int64_t now_micros() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_task_event(TaskId id, std::string_view name,
                                         TaskState state, Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"task_state_change")"
        << R"(,"ts_us":)" << now_micros()
        << R"(,"task":")" << to_string(id) << "\""
        << R"(,"name":")" << json_escape(name) << "\""
        << R"(,"state":")" << to_string(state) << "\""
        << R"(,"duration_us":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_scheduler_stats(const SchedulerStats& stats) {
    std::ostringstream oss;
    oss << R"({"event":"engine_stats")"
        << R"(,"ts_us":)" << now_micros()
        << R"(,"submitted":)" << stats.submitted
        << R"(,"completed":)" << stats.completed
        << R"(,"failed":)" << stats.failed
        << R"(,"propagated_failures":)" << stats.propagated_failures
        << R"(,"peak_concurrency":)" << stats.peak_concurrency
        << R"(,"queued":)" << stats.queued
        << R"(,"running":)" << stats.running
        << R"(,"waiting":)" << stats.waiting
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace task_fabric
