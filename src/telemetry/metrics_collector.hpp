/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace task_fabric {

struct SchedulerStats;

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * Events:
 *   {"event":"task_state_change","task":"3.0","name":"add","state":"resolved","duration_us":..}
 *   {"event":"engine_stats","submitted":..,"completed":..,...}
 *   {"event":"<custom>","data":<payload>}
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_task_event(TaskId id, std::string_view name, TaskState state, Duration duration);
    void record_scheduler_stats(const SchedulerStats& stats);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace task_fabric
