/**
 * @file lineage.hpp
 * @brief Record of which futures each submitted task consumed.
 * @author Dimitris Kafetzis
 *
 * Every submission adds one node whose edges point at the futures passed as
 * arguments. Since a task can only name futures that already exist, nodes
 * arrive in topological order and each node's level (the number of task
 * executions on the longest path ending at it) is fixed on insertion.
 */

#pragma once

#include "core/types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace task_fabric {

struct LineageNode {
    FutureId id;
    std::string name;
    std::vector<FutureId> dependencies;   ///< Distinct, in argument order
    bool is_task = true;                  ///< false for values placed with put()
    size_t level = 0;                     ///< 0 for values, 1 + max(dependency level) for tasks
};

/**
 * @brief Thread-safe lineage graph over futures.
 */
class LineageGraph {
public:
    LineageGraph() = default;

    // ── Construction ──────────────────────────
    void add_task(FutureId id, std::string name, const std::vector<FutureId>& dependencies);
    void add_value(FutureId id);
    /**
     * @brief Drop the node of a released future and the edges touching it.
     *
     * Levels already recorded on its dependents are kept. A critical path
     * walk stops at the removed node.
     */
    void remove(FutureId id);

    // ── Queries ───────────────────────────────
    [[nodiscard]] bool contains(FutureId id) const;
    [[nodiscard]] std::optional<LineageNode> get(FutureId id) const;
    [[nodiscard]] std::vector<FutureId> dependencies(FutureId id) const;
    [[nodiscard]] std::vector<FutureId> dependents(FutureId id) const;
    [[nodiscard]] size_t task_count() const;
    [[nodiscard]] size_t size() const;

    // ── Metrics ───────────────────────────────
    /// Task executions on the longest dependency chain ending at `id`.
    [[nodiscard]] std::optional<size_t> critical_path_length(FutureId id) const;
    /// Task ids along that chain, earliest first.
    [[nodiscard]] std::vector<FutureId> critical_path(FutureId id) const;
    /// Number of tasks at each level; the width bounds the parallelism available there.
    [[nodiscard]] std::map<size_t, size_t> level_widths() const;

private:
    std::unordered_map<FutureId, LineageNode> nodes_;
    std::unordered_map<FutureId, std::vector<FutureId>> dependents_;   // forward edges
    size_t task_count_{0};
    mutable std::mutex mutex_;
};

}  // namespace task_fabric
