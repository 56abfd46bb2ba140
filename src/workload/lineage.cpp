/**
 * @file lineage.cpp
 * @brief LineageGraph implementation.
 * @author Dimitris Kafetzis
 */

#include "workload/lineage.hpp"

#include <algorithm>

namespace task_fabric {

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

void LineageGraph::add_task(FutureId id, std::string name,
                            const std::vector<FutureId>& dependencies) {
    std::lock_guard lock(mutex_);

    LineageNode node{
        .id = id,
        .name = std::move(name),
        .dependencies = {},
        .is_task = true,
        .level = 1
    };

    for (const auto& dep : dependencies) {
        if (std::find(node.dependencies.begin(), node.dependencies.end(), dep)
            != node.dependencies.end()) {
            continue;
        }
        node.dependencies.push_back(dep);
        dependents_[dep].push_back(id);

        // Unknown dependencies (never recorded) contribute nothing.
        if (auto it = nodes_.find(dep); it != nodes_.end()) {
            node.level = std::max(node.level, it->second.level + 1);
        }
    }

    nodes_.insert_or_assign(id, std::move(node));
    ++task_count_;
}

void LineageGraph::add_value(FutureId id) {
    std::lock_guard lock(mutex_);
    nodes_.insert_or_assign(id, LineageNode{
        .id = id,
        .name = "put",
        .dependencies = {},
        .is_task = false,
        .level = 0
    });
}

void LineageGraph::remove(FutureId id) {
    std::lock_guard lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return;

    for (const auto& dep : it->second.dependencies) {
        auto edges = dependents_.find(dep);
        if (edges == dependents_.end()) continue;
        std::erase(edges->second, id);
        if (edges->second.empty()) dependents_.erase(edges);
    }
    dependents_.erase(id);
    nodes_.erase(it);
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

bool LineageGraph::contains(FutureId id) const {
    std::lock_guard lock(mutex_);
    return nodes_.contains(id);
}

std::optional<LineageNode> LineageGraph::get(FutureId id) const {
    std::lock_guard lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

std::vector<FutureId> LineageGraph::dependencies(FutureId id) const {
    std::lock_guard lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return {};
    return it->second.dependencies;
}

std::vector<FutureId> LineageGraph::dependents(FutureId id) const {
    std::lock_guard lock(mutex_);
    auto it = dependents_.find(id);
    if (it == dependents_.end()) return {};
    return it->second;
}

size_t LineageGraph::task_count() const {
    std::lock_guard lock(mutex_);
    return task_count_;
}

size_t LineageGraph::size() const {
    std::lock_guard lock(mutex_);
    return nodes_.size();
}

// ─────────────────────────────────────────────
// Metrics
// ─────────────────────────────────────────────

std::optional<size_t> LineageGraph::critical_path_length(FutureId id) const {
    std::lock_guard lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second.level;
}

std::vector<FutureId> LineageGraph::critical_path(FutureId id) const {
    std::lock_guard lock(mutex_);

    std::vector<FutureId> path;
    auto it = nodes_.find(id);
    while (it != nodes_.end() && it->second.is_task) {
        path.push_back(it->first);

        // Step to the deepest recorded dependency.
        auto next = nodes_.end();
        for (const auto& dep : it->second.dependencies) {
            auto dep_it = nodes_.find(dep);
            if (dep_it == nodes_.end()) continue;
            if (next == nodes_.end() || dep_it->second.level > next->second.level) {
                next = dep_it;
            }
        }
        it = next;
    }

    std::reverse(path.begin(), path.end());
    return path;
}

std::map<size_t, size_t> LineageGraph::level_widths() const {
    std::lock_guard lock(mutex_);
    std::map<size_t, size_t> widths;
    for (const auto& [id, node] : nodes_) {
        if (node.is_task) ++widths[node.level];
    }
    return widths;
}

}  // namespace task_fabric
