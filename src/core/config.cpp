/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>

namespace task_fabric {

namespace {

/// Read an unsigned 32-bit setting, rejecting negative or oversized values.
Result<uint32_t> read_count(toml::node_view<toml::node> table, const std::string& table_name,
                            const std::string& key, int64_t fallback) {
    const int64_t value = table[key].value_or(fallback);
    if (value < 0 || value > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return Error{table_name + "." + key + " must be between 0 and "
                     + std::to_string(std::numeric_limits<uint32_t>::max())
                     + ", got " + std::to_string(value)};
    }
    return static_cast<uint32_t>(value);
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            config.engine.name = engine["name"].value_or(std::string{"task-fabric"});
            auto pool_size = read_count(engine, "engine", "pool_size", 4);
            if (!pool_size) return pool_size.error();
            config.engine.pool_size = *pool_size;
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.metrics = telemetry["metrics"].value_or(false);
            auto max_file_size = read_count(telemetry, "telemetry", "max_file_size_mb", 50);
            if (!max_file_size) return max_file_size.error();
            config.telemetry.max_file_size_mb = *max_file_size;

            if (!parse_log_level(config.telemetry.log_level)) {
                return Error{"Unknown telemetry.log_level: " + config.telemetry.log_level};
            }
        }

        // [demo]
        if (auto demo = tbl["demo"]; demo.is_table()) {
            if (auto* inputs = demo["inputs"].as_array()) {
                config.demo.inputs.clear();
                for (const auto& element : *inputs) {
                    auto v = element.value_exact<int64_t>();
                    if (!v) return Error{"demo.inputs must contain only integers"};
                    config.demo.inputs.push_back(*v);
                }
            }
            auto latency = read_count(demo, "demo", "latency_ms", 100);
            if (!latency) return latency.error();
            config.demo.latency_ms = *latency;
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace task_fabric
