/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace task_fabric {

struct EngineConfig {
    std::string name = "task-fabric";
    uint32_t pool_size = 4;             ///< 0 = hardware_concurrency
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< empty = stdout
    std::string log_level = "info";
    bool metrics = false;
    uint32_t max_file_size_mb = 50;
};

struct DemoConfig {
    std::vector<int64_t> inputs = {1, 2, 3, 4, 5, 6, 7, 8};
    uint32_t latency_ms = 100;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    EngineConfig engine;
    TelemetryConfig telemetry;
    DemoConfig demo;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace task_fabric
