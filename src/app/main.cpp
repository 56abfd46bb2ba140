/**
 * @file main.cpp
 * @brief TaskFabric demo entry point.
 * @author Dimitris Kafetzis
 *
 * Runs the map / reduce exercise against a local Engine:
 *   Config → Logger → Engine → map(increment) → chain reduce → tree reduce
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/engine.hpp"
#include "engine/remote_function.hpp"
#include "patterns/parallel_patterns.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace task_fabric;

namespace {

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║            TaskFabric v1.0.0              ║
  ║   Futures-based task engine: map and      ║
  ║   chain / tree reduce demonstration       ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::optional<uint32_t> workers;
    std::optional<uint32_t> latency_ms;
    std::string log_dir;
};

void print_usage() {
    std::cout << "Usage: task_fabric_demo [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --workers <n>        Worker pool size (0 = hardware concurrency)\n"
              << "  --latency-ms <ms>    Sleep inside each add task\n"
              << "  --log-dir <path>     Write NDJSON logs and metrics here instead of stdout\n"
              << "  --help, -h           Show this help message\n";
}

std::optional<uint32_t> parse_count(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used == text.size() && value >= 0
            && value <= static_cast<long long>(std::numeric_limits<uint32_t>::max())) {
            return static_cast<uint32_t>(value);
        }
    } catch (const std::exception&) {
        // reported below
    }
    std::cerr << "Invalid value for " << flag << ": '" << text << "'" << std::endl;
    std::exit(2);
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--workers" && i + 1 < argc) {
            args.workers = parse_count(arg, argv[++i]);
        } else if (arg == "--latency-ms" && i + 1 < argc) {
            args.latency_ms = parse_count(arg, argv[++i]);
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

template <typename T>
std::string join(const std::vector<T>& values) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << values[i];
    }
    oss << "]";
    return oss.str();
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

/**
 * @brief Run one reduce flavour and report value, wall time and critical path.
 */
template <typename ReduceFn>
bool run_reduce(const std::string& label, Engine& engine, ReduceFn&& reduce) {
    auto start = std::chrono::steady_clock::now();
    auto ref = reduce();
    if (!ref) {
        std::cerr << label << " rejected: " << ref.error().message << std::endl;
        return false;
    }
    auto value = engine.get(*ref);
    auto elapsed = seconds_since(start);
    if (!value) {
        std::cerr << label << " failed: " << value.error().message << std::endl;
        return false;
    }

    auto depth = engine.critical_path_length(*ref);
    std::cout << label << " = " << *value
              << "  (" << elapsed << " s, critical path "
              << (depth ? std::to_string(*depth) : std::string{"?"}) << " tasks)" << std::endl;
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args.workers) config.engine.pool_size = *args.workers;
    if (args.latency_ms) config.demo.latency_ms = *args.latency_ms;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Engine ────────────────────
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);

    Engine::Options opts;
    opts.config = config.engine;
    opts.log_level = level;
    if (!config.telemetry.log_dir.empty()) {
        opts.log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "task_fabric",
                                                       config.telemetry.max_file_size_mb);
        if (config.telemetry.metrics) {
            opts.metrics_sink = std::make_unique<JsonFileSink>(
                config.telemetry.log_dir, "task_fabric_metrics",
                config.telemetry.max_file_size_mb);
        }
    } else {
        opts.log_sink = std::make_unique<StdoutSink>();
        if (config.telemetry.metrics) {
            opts.metrics_sink = std::make_unique<StdoutSink>();
        }
    }

    Engine engine(std::move(opts));

    const auto latency = std::chrono::milliseconds(config.demo.latency_ms);
    const auto& inputs = config.demo.inputs;

    auto increment = remote("increment", [](int64_t x) { return x + 1; });
    auto add = remote("add", [latency](int64_t a, int64_t b) {
        std::this_thread::sleep_for(latency);
        return a + b;
    });

    std::cout << "Workers: " << engine.pool_size()
              << ", inputs: " << join(inputs)
              << ", add latency: " << config.demo.latency_ms << " ms\n" << std::endl;

    // ── Map ──────────────────────────────────
    auto mapped = map_parallel(engine, increment, inputs);
    if (!mapped) {
        std::cerr << "map rejected: " << mapped.error().message << std::endl;
        return 1;
    }
    auto incremented = engine.get_many(*mapped);
    if (!incremented) {
        std::cerr << "map failed: " << incremented.error().message << std::endl;
        return 1;
    }
    std::cout << "map(increment) = " << join(*incremented) << std::endl;

    if (inputs.empty()) {
        std::cout << "No inputs to reduce." << std::endl;
        return 0;
    }

    // ── Reduce ───────────────────────────────
    bool ok = run_reduce("reduce_parallel(add)", engine, [&] {
        return reduce_parallel(engine, add, inputs);
    });
    ok = run_reduce("reduce_parallel_tree(add)", engine, [&] {
        return reduce_parallel_tree(engine, add, inputs);
    }) && ok;

    auto stats = engine.stats();
    std::cout << "\nTasks submitted: " << stats.scheduler.submitted
              << ", completed: " << stats.scheduler.completed
              << ", failed: " << stats.scheduler.failed
              << ", peak concurrency: " << stats.scheduler.peak_concurrency << std::endl;

    engine.shutdown();
    return ok ? 0 : 1;
}
