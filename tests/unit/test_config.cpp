/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace task_fabric;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "tf_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.engine.name, "task-fabric");
    EXPECT_EQ(config.engine.pool_size, 4u);
    EXPECT_TRUE(config.telemetry.log_dir.empty());
    EXPECT_EQ(config.telemetry.log_level, "info");
    EXPECT_FALSE(config.telemetry.metrics);
    EXPECT_EQ(config.demo.inputs, (std::vector<int64_t>{1, 2, 3, 4, 5, 6, 7, 8}));
    EXPECT_EQ(config.demo.latency_ms, 100u);
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [engine]
        name = "bench"
        pool_size = 8

        [telemetry]
        log_dir = "/tmp/tf_logs"
        log_level = "debug"
        metrics = true
        max_file_size_mb = 10

        [demo]
        inputs = [3, 1, 4, 1, 5]
        latency_ms = 20
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.engine.name, "bench");
    EXPECT_EQ(config.engine.pool_size, 8u);
    EXPECT_EQ(config.telemetry.log_dir, "/tmp/tf_logs");
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_TRUE(config.telemetry.metrics);
    EXPECT_EQ(config.telemetry.max_file_size_mb, 10u);
    EXPECT_EQ(config.demo.inputs, (std::vector<int64_t>{3, 1, 4, 1, 5}));
    EXPECT_EQ(config.demo.latency_ms, 20u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [engine]
        pool_size = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->engine.pool_size, 2u);
    // Defaults for everything else
    EXPECT_EQ(result->engine.name, "task-fabric");
    EXPECT_EQ(result->demo.latency_ms, 100u);
}

TEST_F(ConfigTest, ZeroPoolSizeMeansHardwareConcurrency) {
    auto path = write_toml("[engine]\npool_size = 0\n");
    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->engine.pool_size, 0u);
}

TEST_F(ConfigTest, NegativePoolSizeRejected) {
    auto path = write_toml("[engine]\npool_size = -1\n");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("pool_size"), std::string::npos);
}

TEST_F(ConfigTest, NegativeOrOversizedCountsRejected) {
    auto size = load_config(write_toml("[telemetry]\nmax_file_size_mb = -5\n"));
    ASSERT_FALSE(size.has_value());
    EXPECT_NE(size.error().message.find("telemetry.max_file_size_mb"), std::string::npos);

    auto latency = load_config(write_toml("[demo]\nlatency_ms = -1\n"));
    ASSERT_FALSE(latency.has_value());
    EXPECT_NE(latency.error().message.find("demo.latency_ms"), std::string::npos);

    auto pool = load_config(write_toml("[engine]\npool_size = 4294967296\n"));
    ASSERT_FALSE(pool.has_value());
    EXPECT_NE(pool.error().message.find("engine.pool_size"), std::string::npos);

    auto largest = load_config(write_toml("[demo]\nlatency_ms = 4294967295\n"));
    ASSERT_TRUE(largest.has_value());
    EXPECT_EQ(largest->demo.latency_ms, 4294967295u);
}

TEST_F(ConfigTest, UnknownLogLevelRejected) {
    auto path = write_toml("[telemetry]\nlog_level = \"verbose\"\n");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, NonIntegerInputsRejected) {
    auto path = write_toml("[demo]\ninputs = [1, \"two\", 3]\n");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    EXPECT_FALSE(result.has_value());
}
