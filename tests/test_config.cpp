#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "common/config.hpp"
#include "common/logging.hpp"

TEST(ConfigTest, ReadsTypedValues) {
    auto config = Config::fromString(R"(
scheduler_config:
  name: "nightly"
  max_concurrency: 4
log_config:
  verbose: true
  ratio: 0.5
  sinks: [console, file]
)");
    EXPECT_EQ(config.getString("scheduler_config", "name"), "nightly");
    EXPECT_EQ(config.getInt("scheduler_config", "max_concurrency"), 4);
    EXPECT_TRUE(config.getBool("log_config", "verbose"));
    EXPECT_DOUBLE_EQ(config.getDouble("log_config", "ratio"), 0.5);
    EXPECT_EQ(config.getArray<std::string>("log_config", "sinks"),
              (std::vector<std::string>{"console", "file"}));
}

TEST(ConfigTest, MissingAndBadValues) {
    auto config = Config::fromString("scheduler_config:\n  name: x\n  max_concurrency: many\n");
    EXPECT_TRUE(config.has("scheduler_config", "name"));
    EXPECT_FALSE(config.has("scheduler_config", "worker_threads"));
    EXPECT_FALSE(config.has("watcher_config", "poll_interval_ms"));

    EXPECT_THROW(config.getInt("scheduler_config", "max_concurrency"), std::runtime_error);
    EXPECT_THROW(config.getInt("scheduler_config", "worker_threads"), std::runtime_error);
    EXPECT_EQ(config.getOr<int>("watcher_config", "poll_interval_ms", 500), 500);
    EXPECT_THROW(config.getOr<int>("scheduler_config", "max_concurrency", 1), std::runtime_error);
}

TEST(ConfigTest, ArrayWithDecoder) {
    auto config = Config::fromString("a:\n  limits: [{n: 1}, {n: 2}]\n");
    auto values = config.getArray<int>("a", "limits", [](const YAML::Node& node) {
        return node["n"].as<int>();
    });
    EXPECT_EQ(values, (std::vector<int>{1, 2}));
    EXPECT_THROW(config.getArray<int>("a", "missing", [](const YAML::Node& n) { return n.as<int>(); }),
                 std::runtime_error);
}

TEST(ConfigTest, UnknownKeysReported) {
    auto config = Config::fromString("log_config:\n  log_level: info\n  colour: true\n");
    EXPECT_EQ(config.unknownKeys("log_config", {"log_level", "pattern"}),
              (std::vector<std::string>{"colour"}));
    EXPECT_TRUE(config.unknownKeys("scheduler_config", {"name"}).empty());
}

TEST(ConfigTest, LoadsFromFile) {
    const char* path = "jobpilot_test_config.yaml";
    {
        std::ofstream out(path);
        out << "watcher_config:\n  poll_interval_ms: 250\n";
    }
    Config config(path);
    EXPECT_EQ(config.getInt("watcher_config", "poll_interval_ms"), 250);
    std::remove(path);

    EXPECT_THROW(Config("does/not/exist.yaml"), std::runtime_error);
    EXPECT_THROW(Config::fromString("a: [unclosed"), std::runtime_error);
}

TEST(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(parseLogLevel("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(parseLogLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("error"), spdlog::level::err);
    EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
    EXPECT_EQ(parseLogLevel("nonsense"), spdlog::level::info);
}

TEST(LoggingTest, InitLoggingAppliesLevel) {
    initLogging(Config::fromString("log_config:\n  log_level: error\n"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
    initLogging(Config::fromString("{}"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
}
