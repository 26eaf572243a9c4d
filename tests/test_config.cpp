#include "util/config.hpp"
#include "util/logger.hpp"
#include "util/time_format.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace sandpool::util;

namespace fs = std::filesystem;

namespace {

// Clears the named variable on construction and destruction
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() { unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ("python:3.12-slim", config.default_image);
    EXPECT_DOUBLE_EQ(1.0, config.cpu_limit);
    EXPECT_EQ(512u, config.memory_limit_mb);
    EXPECT_EQ(3600u, config.idle_timeout_sec);
    EXPECT_EQ(100u, config.max_pool_size);
    EXPECT_EQ("/tmp/sandboxes", config.sandbox_root);
    EXPECT_EQ("/workspace", config.workspace_mount);
    EXPECT_EQ((std::vector<std::string>{"sleep", "infinity"}), config.keepalive_command);
}

TEST(ConfigTest, FromJsonKeepsUnsetFields) {
    auto j = nlohmann::json::parse(R"({"image": "alpine:3", "max_pool_size": 5})");
    Config config = Config::from_json(j);
    EXPECT_EQ("alpine:3", config.default_image);
    EXPECT_EQ(5u, config.max_pool_size);
    EXPECT_EQ(3600u, config.idle_timeout_sec);

    Config again = Config::from_json(config.to_json());
    EXPECT_EQ("alpine:3", again.default_image);
    EXPECT_EQ(5u, again.max_pool_size);
}

TEST(ConfigTest, FromJsonOverlaysBase) {
    Config base;
    base.idle_timeout_sec = 90;
    base.default_image = "debian:12";

    Config merged = Config::from_json(nlohmann::json::parse(R"({"max_pool_size": 9})"), base);
    EXPECT_EQ(9u, merged.max_pool_size);
    EXPECT_EQ(90u, merged.idle_timeout_sec);
    EXPECT_EQ("debian:12", merged.default_image);
}

TEST(ConfigTest, LoadConfigFile) {
    auto path = fs::temp_directory_path() / ("sandpool-config-" + std::to_string(getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"idle_timeout_sec": 120, "memory_limit_mb": 2048, "keepalive_command": ["cat"]})";
    }

    Config config;
    EXPECT_TRUE(load_config_file(path.string(), config));
    EXPECT_EQ(120u, config.idle_timeout_sec);
    EXPECT_EQ(2048u, config.memory_limit_mb);
    EXPECT_EQ(std::vector<std::string>{"cat"}, config.keepalive_command);
    fs::remove(path);
}

TEST(ConfigTest, BadConfigFileLeavesConfigUntouched) {
    auto path = fs::temp_directory_path() / ("sandpool-badconfig-" + std::to_string(getpid()) + ".json");
    {
        std::ofstream out(path);
        out << "[1, 2";
    }

    Config config;
    EXPECT_FALSE(load_config_file(path.string(), config));
    EXPECT_FALSE(load_config_file("/nonexistent/sandpool.json", config));
    EXPECT_EQ(3600u, config.idle_timeout_sec);
    fs::remove(path);
}

TEST(ConfigTest, EnvironmentOverrides) {
    ScopedEnv image("SANDPOOL_IMAGE", "debian:12");
    ScopedEnv pool("SANDPOOL_MAX_POOL_SIZE", "7");
    ScopedEnv cpu("SANDPOOL_CPU_LIMIT", "0.5");
    ScopedEnv idle("SANDPOOL_IDLE_TIMEOUT", "90");

    Config config;
    apply_env_overrides(config);
    EXPECT_EQ("debian:12", config.default_image);
    EXPECT_EQ(7u, config.max_pool_size);
    EXPECT_DOUBLE_EQ(0.5, config.cpu_limit);
    EXPECT_EQ(90u, config.idle_timeout_sec);
}

TEST(ConfigTest, InvalidEnvironmentValuesAreIgnored) {
    ScopedEnv pool("SANDPOOL_MAX_POOL_SIZE", "many");
    ScopedEnv cpu("SANDPOOL_CPU_LIMIT", "-1");
    ScopedEnv mem("SANDPOOL_MEMORY_LIMIT_MB", "-5");

    Config config;
    apply_env_overrides(config);
    EXPECT_EQ(100u, config.max_pool_size);
    EXPECT_DOUBLE_EQ(1.0, config.cpu_limit);
    EXPECT_EQ(512u, config.memory_limit_mb);
}

TEST(ConfigTest, EnvironmentWinsOverFile) {
    auto path = fs::temp_directory_path() / ("sandpool-precedence-" + std::to_string(getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"idle_timeout_sec": 120, "max_pool_size": 3})";
    }
    ScopedEnv idle("SANDPOOL_IDLE_TIMEOUT", "45");

    Config config = load_config(path.string());
    EXPECT_EQ(45u, config.idle_timeout_sec);
    EXPECT_EQ(3u, config.max_pool_size);
    fs::remove(path);
}

TEST(LoggerTest, LevelFromString) {
    EXPECT_EQ(spdlog::level::debug, log_level_from_string("debug"));
    EXPECT_EQ(spdlog::level::warn, log_level_from_string("warn"));
    EXPECT_EQ(spdlog::level::err, log_level_from_string("error"));
    EXPECT_EQ(spdlog::level::info, log_level_from_string("verbose"));
}

TEST(TimeFormatTest, Iso8601) {
    auto tp = std::chrono::system_clock::from_time_t(0) + std::chrono::milliseconds(1500);
    EXPECT_EQ("1970-01-01T00:00:01.500Z", format_iso8601(tp));

    auto parsed = parse_iso8601("1970-01-01T00:00:01.500Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(tp, *parsed);

    EXPECT_FALSE(parse_iso8601("yesterday").has_value());
}
