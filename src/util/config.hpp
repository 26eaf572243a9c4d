/**
 * sandpool configuration
 *
 * Defaults, overridden in order by a JSON config file, a .env file and
 * SANDPOOL_* environment variables.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sandpool::util {

struct Config {
    // Defaults applied to newly created sandbox records
    std::string default_image = "python:3.12-slim";
    std::string default_runtime = "namespace";
    double cpu_limit = 1.0;                  // CPU cores
    uint64_t memory_limit_mb = 512;
    uint32_t idle_timeout_sec = 3600;

    // Pool and reconciliation
    size_t max_pool_size = 100;
    uint32_t sweep_interval_sec = 60;
    uint32_t creating_grace_sec = 300;       // Age after which "creating" is stale

    // Per-user persistent workspace
    std::string sandbox_root = "/tmp/sandboxes";
    std::string workspace_mount = "/workspace";

    std::string record_file = "sandboxes.json";
    std::vector<std::string> keepalive_command = {"sleep", "infinity"};
    std::string log_level = "info";

    nlohmann::json to_json() const;
    // Fields missing from j keep the defaults, or the values of base
    static Config from_json(const nlohmann::json& j);
    static Config from_json(const nlohmann::json& j, const Config& base);
};

// Load environment variables from the first .env file found near the
// working directory or the executable. Existing variables win.
void load_dotenv();

// Merge a JSON config file into config. Returns false (config untouched)
// if the file cannot be read or parsed.
bool load_config_file(const std::string& path, Config& config);

// Apply SANDPOOL_* environment variables
void apply_env_overrides(Config& config);

// defaults -> config file (if path non-empty) -> .env -> environment
Config load_config(const std::string& config_path = "");

} // namespace sandpool::util
