#include "util/config.hpp"
#include <spdlog/spdlog.h>

#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using json = nlohmann::json;

namespace sandpool::util {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

template <typename T>
void override_unsigned(const char* name, T& target) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return;
    try {
        size_t pos = 0;
        unsigned long long value = std::stoull(raw, &pos);
        if (pos != std::string(raw).size() || raw[0] == '-') {
            throw std::invalid_argument("trailing characters");
        }
        target = static_cast<T>(value);
    } catch (const std::exception&) {
        spdlog::warn("Ignoring invalid value for {}: '{}'", name, raw);
    }
}

void override_double(const char* name, double& target) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return;
    try {
        size_t pos = 0;
        double value = std::stod(raw, &pos);
        if (pos != std::string(raw).size() || value <= 0.0) {
            throw std::invalid_argument("not a positive number");
        }
        target = value;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring invalid value for {}: '{}'", name, raw);
    }
}

void override_string(const char* name, std::string& target) {
    const char* raw = std::getenv(name);
    if (raw && *raw) {
        target = raw;
    }
}

} // namespace

json Config::to_json() const {
    json j;
    j["image"] = default_image;
    j["runtime"] = default_runtime;
    j["cpu_limit"] = cpu_limit;
    j["memory_limit_mb"] = memory_limit_mb;
    j["idle_timeout_sec"] = idle_timeout_sec;
    j["max_pool_size"] = max_pool_size;
    j["sweep_interval_sec"] = sweep_interval_sec;
    j["creating_grace_sec"] = creating_grace_sec;
    j["sandbox_root"] = sandbox_root;
    j["workspace_mount"] = workspace_mount;
    j["record_file"] = record_file;
    j["keepalive_command"] = keepalive_command;
    j["log_level"] = log_level;
    return j;
}

Config Config::from_json(const json& j) {
    return from_json(j, Config{});
}

Config Config::from_json(const json& j, const Config& base) {
    Config c = base;
    c.default_image = j.value("image", base.default_image);
    c.default_runtime = j.value("runtime", base.default_runtime);
    c.cpu_limit = j.value("cpu_limit", base.cpu_limit);
    c.memory_limit_mb = j.value("memory_limit_mb", base.memory_limit_mb);
    c.idle_timeout_sec = j.value("idle_timeout_sec", base.idle_timeout_sec);
    c.max_pool_size = j.value("max_pool_size", base.max_pool_size);
    c.sweep_interval_sec = j.value("sweep_interval_sec", base.sweep_interval_sec);
    c.creating_grace_sec = j.value("creating_grace_sec", base.creating_grace_sec);
    c.sandbox_root = j.value("sandbox_root", base.sandbox_root);
    c.workspace_mount = j.value("workspace_mount", base.workspace_mount);
    c.record_file = j.value("record_file", base.record_file);
    c.keepalive_command = j.value("keepalive_command", base.keepalive_command);
    c.log_level = j.value("log_level", base.log_level);
    return c;
}

void load_dotenv() {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    std::vector<std::filesystem::path> search_paths = {
        std::filesystem::current_path() / ".env",
        "../.env",
    };

    char exe_path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len != -1) {
        exe_path[len] = '\0';
        auto exe_dir = std::filesystem::path(exe_path).parent_path();
        search_paths.push_back(exe_dir / ".env");
        search_paths.push_back(exe_dir.parent_path() / ".env");
    }

    for (const auto& env_path : search_paths) {
        std::error_code ec;
        if (!std::filesystem::exists(env_path, ec)) continue;

        std::ifstream file(env_path);
        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;

            size_t eq_pos = line.find('=');
            if (eq_pos == std::string::npos) continue;

            std::string key = trim(line.substr(0, eq_pos));
            std::string value = trim(line.substr(eq_pos + 1));

            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            if (!key.empty() && !value.empty()) {
                setenv(key.c_str(), value.c_str(), 0);
            }
        }
        spdlog::debug("Loaded environment from {}", env_path.string());
        break;
    }
}

bool load_config_file(const std::string& path, Config& config) {
    std::ifstream file(path);
    if (!file) {
        spdlog::warn("Cannot open config file {}", path);
        return false;
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            spdlog::warn("Config file {} must contain a JSON object", path);
            return false;
        }
        config = Config::from_json(j, config);
    } catch (const json::exception& e) {
        spdlog::warn("Invalid config file {}: {}", path, e.what());
        return false;
    }

    spdlog::debug("Loaded config from {}", path);
    return true;
}

void apply_env_overrides(Config& config) {
    override_string("SANDPOOL_IMAGE", config.default_image);
    override_string("SANDPOOL_RUNTIME", config.default_runtime);
    override_double("SANDPOOL_CPU_LIMIT", config.cpu_limit);
    override_unsigned("SANDPOOL_MEMORY_LIMIT_MB", config.memory_limit_mb);
    override_unsigned("SANDPOOL_IDLE_TIMEOUT", config.idle_timeout_sec);
    override_unsigned("SANDPOOL_MAX_POOL_SIZE", config.max_pool_size);
    override_unsigned("SANDPOOL_SWEEP_INTERVAL", config.sweep_interval_sec);
    override_unsigned("SANDPOOL_CREATING_GRACE", config.creating_grace_sec);
    override_string("SANDPOOL_SANDBOX_ROOT", config.sandbox_root);
    override_string("SANDPOOL_WORKSPACE_MOUNT", config.workspace_mount);
    override_string("SANDPOOL_RECORD_FILE", config.record_file);
    override_string("SANDPOOL_LOG_LEVEL", config.log_level);
}

Config load_config(const std::string& config_path) {
    Config config;
    if (!config_path.empty()) {
        load_config_file(config_path, config);
    }
    load_dotenv();
    apply_env_overrides(config);
    return config;
}

} // namespace sandpool::util
