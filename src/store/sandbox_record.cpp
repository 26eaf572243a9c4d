#include "store/sandbox_record.hpp"
#include <fmt/format.h>
#include <random>

using json = nlohmann::json;

namespace sandpool::store {

const char* sandbox_status_to_string(SandboxStatus status) {
    switch (status) {
        case SandboxStatus::PENDING:     return "pending";
        case SandboxStatus::CREATING:    return "creating";
        case SandboxStatus::RUNNING:     return "running";
        case SandboxStatus::STOPPED:     return "stopped";
        case SandboxStatus::FAILED:      return "failed";
        case SandboxStatus::TERMINATING: return "terminating";
        default: return "unknown";
    }
}

SandboxStatus sandbox_status_from_string(const std::string& str) {
    if (str == "pending")     return SandboxStatus::PENDING;
    if (str == "creating")    return SandboxStatus::CREATING;
    if (str == "running")     return SandboxStatus::RUNNING;
    if (str == "stopped")     return SandboxStatus::STOPPED;
    if (str == "terminating") return SandboxStatus::TERMINATING;
    return SandboxStatus::FAILED;
}

// ============================================================================
// SandboxRecord Implementation
// ============================================================================

json SandboxRecord::to_json() const {
    json j;
    j["id"] = id;
    j["user_id"] = user_id;
    if (container_ref) {
        j["container_ref"] = *container_ref;
    }
    j["status"] = sandbox_status_to_string(status);
    j["image"] = image;
    if (!runtime.empty()) {
        j["runtime"] = runtime;
    }
    j["cpu_limit"] = cpu_limit;
    j["memory_limit_mb"] = memory_limit_mb;
    j["idle_timeout_sec"] = idle_timeout_sec;
    if (last_active_at) {
        j["last_active_at"] = util::format_iso8601(*last_active_at);
    }
    if (error_message) {
        j["error_message"] = *error_message;
    }
    j["created_at"] = util::format_iso8601(created_at);
    j["updated_at"] = util::format_iso8601(updated_at);
    return j;
}

SandboxRecord SandboxRecord::from_json(const json& j) {
    SandboxRecord record;
    record.id = j.at("id").get<std::string>();
    record.user_id = j.at("user_id").get<std::string>();
    if (j.contains("container_ref")) {
        record.container_ref = j["container_ref"].get<std::string>();
    }
    record.status = sandbox_status_from_string(j.value("status", "pending"));
    record.image = j.value("image", "");
    record.runtime = j.value("runtime", "");
    record.cpu_limit = j.value("cpu_limit", 1.0);
    record.memory_limit_mb = j.value("memory_limit_mb", uint64_t{512});
    record.idle_timeout_sec = j.value("idle_timeout_sec", uint32_t{3600});
    if (j.contains("last_active_at")) {
        record.last_active_at = util::parse_iso8601(j["last_active_at"].get<std::string>());
    }
    if (j.contains("error_message")) {
        record.error_message = j["error_message"].get<std::string>();
    }

    auto now = std::chrono::system_clock::now();
    record.created_at = util::parse_iso8601(j.value("created_at", "")).value_or(now);
    record.updated_at = util::parse_iso8601(j.value("updated_at", "")).value_or(record.created_at);
    return record;
}

// ============================================================================
// RecordUpdate Implementation
// ============================================================================

bool RecordUpdate::matches(const SandboxRecord& record) const {
    return !expected_status || *expected_status == record.status;
}

void RecordUpdate::apply(SandboxRecord& record, Timestamp now) const {
    if (status) {
        record.status = *status;
    }
    if (container_ref) {
        record.container_ref = *container_ref;
    }
    if (error_message) {
        record.error_message = *error_message;
    } else if (clear_error_message) {
        record.error_message.reset();
    }
    if (last_active_at) {
        // Never move activity backwards
        if (!record.last_active_at || *record.last_active_at < *last_active_at) {
            record.last_active_at = *last_active_at;
        }
    }
    record.updated_at = now;
}

std::string generate_sandbox_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();

    // Version 4, variant 10
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        static_cast<uint32_t>(hi >> 32),
        static_cast<uint32_t>((hi >> 16) & 0xFFFF),
        static_cast<uint32_t>(hi & 0xFFFF),
        static_cast<uint32_t>(lo >> 48),
        lo & 0xFFFFFFFFFFFFULL);
}

} // namespace sandpool::store
