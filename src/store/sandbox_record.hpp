/**
 * Sandbox record
 *
 * Durable description of one user's sandbox: identity, declared status,
 * resource policy and activity timestamps. Exactly one record per user.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "util/time_format.hpp"

namespace sandpool::store {

using util::Timestamp;

enum class SandboxStatus {
    PENDING,
    CREATING,
    RUNNING,
    STOPPED,
    FAILED,
    TERMINATING
};

const char* sandbox_status_to_string(SandboxStatus status);

// Unknown strings parse as FAILED
SandboxStatus sandbox_status_from_string(const std::string& str);

struct SandboxRecord {
    std::string id;
    std::string user_id;
    std::optional<std::string> container_ref;
    SandboxStatus status = SandboxStatus::PENDING;

    std::string image;
    std::string runtime;

    double cpu_limit = 1.0;              // Cores
    uint64_t memory_limit_mb = 512;
    uint32_t idle_timeout_sec = 3600;

    std::optional<Timestamp> last_active_at;
    std::optional<std::string> error_message;
    Timestamp created_at;
    Timestamp updated_at;

    nlohmann::json to_json() const;
    static SandboxRecord from_json(const nlohmann::json& j);
};

// Partial update. Unset fields are left alone.
struct RecordUpdate {
    std::optional<SandboxStatus> status;
    std::optional<std::string> container_ref;
    std::optional<std::string> error_message;
    bool clear_error_message = false;
    std::optional<Timestamp> last_active_at;

    // Optimistic check: only apply when the stored status matches
    std::optional<SandboxStatus> expected_status;

    bool matches(const SandboxRecord& record) const;

    // Apply to record and stamp updated_at
    void apply(SandboxRecord& record, Timestamp now) const;
};

// Admin listing filter, ordered by updated_at descending
struct RecordQuery {
    std::optional<SandboxStatus> status;
    std::optional<std::string> user_id;
    size_t page = 1;                     // 1-based
    size_t page_size = 20;               // Clamped to 1..100
};

struct RecordPage {
    std::vector<SandboxRecord> items;
    size_t total = 0;
    size_t page = 1;
    size_t page_size = 20;
};

// Random UUIDv4 string
std::string generate_sandbox_id();

} // namespace sandpool::store
