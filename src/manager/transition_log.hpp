/**
 * Transition Log
 *
 * Bounded, in-memory audit trail of every sandbox status change made by
 * the manager. Exportable as JSONL.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "store/sandbox_record.hpp"

namespace sandpool::manager {

struct TransitionEntry {
    uint64_t id;                                     // Monotonic entry id
    store::Timestamp timestamp;
    std::string sandbox_id;
    std::string user_id;
    std::optional<store::SandboxStatus> from;        // Unset for record creation
    store::SandboxStatus to;
    std::string detail;                              // e.g. "idle eviction"

    nlohmann::json to_json() const;
    std::string to_jsonl() const;
};

class TransitionLog {
public:
    explicit TransitionLog(size_t max_entries = 10000);

    void record(const std::string& sandbox_id,
                const std::string& user_id,
                std::optional<store::SandboxStatus> from,
                store::SandboxStatus to,
                const std::string& detail = "");

    // Entries after since_id, oldest first
    std::vector<TransitionEntry> get_entries(uint64_t since_id = 0, size_t limit = 100) const;

    // Full retained history of one sandbox, oldest first
    std::vector<TransitionEntry> entries_for(const std::string& sandbox_id) const;

    std::string export_jsonl(size_t limit = 0) const;  // 0 = all entries

    void clear();
    size_t entry_count() const;
    uint64_t last_entry_id() const;

private:
    size_t max_entries_;
    std::deque<TransitionEntry> entries_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
};

} // namespace sandpool::manager
