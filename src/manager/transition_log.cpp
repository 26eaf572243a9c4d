#include "manager/transition_log.hpp"
#include "util/time_format.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace sandpool::manager {

using json = nlohmann::json;

// ============================================================================
// TransitionEntry Implementation
// ============================================================================

json TransitionEntry::to_json() const {
    json j;
    j["id"] = id;
    j["timestamp"] = util::format_iso8601(timestamp);
    j["sandbox_id"] = sandbox_id;
    j["user_id"] = user_id;
    j["from"] = from ? json(store::sandbox_status_to_string(*from)) : json(nullptr);
    j["to"] = store::sandbox_status_to_string(to);
    if (!detail.empty()) {
        j["detail"] = detail;
    }
    return j;
}

std::string TransitionEntry::to_jsonl() const {
    return to_json().dump() + "\n";
}

// ============================================================================
// TransitionLog Implementation
// ============================================================================

TransitionLog::TransitionLog(size_t max_entries)
    : max_entries_(std::max<size_t>(max_entries, 1)) {}

void TransitionLog::record(const std::string& sandbox_id,
                           const std::string& user_id,
                           std::optional<store::SandboxStatus> from,
                           store::SandboxStatus to,
                           const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);

    TransitionEntry entry;
    entry.id = next_id_++;
    entry.timestamp = std::chrono::system_clock::now();
    entry.sandbox_id = sandbox_id;
    entry.user_id = user_id;
    entry.from = from;
    entry.to = to;
    entry.detail = detail;

    entries_.push_back(std::move(entry));
    while (entries_.size() > max_entries_) {
        entries_.pop_front();
    }
}

std::vector<TransitionEntry> TransitionLog::get_entries(uint64_t since_id, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransitionEntry> result;

    for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
        if (it->id <= since_id) {
            break;
        }
        result.push_back(*it);
    }

    std::reverse(result.begin(), result.end());
    return result;
}

std::vector<TransitionEntry> TransitionLog::entries_for(const std::string& sandbox_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransitionEntry> result;
    for (const auto& entry : entries_) {
        if (entry.sandbox_id == sandbox_id) {
            result.push_back(entry);
        }
    }
    return result;
}

std::string TransitionLog::export_jsonl(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    size_t count = 0;
    for (const auto& entry : entries_) {
        if (limit > 0 && count >= limit) {
            break;
        }
        oss << entry.to_jsonl();
        count++;
    }
    return oss.str();
}

void TransitionLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    spdlog::debug("TransitionLog cleared");
}

size_t TransitionLog::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t TransitionLog::last_entry_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

} // namespace sandpool::manager
