#include "store/memory_record_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_set>

namespace sandpool::store {

std::optional<SandboxRecord> MemoryRecordStore::find_by_user_id(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_user_.find(user_id);
    if (it == by_user_.end()) {
        return std::nullopt;
    }
    return records_.at(it->second);
}

std::optional<SandboxRecord> MemoryRecordStore::find_by_id(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SandboxRecord> MemoryRecordStore::find_by_status(SandboxStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SandboxRecord> result;
    for (const auto& [_, record] : records_) {
        if (record.status == status) {
            result.push_back(record);
        }
    }
    return result;
}

std::vector<SandboxRecord> MemoryRecordStore::list_by_ids(const std::vector<std::string>& ids) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SandboxRecord> result;
    for (const auto& id : ids) {
        auto it = records_.find(id);
        if (it != records_.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

RecordPage MemoryRecordStore::list(const RecordQuery& query) const {
    RecordPage page;
    page.page = std::max<size_t>(query.page, 1);
    page.page_size = std::clamp<size_t>(query.page_size, 1, 100);

    std::vector<SandboxRecord> matches;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, record] : records_) {
            if (query.status && record.status != *query.status) continue;
            if (query.user_id && record.user_id != *query.user_id) continue;
            matches.push_back(record);
        }
    }

    std::sort(matches.begin(), matches.end(), [](const SandboxRecord& a, const SandboxRecord& b) {
        if (a.updated_at != b.updated_at) return a.updated_at > b.updated_at;
        return a.id < b.id;
    });

    page.total = matches.size();
    size_t offset = (page.page - 1) * page.page_size;
    for (size_t i = offset; i < matches.size() && page.items.size() < page.page_size; ++i) {
        page.items.push_back(std::move(matches[i]));
    }
    return page;
}

bool MemoryRecordStore::insert(const SandboxRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.count(record.id) || by_user_.count(record.user_id)) {
        return false;
    }
    records_[record.id] = record;
    by_user_[record.user_id] = record.id;
    try {
        on_mutation(records_);
    } catch (...) {
        records_.erase(record.id);
        by_user_.erase(record.user_id);
        throw;
    }
    return true;
}

bool MemoryRecordStore::update(const std::string& id, const RecordUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || !update.matches(it->second)) {
        return false;
    }
    SandboxRecord previous = it->second;
    update.apply(it->second, std::chrono::system_clock::now());
    try {
        on_mutation(records_);
    } catch (...) {
        it->second = std::move(previous);
        throw;
    }
    return true;
}

size_t MemoryRecordStore::update_many(const std::vector<std::string>& ids, const RecordUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::system_clock::now();
    std::unordered_set<std::string> seen;
    std::vector<SandboxRecord> previous;
    size_t updated = 0;

    for (const auto& id : ids) {
        if (!seen.insert(id).second) continue;
        auto it = records_.find(id);
        if (it == records_.end() || !update.matches(it->second)) continue;
        previous.push_back(it->second);
        update.apply(it->second, now);
        updated++;
    }

    if (updated > 0) {
        try {
            on_mutation(records_);
        } catch (...) {
            for (auto& record : previous) {
                records_[record.id] = std::move(record);
            }
            throw;
        }
    }
    return updated;
}

bool MemoryRecordStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }
    SandboxRecord removed = std::move(it->second);
    by_user_.erase(removed.user_id);
    records_.erase(it);
    try {
        on_mutation(records_);
    } catch (...) {
        by_user_[removed.user_id] = removed.id;
        records_[removed.id] = std::move(removed);
        throw;
    }
    return true;
}

size_t MemoryRecordStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void MemoryRecordStore::load_records(const std::vector<SandboxRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    by_user_.clear();
    for (const auto& record : records) {
        if (by_user_.count(record.user_id)) {
            spdlog::warn("Dropping duplicate sandbox {} for user {}", record.id, record.user_id);
            continue;
        }
        records_[record.id] = record;
        by_user_[record.user_id] = record.id;
    }
}

} // namespace sandpool::store
