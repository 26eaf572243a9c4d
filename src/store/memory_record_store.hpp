#pragma once
#include <mutex>
#include <unordered_map>
#include "store/record_store.hpp"

namespace sandpool::store {

class MemoryRecordStore : public RecordStore {
public:
    MemoryRecordStore() = default;
    ~MemoryRecordStore() override = default;

    MemoryRecordStore(const MemoryRecordStore&) = delete;
    MemoryRecordStore& operator=(const MemoryRecordStore&) = delete;

    std::optional<SandboxRecord> find_by_user_id(const std::string& user_id) const override;
    std::optional<SandboxRecord> find_by_id(const std::string& id) const override;
    std::vector<SandboxRecord> find_by_status(SandboxStatus status) const override;
    std::vector<SandboxRecord> list_by_ids(const std::vector<std::string>& ids) const override;
    RecordPage list(const RecordQuery& query) const override;

    bool insert(const SandboxRecord& record) override;
    bool update(const std::string& id, const RecordUpdate& update) override;
    size_t update_many(const std::vector<std::string>& ids, const RecordUpdate& update) override;
    bool remove(const std::string& id) override;

    size_t size() const override;

protected:
    using RecordMap = std::unordered_map<std::string, SandboxRecord>;

    // Called with mutex_ held after every mutation. If it throws, the
    // mutation is rolled back and the exception propagates.
    virtual void on_mutation(const RecordMap& records) { (void)records; }

    // Replace contents without triggering on_mutation
    void load_records(const std::vector<SandboxRecord>& records);

private:
    RecordMap records_;                                  // id -> record
    std::unordered_map<std::string, std::string> by_user_;  // user_id -> id
    mutable std::mutex mutex_;
};

} // namespace sandpool::store
