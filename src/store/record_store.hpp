#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "store/sandbox_record.hpp"

namespace sandpool::store {

// Backing storage could not be read or written
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Durable sandbox record storage. Implementations are thread-safe.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual std::optional<SandboxRecord> find_by_user_id(const std::string& user_id) const = 0;
    virtual std::optional<SandboxRecord> find_by_id(const std::string& id) const = 0;
    virtual std::vector<SandboxRecord> find_by_status(SandboxStatus status) const = 0;
    virtual std::vector<SandboxRecord> list_by_ids(const std::vector<std::string>& ids) const = 0;
    virtual RecordPage list(const RecordQuery& query) const = 0;

    // False if the id exists or the user already owns a record
    virtual bool insert(const SandboxRecord& record) = 0;

    // False if no record matched (missing id or expected_status mismatch)
    virtual bool update(const std::string& id, const RecordUpdate& update) = 0;

    // Single batch; returns the number of records updated
    virtual size_t update_many(const std::vector<std::string>& ids, const RecordUpdate& update) = 0;

    virtual bool remove(const std::string& id) = 0;

    virtual size_t size() const = 0;
};

} // namespace sandpool::store
