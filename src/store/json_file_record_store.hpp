/**
 * JSON file record store
 *
 * Durable RecordStore: the full record set is kept in memory and the file
 * is rewritten (temp file + rename) after every successful mutation, so a
 * crash leaves either the old or the new file, never a torn one.
 *
 * File layout: {"version": 1, "sandboxes": [<record>, ...]}
 */
#pragma once
#include <string>
#include "store/memory_record_store.hpp"

namespace sandpool::store {

class JsonFileRecordStore : public MemoryRecordStore {
public:
    // Loads path if it exists. Throws StoreError on unreadable/corrupt files.
    explicit JsonFileRecordStore(std::string path);
    ~JsonFileRecordStore() override = default;

    const std::string& path() const { return path_; }

protected:
    void on_mutation(const RecordMap& records) override;

private:
    std::string path_;

    void load();
};

} // namespace sandpool::store
