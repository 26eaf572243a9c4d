#include "store/json_file_record_store.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sandpool::store {

constexpr int FILE_FORMAT_VERSION = 1;

JsonFileRecordStore::JsonFileRecordStore(std::string path)
    : path_(std::move(path)) {
    load();
}

void JsonFileRecordStore::load() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        spdlog::info("Record file {} not found, starting empty", path_);
        return;
    }

    std::ifstream file(path_);
    if (!file) {
        throw StoreError(fmt::format("Cannot open record file {}", path_));
    }

    std::vector<SandboxRecord> records;
    try {
        json j = json::parse(file);
        int version = j.value("version", 0);
        if (version != FILE_FORMAT_VERSION) {
            throw StoreError(fmt::format("Unsupported record file version {} in {}", version, path_));
        }
        for (const auto& item : j.at("sandboxes")) {
            records.push_back(SandboxRecord::from_json(item));
        }
    } catch (const json::exception& e) {
        throw StoreError(fmt::format("Corrupt record file {}: {}", path_, e.what()));
    }

    load_records(records);
    spdlog::info("Loaded {} sandbox records from {}", records.size(), path_);
}

void JsonFileRecordStore::on_mutation(const RecordMap& records) {
    std::vector<const SandboxRecord*> ordered;
    ordered.reserve(records.size());
    for (const auto& [_, record] : records) {
        ordered.push_back(&record);
    }
    // Sorted by id
    std::sort(ordered.begin(), ordered.end(), [](const SandboxRecord* a, const SandboxRecord* b) {
        return a->id < b->id;
    });

    json j;
    j["version"] = FILE_FORMAT_VERSION;
    j["sandboxes"] = json::array();
    for (const auto* record : ordered) {
        j["sandboxes"].push_back(record->to_json());
    }

    fs::path target(path_);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
    }

    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw StoreError(fmt::format("Cannot write record file {}", tmp_path));
        }
        out << j.dump(2) << "\n";
        if (!out.good()) {
            throw StoreError(fmt::format("Failed writing record file {}", tmp_path));
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path_, ec);
    if (ec) {
        throw StoreError(fmt::format("Cannot replace record file {}: {}", path_, ec.message()));
    }
    spdlog::trace("Persisted {} sandbox records to {}", records.size(), path_);
}

} // namespace sandpool::store
