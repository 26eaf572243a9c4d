#include "manager/sandbox_manager.hpp"
#include "manager/state_machine.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cctype>
#include <filesystem>
#include <mutex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sandpool::manager {

using store::RecordUpdate;
using store::SandboxRecord;
using store::SandboxStatus;

namespace {

// Holds a sandbox's creation gate and hands it back to the pool. Declared
// before the lock on it, so the lock is dropped first.
class ScopedGate {
public:
    ScopedGate(pool::SandboxPool& pool, std::string id)
        : pool_(pool)
        , id_(std::move(id))
        , gate_(pool_.creation_gate(id_)) {}

    ~ScopedGate() {
        pool_.release_creation_gate(id_, std::move(gate_));
    }

    ScopedGate(const ScopedGate&) = delete;
    ScopedGate& operator=(const ScopedGate&) = delete;

    std::mutex& mutex() { return *gate_; }

private:
    pool::SandboxPool& pool_;
    std::string id_;
    std::shared_ptr<std::mutex> gate_;
};

} // namespace

SandboxManager::SandboxManager(const util::Config& config,
                               std::shared_ptr<store::RecordStore> store,
                               std::shared_ptr<pool::SandboxPool> pool,
                               std::shared_ptr<runtime::ContainerRuntime> runtime)
    : config_(config)
    , store_(std::move(store))
    , pool_(std::move(pool))
    , runtime_(std::move(runtime)) {
    if (!store_ || !pool_ || !runtime_) {
        throw std::invalid_argument("SandboxManager requires a store, a pool and a runtime");
    }
    spdlog::debug("SandboxManager initialized (runtime={}, idle_timeout={}s)",
        runtime_->name(), config_.idle_timeout_sec);
}

// ============================================================================
// Records
// ============================================================================

std::optional<SandboxRecord> SandboxManager::get_record(const std::string& sandbox_id) const {
    return store_->find_by_id(sandbox_id);
}

std::optional<SandboxRecord> SandboxManager::get_record_for_user(const std::string& user_id) const {
    return store_->find_by_user_id(user_id);
}

store::RecordPage SandboxManager::list_records(const store::RecordQuery& query) const {
    return store_->list(query);
}

SandboxRecord SandboxManager::create_record(const std::string& user_id) {
    if (user_id.empty()) {
        throw std::invalid_argument("user_id must not be empty");
    }

    if (auto existing = store_->find_by_user_id(user_id)) {
        return *existing;
    }

    auto now = std::chrono::system_clock::now();
    SandboxRecord record;
    record.id = store::generate_sandbox_id();
    record.user_id = user_id;
    record.status = SandboxStatus::PENDING;
    record.image = config_.default_image;
    record.runtime = config_.default_runtime;
    record.cpu_limit = config_.cpu_limit;
    record.memory_limit_mb = config_.memory_limit_mb;
    record.idle_timeout_sec = config_.idle_timeout_sec;
    record.created_at = now;
    record.updated_at = now;

    if (store_->insert(record)) {
        transitions_.record(record.id, user_id, std::nullopt, SandboxStatus::PENDING, "record created");
        spdlog::info("Created sandbox record {} for user {}", record.id, user_id);
        return record;
    }

    // Lost the race against a concurrent insert for the same user
    if (auto existing = store_->find_by_user_id(user_id)) {
        return *existing;
    }
    throw store::StoreError(fmt::format("Cannot create sandbox record for user {}", user_id));
}

// ============================================================================
// ensure_running
// ============================================================================

pool::SandboxLease SandboxManager::ensure_running(const std::string& user_id) {
    SandboxRecord record = create_record(user_id);

    if (auto lease = try_reuse(record)) {
        return lease;
    }

    ScopedGate gate(*pool_, record.id);
    std::lock_guard<std::mutex> gate_lock(gate.mutex());

    // Another caller may have finished creating while we waited
    if (auto lease = try_reuse(record)) {
        return lease;
    }
    return start_locked(user_id, record.id);
}

pool::SandboxLease SandboxManager::try_reuse(const SandboxRecord& record) {
    auto handle = pool_->acquire(record.id);
    if (!handle) {
        return {};
    }

    pool::SandboxLease lease(pool_, record.id, handle);

    bool alive = false;
    try {
        alive = handle->is_started();
    } catch (const std::exception& e) {
        spdlog::warn("Liveness check failed for sandbox {}: {}", record.id, e.what());
    }

    if (!alive) {
        spdlog::warn("Sandbox {} (user {}) has a dead handle, recreating", record.id, record.user_id);
        lease.release();
        // Only our dead handle: another caller may already have replaced it
        pool_->remove(record.id, handle);
        return {};
    }

    RecordUpdate touch;
    touch.last_active_at = std::chrono::system_clock::now();
    if (!store_->update(record.id, touch)) {
        spdlog::debug("Sandbox {} record vanished while in use", record.id);
    }
    return lease;
}

pool::SandboxLease SandboxManager::start_locked(const std::string& user_id, const std::string& sandbox_id) {
    auto current = store_->find_by_id(sandbox_id);
    if (!current) {
        throw SandboxUnavailable(user_id, sandbox_id, "sandbox record was deleted");
    }
    SandboxRecord record = *current;

    if (record.status == SandboxStatus::TERMINATING) {
        throw SandboxUnavailable(user_id, sandbox_id, "sandbox is being deleted");
    }

    runtime::ContainerSpec spec;
    pool::HandlePtr handle;
    bool handed_to_pool = false;
    bool registered = false;

    try {
        // The record claims running but nothing live is pooled
        if (record.status == SandboxStatus::RUNNING &&
            !transition(record, SandboxStatus::STOPPED, {}, "no live handle")) {
            throw std::runtime_error("sandbox record changed concurrently");
        }
        if (record.status != SandboxStatus::CREATING) {
            if (!can_start_from(record.status)) {
                throw std::runtime_error(fmt::format("cannot start from status {}",
                    store::sandbox_status_to_string(record.status)));
            }
            if (!transition(record, SandboxStatus::CREATING)) {
                throw std::runtime_error("sandbox record changed concurrently");
            }
        }

        spec.image = record.image;
        spec.session_id = record.id;
        spec.idle_timeout_sec = record.idle_timeout_sec;
        spec.volumes = prepare_workspace(record);
        spec.cpu_limit = record.cpu_limit;
        spec.memory_limit_mb = record.memory_limit_mb;

        spdlog::info("Starting sandbox for user {} (id={})", user_id, record.id);
        handle = runtime_->start(spec);
        if (!handle) {
            throw runtime::RuntimeError("runtime returned no handle");
        }

        handed_to_pool = true;
        auto result = pool_->register_handle(record.id, handle);
        if (!result.registered) {
            throw runtime::RuntimeError("sandbox pool is shut down");
        }
        registered = true;

        if (!result.evicted_ids.empty()) {
            try {
                reconcile_stopped(result.evicted_ids, "lru eviction");
            } catch (const std::exception& e) {
                spdlog::warn("Failed to record LRU evictions {}: {}",
                    fmt::join(result.evicted_ids, ", "), e.what());
            }
        }

        RecordUpdate update;
        update.clear_error_message = true;
        std::string ref = handle->container_ref();
        if (!ref.empty()) {
            update.container_ref = ref;
        }
        if (!transition(record, SandboxStatus::RUNNING, update)) {
            throw std::runtime_error("sandbox record changed during creation");
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to start sandbox for user {}: {}", user_id, e.what());
        if (registered) {
            pool_->remove(record.id, handle);
        } else if (handle && !handed_to_pool) {
            pool::SandboxPool::close_handle(record.id, handle);
        }
        mark_failed(record, e.what());
        throw SandboxUnavailable(user_id, record.id, e.what());
    }

    spdlog::info("Sandbox {} running for user {}", record.id, user_id);
    return pool::SandboxLease(pool_, record.id, handle);
}

std::vector<runtime::VolumeMount> SandboxManager::prepare_workspace(const SandboxRecord& record) {
    if (config_.sandbox_root.empty()) {
        return {};
    }

    fs::path host_dir = fs::path(config_.sandbox_root) / sanitize_path_component(record.user_id);
    fs::create_directories(host_dir);

    runtime::VolumeMount mount;
    mount.host_path = host_dir.string();
    mount.container_path = config_.workspace_mount;
    return {mount};
}

std::string SandboxManager::sanitize_path_component(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        bool safe = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
        result.push_back(safe ? c : '_');
    }
    if (result.empty() || result == "." || result == "..") {
        result = "_" + result;
    }
    return result;
}

// ============================================================================
// State transitions
// ============================================================================

bool SandboxManager::transition(SandboxRecord& record,
                                SandboxStatus to,
                                RecordUpdate update,
                                const std::string& detail) {
    SandboxStatus from = record.status;
    if (!is_legal_transition(from, to)) {
        throw IllegalTransition(from, to);
    }

    auto now = std::chrono::system_clock::now();
    update.status = to;
    update.expected_status = from;
    if (!update.last_active_at) {
        update.last_active_at = now;
    }

    if (!store_->update(record.id, update)) {
        spdlog::warn("Sandbox {} changed concurrently, {} -> {} not applied",
            record.id, store::sandbox_status_to_string(from), store::sandbox_status_to_string(to));
        return false;
    }

    update.apply(record, now);
    transitions_.record(record.id, record.user_id, from, to, detail);
    spdlog::debug("Sandbox {} state: {} -> {}",
        record.id, store::sandbox_status_to_string(from), store::sandbox_status_to_string(to));
    return true;
}

void SandboxManager::mark_failed(SandboxRecord& record, const std::string& message) {
    if (!is_legal_transition(record.status, SandboxStatus::FAILED)) {
        spdlog::warn("Sandbox {} left {} after failure: {}",
            record.id, store::sandbox_status_to_string(record.status), message);
        return;
    }

    RecordUpdate update;
    update.error_message = message;
    try {
        transition(record, SandboxStatus::FAILED, update, message);
    } catch (const std::exception& e) {
        spdlog::error("Cannot mark sandbox {} failed: {}", record.id, e.what());
    }
}

size_t SandboxManager::reconcile_stopped(const std::vector<std::string>& ids, const std::string& reason) {
    auto before = store_->list_by_ids(ids);

    RecordUpdate update;
    update.status = SandboxStatus::STOPPED;
    update.expected_status = SandboxStatus::RUNNING;
    update.last_active_at = std::chrono::system_clock::now();
    size_t changed = store_->update_many(ids, update);

    for (const auto& record : before) {
        if (record.status == SandboxStatus::RUNNING) {
            transitions_.record(record.id, record.user_id, SandboxStatus::RUNNING,
                                SandboxStatus::STOPPED, reason);
        }
    }
    return changed;
}

// ============================================================================
// Administrative operations
// ============================================================================

bool SandboxManager::stop_sandbox(const std::string& sandbox_id) {
    auto record = store_->find_by_id(sandbox_id);
    if (!record) {
        spdlog::debug("Stop: sandbox {} not found", sandbox_id);
        return false;
    }
    if (record->status != SandboxStatus::RUNNING) {
        spdlog::debug("Stop: sandbox {} is {}, nothing to stop",
            sandbox_id, store::sandbox_status_to_string(record->status));
        return false;
    }

    // An explicit stop wins over in-flight users
    pool_->remove(sandbox_id);

    bool stopped = transition(*record, SandboxStatus::STOPPED, {}, "explicit stop");
    if (stopped) {
        spdlog::info("Stopped sandbox {} (user {})", sandbox_id, record->user_id);
    }
    return stopped;
}

bool SandboxManager::restart_sandbox(const std::string& sandbox_id) {
    auto record = store_->find_by_id(sandbox_id);
    if (!record) {
        return false;
    }

    // Recreation is deferred to the next ensure_running
    stop_sandbox(sandbox_id);
    spdlog::info("Sandbox {} scheduled for restart on next use", sandbox_id);
    return true;
}

bool SandboxManager::delete_sandbox(const std::string& sandbox_id) {
    auto record = store_->find_by_id(sandbox_id);
    if (!record) {
        return false;
    }

    if (record->status == SandboxStatus::RUNNING) {
        stop_sandbox(sandbox_id);
    }
    // Also drops a handle registered by a creation still in flight
    pool_->remove(sandbox_id);

    for (int attempt = 0; attempt < 2; ++attempt) {
        record = store_->find_by_id(sandbox_id);
        if (!record) {
            return false;
        }
        if (record->status == SandboxStatus::TERMINATING ||
            transition(*record, SandboxStatus::TERMINATING, {}, "delete requested")) {
            break;
        }
    }

    bool removed = store_->remove(sandbox_id);
    pool_->drop_creation_gate(sandbox_id);
    if (removed) {
        spdlog::info("Deleted sandbox {} (user {})", sandbox_id, record->user_id);
    }
    return removed;
}

// ============================================================================
// Reconciliation
// ============================================================================

size_t SandboxManager::cleanup_idle_sandboxes() {
    auto evicted = pool_->sweep_idle(std::chrono::seconds(config_.idle_timeout_sec));
    if (evicted.empty()) {
        return 0;
    }

    spdlog::info("Syncing status for evicted sandboxes: {}", fmt::join(evicted, ", "));
    reconcile_stopped(evicted, "idle eviction");
    return evicted.size();
}

size_t SandboxManager::recover_stale_records() {
    size_t changed = 0;
    auto now = std::chrono::system_clock::now();
    auto grace = std::chrono::seconds(config_.creating_grace_sec);

    for (auto& record : store_->find_by_status(SandboxStatus::CREATING)) {
        if (now - record.updated_at <= grace) {
            continue;
        }
        // Skip creations still in progress in this process
        ScopedGate gate(*pool_, record.id);
        std::unique_lock<std::mutex> gate_lock(gate.mutex(), std::try_to_lock);
        if (!gate_lock.owns_lock()) {
            continue;
        }

        RecordUpdate update;
        update.error_message = "Sandbox creation was interrupted";
        if (transition(record, SandboxStatus::FAILED, update, "stale creating record")) {
            changed++;
        }
    }

    for (auto& record : store_->find_by_status(SandboxStatus::RUNNING)) {
        if (pool_->contains(record.id)) {
            continue;
        }
        if (transition(record, SandboxStatus::STOPPED, {}, "no live handle")) {
            changed++;
        }
    }

    if (changed > 0) {
        spdlog::info("Recovered {} stale sandbox records", changed);
    }
    return changed;
}

} // namespace sandpool::manager
