/**
 * Sandbox Lifecycle Manager
 *
 * Reconciles the durable sandbox record, the in-memory pool and the
 * container runtime. The only writer of SandboxRecord::status.
 *
 * Record and pool are never updated atomically together: brief
 * disagreement is tolerated and repaired lazily, by the liveness check in
 * ensure_running, by the idle sweep, and by recover_stale_records at
 * startup.
 */
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "manager/errors.hpp"
#include "manager/transition_log.hpp"
#include "pool/sandbox_lease.hpp"
#include "pool/sandbox_pool.hpp"
#include "runtime/container_runtime.hpp"
#include "store/record_store.hpp"
#include "util/config.hpp"

namespace sandpool::manager {

class SandboxManager {
public:
    SandboxManager(const util::Config& config,
                   std::shared_ptr<store::RecordStore> store,
                   std::shared_ptr<pool::SandboxPool> pool,
                   std::shared_ptr<runtime::ContainerRuntime> runtime);

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    // Idempotent and safe to call concurrently for the same user: at most
    // one container start per sandbox. The lease holds one pool reference.
    // Throws SandboxUnavailable if the container cannot be started.
    pool::SandboxLease ensure_running(const std::string& user_id);

    // Records
    std::optional<store::SandboxRecord> get_record(const std::string& sandbox_id) const;
    std::optional<store::SandboxRecord> get_record_for_user(const std::string& user_id) const;
    store::SandboxRecord create_record(const std::string& user_id);  // Existing record if any
    store::RecordPage list_records(const store::RecordQuery& query) const;

    // Administrative operations; false when there is nothing to act on
    bool stop_sandbox(const std::string& sandbox_id);
    bool restart_sandbox(const std::string& sandbox_id);
    bool delete_sandbox(const std::string& sandbox_id);

    // Sweep idle pool entries and mark their records stopped.
    // Returns the number of sandboxes evicted.
    size_t cleanup_idle_sandboxes();

    // Startup pass: stale "creating" records become failed, "running"
    // records without a pool entry become stopped. Returns records changed.
    size_t recover_stale_records();

    const TransitionLog& transitions() const { return transitions_; }
    pool::SandboxPool& pool() { return *pool_; }
    const util::Config& config() const { return config_; }

    // User ids are used as directory names under the sandbox root
    static std::string sanitize_path_component(const std::string& name);

private:
    util::Config config_;
    std::shared_ptr<store::RecordStore> store_;
    std::shared_ptr<pool::SandboxPool> pool_;
    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    TransitionLog transitions_;

    // Acquire from the pool and check liveness; empty lease on miss
    pool::SandboxLease try_reuse(const store::SandboxRecord& record);

    // Caller must hold the sandbox's creation gate
    pool::SandboxLease start_locked(const std::string& user_id, const std::string& sandbox_id);

    std::vector<runtime::VolumeMount> prepare_workspace(const store::SandboxRecord& record);

    // Compare-and-set status change, stamping last_active_at. Throws
    // IllegalTransition for edges outside the state machine; false if the
    // stored status moved underneath us.
    bool transition(store::SandboxRecord& record,
                    store::SandboxStatus to,
                    store::RecordUpdate update = {},
                    const std::string& detail = "");

    void mark_failed(store::SandboxRecord& record, const std::string& message);

    // running -> stopped for every id, one batch
    size_t reconcile_stopped(const std::vector<std::string>& ids, const std::string& reason);
};

} // namespace sandpool::manager
