/**
 * Sandbox Pool
 *
 * Concurrency-safe registry of live container handles keyed by sandbox id.
 * Tracks per-entry reference counts and last use, evicts idle entries on
 * request and least-recently-used entries when full. Never touches the
 * record store.
 *
 * Capacity is a soft target: when the pool is full and every entry is
 * referenced, register_handle still inserts rather than blocking or
 * failing a user waiting on their own sandbox.
 *
 * Handles are closed with cleanup() outside the registry lock. Close
 * errors are logged and swallowed.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "runtime/container_runtime.hpp"

namespace sandpool::pool {

using Clock = std::chrono::steady_clock;
using ClockFn = std::function<Clock::time_point()>;
using HandlePtr = std::shared_ptr<runtime::ContainerHandle>;

struct PoolEntry {
    HandlePtr handle;
    Clock::time_point last_used;
    uint32_t active_count = 0;
};

struct RegisterResult {
    bool registered = false;             // false: pool shut down, handle closed
    std::vector<std::string> evicted_ids;  // LRU evictions made to fit
};

struct PoolStats {
    size_t size = 0;
    size_t capacity = 0;
    size_t in_use = 0;                   // Entries with active_count > 0
    bool closed = false;
};

class SandboxPool {
public:
    explicit SandboxPool(size_t max_size = 100, ClockFn clock = nullptr);
    ~SandboxPool();

    SandboxPool(const SandboxPool&) = delete;
    SandboxPool& operator=(const SandboxPool&) = delete;

    // Bump the reference count and return the handle, or nullptr on miss
    HandlePtr acquire(const std::string& id);

    // Insert with active_count = 1. Closes any previous handle for id.
    RegisterResult register_handle(const std::string& id, HandlePtr handle);

    // Drop one reference (floor 0). With expected set, only when the
    // entry still holds that handle.
    void release(const std::string& id, const HandlePtr& expected = nullptr);

    // Detach and close regardless of references. False if absent. With
    // expected set, only when the entry still holds that handle.
    bool remove(const std::string& id, const HandlePtr& expected = nullptr);

    // Detach and close unreferenced entries unused for longer than
    // idle_threshold. Returns evicted ids.
    std::vector<std::string> sweep_idle(std::chrono::seconds idle_threshold);

    // Close every entry; later registrations are closed immediately
    void shutdown();

    // Per-id creation gate, created on demand
    std::shared_ptr<std::mutex> creation_gate(const std::string& id);
    void drop_creation_gate(const std::string& id);

    // Hand back a gate after unlocking it. The gate is forgotten once no
    // other caller holds it; callers still waiting keep it registered.
    void release_creation_gate(const std::string& id, std::shared_ptr<std::mutex> gate);
    size_t gate_count() const;

    bool contains(const std::string& id) const;
    std::optional<uint32_t> active_count(const std::string& id) const;
    std::vector<std::string> ids() const;
    size_t size() const;
    size_t capacity() const { return max_size_; }
    bool is_closed() const;
    PoolStats stats() const;

    // Best-effort close used for every detached handle
    static void close_handle(const std::string& id, const HandlePtr& handle);

private:
    using Detached = std::vector<std::pair<std::string, HandlePtr>>;

    std::unordered_map<std::string, PoolEntry> entries_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> gates_;
    mutable std::mutex mutex_;
    size_t max_size_;
    ClockFn clock_;
    bool closed_ = false;

    Clock::time_point now() const;

    // Caller must hold mutex_
    std::optional<std::string> evict_lru_locked(Detached& detached);

    static void close_all(const Detached& detached);
};

} // namespace sandpool::pool
