#include "pool/sandbox_pool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace sandpool::pool {

SandboxPool::SandboxPool(size_t max_size, ClockFn clock)
    : max_size_(max_size)
    , clock_(std::move(clock)) {
    spdlog::debug("SandboxPool initialized (max_size={})", max_size_);
}

SandboxPool::~SandboxPool() {
    shutdown();
}

Clock::time_point SandboxPool::now() const {
    return clock_ ? clock_() : Clock::now();
}

HandlePtr SandboxPool::acquire(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return nullptr;
    }

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }

    it->second.active_count++;
    it->second.last_used = now();
    return it->second.handle;
}

RegisterResult SandboxPool::register_handle(const std::string& id, HandlePtr handle) {
    if (!handle) {
        throw std::invalid_argument("Cannot register a null handle");
    }

    RegisterResult result;
    Detached detached;
    size_t size_after = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (closed_) {
            detached.emplace_back(id, std::move(handle));
        } else {
            auto it = entries_.find(id);
            if (it != entries_.end()) {
                // Never two live handles for one id
                if (it->second.handle != handle) {
                    detached.emplace_back(id, it->second.handle);
                }
                entries_.erase(it);
            } else if (entries_.size() >= max_size_) {
                if (auto evicted = evict_lru_locked(detached)) {
                    result.evicted_ids.push_back(*evicted);
                } else {
                    spdlog::warn("Sandbox pool over capacity ({}/{}): every entry is in use",
                        entries_.size() + 1, max_size_);
                }
            }

            PoolEntry entry;
            entry.handle = std::move(handle);
            entry.last_used = now();
            entry.active_count = 1;   // The registering caller holds a reference
            entries_[id] = std::move(entry);
            result.registered = true;
            size_after = entries_.size();
        }
    }

    if (!result.registered) {
        spdlog::warn("Sandbox pool is shut down, closing handle for {}", id);
    } else {
        spdlog::debug("Added sandbox {} to pool. Size: {}", id, size_after);
    }
    close_all(detached);
    return result;
}

void SandboxPool::release(const std::string& id, const HandlePtr& expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return;
    }
    if (expected && it->second.handle != expected) {
        return;
    }

    if (it->second.active_count > 0) {
        it->second.active_count--;
    }
    it->second.last_used = now();
}

bool SandboxPool::remove(const std::string& id, const HandlePtr& expected) {
    HandlePtr handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }
        if (expected && it->second.handle != expected) {
            return false;
        }
        handle = std::move(it->second.handle);
        entries_.erase(it);
    }

    close_handle(id, handle);
    spdlog::debug("Removed sandbox {} from pool", id);
    return true;
}

std::vector<std::string> SandboxPool::sweep_idle(std::chrono::seconds idle_threshold) {
    std::vector<std::string> to_remove;
    Detached detached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto current = now();

        for (const auto& [id, entry] : entries_) {
            if (entry.active_count == 0 && (current - entry.last_used) > idle_threshold) {
                to_remove.push_back(id);
            }
        }

        for (const auto& id : to_remove) {
            auto it = entries_.find(id);
            detached.emplace_back(id, std::move(it->second.handle));
            entries_.erase(it);
        }
    }

    close_all(detached);
    if (!to_remove.empty()) {
        spdlog::info("Cleaned up {} idle sandboxes", to_remove.size());
    }
    return to_remove;
}

void SandboxPool::shutdown() {
    Detached detached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ && entries_.empty()) {
            return;
        }
        closed_ = true;
        for (auto& [id, entry] : entries_) {
            detached.emplace_back(id, std::move(entry.handle));
        }
        entries_.clear();
        gates_.clear();
    }

    if (!detached.empty()) {
        spdlog::info("Shutting down sandbox pool ({} entries)", detached.size());
    }
    close_all(detached);
}

std::shared_ptr<std::mutex> SandboxPool::creation_gate(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& gate = gates_[id];
    if (!gate) {
        gate = std::make_shared<std::mutex>();
    }
    return gate;
}

void SandboxPool::drop_creation_gate(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    gates_.erase(id);
}

void SandboxPool::release_creation_gate(const std::string& id, std::shared_ptr<std::mutex> gate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gates_.find(id);
    // One reference in the map, one passed in
    if (it != gates_.end() && it->second == gate && gate.use_count() <= 2) {
        gates_.erase(it);
    }
    // Dropped under the lock so the last caller always sees the final count
    gate.reset();
}

size_t SandboxPool::gate_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gates_.size();
}

bool SandboxPool::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(id) > 0;
}

std::optional<uint32_t> SandboxPool::active_count(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.active_count;
}

std::vector<std::string> SandboxPool::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [id, _] : entries_) {
        result.push_back(id);
    }
    return result;
}

size_t SandboxPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool SandboxPool::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

PoolStats SandboxPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStats stats;
    stats.size = entries_.size();
    stats.capacity = max_size_;
    stats.closed = closed_;
    for (const auto& [_, entry] : entries_) {
        if (entry.active_count > 0) {
            stats.in_use++;
        }
    }
    return stats;
}

std::optional<std::string> SandboxPool::evict_lru_locked(Detached& detached) {
    auto lru = entries_.end();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->second.active_count != 0) continue;
        if (lru == entries_.end() || it->second.last_used < lru->second.last_used) {
            lru = it;
        }
    }

    if (lru == entries_.end()) {
        return std::nullopt;
    }

    std::string id = lru->first;
    detached.emplace_back(id, std::move(lru->second.handle));
    entries_.erase(lru);
    spdlog::debug("Evicted LRU sandbox {}", id);
    return id;
}

void SandboxPool::close_handle(const std::string& id, const HandlePtr& handle) {
    if (!handle) {
        return;
    }
    try {
        handle->cleanup();
    } catch (const std::exception& e) {
        spdlog::warn("Error closing sandbox {}: {}", id, e.what());
    } catch (...) {
        spdlog::warn("Error closing sandbox {}: unknown exception", id);
    }
}

void SandboxPool::close_all(const Detached& detached) {
    for (const auto& [id, handle] : detached) {
        close_handle(id, handle);
    }
}

} // namespace sandpool::pool
