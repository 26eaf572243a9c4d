#include "manager/idle_sweeper.hpp"
#include "manager/sandbox_manager.hpp"
#include <spdlog/spdlog.h>

namespace sandpool::manager {

IdleSweeper::IdleSweeper(SandboxManager& manager, std::chrono::milliseconds interval)
    : manager_(manager)
    , interval_(interval) {}

IdleSweeper::~IdleSweeper() {
    stop();
}

bool IdleSweeper::start() {
    if (running_.exchange(true)) {
        spdlog::warn("Idle sweeper already running");
        return false;
    }
    if (interval_.count() <= 0) {
        spdlog::warn("Idle sweeper interval must be positive, not starting");
        running_ = false;
        return false;
    }

    thread_ = std::thread(&IdleSweeper::run_loop, this);
    spdlog::info("Idle sweeper started (interval={}ms)", interval_.count());
    return true;
}

void IdleSweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::info("Idle sweeper stopped after {} sweeps", sweep_count_.load());
}

size_t IdleSweeper::sweep_now() {
    size_t evicted = manager_.cleanup_idle_sandboxes();
    sweep_count_++;
    if (evicted > 0) {
        spdlog::info("Idle sweep evicted {} sandboxes", evicted);
    }
    return evicted;
}

void IdleSweeper::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (cv_.wait_for(lock, interval_, [this] { return !running_; })) {
            break;
        }

        lock.unlock();
        try {
            sweep_now();
        } catch (const std::exception& e) {
            spdlog::error("Idle sweep failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace sandpool::manager
