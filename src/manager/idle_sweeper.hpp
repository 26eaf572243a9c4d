#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace sandpool::manager {

class SandboxManager;

// Background thread calling SandboxManager::cleanup_idle_sandboxes on a
// fixed interval. stop() wakes the thread immediately.
class IdleSweeper {
public:
    IdleSweeper(SandboxManager& manager, std::chrono::milliseconds interval);
    ~IdleSweeper();

    IdleSweeper(const IdleSweeper&) = delete;
    IdleSweeper& operator=(const IdleSweeper&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_; }

    // Run one sweep on the caller's thread. Returns sandboxes evicted.
    size_t sweep_now();

    uint64_t sweep_count() const { return sweep_count_; }

private:
    SandboxManager& manager_;
    std::chrono::milliseconds interval_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> sweep_count_{0};

    void run_loop();
};

} // namespace sandpool::manager
