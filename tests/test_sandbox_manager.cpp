#include "manager/sandbox_manager.hpp"
#include "manager/state_machine.hpp"
#include "store/memory_record_store.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <future>
#include <thread>
#include <unistd.h>

using namespace sandpool;
using namespace sandpool::fakes;
using store::SandboxStatus;
using std::chrono::seconds;

namespace fs = std::filesystem;

class SandboxManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() /
                ("sandpool-manager-" + std::to_string(getpid()) + "-" + info->name());
        config_.sandbox_root = root_.string();
        config_.idle_timeout_sec = 60;
        build(10);
    }

    void TearDown() override {
        manager_.reset();
        pool_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void build(size_t max_pool_size) {
        manager_.reset();
        store_ = std::make_shared<store::MemoryRecordStore>();
        pool_ = std::make_shared<pool::SandboxPool>(max_pool_size, clock_.fn());
        runtime_ = std::make_shared<FakeRuntime>();
        manager_ = std::make_unique<manager::SandboxManager>(config_, store_, pool_, runtime_);
    }

    SandboxStatus status_of(const std::string& user_id) {
        auto record = manager_->get_record_for_user(user_id);
        EXPECT_TRUE(record.has_value());
        return record ? record->status : SandboxStatus::FAILED;
    }

    FakeClock clock_;
    fs::path root_;
    util::Config config_;
    std::shared_ptr<store::MemoryRecordStore> store_;
    std::shared_ptr<pool::SandboxPool> pool_;
    std::shared_ptr<FakeRuntime> runtime_;
    std::unique_ptr<manager::SandboxManager> manager_;
};

TEST_F(SandboxManagerTest, EnsureRunningStartsContainer) {
    auto lease = manager_->ensure_running("alice");
    ASSERT_TRUE(static_cast<bool>(lease));
    EXPECT_TRUE(lease->is_started());
    EXPECT_EQ(1, runtime_->start_calls.load());

    auto record = manager_->get_record_for_user("alice");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(SandboxStatus::RUNNING, record->status);
    EXPECT_EQ(record->id, lease.sandbox_id());
    EXPECT_EQ("fake-" + record->id, record->container_ref.value_or(""));
    EXPECT_TRUE(record->last_active_at.has_value());
    EXPECT_FALSE(record->error_message.has_value());
    EXPECT_EQ(1u, pool_->active_count(record->id).value());
}

TEST_F(SandboxManagerTest, RecordUsesConfiguredDefaults) {
    auto record = manager_->create_record("alice");
    EXPECT_EQ(SandboxStatus::PENDING, record.status);
    EXPECT_EQ("python:3.12-slim", record.image);
    EXPECT_DOUBLE_EQ(1.0, record.cpu_limit);
    EXPECT_EQ(512u, record.memory_limit_mb);
    EXPECT_EQ(60u, record.idle_timeout_sec);

    // One record per user
    EXPECT_EQ(record.id, manager_->create_record("alice").id);
    EXPECT_EQ(1u, store_->size());
}

TEST_F(SandboxManagerTest, EmptyUserIdIsRejected) {
    EXPECT_THROW(manager_->create_record(""), std::invalid_argument);
    EXPECT_THROW(manager_->ensure_running(""), std::invalid_argument);
    EXPECT_EQ(0, runtime_->start_calls.load());
}

TEST_F(SandboxManagerTest, ReusesLiveSandbox) {
    std::string first_id;
    {
        auto lease = manager_->ensure_running("alice");
        first_id = lease.sandbox_id();
    }
    auto lease = manager_->ensure_running("alice");
    EXPECT_EQ(first_id, lease.sandbox_id());
    EXPECT_EQ(1, runtime_->start_calls.load());
    EXPECT_EQ(1u, pool_->active_count(first_id).value());
}

TEST_F(SandboxManagerTest, ConcurrentEnsureStartsOnce) {
    runtime_->start_delay = std::chrono::milliseconds(50);

    constexpr int kCallers = 8;
    std::vector<pool::SandboxLease> leases(kCallers);
    std::vector<std::thread> threads;
    for (int i = 0; i < kCallers; i++) {
        threads.emplace_back([this, &leases, i] {
            leases[i] = manager_->ensure_running("alice");
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(1, runtime_->start_calls.load());
    auto handle = runtime_->last_handle();
    for (const auto& lease : leases) {
        EXPECT_EQ(handle, lease.handle());
    }

    auto id = leases[0].sandbox_id();
    EXPECT_EQ(static_cast<uint32_t>(kCallers), pool_->active_count(id).value());

    leases.clear();
    EXPECT_EQ(0u, pool_->active_count(id).value());
    EXPECT_EQ(SandboxStatus::RUNNING, status_of("alice"));
}

TEST_F(SandboxManagerTest, DeadHandleIsReplaced) {
    std::string id;
    {
        auto lease = manager_->ensure_running("alice");
        id = lease.sandbox_id();
    }
    auto first = runtime_->last_handle();
    first->alive = false;

    auto lease = manager_->ensure_running("alice");
    EXPECT_EQ(2, runtime_->start_calls.load());
    EXPECT_NE(first, lease.handle());
    EXPECT_TRUE(lease->is_started());
    EXPECT_EQ(1, first->cleanup_calls.load());
    EXPECT_EQ(SandboxStatus::RUNNING, status_of("alice"));

    // running -> stopped -> creating -> running
    auto history = manager_->transitions().entries_for(id);
    ASSERT_GE(history.size(), 3u);
    auto n = history.size();
    EXPECT_EQ(SandboxStatus::STOPPED, history[n - 3].to);
    EXPECT_EQ(SandboxStatus::CREATING, history[n - 2].to);
    EXPECT_EQ(SandboxStatus::RUNNING, history[n - 1].to);
}

TEST_F(SandboxManagerTest, SlowLivenessCheckKeepsReplacement) {
    std::string id = manager_->ensure_running("alice").sandbox_id();
    auto first = runtime_->last_handle();
    first->alive = false;

    // The first liveness check stalls until the second caller has recreated
    std::promise<void> entered;
    std::promise<void> proceed;
    std::shared_future<void> proceed_future = proceed.get_future().share();
    std::atomic<bool> stalled{false};
    first->before_check = [&] {
        if (!stalled.exchange(true)) {
            entered.set_value();
            proceed_future.wait();
        }
    };

    pool::SandboxLease slow_lease;
    std::thread slow([&] { slow_lease = manager_->ensure_running("alice"); });
    entered.get_future().wait();

    auto lease = manager_->ensure_running("alice");
    auto second = runtime_->last_handle();
    ASSERT_NE(first, second);
    EXPECT_EQ(second, lease.handle());

    proceed.set_value();
    slow.join();

    EXPECT_EQ(2, runtime_->start_calls.load());
    EXPECT_EQ(1, first->cleanup_calls.load());
    EXPECT_EQ(0, second->cleanup_calls.load());
    EXPECT_TRUE(second->is_started());
    EXPECT_EQ(second, slow_lease.handle());
    EXPECT_TRUE(pool_->contains(id));
    EXPECT_EQ(2u, pool_->active_count(id).value());
    EXPECT_EQ(SandboxStatus::RUNNING, status_of("alice"));
}

TEST_F(SandboxManagerTest, ConcurrentEnsureReplacesDeadHandleOnce) {
    std::string id = manager_->ensure_running("alice").sandbox_id();
    auto first = runtime_->last_handle();
    first->alive = false;
    runtime_->start_delay = std::chrono::milliseconds(50);

    constexpr int kCallers = 8;
    std::vector<pool::SandboxLease> leases(kCallers);
    std::vector<std::thread> threads;
    for (int i = 0; i < kCallers; i++) {
        threads.emplace_back([this, &leases, i] {
            leases[i] = manager_->ensure_running("alice");
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(2, runtime_->start_calls.load());
    auto second = runtime_->last_handle();
    EXPECT_NE(first, second);
    EXPECT_EQ(1, first->cleanup_calls.load());
    EXPECT_EQ(0, second->cleanup_calls.load());
    for (const auto& lease : leases) {
        EXPECT_EQ(second, lease.handle());
    }
    EXPECT_EQ(static_cast<uint32_t>(kCallers), pool_->active_count(id).value());
    EXPECT_EQ(0u, pool_->gate_count());
    EXPECT_EQ(SandboxStatus::RUNNING, status_of("alice"));
}

TEST_F(SandboxManagerTest, DeleteDuringCreationDiscardsContainer) {
    std::promise<void> started;
    std::promise<void> proceed;
    std::shared_future<void> proceed_future = proceed.get_future().share();
    runtime_->on_start = [&] {
        started.set_value();
        proceed_future.wait();
    };

    std::string id = manager_->create_record("alice").id;
    std::thread creator([&] {
        EXPECT_THROW(manager_->ensure_running("alice"), manager::SandboxUnavailable);
    });
    started.get_future().wait();

    EXPECT_EQ(SandboxStatus::CREATING, status_of("alice"));
    EXPECT_TRUE(manager_->delete_sandbox(id));

    proceed.set_value();
    creator.join();

    EXPECT_EQ(1, runtime_->start_calls.load());
    auto handle = runtime_->last_handle();
    ASSERT_NE(nullptr, handle);
    EXPECT_EQ(1, handle->cleanup_calls.load());
    EXPECT_FALSE(pool_->contains(id));
    EXPECT_FALSE(manager_->get_record(id).has_value());
    EXPECT_EQ(0u, pool_->gate_count());

    auto history = manager_->transitions().entries_for(id);
    ASSERT_EQ(3u, history.size());
    EXPECT_EQ(SandboxStatus::PENDING, history[0].to);
    EXPECT_EQ(SandboxStatus::CREATING, history[1].to);
    EXPECT_EQ(SandboxStatus::TERMINATING, history[2].to);
}

TEST_F(SandboxManagerTest, StopDuringCreationIsIgnored) {
    std::promise<void> started;
    std::promise<void> proceed;
    std::shared_future<void> proceed_future = proceed.get_future().share();
    runtime_->on_start = [&] {
        started.set_value();
        proceed_future.wait();
    };

    std::string id = manager_->create_record("alice").id;
    pool::SandboxLease lease;
    std::thread creator([&] { lease = manager_->ensure_running("alice"); });
    started.get_future().wait();

    EXPECT_FALSE(manager_->stop_sandbox(id));

    proceed.set_value();
    creator.join();

    ASSERT_TRUE(static_cast<bool>(lease));
    EXPECT_EQ(1, runtime_->start_calls.load());
    EXPECT_EQ(0, runtime_->last_handle()->cleanup_calls.load());
    EXPECT_EQ(SandboxStatus::RUNNING, status_of("alice"));
    EXPECT_EQ(1u, pool_->active_count(id).value());

    // Once running, the same stop goes through
    EXPECT_TRUE(manager_->stop_sandbox(id));
    EXPECT_EQ(1, runtime_->last_handle()->cleanup_calls.load());
}

TEST_F(SandboxManagerTest, StoreFailureAfterStartDiscardsContainer) {
    manager_.reset();
    auto flaky = std::make_shared<FlakyRecordStore>();
    store_ = flaky;
    manager_ = std::make_unique<manager::SandboxManager>(config_, store_, pool_, runtime_);

    std::string id = manager_->create_record("alice").id;
    runtime_->on_start = [&] { flaky->fail_writes = true; };

    EXPECT_THROW(manager_->ensure_running("alice"), manager::SandboxUnavailable);
    auto first = runtime_->last_handle();
    ASSERT_NE(nullptr, first);
    EXPECT_EQ(1, first->cleanup_calls.load());
    EXPECT_FALSE(pool_->contains(id));

    // The failed write left the record where it was
    EXPECT_EQ(SandboxStatus::CREATING, status_of("alice"));

    flaky->fail_writes = false;
    runtime_->on_start = nullptr;
    auto lease = manager_->ensure_running("alice");
    EXPECT_EQ(2, runtime_->start_calls.load());
    EXPECT_EQ(SandboxStatus::RUNNING, status_of("alice"));
    EXPECT_EQ(runtime_->last_handle(), lease.handle());
}

TEST_F(SandboxManagerTest, CreationGateIsReleased) {
    auto lease = manager_->ensure_running("alice");
    EXPECT_EQ(0u, pool_->gate_count());

    runtime_->fail_next = 1;
    EXPECT_THROW(manager_->ensure_running("bob"), manager::SandboxUnavailable);
    EXPECT_EQ(0u, pool_->gate_count());
}

TEST_F(SandboxManagerTest, StartFailureMarksRecordFailed) {
    runtime_->fail_next = 1;

    try {
        manager_->ensure_running("alice");
        FAIL() << "expected SandboxUnavailable";
    } catch (const manager::SandboxUnavailable& e) {
        EXPECT_EQ(503, e.status_code());
        EXPECT_EQ("alice", e.user_id());
        EXPECT_EQ(0u, std::string(e.what()).find("Failed to start sandbox: "));
    }

    auto record = manager_->get_record_for_user("alice");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(SandboxStatus::FAILED, record->status);
    ASSERT_TRUE(record->error_message.has_value());
    EXPECT_NE(std::string::npos, record->error_message->find("image pull failed"));
    EXPECT_FALSE(pool_->contains(record->id));

    // A later call retries and clears the error
    auto lease = manager_->ensure_running("alice");
    EXPECT_TRUE(static_cast<bool>(lease));
    record = manager_->get_record_for_user("alice");
    EXPECT_EQ(SandboxStatus::RUNNING, record->status);
    EXPECT_FALSE(record->error_message.has_value());
}

TEST_F(SandboxManagerTest, TerminatingRecordIsNotStarted) {
    auto record = manager_->create_record("alice");
    store::RecordUpdate update;
    update.status = SandboxStatus::TERMINATING;
    ASSERT_TRUE(store_->update(record.id, update));

    EXPECT_THROW(manager_->ensure_running("alice"), manager::SandboxUnavailable);
    EXPECT_EQ(0, runtime_->start_calls.load());
    EXPECT_EQ(SandboxStatus::TERMINATING, status_of("alice"));
}

TEST_F(SandboxManagerTest, IdleSweepStopsRecords) {
    std::vector<std::string> users = {"alice", "bob", "carol"};
    for (const auto& user : users) {
        manager_->ensure_running(user);
    }

    clock_.advance(seconds(30));
    EXPECT_EQ(0u, manager_->cleanup_idle_sandboxes());

    clock_.advance(seconds(31));
    EXPECT_EQ(3u, manager_->cleanup_idle_sandboxes());
    EXPECT_EQ(0u, pool_->size());

    for (const auto& user : users) {
        EXPECT_EQ(SandboxStatus::STOPPED, status_of(user));
    }
    for (const auto& handle : runtime_->handles()) {
        EXPECT_EQ(1, handle->cleanup_calls.load());
    }
}

TEST_F(SandboxManagerTest, IdleSweepSkipsSandboxesInUse) {
    auto lease = manager_->ensure_running("alice");
    manager_->ensure_running("bob");

    clock_.advance(seconds(120));
    EXPECT_EQ(1u, manager_->cleanup_idle_sandboxes());
    EXPECT_EQ(SandboxStatus::RUNNING, status_of("alice"));
    EXPECT_EQ(SandboxStatus::STOPPED, status_of("bob"));
    EXPECT_TRUE(lease->is_started());
}

TEST_F(SandboxManagerTest, StopIsIdempotent) {
    std::string id = manager_->ensure_running("alice").sandbox_id();
    auto handle = runtime_->last_handle();

    EXPECT_TRUE(manager_->stop_sandbox(id));
    EXPECT_FALSE(manager_->stop_sandbox(id));
    EXPECT_FALSE(manager_->stop_sandbox("missing"));

    EXPECT_EQ(1, handle->cleanup_calls.load());
    EXPECT_EQ(SandboxStatus::STOPPED, status_of("alice"));
    EXPECT_FALSE(pool_->contains(id));
}

TEST_F(SandboxManagerTest, StoppedSandboxRestartsOnNextUse) {
    std::string id = manager_->ensure_running("alice").sandbox_id();
    ASSERT_TRUE(manager_->stop_sandbox(id));

    auto lease = manager_->ensure_running("alice");
    EXPECT_EQ(id, lease.sandbox_id());
    EXPECT_EQ(2, runtime_->start_calls.load());
    EXPECT_EQ(SandboxStatus::RUNNING, status_of("alice"));
}

TEST_F(SandboxManagerTest, RestartDefersRecreation) {
    std::string id = manager_->ensure_running("alice").sandbox_id();

    EXPECT_TRUE(manager_->restart_sandbox(id));
    EXPECT_EQ(SandboxStatus::STOPPED, status_of("alice"));
    EXPECT_EQ(1, runtime_->start_calls.load());

    // Restarting a stopped sandbox is still accepted
    EXPECT_TRUE(manager_->restart_sandbox(id));
    EXPECT_FALSE(manager_->restart_sandbox("missing"));

    manager_->ensure_running("alice");
    EXPECT_EQ(2, runtime_->start_calls.load());
}

TEST_F(SandboxManagerTest, DeleteRemovesRecordAndContainer) {
    std::string id = manager_->ensure_running("alice").sandbox_id();
    auto handle = runtime_->last_handle();

    EXPECT_TRUE(manager_->delete_sandbox(id));
    EXPECT_FALSE(manager_->get_record(id).has_value());
    EXPECT_FALSE(pool_->contains(id));
    EXPECT_EQ(1, handle->cleanup_calls.load());
    EXPECT_FALSE(manager_->delete_sandbox(id));

    auto history = manager_->transitions().entries_for(id);
    ASSERT_FALSE(history.empty());
    EXPECT_EQ(SandboxStatus::TERMINATING, history.back().to);

    // The user gets a fresh sandbox afterwards
    auto lease = manager_->ensure_running("alice");
    EXPECT_NE(id, lease.sandbox_id());
}

TEST_F(SandboxManagerTest, LruEvictionStopsRecord) {
    build(1);

    std::string alice = manager_->ensure_running("alice").sandbox_id();
    auto alice_handle = runtime_->last_handle();
    clock_.advance(seconds(1));

    auto lease = manager_->ensure_running("bob");
    EXPECT_EQ(1, alice_handle->cleanup_calls.load());
    EXPECT_FALSE(pool_->contains(alice));
    EXPECT_EQ(SandboxStatus::STOPPED, status_of("alice"));
    EXPECT_EQ(SandboxStatus::RUNNING, status_of("bob"));
}

TEST_F(SandboxManagerTest, TransitionsFollowStateMachine) {
    runtime_->fail_next = 1;
    EXPECT_THROW(manager_->ensure_running("alice"), manager::SandboxUnavailable);
    std::string id = manager_->ensure_running("alice").sandbox_id();
    manager_->stop_sandbox(id);
    manager_->ensure_running("alice");
    runtime_->last_handle()->alive = false;
    manager_->ensure_running("alice");
    clock_.advance(seconds(61));
    manager_->cleanup_idle_sandboxes();
    manager_->delete_sandbox(id);

    auto history = manager_->transitions().entries_for(id);
    ASSERT_FALSE(history.empty());
    EXPECT_FALSE(history.front().from.has_value());
    EXPECT_EQ(SandboxStatus::PENDING, history.front().to);

    for (size_t i = 1; i < history.size(); i++) {
        ASSERT_TRUE(history[i].from.has_value());
        EXPECT_TRUE(manager::is_legal_transition(*history[i].from, history[i].to))
            << store::sandbox_status_to_string(*history[i].from) << " -> "
            << store::sandbox_status_to_string(history[i].to);
        EXPECT_EQ(history[i - 1].to, *history[i].from);
    }
}

TEST_F(SandboxManagerTest, RecoverStaleRecords) {
    auto now = std::chrono::system_clock::now();
    auto make = [&](const std::string& id, SandboxStatus status, std::chrono::seconds age) {
        store::SandboxRecord record;
        record.id = id;
        record.user_id = "user-" + id;
        record.status = status;
        record.image = config_.default_image;
        record.created_at = now - age;
        record.updated_at = now - age;
        ASSERT_TRUE(store_->insert(record));
    };
    make("stale-creating", SandboxStatus::CREATING, seconds(3600));
    make("fresh-creating", SandboxStatus::CREATING, seconds(10));
    make("orphan-running", SandboxStatus::RUNNING, seconds(10));
    make("stopped", SandboxStatus::STOPPED, seconds(3600));

    EXPECT_EQ(2u, manager_->recover_stale_records());

    auto stale = manager_->get_record("stale-creating");
    EXPECT_EQ(SandboxStatus::FAILED, stale->status);
    EXPECT_TRUE(stale->error_message.has_value());
    EXPECT_EQ(SandboxStatus::CREATING, manager_->get_record("fresh-creating")->status);
    EXPECT_EQ(SandboxStatus::STOPPED, manager_->get_record("orphan-running")->status);
    EXPECT_EQ(SandboxStatus::STOPPED, manager_->get_record("stopped")->status);

    // Nothing left to recover
    EXPECT_EQ(0u, manager_->recover_stale_records());
}

TEST_F(SandboxManagerTest, WorkspaceIsMounted) {
    manager_->ensure_running("team/alice");

    auto specs = runtime_->specs();
    ASSERT_EQ(1u, specs.size());
    ASSERT_EQ(1u, specs[0].volumes.size());
    EXPECT_EQ("/workspace", specs[0].volumes[0].container_path);
    EXPECT_EQ((root_ / "team_alice").string(), specs[0].volumes[0].host_path);
    EXPECT_TRUE(fs::is_directory(root_ / "team_alice"));
    EXPECT_EQ(512u, specs[0].memory_limit_mb);
}

TEST_F(SandboxManagerTest, SanitizePathComponent) {
    using manager::SandboxManager;
    EXPECT_EQ("alice", SandboxManager::sanitize_path_component("alice"));
    EXPECT_EQ("a_b", SandboxManager::sanitize_path_component("a/b"));
    EXPECT_EQ("user.name-1", SandboxManager::sanitize_path_component("user.name-1"));
    EXPECT_EQ("_..", SandboxManager::sanitize_path_component(".."));
    EXPECT_EQ("_", SandboxManager::sanitize_path_component(""));
}

TEST_F(SandboxManagerTest, ListRecordsFiltersByStatus) {
    std::string alice = manager_->ensure_running("alice").sandbox_id();
    manager_->ensure_running("bob");
    manager_->create_record("carol");
    manager_->stop_sandbox(alice);

    store::RecordQuery query;
    query.status = SandboxStatus::RUNNING;
    auto page = manager_->list_records(query);
    ASSERT_EQ(1u, page.total);
    EXPECT_EQ("bob", page.items[0].user_id);

    auto all = manager_->list_records({});
    EXPECT_EQ(3u, all.total);
}
