#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include "manager/idle_sweeper.hpp"
#include "manager/sandbox_manager.hpp"
#include "pool/sandbox_pool.hpp"
#include "runtime/namespace_runtime.hpp"
#include "store/json_file_record_store.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

using namespace sandpool;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

struct Args {
    std::string config_path;
    bool list = false;
    bool help = false;
};

void print_usage(const char* prog) {
    fmt::print("Usage: {} [--config <path>] [--list]\n\n", prog);
    fmt::print("  --config <path>  JSON configuration file\n");
    fmt::print("  --list           Print sandbox records and exit\n");
}

bool parse_args(int argc, char** argv, Args& args) {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                fmt::print(stderr, "--config requires a path\n");
                return false;
            }
            args.config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--list") == 0) {
            args.list = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            args.help = true;
        } else {
            fmt::print(stderr, "Unknown argument: {}\n", argv[i]);
            return false;
        }
    }
    return true;
}

void print_status_box(const util::Config& config, const std::string& runtime_name) {
    fmt::print(fmt::emphasis::bold | fg(fmt::color::cyan), "\n    SANDPOOL\n");
    fmt::print("    Runtime      {}\n", fmt::styled(runtime_name, fg(fmt::color::green)));
    fmt::print("    Image        {}\n", config.default_image);
    fmt::print("    Pool size    {}\n", config.max_pool_size);
    fmt::print("    Idle timeout {}s (sweep every {}s)\n",
        config.idle_timeout_sec, config.sweep_interval_sec);
    fmt::print("    Records      {}\n\n", fmt::styled(config.record_file, fg(fmt::color::yellow)));
}

void print_records(const store::RecordStore& store) {
    store::RecordQuery query;
    query.page_size = 100;

    auto page = store.list(query);
    fmt::print("{:<36}  {:<20}  {:<11}  {:<24}  {}\n",
        "ID", "USER", "STATUS", "UPDATED", "ERROR");
    while (true) {
        for (const auto& record : page.items) {
            fmt::print("{:<36}  {:<20}  {:<11}  {:<24}  {}\n",
                record.id,
                record.user_id,
                store::sandbox_status_to_string(record.status),
                util::format_iso8601(record.updated_at),
                record.error_message.value_or(""));
        }
        if (page.page * page.page_size >= page.total) {
            break;
        }
        query.page++;
        page = store.list(query);
    }
    fmt::print("\n{} sandbox records\n", page.total);
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 2;
    }
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    util::init_logger();
    util::Config config = util::load_config(args.config_path);
    util::set_log_level(util::log_level_from_string(config.log_level));

    std::shared_ptr<store::JsonFileRecordStore> records;
    try {
        records = std::make_shared<store::JsonFileRecordStore>(config.record_file);
    } catch (const store::StoreError& e) {
        spdlog::critical("Cannot open record store: {}", e.what());
        return 1;
    }

    if (args.list) {
        print_records(*records);
        return 0;
    }

    runtime::NamespaceOptions ns_options;
    ns_options.command = config.keepalive_command;
    auto runtime = std::make_shared<runtime::NamespaceRuntime>(ns_options);
    auto pool = std::make_shared<pool::SandboxPool>(config.max_pool_size);

    manager::SandboxManager manager(config, records, pool, runtime);
    print_status_box(config, runtime->name());

    try {
        manager.recover_stale_records();
    } catch (const std::exception& e) {
        spdlog::error("Startup reconciliation failed: {}", e.what());
    }

    manager::IdleSweeper sweeper(manager, std::chrono::seconds(config.sweep_interval_sec));
    sweeper.start();

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    spdlog::info("sandpoold running, press Ctrl+C to exit");
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Shutting down...");
    sweeper.stop();
    pool->shutdown();
    spdlog::info("sandpoold stopped");
    return 0;
}
