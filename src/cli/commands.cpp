#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

#include "config/config_loader.hpp"
#include "export/archive_extractor.hpp"
#include "export/graph_export_client.hpp"
#include "export/job_poller.hpp"
#include "export/report_catalog.hpp"
#include "nlohmann/json.hpp"
#include "notify/notification_dispatcher.hpp"
#include "notify/webhook_sender.hpp"
#include "reports/report_store.hpp"
#include "rpc/http_transport.hpp"
#include "rpc/operation_lock.hpp"
#include "rpc/report_service.hpp"
#include "scheduler/execution_coordinator.hpp"
#include "scheduler/scheduler_service.hpp"
#include "storage/azure_blob_client.hpp"
#include "storage/storage_uploader.hpp"
#include "utils/logging.hpp"

namespace {

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

// Everything the daemon and the one-shot commands share.
struct Runtime {
    explicit Runtime(const reportd::config::Config& config)
        : clock(std::chrono::minutes(config.scheduler.utc_offset_minutes))
        , store(config.service.reports_dir, clock)
        , export_client(config.graph, reportd::exporting::GraphExportClient::MakeTokenSource(config.graph))
        , poller(export_client)
        , extractor(config.service.temp_dir)
        , registry(config.storage.configurations)
        , uploader(registry, blob_client)
        , notifier(webhook_sender, config.notifications.global_webhook_url, clock.utc_offset())
        , coordinator(store, catalog, export_client, poller, extractor, uploader, notifier, CoordinatorOptionsFor(config))
        , scheduler(coordinator, store, std::chrono::seconds(config.scheduler.interval_s), config.scheduler.enabled) {}

    static reportd::scheduler::CoordinatorOptions CoordinatorOptionsFor(const reportd::config::Config& config) {
        reportd::scheduler::CoordinatorOptions options;
        options.poll.interval = std::chrono::seconds(config.scheduler.poll_interval_s);
        options.poll.timeout = std::chrono::seconds(config.scheduler.job_timeout_s);
        options.utc_offset = std::chrono::minutes(config.scheduler.utc_offset_minutes);
        return options;
    }

    reportd::exporting::ReportCatalog catalog;
    reportd::schedule::ScheduleClock clock;
    reportd::reports::ReportStore store;
    reportd::exporting::GraphExportClient export_client;
    reportd::exporting::JobPoller poller;
    reportd::exporting::ArchiveExtractor extractor;
    reportd::storage::StorageConfigRegistry registry;
    reportd::storage::AzureBlobClient blob_client;
    reportd::storage::StorageUploader uploader;
    reportd::notify::HttpWebhookSender webhook_sender;
    reportd::notify::NotificationDispatcher notifier;
    reportd::scheduler::ExecutionCoordinator coordinator;
    reportd::scheduler::SchedulerService scheduler;
};

reportd::config::Config LoadAndConfigure() {
    auto config = reportd::config::LoadConfig();
    reportd::utils::LogConfig log_config;
    log_config.min_level = reportd::utils::LogLevelFromString(config.logging.level);
    reportd::utils::ConfigureLogging(log_config);
    return config;
}

void LoadCatalog(Runtime& runtime, const reportd::config::Config& config) {
    if (config.catalog_path.empty()) {
        return;
    }
    try {
        runtime.catalog.LoadFile(config.catalog_path);
        reportd::utils::LogInfo("cli", "loaded report catalog", {
            {"path", config.catalog_path},
            {"types", std::to_string(runtime.catalog.size())}});
    } catch (const std::exception& ex) {
        reportd::utils::LogError("cli", "ignoring report catalog", {
            {"path", config.catalog_path},
            {"error", ex.what()}});
    }
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(const std::filesystem::path& path, pid_t pid) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

bool WaitForExit(pid_t pid, std::chrono::seconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!IsProcessRunning(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return !IsProcessRunning(pid);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

int RunServe() {
    const auto config = LoadAndConfigure();
    const std::filesystem::path pid_file = config.service.pid_file;

    const auto existing_pid = ReadPidFile(pid_file);
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "reportd already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    RemovePidFile(pid_file);
    if (!WritePidFile(pid_file, ::getpid())) {
        std::cout << "Failed to write pid file " << pid_file.string() << std::endl;
        return 1;
    }

    Runtime runtime(config);
    LoadCatalog(runtime, config);
    reportd::rpc::NamedOperationLock operations;
    reportd::rpc::ReportService service(runtime.store, runtime.scheduler, operations);
    reportd::rpc::HttpTransport transport(service, config.rpc.host, config.rpc.port);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    if (!transport.Start()) {
        RemovePidFile(pid_file);
        return 1;
    }
    runtime.scheduler.Start();

    std::cout << "reportd started. Press Ctrl+C to stop." << std::endl;
    while (g_running.load()) {
        if (g_signal != 0) {
            g_running.store(false);
            break;
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    // Stop waits for the report in progress so its state and temp files are settled.
    reportd::utils::LogInfo("cli", "shutting down", {{"signal", std::to_string(static_cast<int>(g_signal))}});
    transport.Stop();
    runtime.scheduler.Stop();
    RemovePidFile(pid_file);
    return 0;
}

int RunStop() {
    const auto config = reportd::config::LoadConfig();
    const std::filesystem::path pid_file = config.service.pid_file;
    const auto pid = ReadPidFile(pid_file);
    if (!pid || !IsProcessRunning(*pid)) {
        std::cout << "reportd not running." << std::endl;
        return 1;
    }
    ::kill(*pid, SIGTERM);
    if (!WaitForExit(*pid, reportd::config::ShutdownGracePeriod(config.scheduler))) {
        std::cout << "reportd (pid=" << *pid << ") did not exit." << std::endl;
        return 1;
    }
    RemovePidFile(pid_file);
    return 0;
}

int RunSweep() {
    const auto config = LoadAndConfigure();
    Runtime runtime(config);
    LoadCatalog(runtime, config);
    const auto summary = runtime.scheduler.RunOnce();
    std::cout << reportd::scheduler::SweepSummaryToJson(summary).dump(2) << std::endl;
    return summary.error.has_value() ? 1 : 0;
}

int RunStatus() {
    const auto config = LoadAndConfigure();
    Runtime runtime(config);
    std::cout << runtime.scheduler.GetStatus().dump(2) << std::endl;
    return 0;
}

int RunRebuildIndex() {
    const auto config = LoadAndConfigure();
    Runtime runtime(config);
    try {
        const auto count = runtime.store.RebuildIndex(reportd::utils::Now());
        std::cout << "Indexed " << count << " report(s)." << std::endl;
    } catch (const std::exception& ex) {
        std::cout << "Failed to rebuild index: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string command = argc >= 2 ? argv[1] : "";
    if (command == "serve") {
        return RunServe();
    }
    if (command == "stop") {
        return RunStop();
    }
    if (command == "sweep") {
        return RunSweep();
    }
    if (command == "status") {
        return RunStatus();
    }
    if (command == "rebuild-index") {
        return RunRebuildIndex();
    }
    std::cout << "Usage: reportd serve | reportd stop | reportd sweep | reportd status | reportd rebuild-index"
              << std::endl;
    return 1;
}
