#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "export/archive_extractor.hpp"
#include "export/job_poller.hpp"
#include "export/remote_job_client.hpp"
#include "export/report_catalog.hpp"
#include "nlohmann/json.hpp"
#include "notify/notification_dispatcher.hpp"
#include "reports/due_set.hpp"
#include "reports/report_store.hpp"
#include "storage/storage_uploader.hpp"
#include "utils/common.hpp"

namespace reportd::scheduler {

struct ReportRunSummary {
    std::string report_id;
    std::string report_name;
    std::string report_type;
    bool success = false;
    double execution_time_s = 0.0;
    utils::TimePoint timestamp;
    std::string error;
};

struct SweepSummary {
    std::size_t total_reports_checked = 0;
    std::size_t reports_executed = 0;
    std::size_t successful_executions = 0;
    std::size_t failed_executions = 0;
    std::vector<ReportRunSummary> results;
    // Set when the sweep could not start.
    std::optional<std::string> error;
};

nlohmann::json SweepSummaryToJson(const SweepSummary& summary);

struct CoordinatorOptions {
    exporting::PollOptions poll;
    std::chrono::minutes utc_offset{0};
};

// Runs due reports one after another. A failure in one report never stops
// the sweep; every attempt advances nextRun and is persisted.
class ExecutionCoordinator {
public:
    using NowFn = std::function<utils::TimePoint()>;

    ExecutionCoordinator(const reports::ReportStore& store,
                         const exporting::ReportCatalog& catalog,
                         exporting::RemoteJobClient& client,
                         const exporting::JobPoller& poller,
                         const exporting::ArchiveExtractor& extractor,
                         const storage::StorageUploader& uploader,
                         const notify::NotificationDispatcher& notifier,
                         CoordinatorOptions options,
                         NowFn now = {});

    using StopRequested = std::function<bool()>;

    // Checks stop_requested between reports; a report already running always finishes.
    SweepSummary Sweep(const StopRequested& stop_requested = {});
    // Executes one report regardless of its schedule, updates it in place and persists it.
    ReportRunSummary Execute(reports::ScheduledReport& report);

private:
    reports::RunResult RunPipeline(const reports::ScheduledReport& report,
                                   utils::TimePoint started,
                                   notify::RunOutcome& outcome);
    void AdvanceSchedule(reports::ScheduledReport& report, utils::TimePoint completed) const;
    void Persist(const reports::ScheduledReport& report) const;

    const reports::ReportStore& store_;
    const exporting::ReportCatalog& catalog_;
    exporting::RemoteJobClient& client_;
    const exporting::JobPoller& poller_;
    const exporting::ArchiveExtractor& extractor_;
    const storage::StorageUploader& uploader_;
    const notify::NotificationDispatcher& notifier_;
    CoordinatorOptions options_;
    NowFn now_;
    reports::DueSetResolver resolver_;
    schedule::ScheduleClock clock_;
};

}  // namespace reportd::scheduler
