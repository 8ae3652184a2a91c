#include "scheduler/execution_coordinator.hpp"

#include <algorithm>
#include <utility>

#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace reportd::scheduler {
namespace {

constexpr const char* kTag = "scheduler";

std::string BaseName(const std::string& blob_name) {
    const auto slash = blob_name.find_last_of('/');
    return slash == std::string::npos ? blob_name : blob_name.substr(slash + 1);
}

double SecondsBetween(std::chrono::steady_clock::time_point start,
                      std::chrono::steady_clock::time_point end) {
    const auto seconds = std::chrono::duration<double>(end - start).count();
    return std::max(0.0, seconds);
}

}  // namespace

nlohmann::json SweepSummaryToJson(const SweepSummary& summary) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& item : summary.results) {
        nlohmann::json entry{
            {"reportId", item.report_id},
            {"reportName", item.report_name},
            {"reportType", item.report_type},
            {"success", item.success},
            {"executionTime", item.execution_time_s},
            {"timestamp", utils::ToMs(item.timestamp)}};
        if (!item.error.empty()) {
            entry["error"] = item.error;
        }
        results.push_back(std::move(entry));
    }
    nlohmann::json data{
        {"totalReportsChecked", summary.total_reports_checked},
        {"reportsExecuted", summary.reports_executed},
        {"successfulExecutions", summary.successful_executions},
        {"failedExecutions", summary.failed_executions},
        {"results", results}};
    if (summary.error.has_value()) {
        data["error"] = summary.error.value();
    }
    return data;
}

ExecutionCoordinator::ExecutionCoordinator(const reports::ReportStore& store,
                                           const exporting::ReportCatalog& catalog,
                                           exporting::RemoteJobClient& client,
                                           const exporting::JobPoller& poller,
                                           const exporting::ArchiveExtractor& extractor,
                                           const storage::StorageUploader& uploader,
                                           const notify::NotificationDispatcher& notifier,
                                           CoordinatorOptions options,
                                           NowFn now)
    : store_(store)
    , catalog_(catalog)
    , client_(client)
    , poller_(poller)
    , extractor_(extractor)
    , uploader_(uploader)
    , notifier_(notifier)
    , options_(options)
    , now_(std::move(now))
    , clock_(options.utc_offset) {
    if (!now_) {
        now_ = [] { return utils::Now(); };
    }
}

SweepSummary ExecutionCoordinator::Sweep(const StopRequested& stop_requested) {
    SweepSummary summary;
    const auto now = now_();

    reports::ReportStore::LoadResult loaded;
    try {
        loaded = store_.LoadAll(now);
    } catch (const utils::StoreError& ex) {
        summary.error = ex.what();
        utils::LogError(kTag, "sweep aborted", {{"error", ex.what()}});
        return summary;
    }

    summary.total_reports_checked = loaded.reports.size();
    auto due = resolver_.Resolve(loaded.reports, now);
    utils::LogInfo(kTag, "sweep started", {
        {"reports", std::to_string(loaded.reports.size())},
        {"due", std::to_string(due.size())}});

    for (auto& report : due) {
        if (stop_requested && stop_requested()) {
            utils::LogInfo(kTag, "sweep stopped early", {
                {"remaining", std::to_string(due.size() - summary.reports_executed)}});
            break;
        }
        auto result = Execute(report);
        ++summary.reports_executed;
        if (result.success) {
            ++summary.successful_executions;
        } else {
            ++summary.failed_executions;
        }
        summary.results.push_back(std::move(result));
    }

    utils::LogInfo(kTag, "sweep finished", {
        {"executed", std::to_string(summary.reports_executed)},
        {"succeeded", std::to_string(summary.successful_executions)},
        {"failed", std::to_string(summary.failed_executions)}});
    return summary;
}

ReportRunSummary ExecutionCoordinator::Execute(reports::ScheduledReport& report) {
    const auto started = now_();
    const auto started_steady = std::chrono::steady_clock::now();
    utils::LogInfo(kTag, "executing report", {{"report", report.name}, {"type", report.report_type}});

    notify::RunOutcome outcome;
    outcome.report_name = report.name;
    outcome.report_type = report.report_type;
    outcome.format = report.format;

    auto result = RunPipeline(report, started, outcome);

    const auto completed = now_();
    result.run_duration = SecondsBetween(started_steady, std::chrono::steady_clock::now());
    result.completed_at_ms = utils::ToMs(completed);

    outcome.success = result.success;
    outcome.error = result.error.value_or("");
    outcome.timestamp = completed;

    report.last_run_ms = utils::ToMs(started);
    report.last_run_result = result;
    report.modified_ms = utils::ToMs(completed);
    AdvanceSchedule(report, completed);

    notifier_.Dispatch(report.notifications, outcome);
    Persist(report);

    if (result.success) {
        utils::LogInfo(kTag, "report succeeded", {
            {"report", report.name},
            {"file", result.file_name.value_or("")},
            {"duration_s", std::to_string(result.run_duration)}});
    } else {
        utils::LogError(kTag, "report failed", {
            {"report", report.name},
            {"error", result.error.value_or("")}});
    }

    ReportRunSummary summary;
    summary.report_id = report.id;
    summary.report_name = report.name;
    summary.report_type = report.report_type;
    summary.success = result.success;
    summary.execution_time_s = result.run_duration;
    summary.timestamp = completed;
    summary.error = result.error.value_or("");
    return summary;
}

reports::RunResult ExecutionCoordinator::RunPipeline(const reports::ScheduledReport& report,
                                                     utils::TimePoint started,
                                                     notify::RunOutcome& outcome) {
    reports::RunResult result;
    result.format = report.format;

    try {
        exporting::ExportRequest request;
        request.report_name = report.report_type;
        request.filter = catalog_.BuildFilterExpression(report.report_type, report.filters);
        request.select = catalog_.ColumnsFor(report.report_type, report.selected_columns);
        request.format = report.format;

        const auto poll = poller_.Run(request, options_.poll);
        if (!poll.job_id.empty()) {
            outcome.job_id = poll.job_id;
        }
        if (!poll.completed()) {
            result.error = poll.error;
            return result;
        }

        const auto archive = client_.Download(poll.download_handle);
        const auto payload = extractor_.Extract(archive, report.format);
        const auto records = exporting::CountRecords(payload.bytes, payload.format);

        storage::UploadContext context;
        context.report_name = report.name;
        context.report_type = report.report_type;
        context.job_id = poll.job_id;
        context.extension = payload.format;
        context.now = started;
        context.utc_offset = options_.utc_offset;
        const auto upload = uploader_.Upload(report.delivery, payload.bytes, context);

        result.success = true;
        result.format = payload.format;
        result.file_name = BaseName(upload.blob_name);
        result.file_size = static_cast<std::int64_t>(payload.bytes.size());
        result.record_count = records;
        result.storage_link = upload.link;
        result.link_expiration_days = upload.link_expiration_days;

        outcome.format = payload.format;
        outcome.record_count = result.record_count;
        outcome.file_size = result.file_size;
        outcome.storage_link = result.storage_link;
        outcome.link_expiration_days = result.link_expiration_days;
    } catch (const utils::StorageConfigError& ex) {
        result.success = false;
        result.error = std::string("storage configuration error: ") + ex.what();
    } catch (const utils::StorageTransportError& ex) {
        result.success = false;
        result.error = std::string("upload failed: ") + ex.what();
    } catch (const utils::ExtractionError& ex) {
        result.success = false;
        result.error = std::string("extraction failed: ") + ex.what();
    } catch (const utils::RemoteJobError& ex) {
        result.success = false;
        result.error = std::string("download failed: ") + ex.what();
    } catch (const std::exception& ex) {
        result.success = false;
        result.error = ex.what();
    }
    return result;
}

void ExecutionCoordinator::AdvanceSchedule(reports::ScheduledReport& report, utils::TimePoint completed) const {
    // Past the previous slot as well, so a manual run of a not-yet-due report still moves forward.
    auto after = completed;
    if (report.next_run_ms.has_value()) {
        after = std::max(after, utils::FromMs(report.next_run_ms.value()));
    }
    const auto next = clock_.NextRun(report.schedule, after);
    if (next.has_value()) {
        report.next_run_ms = utils::ToMs(next.value());
    } else {
        report.next_run_ms.reset();
    }
}

void ExecutionCoordinator::Persist(const reports::ScheduledReport& report) const {
    try {
        // The definition may have been edited or disabled while the report ran.
        auto current = store_.Find(report.id, now_());
        if (!current.has_value()) {
            utils::LogWarn(kTag, "report removed during run, state not saved", {{"report", report.id}});
            return;
        }
        current->last_run_ms = report.last_run_ms;
        current->last_run_result = report.last_run_result;
        current->next_run_ms = report.next_run_ms;
        current->modified_ms = report.modified_ms;
        store_.Save(current.value());
    } catch (const std::exception& ex) {
        utils::LogError(kTag, "failed to persist report state", {{"report", report.id}, {"error", ex.what()}});
    }
}

}  // namespace reportd::scheduler
