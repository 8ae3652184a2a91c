#include "scheduler/scheduler_service.hpp"

#include <utility>

#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace reportd::scheduler {
namespace {

constexpr const char* kTag = "scheduler";

}  // namespace

SchedulerService::SchedulerService(ExecutionCoordinator& coordinator,
                                   const reports::ReportStore& store,
                                   std::chrono::seconds interval,
                                   bool enabled,
                                   NowFn now)
    : coordinator_(coordinator)
    , store_(store)
    , interval_(interval)
    , enabled_(enabled)
    , now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return utils::Now(); };
    }
}

SchedulerService::~SchedulerService() {
    Stop();
}

void SchedulerService::Start() {
    if (!enabled_ || running_.exchange(true)) {
        return;
    }
    stopping_.store(false);
    utils::LogInfo(kTag, "scheduler started", {{"interval_s", std::to_string(interval_.count())}});
    worker_ = std::thread([this]() { RunLoop(); });
}

void SchedulerService::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    stopping_.store(true);
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    utils::LogInfo(kTag, "scheduler stopped");
}

SweepSummary SchedulerService::RunOnce() {
    std::lock_guard<std::mutex> sweep_lock(sweep_mutex_);
    auto summary = coordinator_.Sweep([this]() { return stopping_.load(); });
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_sweep_ = now_();
        last_summary_ = summary;
    }
    return summary;
}

void SchedulerService::RunLoop() {
    while (running_) {
        RunOnce();
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_for(lock, interval_, [this]() { return !running_; });
    }
}

nlohmann::json SchedulerService::GetStatus() const {
    const auto now = now_();
    nlohmann::json status{
        {"schedulerEnabled", enabled_},
        {"running", running_.load()},
        {"intervalS", interval_.count()}};

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (last_sweep_.has_value()) {
            status["lastSweep"] = utils::ToMs(last_sweep_.value());
        }
        if (last_summary_.has_value()) {
            status["lastSummary"] = SweepSummaryToJson(last_summary_.value());
        }
    }

    reports::ReportStore::LoadResult loaded;
    try {
        loaded = store_.LoadAll(now);
    } catch (const utils::StoreError& ex) {
        status["totalReports"] = 0;
        status["enabledReports"] = 0;
        status["overdueReports"] = 0;
        status["error"] = ex.what();
        return status;
    }

    std::size_t enabled_reports = 0;
    std::optional<long long> next_due;
    double total_duration = 0.0;
    std::size_t timed_runs = 0;
    for (const auto& report : loaded.reports) {
        if (report.is_enabled) {
            ++enabled_reports;
            if (!report.schedule.empty() && report.next_run_ms.has_value()) {
                if (!next_due.has_value() || report.next_run_ms.value() < next_due.value()) {
                    next_due = report.next_run_ms.value();
                }
            }
        }
        if (report.last_run_result.has_value()) {
            total_duration += report.last_run_result->run_duration;
            ++timed_runs;
        }
    }

    status["totalReports"] = loaded.reports.size();
    status["enabledReports"] = enabled_reports;
    status["overdueReports"] = resolver_.CountOverdue(loaded.reports, now);
    if (next_due.has_value()) {
        status["nextReportDue"] = next_due.value();
    }
    if (timed_runs > 0) {
        status["averageExecutionTime"] = total_duration / static_cast<double>(timed_runs);
    }
    return status;
}

}  // namespace reportd::scheduler
