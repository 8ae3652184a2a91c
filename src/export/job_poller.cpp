#include "export/job_poller.hpp"

#include <thread>
#include <utility>

#include "utils/logging.hpp"

namespace reportd::exporting {
namespace {

constexpr const char* kTag = "poller";

}  // namespace

const char* ToString(PollState state) {
    switch (state) {
        case PollState::kCreated: return "created";
        case PollState::kPolling: return "polling";
        case PollState::kCompleted: return "completed";
        case PollState::kFailed: return "failed";
        case PollState::kTimedOut: return "timedOut";
    }
    return "failed";
}

JobPoller::JobPoller(RemoteJobClient& client, Sleeper sleeper, MonotonicNow now)
    : client_(client), sleeper_(std::move(sleeper)), now_(std::move(now)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
    if (!now_) {
        now_ = [] { return std::chrono::steady_clock::now(); };
    }
}

PollOutcome JobPoller::Run(const ExportRequest& request, const PollOptions& options) const {
    std::string job_id;
    try {
        job_id = client_.CreateJob(request);
    } catch (const std::exception& ex) {
        PollOutcome outcome;
        outcome.state = PollState::kFailed;
        outcome.error = std::string("failed to create export job: ") + ex.what();
        utils::LogError(kTag, outcome.error, {{"report", request.report_name}});
        return outcome;
    }
    utils::LogInfo(kTag, "export job created", {{"job", job_id}, {"report", request.report_name}});
    return Poll(job_id, options);
}

PollOutcome JobPoller::Poll(const std::string& job_id, const PollOptions& options) const {
    PollOutcome outcome;
    outcome.job_id = job_id;
    outcome.state = PollState::kPolling;

    const auto start = now_();
    const auto elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now_() - start);
    };

    while (elapsed() < options.timeout) {
        sleeper_(options.interval);

        ExportJob job;
        try {
            job = client_.GetStatus(job_id);
        } catch (const std::exception& ex) {
            ++outcome.status_checks;
            outcome.state = PollState::kFailed;
            outcome.error = std::string("status check failed: ") + ex.what();
            outcome.elapsed = elapsed();
            utils::LogError(kTag, outcome.error, {{"job", job_id}});
            return outcome;
        }
        ++outcome.status_checks;
        utils::LogDebug(kTag, "status", {{"job", job_id}, {"status", ToString(job.status)}});

        if (job.status == ExportStatus::kCompleted) {
            outcome.elapsed = elapsed();
            if (job.download_handle.empty()) {
                outcome.state = PollState::kFailed;
                outcome.error = "export job " + job_id + " completed without a download url";
                utils::LogError(kTag, outcome.error);
                return outcome;
            }
            outcome.state = PollState::kCompleted;
            outcome.download_handle = job.download_handle;
            utils::LogInfo(kTag, "export job completed", {
                {"job", job_id},
                {"checks", std::to_string(outcome.status_checks)}});
            return outcome;
        }
        if (job.status == ExportStatus::kFailed) {
            outcome.state = PollState::kFailed;
            outcome.error = "export job " + job_id + " failed";
            if (!job.error.empty()) {
                outcome.error += ": " + job.error;
            }
            outcome.elapsed = elapsed();
            utils::LogError(kTag, outcome.error);
            return outcome;
        }
    }

    outcome.state = PollState::kTimedOut;
    outcome.elapsed = elapsed();
    outcome.error = "export job " + job_id + " did not complete within " +
                    std::to_string(std::chrono::duration_cast<std::chrono::seconds>(options.timeout).count()) + "s";
    utils::LogError(kTag, outcome.error);
    return outcome;
}

}  // namespace reportd::exporting
