#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "export/remote_job_client.hpp"

namespace reportd::exporting {

enum class PollState {
    kCreated,
    kPolling,
    kCompleted,
    kFailed,
    kTimedOut
};

const char* ToString(PollState state);

struct PollOptions {
    std::chrono::milliseconds interval = std::chrono::seconds(10);
    std::chrono::milliseconds timeout = std::chrono::seconds(300);
};

struct PollOutcome {
    PollState state = PollState::kCreated;
    // Empty when creation itself failed.
    std::string job_id;
    std::string download_handle;
    std::string error;
    int status_checks = 0;
    std::chrono::milliseconds elapsed{0};

    bool completed() const { return state == PollState::kCompleted; }
};

// Drives one export job: create, then sleep/check until a terminal state.
// A single failed status check ends the job as kFailed.
class JobPoller {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using MonotonicNow = std::function<std::chrono::steady_clock::time_point()>;

    explicit JobPoller(RemoteJobClient& client, Sleeper sleeper = {}, MonotonicNow now = {});

    PollOutcome Run(const ExportRequest& request, const PollOptions& options) const;
    PollOutcome Poll(const std::string& job_id, const PollOptions& options) const;

private:
    RemoteJobClient& client_;
    Sleeper sleeper_;
    MonotonicNow now_;
};

}  // namespace reportd::exporting
