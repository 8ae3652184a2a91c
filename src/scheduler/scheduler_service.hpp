#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include "nlohmann/json.hpp"
#include "reports/due_set.hpp"
#include "reports/report_store.hpp"
#include "scheduler/execution_coordinator.hpp"

namespace reportd::scheduler {

// Background loop that sweeps every `interval`. RunOnce may also be called
// from RPC handlers; sweeps never overlap.
class SchedulerService {
public:
    using NowFn = std::function<utils::TimePoint()>;

    SchedulerService(ExecutionCoordinator& coordinator,
                     const reports::ReportStore& store,
                     std::chrono::seconds interval = std::chrono::seconds(5 * 60),
                     bool enabled = true,
                     NowFn now = {});
    ~SchedulerService();

    void Start();
    // Returns once the report in progress, if any, has finished and been saved.
    void Stop();
    SweepSummary RunOnce();

    nlohmann::json GetStatus() const;
    bool enabled() const { return enabled_; }

private:
    void RunLoop();

    ExecutionCoordinator& coordinator_;
    const reports::ReportStore& store_;
    std::chrono::seconds interval_;
    bool enabled_ = true;
    NowFn now_;
    reports::DueSetResolver resolver_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::thread worker_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;

    std::mutex sweep_mutex_;
    mutable std::mutex state_mutex_;
    std::optional<utils::TimePoint> last_sweep_;
    std::optional<SweepSummary> last_summary_;
};

}  // namespace reportd::scheduler
