#pragma once

#include <functional>
#include <map>
#include <string>

#include "nlohmann/json.hpp"
#include "reports/report_store.hpp"
#include "rpc/operation_lock.hpp"
#include "rpc/rpc_handler.hpp"
#include "scheduler/scheduler_service.hpp"

namespace reportd::rpc {

// Privileged entry points used by the front end.
class ReportService : public RpcHandler {
public:
    using NowFn = std::function<utils::TimePoint()>;

    ReportService(const reports::ReportStore& store,
                  scheduler::SchedulerService& scheduler,
                  NamedOperationLock& operations,
                  NowFn now = {});

    nlohmann::json Handle(const std::string& method, const nlohmann::json& params) override;

private:
    using Method = std::function<nlohmann::json(const nlohmann::json&)>;

    nlohmann::json ExecuteScheduledReports(const nlohmann::json& params);
    nlohmann::json GetSchedulerStatus(const nlohmann::json& params);
    nlohmann::json SaveConfiguration(const nlohmann::json& params);
    nlohmann::json DeleteConfiguration(const nlohmann::json& params);
    nlohmann::json UpdateIndex(const nlohmann::json& params);
    nlohmann::json RebuildIndex(const nlohmann::json& params);
    nlohmann::json DisableReportsByName(const nlohmann::json& params);
    nlohmann::json BeginOperation(const nlohmann::json& params);
    nlohmann::json EndOperation(const nlohmann::json& params);

    const reports::ReportStore& store_;
    scheduler::SchedulerService& scheduler_;
    NamedOperationLock& operations_;
    NowFn now_;
    std::map<std::string, Method> methods_;
};

}  // namespace reportd::rpc
