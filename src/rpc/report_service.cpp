#include "rpc/report_service.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>
#include <vector>

#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace reportd::rpc {
namespace {

constexpr const char* kTag = "rpc";
// Longer requests are held for a day at most.
constexpr double kMaxOperationTimeoutS = 24.0 * 60 * 60;

// Thrown by parameter accessors; mapped to "invalid_params".
class InvalidParams : public std::runtime_error {
public:
    explicit InvalidParams(const std::string& msg) : std::runtime_error(msg) {}
};

std::string RequireString(const nlohmann::json& params, const char* key) {
    if (!params.is_object() || !params.contains(key) || !params[key].is_string()) {
        throw InvalidParams(std::string("missing string parameter '") + key + "'");
    }
    auto value = params[key].get<std::string>();
    if (value.empty()) {
        throw InvalidParams(std::string("parameter '") + key + "' must not be empty");
    }
    return value;
}

// Accepts either a JSON document in a string or an inline object.
std::string RequireDocument(const nlohmann::json& params, const char* key) {
    if (!params.is_object() || !params.contains(key)) {
        throw InvalidParams(std::string("missing parameter '") + key + "'");
    }
    const auto& value = params[key];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_object()) {
        return value.dump(2);
    }
    throw InvalidParams(std::string("parameter '") + key + "' must be a string or an object");
}

}  // namespace

ReportService::ReportService(const reports::ReportStore& store,
                             scheduler::SchedulerService& scheduler,
                             NamedOperationLock& operations,
                             NowFn now)
    : store_(store), scheduler_(scheduler), operations_(operations), now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return utils::Now(); };
    }
    methods_["executeScheduledReports"] = [this](const nlohmann::json& p) { return ExecuteScheduledReports(p); };
    methods_["getSchedulerStatus"] = [this](const nlohmann::json& p) { return GetSchedulerStatus(p); };
    methods_["saveScheduledReportConfiguration"] = [this](const nlohmann::json& p) { return SaveConfiguration(p); };
    methods_["deleteScheduledReportConfiguration"] = [this](const nlohmann::json& p) { return DeleteConfiguration(p); };
    methods_["updateScheduledReportsIndex"] = [this](const nlohmann::json& p) { return UpdateIndex(p); };
    methods_["rebuildIndex"] = [this](const nlohmann::json& p) { return RebuildIndex(p); };
    methods_["disableReportsByName"] = [this](const nlohmann::json& p) { return DisableReportsByName(p); };
    methods_["beginOperation"] = [this](const nlohmann::json& p) { return BeginOperation(p); };
    methods_["endOperation"] = [this](const nlohmann::json& p) { return EndOperation(p); };
    methods_["ping"] = [](const nlohmann::json&) { return nlohmann::json("pong"); };
}

nlohmann::json ReportService::Handle(const std::string& method, const nlohmann::json& params) {
    auto it = methods_.find(method);
    if (it == methods_.end()) {
        utils::LogWarn(kTag, "unknown method", {{"method", method}});
        return MakeError("method_not_found", "unknown method: " + method);
    }
    try {
        return MakeResult(it->second(params));
    } catch (const InvalidParams& ex) {
        return MakeError("invalid_params", ex.what());
    } catch (const utils::DefinitionError& ex) {
        return MakeError("invalid_definition", ex.what());
    } catch (const utils::StoreError& ex) {
        utils::LogError(kTag, "store error", {{"method", method}, {"error", ex.what()}});
        return MakeError("store_error", ex.what());
    } catch (const std::exception& ex) {
        utils::LogError(kTag, "request failed", {{"method", method}, {"error", ex.what()}});
        return MakeError("internal", ex.what());
    }
}

nlohmann::json ReportService::ExecuteScheduledReports(const nlohmann::json&) {
    return scheduler::SweepSummaryToJson(scheduler_.RunOnce());
}

nlohmann::json ReportService::GetSchedulerStatus(const nlohmann::json&) {
    return scheduler_.GetStatus();
}

nlohmann::json ReportService::SaveConfiguration(const nlohmann::json& params) {
    const auto bytes = RequireDocument(params, "reportData");
    const auto file_name = RequireString(params, "fileName");
    store_.SaveRaw(bytes, file_name, now_());
    return true;
}

nlohmann::json ReportService::DeleteConfiguration(const nlohmann::json& params) {
    return store_.Delete(RequireString(params, "fileName"));
}

nlohmann::json ReportService::UpdateIndex(const nlohmann::json& params) {
    store_.WriteIndex(RequireDocument(params, "indexData"));
    return true;
}

nlohmann::json ReportService::RebuildIndex(const nlohmann::json&) {
    return store_.RebuildIndex(now_());
}

nlohmann::json ReportService::DisableReportsByName(const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("names") || !params["names"].is_array()) {
        throw InvalidParams("missing array parameter 'names'");
    }
    std::vector<std::string> names;
    for (const auto& item : params["names"]) {
        if (!item.is_string()) {
            throw InvalidParams("'names' must contain strings");
        }
        names.push_back(item.get<std::string>());
    }
    return store_.DisableReportsByName(names, now_());
}

nlohmann::json ReportService::BeginOperation(const nlohmann::json& params) {
    const auto identifier = RequireString(params, "identifier");
    std::chrono::milliseconds timeout = std::chrono::seconds(300);
    if (params.contains("timeoutS")) {
        if (!params["timeoutS"].is_number() || params["timeoutS"].get<double>() <= 0) {
            throw InvalidParams("'timeoutS' must be a positive number");
        }
        const double seconds = std::min(params["timeoutS"].get<double>(), kMaxOperationTimeoutS);
        timeout = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    }
    return operations_.Begin(identifier, timeout);
}

nlohmann::json ReportService::EndOperation(const nlohmann::json& params) {
    return operations_.End(RequireString(params, "identifier"));
}

}  // namespace reportd::rpc
