#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "reports/report_types.hpp"

namespace reportd::reports {

// Definitions keep member order on disk so filters round-trip in order.
using Json = nlohmann::ordered_json;

// Throw DefinitionError on malformed or invalid input.
ScheduledReport DecodeReport(const std::string& bytes);
ScheduledReport ReportFromJson(const Json& data);

std::string EncodeReport(const ScheduledReport& report);
Json ReportToJson(const ScheduledReport& report);

Json RunResultToJson(const RunResult& result);
Json TriggerToJson(const schedule::Trigger& trigger);

// Empty when valid, otherwise a description of the first problem.
std::string ValidateReport(const ScheduledReport& report);

}  // namespace reportd::reports
