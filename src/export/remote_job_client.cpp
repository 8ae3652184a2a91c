#include "export/remote_job_client.hpp"

#include "utils/common.hpp"

namespace reportd::exporting {

const char* ToString(ExportStatus status) {
    switch (status) {
        case ExportStatus::kQueued: return "queued";
        case ExportStatus::kInProgress: return "inProgress";
        case ExportStatus::kCompleted: return "completed";
        case ExportStatus::kFailed: return "failed";
    }
    return "inProgress";
}

ExportStatus ExportStatusFromString(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "completed") {
        return ExportStatus::kCompleted;
    }
    if (lowered == "failed") {
        return ExportStatus::kFailed;
    }
    if (lowered == "queued" || lowered == "notstarted") {
        return ExportStatus::kQueued;
    }
    return ExportStatus::kInProgress;
}

}  // namespace reportd::exporting
