#pragma once

#include <optional>
#include <string>
#include <vector>

namespace reportd::exporting {

enum class ExportStatus {
    kQueued,
    kInProgress,
    kCompleted,
    kFailed
};

const char* ToString(ExportStatus status);
// notStarted/queued -> kQueued; unknown values map to kInProgress.
ExportStatus ExportStatusFromString(const std::string& value);

struct ExportRequest {
    std::string report_name;
    std::optional<std::string> filter;
    std::vector<std::string> select;
    std::string format = "csv";
};

struct ExportJob {
    std::string id;
    ExportStatus status = ExportStatus::kQueued;
    // Set once the job completes.
    std::string download_handle;
    std::string error;
};

// Remote export API. Every call throws RemoteJobError on failure.
class RemoteJobClient {
public:
    virtual ~RemoteJobClient() = default;

    virtual std::string CreateJob(const ExportRequest& request) = 0;
    virtual ExportJob GetStatus(const std::string& job_id) = 0;
    virtual std::string Download(const std::string& download_handle) = 0;
};

}  // namespace reportd::exporting
