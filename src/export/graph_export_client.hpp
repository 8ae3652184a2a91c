#pragma once

#include <memory>
#include <string>

#include "auth/token_source.hpp"
#include "config/config_schema.hpp"
#include "export/remote_job_client.hpp"

namespace reportd::exporting {

// deviceManagement/reports/exportJobs over cpp-httplib.
class GraphExportClient : public RemoteJobClient {
public:
    GraphExportClient(config::GraphConfig config, std::shared_ptr<auth::TokenSource> tokens);

    std::string CreateJob(const ExportRequest& request) override;
    ExportJob GetStatus(const std::string& job_id) override;
    // The handle is a pre-signed URL; no Authorization header is sent.
    std::string Download(const std::string& download_handle) override;

    static std::shared_ptr<auth::TokenSource> MakeTokenSource(const config::GraphConfig& config);

private:
    std::string BearerToken();

    config::GraphConfig config_;
    std::shared_ptr<auth::TokenSource> tokens_;
};

}  // namespace reportd::exporting
