#include "export/graph_export_client.hpp"

#include <utility>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/http.hpp"
#include "utils/logging.hpp"

namespace reportd::exporting {
namespace {

constexpr const char* kTag = "export";
constexpr const char* kExportJobsPath = "/deviceManagement/reports/exportJobs";

std::string TrimTrailingSlash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

std::string Truncate(const std::string& body, std::size_t limit = 512) {
    return body.size() > limit ? body.substr(0, limit) + "..." : body;
}

std::string GraphScope(const std::string& base_url) {
    try {
        const auto parsed = utils::ParseUrl(base_url);
        return std::string(parsed.https ? "https://" : "http://") + parsed.host + "/.default";
    } catch (const std::exception&) {
        return "https://graph.microsoft.com/.default";
    }
}

}  // namespace

GraphExportClient::GraphExportClient(config::GraphConfig config, std::shared_ptr<auth::TokenSource> tokens)
    : config_(std::move(config)), tokens_(std::move(tokens)) {
    config_.base_url = TrimTrailingSlash(config_.base_url);
}

std::shared_ptr<auth::TokenSource> GraphExportClient::MakeTokenSource(const config::GraphConfig& config) {
    auth::ClientCredential credential;
    credential.authority_url = config.authority_url;
    credential.tenant_id = config.tenant_id;
    credential.client_id = config.client_id;
    credential.client_secret = config.client_secret;
    credential.scope = GraphScope(config.base_url);
    return std::make_shared<auth::ClientCredentialTokenSource>(credential, config.timeout_s);
}

std::string GraphExportClient::BearerToken() {
    if (!tokens_) {
        throw utils::RemoteJobError("no token source configured for the export API");
    }
    try {
        return tokens_->GetToken();
    } catch (const std::exception& ex) {
        throw utils::RemoteJobError(std::string("authentication failed: ") + ex.what());
    }
}

std::string GraphExportClient::CreateJob(const ExportRequest& request) {
    nlohmann::json payload{
        {"reportName", request.report_name},
        {"format", request.format},
        {"localizationType", "LocalizedValuesAsAdditionalColumn"}};
    if (request.filter.has_value()) {
        payload["filter"] = request.filter.value();
    }
    if (!request.select.empty()) {
        payload["select"] = request.select;
    }

    const auto url = utils::ParseUrl(config_.base_url + kExportJobsPath);
    auto client = utils::MakeHttpClient(url, config_.timeout_s);
    httplib::Headers headers{{"Authorization", "Bearer " + BearerToken()}};

    utils::LogInfo(kTag, "creating export job", {
        {"report", request.report_name},
        {"format", request.format},
        {"filter", request.filter.value_or("")}});
    auto response = client->Post(url.path, headers, payload.dump(), "application/json");
    if (!response) {
        throw utils::RemoteJobError("export job request failed: " + utils::HttpErrorToString(response));
    }
    if (response->status != 200 && response->status != 201) {
        throw utils::RemoteJobError("failed to create export job for " + request.report_name + ": HTTP " +
                                    std::to_string(response->status) + " " + Truncate(response->body));
    }
    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.contains("id") || !json["id"].is_string()) {
        throw utils::RemoteJobError("export job response has no id");
    }
    return json["id"].get<std::string>();
}

ExportJob GraphExportClient::GetStatus(const std::string& job_id) {
    const auto url = utils::ParseUrl(config_.base_url + kExportJobsPath + "('" + job_id + "')");
    auto client = utils::MakeHttpClient(url, config_.timeout_s);
    httplib::Headers headers{{"Authorization", "Bearer " + BearerToken()}};

    auto response = client->Get(url.path, headers);
    if (!response) {
        throw utils::RemoteJobError("status request failed: " + utils::HttpErrorToString(response));
    }
    if (response->status != 200) {
        throw utils::RemoteJobError("failed to get export job status: HTTP " +
                                    std::to_string(response->status) + " " + Truncate(response->body));
    }
    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw utils::RemoteJobError("export job status is not a JSON object");
    }

    ExportJob job;
    job.id = json.value("id", job_id);
    job.status = ExportStatusFromString(json.value("status", ""));
    if (json.contains("url") && json["url"].is_string()) {
        job.download_handle = json["url"].get<std::string>();
    }
    if (json.contains("error") && json["error"].is_string()) {
        job.error = json["error"].get<std::string>();
    }
    utils::LogDebug(kTag, "export job status", {{"job", job_id}, {"status", ToString(job.status)}});
    return job;
}

std::string GraphExportClient::Download(const std::string& download_handle) {
    utils::ParsedUrl url;
    try {
        url = utils::ParseUrl(download_handle);
    } catch (const std::exception& ex) {
        throw utils::RemoteJobError(std::string("invalid download url: ") + ex.what());
    }
    auto client = utils::MakeHttpClient(url, config_.timeout_s);
    client->set_follow_location(true);
    auto response = client->Get(url.PathWithQuery());
    if (!response) {
        throw utils::RemoteJobError("download failed: " + utils::HttpErrorToString(response));
    }
    if (response->status != 200) {
        throw utils::RemoteJobError("failed to download export data: HTTP " + std::to_string(response->status));
    }
    utils::LogInfo(kTag, "downloaded export data", {{"bytes", std::to_string(response->body.size())}});
    return std::move(response->body);
}

}  // namespace reportd::exporting
