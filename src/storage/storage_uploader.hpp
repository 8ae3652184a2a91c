#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "reports/report_types.hpp"
#include "storage/blob_client.hpp"
#include "storage/storage_config.hpp"
#include "utils/common.hpp"

namespace reportd::storage {

// Values substituted into delivery templates.
struct UploadContext {
    std::string report_name;
    std::string report_type;
    std::string job_id;
    std::string extension;
    utils::TimePoint now;
    std::chrono::minutes utc_offset{0};
};

struct UploadResult {
    std::string config_name;
    std::string blob_name;
    std::optional<std::string> link;
    std::optional<int> link_expiration_days;
};

class StorageUploader {
public:
    StorageUploader(const StorageConfigRegistry& registry, BlobClient& client);

    // Throws StorageConfigError before any transfer when the named
    // configuration cannot be resolved, StorageTransportError afterwards.
    UploadResult Upload(const reports::DeliveryConfig& delivery,
                        const std::string& bytes,
                        const UploadContext& context) const;

    // {reportName} {reportType} {date} {time} {jobId} {extension}
    static std::string RenderFileName(const std::string& file_template, const UploadContext& context);
    // {reportType}, lower-cased
    static std::string RenderFolder(const std::string& folder_template, const UploadContext& context);
    static std::string BlobName(const reports::DeliveryConfig& delivery, const UploadContext& context);

private:
    const StorageConfigRegistry& registry_;
    BlobClient& client_;
};

}  // namespace reportd::storage
