#include "storage/storage_uploader.hpp"

#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace reportd::storage {
namespace {

constexpr const char* kTag = "storage";

std::string ContentTypeFor(const std::string& extension) {
    const auto lowered = utils::ToLower(extension);
    if (lowered == "csv") {
        return "text/csv";
    }
    if (lowered == "json") {
        return "application/json";
    }
    return "application/octet-stream";
}

}  // namespace

StorageUploader::StorageUploader(const StorageConfigRegistry& registry, BlobClient& client)
    : registry_(registry), client_(client) {}

std::string StorageUploader::RenderFileName(const std::string& file_template, const UploadContext& context) {
    auto name = file_template.empty() ? std::string(reports::kDefaultFileNameTemplate) : file_template;
    name = utils::ReplaceAll(name, "{reportName}", utils::ReplaceAll(context.report_name, " ", ""));
    name = utils::ReplaceAll(name, "{reportType}", context.report_type);
    name = utils::ReplaceAll(name, "{date}", utils::FormatTime(context.now, "%Y-%m-%d", context.utc_offset));
    name = utils::ReplaceAll(name, "{time}", utils::FormatTime(context.now, "%H-%M-%S", context.utc_offset));
    name = utils::ReplaceAll(name, "{jobId}", context.job_id);
    name = utils::ReplaceAll(name, "{extension}", utils::ToLower(context.extension));
    return name;
}

std::string StorageUploader::RenderFolder(const std::string& folder_template, const UploadContext& context) {
    return utils::ReplaceAll(folder_template, "{reportType}", utils::ToLower(context.report_type));
}

std::string StorageUploader::BlobName(const reports::DeliveryConfig& delivery, const UploadContext& context) {
    auto folder = RenderFolder(delivery.folder_path, context);
    while (!folder.empty() && folder.front() == '/') {
        folder.erase(0, 1);
    }
    if (!folder.empty() && folder.back() != '/') {
        folder.push_back('/');
    }
    return folder + RenderFileName(delivery.file_name_template, context);
}

UploadResult StorageUploader::Upload(const reports::DeliveryConfig& delivery,
                                     const std::string& bytes,
                                     const UploadContext& context) const {
    const auto& config = registry_.Resolve(delivery.storage_config_name);

    UploadResult result;
    result.config_name = config.name;
    result.blob_name = BlobName(delivery, context);
    client_.Upload(config, result.blob_name, bytes, ContentTypeFor(context.extension));
    utils::LogInfo(kTag, "uploaded report", {{"config", config.name}, {"blob", result.blob_name}});

    if (delivery.create_shareable_link) {
        const int days = delivery.link_expiration_days.value_or(reports::kDefaultLinkExpirationDays);
        result.link = client_.GenerateReadLink(config, result.blob_name, days);
        result.link_expiration_days = days;
        utils::LogInfo(kTag, "generated shareable link", {{"blob", result.blob_name}, {"days", std::to_string(days)}});
    }
    return result;
}

}  // namespace reportd::storage
