#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "auth/token_source.hpp"
#include "storage/blob_client.hpp"
#include "utils/common.hpp"

namespace reportd::storage {

// Azure Blob REST (Put Blob) with SharedKey, SAS or bearer-token auth.
class AzureBlobClient : public BlobClient {
public:
    using NowFn = std::function<utils::TimePoint()>;

    explicit AzureBlobClient(int timeout_s = 120, NowFn now = {});

    void Upload(const NamedStorageConfig& config,
                const std::string& blob_name,
                const std::string& bytes,
                const std::string& content_type) override;

    // SharedKey configs sign a service SAS; SAS configs reuse their token.
    // Bearer-token configs cannot mint links.
    std::string GenerateReadLink(const NamedStorageConfig& config,
                                 const std::string& blob_name,
                                 int expiration_days) override;

private:
    std::string BlobUrl(const NamedStorageConfig& config, const std::string& blob_name) const;
    std::shared_ptr<auth::TokenSource> TokenFor(const NamedStorageConfig& config);

    int timeout_s_;
    NowFn now_;
    std::mutex tokens_mutex_;
    std::map<std::string, std::shared_ptr<auth::TokenSource>> tokens_;
};

// Percent-encodes each path segment, keeping '/'.
std::string EncodeBlobPath(const std::string& blob_name);

}  // namespace reportd::storage
