#pragma once

#include <string>

#include "storage/storage_config.hpp"

namespace reportd::storage {

// Object storage transport. Both calls throw StorageTransportError.
class BlobClient {
public:
    virtual ~BlobClient() = default;

    virtual void Upload(const NamedStorageConfig& config,
                        const std::string& blob_name,
                        const std::string& bytes,
                        const std::string& content_type) = 0;

    // Read-only URL valid for expiration_days.
    virtual std::string GenerateReadLink(const NamedStorageConfig& config,
                                         const std::string& blob_name,
                                         int expiration_days) = 0;
};

}  // namespace reportd::storage
