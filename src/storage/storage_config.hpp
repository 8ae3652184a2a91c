#pragma once

#include <map>
#include <string>
#include <vector>

namespace reportd::storage {

enum class StorageAuthKind {
    kSharedKey,
    kSasToken,
    kClientCredential
};

const char* ToString(StorageAuthKind kind);
bool StorageAuthKindFromString(const std::string& value, StorageAuthKind& kind);

struct StorageAuth {
    StorageAuthKind kind = StorageAuthKind::kSharedKey;
    std::string account_key;
    std::string sas_token;
    std::string tenant_id;
    std::string client_id;
    std::string client_secret;
};

struct NamedStorageConfig {
    std::string name;
    std::string account_name;
    std::string container_name;
    std::string endpoint_suffix = "blob.core.windows.net";
    // Overrides https://<account>.<suffix>; used for emulators and tests.
    std::string endpoint_url;
    StorageAuth auth;

    // Empty when usable, otherwise the first problem found.
    std::string Validate() const;
    std::string BaseUrl() const;
};

class StorageConfigRegistry {
public:
    StorageConfigRegistry() = default;
    explicit StorageConfigRegistry(std::map<std::string, NamedStorageConfig> configurations);

    // Throws StorageConfigError when the name is unknown or the entry is incomplete.
    const NamedStorageConfig& Resolve(const std::string& name) const;
    bool Contains(const std::string& name) const;
    std::vector<std::string> Names() const;

private:
    std::map<std::string, NamedStorageConfig> configurations_;
};

}  // namespace reportd::storage
