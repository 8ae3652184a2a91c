#include "storage/storage_config.hpp"

#include "utils/common.hpp"
#include "utils/errors.hpp"

namespace reportd::storage {
namespace {

std::string NormalizeName(const std::string& name) {
    return reportd::utils::ToLower(name);
}

}  // namespace

const char* ToString(StorageAuthKind kind) {
    switch (kind) {
        case StorageAuthKind::kSharedKey: return "sharedKey";
        case StorageAuthKind::kSasToken: return "sasToken";
        case StorageAuthKind::kClientCredential: return "clientCredential";
    }
    return "sharedKey";
}

bool StorageAuthKindFromString(const std::string& value, StorageAuthKind& kind) {
    const auto lowered = reportd::utils::ToLower(value);
    if (lowered == "sharedkey" || lowered == "storagekey") {
        kind = StorageAuthKind::kSharedKey;
        return true;
    }
    if (lowered == "sastoken" || lowered == "sas") {
        kind = StorageAuthKind::kSasToken;
        return true;
    }
    if (lowered == "clientcredential" || lowered == "oauth") {
        kind = StorageAuthKind::kClientCredential;
        return true;
    }
    return false;
}

std::string NamedStorageConfig::Validate() const {
    if (account_name.empty()) {
        return "missing account name";
    }
    if (container_name.empty()) {
        return "missing container name";
    }
    switch (auth.kind) {
        case StorageAuthKind::kSharedKey:
            if (auth.account_key.empty()) {
                return "shared key authentication without an account key";
            }
            break;
        case StorageAuthKind::kSasToken:
            if (auth.sas_token.empty()) {
                return "SAS authentication without a token";
            }
            break;
        case StorageAuthKind::kClientCredential:
            if (auth.tenant_id.empty() || auth.client_id.empty() || auth.client_secret.empty()) {
                return "client credential authentication requires tenant, client id and secret";
            }
            break;
    }
    return {};
}

std::string NamedStorageConfig::BaseUrl() const {
    if (!endpoint_url.empty()) {
        auto url = endpoint_url;
        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        return url;
    }
    return "https://" + account_name + "." + endpoint_suffix;
}

StorageConfigRegistry::StorageConfigRegistry(std::map<std::string, NamedStorageConfig> configurations) {
    for (auto& [name, config] : configurations) {
        if (config.name.empty()) {
            config.name = name;
        }
        configurations_[NormalizeName(name)] = std::move(config);
    }
}

const NamedStorageConfig& StorageConfigRegistry::Resolve(const std::string& name) const {
    if (name.empty()) {
        throw reportd::utils::StorageConfigError("no storage configuration named in delivery settings");
    }
    const auto it = configurations_.find(NormalizeName(name));
    if (it == configurations_.end()) {
        throw reportd::utils::StorageConfigError("unknown storage configuration '" + name + "'");
    }
    const auto problem = it->second.Validate();
    if (!problem.empty()) {
        throw reportd::utils::StorageConfigError(
            "storage configuration '" + name + "' is invalid: " + problem);
    }
    return it->second;
}

bool StorageConfigRegistry::Contains(const std::string& name) const {
    return configurations_.count(NormalizeName(name)) > 0;
}

std::vector<std::string> StorageConfigRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(configurations_.size());
    for (const auto& entry : configurations_) {
        names.push_back(entry.second.name);
    }
    return names;
}

}  // namespace reportd::storage
