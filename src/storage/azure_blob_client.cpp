#include "storage/azure_blob_client.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "utils/crypto.hpp"
#include "utils/errors.hpp"
#include "utils/http.hpp"
#include "utils/logging.hpp"

namespace reportd::storage {
namespace {

constexpr const char* kTag = "storage";
constexpr const char* kApiVersion = "2021-08-06";
constexpr const char* kSasVersion = "2020-12-06";

std::string Rfc1123(utils::TimePoint tp) {
    return utils::FormatTime(tp, "%a, %d %b %Y %H:%M:%S GMT");
}

std::string StripQuestionMark(std::string token) {
    if (!token.empty() && token.front() == '?') {
        token.erase(0, 1);
    }
    return token;
}

std::string DecodeAccountKey(const NamedStorageConfig& config) {
    try {
        return utils::Base64Decode(config.auth.account_key);
    } catch (const std::exception& ex) {
        throw utils::StorageTransportError("account key for '" + config.name + "' is not valid base64: " + ex.what());
    }
}

// Authorization header value for the Put Blob request.
std::string SharedKeyAuthorization(const NamedStorageConfig& config,
                                   const std::string& canonical_path,
                                   const httplib::Headers& ms_headers,
                                   std::size_t content_length,
                                   const std::string& content_type) {
    std::vector<std::pair<std::string, std::string>> canonical_headers;
    for (const auto& [name, value] : ms_headers) {
        const auto lowered = utils::ToLower(name);
        if (lowered.rfind("x-ms-", 0) == 0) {
            canonical_headers.emplace_back(lowered, value);
        }
    }
    std::sort(canonical_headers.begin(), canonical_headers.end());

    std::string string_to_sign = "PUT\n";
    string_to_sign += "\n";  // Content-Encoding
    string_to_sign += "\n";  // Content-Language
    string_to_sign += (content_length == 0 ? std::string() : std::to_string(content_length)) + "\n";
    string_to_sign += "\n";  // Content-MD5
    string_to_sign += content_type + "\n";
    string_to_sign += "\n\n\n\n\n\n";  // Date, If-*, Range
    for (const auto& [name, value] : canonical_headers) {
        string_to_sign += name + ":" + value + "\n";
    }
    string_to_sign += "/" + config.account_name + canonical_path;

    const auto signature = utils::Base64Encode(utils::HmacSha256(DecodeAccountKey(config), string_to_sign));
    return "SharedKey " + config.account_name + ":" + signature;
}

}  // namespace

std::string EncodeBlobPath(const std::string& blob_name) {
    std::string encoded;
    std::size_t start = 0;
    while (start <= blob_name.size()) {
        const auto slash = blob_name.find('/', start);
        const auto segment = blob_name.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        encoded += utils::UrlEncode(segment);
        if (slash == std::string::npos) {
            break;
        }
        encoded += "/";
        start = slash + 1;
    }
    return encoded;
}

AzureBlobClient::AzureBlobClient(int timeout_s, NowFn now)
    : timeout_s_(timeout_s), now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return utils::Now(); };
    }
}

std::string AzureBlobClient::BlobUrl(const NamedStorageConfig& config, const std::string& blob_name) const {
    return config.BaseUrl() + "/" + config.container_name + "/" + EncodeBlobPath(blob_name);
}

std::shared_ptr<auth::TokenSource> AzureBlobClient::TokenFor(const NamedStorageConfig& config) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    auto& source = tokens_[config.name];
    if (!source) {
        auth::ClientCredential credential;
        credential.tenant_id = config.auth.tenant_id;
        credential.client_id = config.auth.client_id;
        credential.client_secret = config.auth.client_secret;
        credential.scope = "https://storage.azure.com/.default";
        source = std::make_shared<auth::ClientCredentialTokenSource>(credential, timeout_s_);
    }
    return source;
}

void AzureBlobClient::Upload(const NamedStorageConfig& config,
                             const std::string& blob_name,
                             const std::string& bytes,
                             const std::string& content_type) {
    utils::ParsedUrl url;
    try {
        url = utils::ParseUrl(BlobUrl(config, blob_name));
    } catch (const std::exception& ex) {
        throw utils::StorageTransportError(std::string("invalid storage endpoint: ") + ex.what());
    }

    httplib::Headers headers{
        {"x-ms-blob-type", "BlockBlob"},
        {"x-ms-date", Rfc1123(now_())},
        {"x-ms-version", kApiVersion}};

    switch (config.auth.kind) {
        case StorageAuthKind::kSharedKey:
            headers.emplace("Authorization",
                            SharedKeyAuthorization(config, url.path, headers, bytes.size(), content_type));
            break;
        case StorageAuthKind::kSasToken:
            url.query = StripQuestionMark(config.auth.sas_token);
            break;
        case StorageAuthKind::kClientCredential:
            try {
                headers.emplace("Authorization", "Bearer " + TokenFor(config)->GetToken());
            } catch (const std::exception& ex) {
                throw utils::StorageTransportError("storage authentication failed for '" + config.name + "': " + ex.what());
            }
            break;
    }

    auto client = utils::MakeHttpClient(url, timeout_s_);
    utils::LogInfo(kTag, "uploading blob", {
        {"config", config.name},
        {"container", config.container_name},
        {"blob", blob_name},
        {"bytes", std::to_string(bytes.size())},
        {"auth", ToString(config.auth.kind)}});
    auto response = client->Put(url.PathWithQuery(), headers, bytes, content_type);
    if (!response) {
        throw utils::StorageTransportError("upload of " + blob_name + " failed: " + utils::HttpErrorToString(response));
    }
    if (response->status != 201 && response->status != 200) {
        const auto body = response->body.size() > 512 ? response->body.substr(0, 512) + "..." : response->body;
        throw utils::StorageTransportError("upload of " + blob_name + " rejected: HTTP " +
                                           std::to_string(response->status) + " " + body);
    }
}

std::string AzureBlobClient::GenerateReadLink(const NamedStorageConfig& config,
                                              const std::string& blob_name,
                                              int expiration_days) {
    const auto url = BlobUrl(config, blob_name);
    switch (config.auth.kind) {
        case StorageAuthKind::kSasToken:
            return url + "?" + StripQuestionMark(config.auth.sas_token);
        case StorageAuthKind::kClientCredential:
            throw utils::StorageTransportError("storage configuration '" + config.name +
                                               "' uses client credentials and cannot create shareable links");
        case StorageAuthKind::kSharedKey:
            break;
    }

    const auto expiry = utils::FormatIso8601(now_() + std::chrono::hours(24 * std::max(1, expiration_days)));
    const std::string permissions = "r";
    const std::string protocol = "https";
    const std::string resource = "b";
    const std::string canonical = "/blob/" + config.account_name + "/" + config.container_name + "/" + blob_name;

    std::string string_to_sign;
    string_to_sign += permissions + "\n";
    string_to_sign += "\n";  // start
    string_to_sign += expiry + "\n";
    string_to_sign += canonical + "\n";
    string_to_sign += "\n";  // identifier
    string_to_sign += "\n";  // ip
    string_to_sign += protocol + "\n";
    string_to_sign += std::string(kSasVersion) + "\n";
    string_to_sign += resource + "\n";
    string_to_sign += "\n";  // snapshot time
    string_to_sign += "\n";  // encryption scope
    string_to_sign += "\n\n\n\n";  // rscc, rscd, rsce, rscl
    // rsct is last and carries no trailing newline.

    const auto signature = utils::Base64Encode(utils::HmacSha256(DecodeAccountKey(config), string_to_sign));
    return url + "?sv=" + kSasVersion +
           "&sr=" + resource +
           "&sp=" + permissions +
           "&se=" + utils::UrlEncode(expiry) +
           "&spr=" + protocol +
           "&sig=" + utils::UrlEncode(signature);
}

}  // namespace reportd::storage
