#include "auth/token_source.hpp"

#include <stdexcept>
#include <utility>

#include "nlohmann/json.hpp"
#include "utils/http.hpp"
#include "utils/logging.hpp"

namespace reportd::auth {
namespace {

constexpr const char* kTag = "auth";
constexpr auto kRefreshMargin = std::chrono::seconds(60);

}  // namespace

ClientCredentialTokenSource::ClientCredentialTokenSource(ClientCredential credential, int timeout_s)
    : credential_(std::move(credential)), timeout_s_(timeout_s) {}

std::string ClientCredentialTokenSource::GetToken() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (!token_.empty() && now + kRefreshMargin < expires_at_) {
        return token_;
    }
    if (credential_.tenant_id.empty() || credential_.client_id.empty() || credential_.client_secret.empty()) {
        throw std::runtime_error("client credential is incomplete (tenant, client id and secret are required)");
    }

    auto authority = credential_.authority_url;
    while (!authority.empty() && authority.back() == '/') {
        authority.pop_back();
    }
    const auto url = utils::ParseUrl(authority + "/" + credential_.tenant_id + "/oauth2/v2.0/token");
    auto client = utils::MakeHttpClient(url, timeout_s_);

    const std::string body = "grant_type=client_credentials"
                             "&client_id=" + utils::UrlEncode(credential_.client_id) +
                             "&client_secret=" + utils::UrlEncode(credential_.client_secret) +
                             "&scope=" + utils::UrlEncode(credential_.scope);

    utils::LogDebug(kTag, "requesting token", {
        {"tenant", credential_.tenant_id},
        {"client", credential_.client_id},
        {"secret", utils::MaskSecret(credential_.client_secret)},
        {"scope", credential_.scope}});

    auto response = client->Post(url.path, body, "application/x-www-form-urlencoded");
    if (!response || response->status != 200) {
        const auto detail = response ? response->body : std::string();
        throw std::runtime_error("token request failed: " + utils::HttpErrorToString(response) +
                                 (detail.empty() ? "" : " " + detail));
    }

    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.contains("access_token") || !json["access_token"].is_string()) {
        throw std::runtime_error("token response has no access_token");
    }
    token_ = json["access_token"].get<std::string>();
    long long expires_in = 3600;
    if (json.contains("expires_in")) {
        if (json["expires_in"].is_number_integer()) {
            expires_in = json["expires_in"].get<long long>();
        } else if (json["expires_in"].is_string()) {
            try {
                expires_in = std::stoll(json["expires_in"].get<std::string>());
            } catch (const std::exception&) {
                expires_in = 3600;
            }
        }
    }
    expires_at_ = now + std::chrono::seconds(expires_in);
    return token_;
}

}  // namespace reportd::auth
