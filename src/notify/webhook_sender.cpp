#include "notify/webhook_sender.hpp"

#include "utils/http.hpp"
#include "utils/logging.hpp"

namespace reportd::notify {
namespace {

constexpr const char* kTag = "notify";

}  // namespace

HttpWebhookSender::HttpWebhookSender(int timeout_s) : timeout_s_(timeout_s) {}

bool HttpWebhookSender::Post(const std::string& url, const std::string& json_body) {
    utils::ParsedUrl parsed;
    try {
        parsed = utils::ParseUrl(url);
    } catch (const std::exception& ex) {
        utils::LogError(kTag, "invalid webhook url", {{"error", ex.what()}});
        return false;
    }
    auto client = utils::MakeHttpClient(parsed, timeout_s_);
    auto response = client->Post(parsed.PathWithQuery(), json_body, "application/json");
    if (!response) {
        utils::LogError(kTag, "webhook request failed", {
            {"host", parsed.host}, {"error", utils::HttpErrorToString(response)}});
        return false;
    }
    if (response->status < 200 || response->status >= 300) {
        utils::LogError(kTag, "webhook rejected message", {
            {"host", parsed.host}, {"status", std::to_string(response->status)}});
        return false;
    }
    return true;
}

}  // namespace reportd::notify
