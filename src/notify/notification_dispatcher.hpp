#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "notify/webhook_sender.hpp"
#include "reports/report_types.hpp"
#include "utils/common.hpp"

namespace reportd::notify {

struct RunOutcome {
    std::string report_name;
    std::string report_type;
    std::string format;
    bool success = false;
    std::string error;
    std::optional<std::string> job_id;
    std::optional<long long> record_count;
    std::optional<std::int64_t> file_size;
    std::optional<std::string> storage_link;
    std::optional<int> link_expiration_days;
    utils::TimePoint timestamp;
};

// Best effort: Dispatch reports delivery with its return value and never throws.
class NotificationDispatcher {
public:
    NotificationDispatcher(WebhookSender& sender,
                           std::string global_webhook_url,
                           std::chrono::minutes utc_offset = std::chrono::minutes(0));

    bool Dispatch(const reports::NotificationConfig& config, const RunOutcome& outcome) const;

    std::string RenderMessage(const std::string& message_template, const RunOutcome& outcome) const;
    // Adaptive card when a link exists, otherwise {"text": message}.
    nlohmann::json BuildPayload(const std::string& message, const RunOutcome& outcome) const;
    std::optional<std::string> ResolveWebhook(const reports::NotificationConfig& config) const;

    static const std::string& DefaultTemplate();

private:
    std::string FormatTimestamp(utils::TimePoint tp, const char* format) const;
    std::string ExpirationText(const RunOutcome& outcome) const;

    WebhookSender& sender_;
    std::string global_webhook_url_;
    std::chrono::minutes utc_offset_;
};

}  // namespace reportd::notify
