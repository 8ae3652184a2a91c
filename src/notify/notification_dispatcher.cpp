#include "notify/notification_dispatcher.hpp"

#include <utility>

#include "utils/logging.hpp"

namespace reportd::notify {
namespace {

constexpr const char* kTag = "notify";
constexpr const char* kNotAvailable = "Not available";

std::string RecordCountText(const RunOutcome& outcome) {
    return outcome.record_count.has_value() ? std::to_string(outcome.record_count.value()) : "Unknown";
}

std::string FileSizeText(const RunOutcome& outcome) {
    if (!outcome.file_size.has_value() || outcome.file_size.value() < 0) {
        return "Unknown";
    }
    return utils::HumanBytes(static_cast<std::uint64_t>(outcome.file_size.value()));
}

}  // namespace

NotificationDispatcher::NotificationDispatcher(WebhookSender& sender,
                                               std::string global_webhook_url,
                                               std::chrono::minutes utc_offset)
    : sender_(sender), global_webhook_url_(std::move(global_webhook_url)), utc_offset_(utc_offset) {}

const std::string& NotificationDispatcher::DefaultTemplate() {
    static const std::string kTemplate =
        "\xF0\x9F\x93\x8A **Scheduled Report Complete: {status}**\n"
        "\n"
        "**{reportName}** generated\n"
        "- **Records:** {recordCount}\n"
        "- **File Size:** {fileSize}\n"
        "- **Format:** {format}\n"
        "\n"
        "\xF0\x9F\x94\x97 **Download:** [{reportName} Report]({storageLink})\n"
        "\n"
        "\xE2\x8F\xB0 **Link expires:** {expirationDate}\n";
    return kTemplate;
}

std::string NotificationDispatcher::FormatTimestamp(utils::TimePoint tp, const char* format) const {
    return utils::FormatTime(tp, format, utc_offset_);
}

std::string NotificationDispatcher::ExpirationText(const RunOutcome& outcome) const {
    if (!outcome.storage_link.has_value()) {
        return "N/A";
    }
    if (!outcome.link_expiration_days.has_value()) {
        return "Never";
    }
    const auto expires = outcome.timestamp + std::chrono::hours(24 * outcome.link_expiration_days.value());
    return FormatTimestamp(expires, "%Y-%m-%d");
}

std::string NotificationDispatcher::RenderMessage(const std::string& message_template,
                                                  const RunOutcome& outcome) const {
    auto message = message_template;
    message = utils::ReplaceAll(message, "{reportName}", outcome.report_name);
    message = utils::ReplaceAll(message, "{reportType}", outcome.report_type);
    message = utils::ReplaceAll(message, "{status}", outcome.success ? "SUCCESS" : "FAILED");
    message = utils::ReplaceAll(message, "{timestamp}", FormatTimestamp(outcome.timestamp, "%Y-%m-%d %H:%M:%S"));
    message = utils::ReplaceAll(message, "{error}", outcome.error);
    message = utils::ReplaceAll(message, "{jobId}", outcome.job_id.value_or("N/A"));
    message = utils::ReplaceAll(message, "{recordCount}", RecordCountText(outcome));
    message = utils::ReplaceAll(message, "{fileSize}", FileSizeText(outcome));
    message = utils::ReplaceAll(message, "{format}", utils::ToUpper(outcome.format));
    message = utils::ReplaceAll(message, "{storageLink}", outcome.storage_link.value_or(kNotAvailable));
    message = utils::ReplaceAll(message, "{expirationDate}", ExpirationText(outcome));
    return message;
}

nlohmann::json NotificationDispatcher::BuildPayload(const std::string& message, const RunOutcome& outcome) const {
    if (!outcome.storage_link.has_value()) {
        return nlohmann::json{{"text", message}};
    }

    const auto expires = outcome.link_expiration_days.has_value() ? ExpirationText(outcome) : std::string("Never");
    nlohmann::json body = nlohmann::json::array();
    body.push_back({
        {"type", "TextBlock"},
        {"text", outcome.success ? "**Scheduled Report Complete**" : "**Scheduled Report Failed**"},
        {"weight", "Bolder"},
        {"size", "Large"},
        {"format", "markdown"}});
    body.push_back({
        {"type", "TextBlock"},
        {"text", "**" + outcome.report_name + "** " +
                     (outcome.success ? "generated successfully" : "failed: " + outcome.error)},
        {"spacing", "Medium"},
        {"wrap", true},
        {"format", "markdown"}});
    body.push_back({
        {"type", "FactSet"},
        {"facts", nlohmann::json::array({
            {{"title", "Records"}, {"value", RecordCountText(outcome)}},
            {{"title", "File Size"}, {"value", FileSizeText(outcome)}},
            {{"title", "Format"}, {"value", utils::ToUpper(outcome.format)}},
            {{"title", "Link Expires"}, {"value", expires}}})},
        {"spacing", "Medium"}});

    nlohmann::json actions = nlohmann::json::array();
    actions.push_back({
        {"type", "Action.OpenUrl"},
        {"title", "Download Report"},
        {"url", outcome.storage_link.value()}});

    nlohmann::json card{
        {"type", "AdaptiveCard"},
        {"version", "1.4"},
        {"msteams", {{"width", "full"}}},
        {"body", body},
        {"actions", actions}};

    nlohmann::json attachment{
        {"contentType", "application/vnd.microsoft.card.adaptive"},
        {"content", card}};

    return nlohmann::json{
        {"type", "message"},
        {"attachments", nlohmann::json::array({attachment})}};
}

std::optional<std::string> NotificationDispatcher::ResolveWebhook(const reports::NotificationConfig& config) const {
    const auto& url = config.use_global_webhook ? global_webhook_url_ : config.custom_webhook_url;
    if (url.empty()) {
        return std::nullopt;
    }
    return url;
}

bool NotificationDispatcher::Dispatch(const reports::NotificationConfig& config, const RunOutcome& outcome) const {
    if (!config.enabled) {
        utils::LogDebug(kTag, "notifications disabled", {{"report", outcome.report_name}});
        return false;
    }
    const auto webhook = ResolveWebhook(config);
    if (!webhook.has_value()) {
        utils::LogError(kTag, "no webhook url configured", {{"report", outcome.report_name}});
        return false;
    }

    bool delivered = false;
    try {
        const auto message = RenderMessage(config.message_template.value_or(DefaultTemplate()), outcome);
        delivered = sender_.Post(webhook.value(), BuildPayload(message, outcome).dump());
    } catch (const std::exception& ex) {
        utils::LogError(kTag, "notification failed", {{"report", outcome.report_name}, {"error", ex.what()}});
        return false;
    }

    if (delivered) {
        utils::LogInfo(kTag, "notification sent", {{"report", outcome.report_name}});
    } else {
        utils::LogError(kTag, "notification not delivered", {{"report", outcome.report_name}});
    }
    return delivered;
}

}  // namespace reportd::notify
