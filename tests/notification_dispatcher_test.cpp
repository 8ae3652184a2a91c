#include <gtest/gtest.h>

#include "nlohmann/json.hpp"
#include "notify/notification_dispatcher.hpp"
#include "test_support.hpp"

namespace reportd::notify {
namespace {

using reportd::testing::FakeWebhookSender;
using reportd::testing::Utc;

RunOutcome SuccessOutcome() {
    RunOutcome outcome;
    outcome.report_name = "Weekly Compliance";
    outcome.report_type = "DeviceCompliance";
    outcome.format = "csv";
    outcome.success = true;
    outcome.job_id = "job-9";
    outcome.record_count = 1250;
    outcome.file_size = 2500000;
    outcome.storage_link = "https://acct.blob.example/exports/a.csv?sig=x";
    outcome.link_expiration_days = 7;
    outcome.timestamp = Utc(2024, 1, 1, 9, 5);
    return outcome;
}

RunOutcome FailureOutcome() {
    RunOutcome outcome;
    outcome.report_name = "Weekly Compliance";
    outcome.report_type = "DeviceCompliance";
    outcome.format = "csv";
    outcome.success = false;
    outcome.error = "export job job-9 failed: quota exceeded";
    outcome.timestamp = Utc(2024, 1, 1, 9, 5);
    return outcome;
}

reports::NotificationConfig Enabled() {
    reports::NotificationConfig config;
    config.enabled = true;
    return config;
}

TEST(NotificationDispatcherTest, RendersAllPlaceholders) {
    FakeWebhookSender sender;
    NotificationDispatcher dispatcher(sender, "https://hooks.example/global");
    const auto message = dispatcher.RenderMessage(
        "{reportName}|{reportType}|{status}|{timestamp}|{error}|{jobId}|{recordCount}|{fileSize}|{format}|"
        "{storageLink}|{expirationDate}",
        SuccessOutcome());
    EXPECT_EQ(message,
              "Weekly Compliance|DeviceCompliance|SUCCESS|2024-01-01 09:05:00||job-9|1250|2.5 MB|CSV|"
              "https://acct.blob.example/exports/a.csv?sig=x|2024-01-08");
}

TEST(NotificationDispatcherTest, RendersFallbacksForFailedRun) {
    FakeWebhookSender sender;
    NotificationDispatcher dispatcher(sender, "https://hooks.example/global");
    const auto message = dispatcher.RenderMessage(
        "{status} {jobId} {recordCount} {fileSize} {storageLink} {expirationDate} {error}", FailureOutcome());
    EXPECT_EQ(message, "FAILED N/A Unknown Unknown Not available N/A export job job-9 failed: quota exceeded");
}

TEST(NotificationDispatcherTest, LinkWithoutExpiryNeverExpires) {
    FakeWebhookSender sender;
    NotificationDispatcher dispatcher(sender, "");
    auto outcome = SuccessOutcome();
    outcome.link_expiration_days.reset();
    EXPECT_EQ(dispatcher.RenderMessage("{expirationDate}", outcome), "Never");
}

TEST(NotificationDispatcherTest, DefaultTemplateUsedWhenNoneConfigured) {
    FakeWebhookSender sender;
    NotificationDispatcher dispatcher(sender, "https://hooks.example/global");
    ASSERT_TRUE(dispatcher.Dispatch(Enabled(), FailureOutcome()));
    ASSERT_EQ(sender.posts.size(), 1u);
    EXPECT_EQ(sender.posts[0].first, "https://hooks.example/global");

    const auto body = nlohmann::json::parse(sender.posts[0].second);
    ASSERT_TRUE(body.contains("text"));
    const auto text = body["text"].get<std::string>();
    EXPECT_NE(text.find("Scheduled Report Complete: FAILED"), std::string::npos);
    EXPECT_NE(text.find("**Weekly Compliance** generated"), std::string::npos);
    EXPECT_NE(text.find("Not available"), std::string::npos);
}

TEST(NotificationDispatcherTest, LinkProducesAdaptiveCard) {
    FakeWebhookSender sender;
    NotificationDispatcher dispatcher(sender, "https://hooks.example/global");
    auto config = Enabled();
    config.message_template = "{reportName} done";
    ASSERT_TRUE(dispatcher.Dispatch(config, SuccessOutcome()));

    const auto body = nlohmann::json::parse(sender.posts.at(0).second);
    EXPECT_EQ(body["type"], "message");
    const auto& attachment = body["attachments"].at(0);
    EXPECT_EQ(attachment["contentType"], "application/vnd.microsoft.card.adaptive");
    const auto& card = attachment["content"];
    EXPECT_EQ(card["type"], "AdaptiveCard");
    EXPECT_EQ(card["version"], "1.4");
    EXPECT_EQ(card["actions"].at(0)["type"], "Action.OpenUrl");
    EXPECT_EQ(card["actions"].at(0)["url"], "https://acct.blob.example/exports/a.csv?sig=x");
    const auto& facts = card["body"].at(2)["facts"];
    ASSERT_EQ(facts.size(), 4u);
    EXPECT_EQ(facts.at(0)["value"], "1250");
    EXPECT_EQ(facts.at(3)["value"], "2024-01-08");
}

TEST(NotificationDispatcherTest, CustomWebhookOverridesGlobal) {
    FakeWebhookSender sender;
    NotificationDispatcher dispatcher(sender, "https://hooks.example/global");
    auto config = Enabled();
    config.use_global_webhook = false;
    config.custom_webhook_url = "https://hooks.example/team";
    dispatcher.Dispatch(config, SuccessOutcome());
    ASSERT_EQ(sender.posts.size(), 1u);
    EXPECT_EQ(sender.posts[0].first, "https://hooks.example/team");
}

TEST(NotificationDispatcherTest, SkippedWhenDisabledOrUnaddressed) {
    FakeWebhookSender sender;
    NotificationDispatcher no_global(sender, "");

    reports::NotificationConfig disabled;
    EXPECT_FALSE(no_global.Dispatch(disabled, SuccessOutcome()));
    EXPECT_FALSE(no_global.Dispatch(Enabled(), SuccessOutcome()));

    auto custom_missing = Enabled();
    custom_missing.use_global_webhook = false;
    EXPECT_FALSE(no_global.Dispatch(custom_missing, SuccessOutcome()));
    EXPECT_TRUE(sender.posts.empty());
}

TEST(NotificationDispatcherTest, DeliveryFailureIsReportedNotThrown) {
    FakeWebhookSender sender;
    sender.succeed = false;
    NotificationDispatcher dispatcher(sender, "https://hooks.example/global");
    bool delivered = true;
    EXPECT_NO_THROW(delivered = dispatcher.Dispatch(Enabled(), SuccessOutcome()));
    EXPECT_FALSE(delivered);
    EXPECT_EQ(sender.posts.size(), 1u);
}

}  // namespace
}  // namespace reportd::notify
