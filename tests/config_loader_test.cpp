#include <cstdlib>
#include <fstream>

#include <gtest/gtest.h>

#include "config/config_loader.hpp"
#include "test_support.hpp"

namespace reportd::config {
namespace {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const auto* name : kVariables) {
            ::unsetenv(name);
        }
    }
    void TearDown() override {
        for (const auto* name : kVariables) {
            ::unsetenv(name);
        }
    }

    std::filesystem::path Write(const std::string& text) {
        const auto path = dir_.path() / "config.json";
        std::ofstream output(path, std::ios::trunc);
        output << text;
        return path;
    }

    static constexpr const char* kVariables[] = {
        "REPORTD_SCHEDULER__INTERVAL_S",
        "REPORTD_SCHEDULER_ENABLED",
        "REPORTD_REPORTS_DIR",
        "REPORTD_GLOBAL_WEBHOOK_URL",
    };

    reportd::testing::TempDir dir_;
};

TEST_F(ConfigLoaderTest, MissingFileYieldsDefaults) {
    const auto config = LoadConfigFromFile(dir_.path() / "absent.json");
    EXPECT_TRUE(config.scheduler.enabled);
    EXPECT_EQ(config.scheduler.interval_s, 300);
    EXPECT_EQ(config.scheduler.poll_interval_s, 10);
    EXPECT_EQ(config.scheduler.job_timeout_s, 300);
    EXPECT_EQ(config.rpc.host, "127.0.0.1");
    EXPECT_EQ(config.rpc.port, 18790);
    EXPECT_FALSE(config.service.reports_dir.empty());
    EXPECT_FALSE(config.service.temp_dir.empty());
    EXPECT_EQ(config.graph.base_url, "https://graph.microsoft.com/beta");
}

TEST_F(ConfigLoaderTest, ReadsSectionsAndStorageConfigurations) {
    const auto path = Write(R"({
        "service": {"reportsDir": "/srv/reports"},
        "scheduler": {"enabled": false, "intervalS": 60, "pollIntervalS": 5, "utcOffsetMinutes": -300},
        "graph": {"tenantId": "tenant", "clientId": "client", "clientSecret": "secret"},
        "notifications": {"globalWebhookUrl": "https://hooks.example/global"},
        "storage": {"configurations": {
            "primary": {"accountName": "acct", "containerName": "exports",
                        "auth": {"kind": "sasToken", "sasToken": "sv=1&sig=2"}},
            "ignored": 5
        }},
        "rpc": {"port": 19000},
        "logging": {"level": "debug"},
        "catalogPath": "/etc/reportd/catalog.json"
    })");
    const auto config = LoadConfigFromFile(path);
    EXPECT_EQ(config.service.reports_dir, "/srv/reports");
    EXPECT_FALSE(config.scheduler.enabled);
    EXPECT_EQ(config.scheduler.interval_s, 60);
    EXPECT_EQ(config.scheduler.poll_interval_s, 5);
    EXPECT_EQ(config.scheduler.utc_offset_minutes, -300);
    EXPECT_EQ(config.graph.tenant_id, "tenant");
    EXPECT_EQ(config.notifications.global_webhook_url, "https://hooks.example/global");
    ASSERT_EQ(config.storage.configurations.size(), 1u);
    const auto& primary = config.storage.configurations.at("primary");
    EXPECT_EQ(primary.name, "primary");
    EXPECT_EQ(primary.auth.kind, storage::StorageAuthKind::kSasToken);
    EXPECT_EQ(primary.auth.sas_token, "sv=1&sig=2");
    EXPECT_EQ(config.rpc.port, 19000);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.catalog_path, "/etc/reportd/catalog.json");
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const auto path = Write(R"({"scheduler": {"intervalS": 60}, "service": {"reportsDir": "/srv/reports"}})");
    ::setenv("REPORTD_SCHEDULER__INTERVAL_S", "120", 1);
    ::setenv("REPORTD_SCHEDULER_ENABLED", "false", 1);
    ::setenv("REPORTD_REPORTS_DIR", "/var/lib/reportd", 1);
    ::setenv("REPORTD_GLOBAL_WEBHOOK_URL", "https://hooks.example/env", 1);

    const auto config = LoadConfigFromFile(path);
    EXPECT_EQ(config.scheduler.interval_s, 120);
    EXPECT_FALSE(config.scheduler.enabled);
    EXPECT_EQ(config.service.reports_dir, "/var/lib/reportd");
    EXPECT_EQ(config.notifications.global_webhook_url, "https://hooks.example/env");
}

TEST_F(ConfigLoaderTest, MalformedFileKeepsDefaults) {
    const auto config = LoadConfigFromFile(Write("{ this is not json"));
    EXPECT_EQ(config.scheduler.interval_s, 300);
    EXPECT_TRUE(config.storage.configurations.empty());
}

TEST_F(ConfigLoaderTest, NonPositiveIntervalsFallBackToDefaults) {
    const auto config = LoadConfigFromFile(Write(R"({"scheduler": {"intervalS": 0, "jobTimeoutS": -1}})"));
    EXPECT_EQ(config.scheduler.interval_s, 300);
    EXPECT_EQ(config.scheduler.job_timeout_s, 300);
}

TEST_F(ConfigLoaderTest, ShutdownGraceCoversTheLongestScheduledJob) {
    auto config = LoadConfigFromFile(dir_.path() / "absent.json");
    EXPECT_GE(ShutdownGracePeriod(config.scheduler), std::chrono::seconds(300 + 10));

    config.scheduler.job_timeout_s = 1800;
    config.scheduler.poll_interval_s = 30;
    EXPECT_GE(ShutdownGracePeriod(config.scheduler), std::chrono::seconds(1800 + 30));
    EXPECT_GT(ShutdownGracePeriod(config.scheduler), std::chrono::seconds(35));
}

}  // namespace
}  // namespace reportd::config
