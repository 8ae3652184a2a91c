#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace reportd::config {
namespace {

using reportd::utils::GetEnv;

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path ReportdHome() {
    return reportd::utils::GetHomePath() / ".reportd";
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyInt(int& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyBool(bool& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

reportd::storage::NamedStorageConfig ParseStorageConfig(const std::string& name,
                                                        const nlohmann::json& source) {
    reportd::storage::NamedStorageConfig config{};
    config.name = name;
    ApplyString(config.account_name, source, "accountName");
    ApplyString(config.container_name, source, "containerName");
    ApplyString(config.endpoint_suffix, source, "endpointSuffix");
    ApplyString(config.endpoint_url, source, "endpointUrl");
    if (source.contains("auth") && source["auth"].is_object()) {
        const auto& auth = source["auth"];
        if (auth.contains("kind") && auth["kind"].is_string()) {
            const auto kind = auth["kind"].get<std::string>();
            if (!reportd::storage::StorageAuthKindFromString(kind, config.auth.kind)) {
                std::cerr << "[config] storage configuration " << name
                          << " has unknown auth kind '" << kind << "'" << std::endl;
            }
        }
        ApplyString(config.auth.account_key, auth, "accountKey");
        ApplyString(config.auth.sas_token, auth, "sasToken");
        ApplyString(config.auth.tenant_id, auth, "tenantId");
        ApplyString(config.auth.client_id, auth, "clientId");
        ApplyString(config.auth.client_secret, auth, "clientSecret");
    }
    return config;
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("service") && data["service"].is_object()) {
        const auto& service = data["service"];
        ApplyString(config.service.reports_dir, service, "reportsDir");
        ApplyString(config.service.temp_dir, service, "tempDir");
        ApplyString(config.service.pid_file, service, "pidFile");
    }

    if (data.contains("scheduler") && data["scheduler"].is_object()) {
        const auto& scheduler = data["scheduler"];
        ApplyBool(config.scheduler.enabled, scheduler, "enabled");
        ApplyInt(config.scheduler.interval_s, scheduler, "intervalS");
        ApplyInt(config.scheduler.poll_interval_s, scheduler, "pollIntervalS");
        ApplyInt(config.scheduler.job_timeout_s, scheduler, "jobTimeoutS");
        ApplyInt(config.scheduler.utc_offset_minutes, scheduler, "utcOffsetMinutes");
    }

    if (data.contains("graph") && data["graph"].is_object()) {
        const auto& graph = data["graph"];
        ApplyString(config.graph.tenant_id, graph, "tenantId");
        ApplyString(config.graph.client_id, graph, "clientId");
        ApplyString(config.graph.client_secret, graph, "clientSecret");
        ApplyString(config.graph.base_url, graph, "baseUrl");
        ApplyString(config.graph.authority_url, graph, "authorityUrl");
        ApplyInt(config.graph.timeout_s, graph, "timeoutS");
    }

    if (data.contains("notifications") && data["notifications"].is_object()) {
        ApplyString(config.notifications.global_webhook_url, data["notifications"], "globalWebhookUrl");
    }

    if (data.contains("storage") && data["storage"].is_object()) {
        const auto& storage = data["storage"];
        if (storage.contains("configurations") && storage["configurations"].is_object()) {
            config.storage.configurations.clear();
            for (const auto& item : storage["configurations"].items()) {
                if (!item.value().is_object()) {
                    continue;
                }
                config.storage.configurations[item.key()] = ParseStorageConfig(item.key(), item.value());
            }
        }
    }

    if (data.contains("rpc") && data["rpc"].is_object()) {
        ApplyString(config.rpc.host, data["rpc"], "host");
        ApplyInt(config.rpc.port, data["rpc"], "port");
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }

    ApplyString(config.catalog_path, data, "catalogPath");
}

bool ParseBool(const std::string& value) {
    const auto lowered = reportd::utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto reports_dir = GetEnvFallback("REPORTD_SERVICE__REPORTS_DIR", "REPORTD_REPORTS_DIR");
    if (!reports_dir.empty()) {
        config.service.reports_dir = reports_dir;
    }

    const auto temp_dir = GetEnvFallback("REPORTD_SERVICE__TEMP_DIR", "REPORTD_TEMP_DIR");
    if (!temp_dir.empty()) {
        config.service.temp_dir = temp_dir;
    }

    const auto scheduler_enabled = GetEnvFallback("REPORTD_SCHEDULER__ENABLED", "REPORTD_SCHEDULER_ENABLED");
    if (!scheduler_enabled.empty()) {
        config.scheduler.enabled = ParseBool(scheduler_enabled);
    }

    const auto interval = GetEnvFallback("REPORTD_SCHEDULER__INTERVAL_S", "REPORTD_SCHEDULER_INTERVAL_S");
    if (!interval.empty()) {
        config.scheduler.interval_s = ParseInt(interval, config.scheduler.interval_s);
    }

    const auto poll_interval = GetEnvFallback(
        "REPORTD_SCHEDULER__POLL_INTERVAL_S",
        "REPORTD_SCHEDULER_POLL_INTERVAL_S");
    if (!poll_interval.empty()) {
        config.scheduler.poll_interval_s = ParseInt(poll_interval, config.scheduler.poll_interval_s);
    }

    const auto job_timeout = GetEnvFallback(
        "REPORTD_SCHEDULER__JOB_TIMEOUT_S",
        "REPORTD_SCHEDULER_JOB_TIMEOUT_S");
    if (!job_timeout.empty()) {
        config.scheduler.job_timeout_s = ParseInt(job_timeout, config.scheduler.job_timeout_s);
    }

    const auto utc_offset = GetEnvFallback(
        "REPORTD_SCHEDULER__UTC_OFFSET_MINUTES",
        "REPORTD_SCHEDULER_UTC_OFFSET_MINUTES");
    if (!utc_offset.empty()) {
        config.scheduler.utc_offset_minutes = ParseInt(utc_offset, config.scheduler.utc_offset_minutes);
    }

    const auto tenant_id = GetEnvFallback("REPORTD_GRAPH__TENANT_ID", "REPORTD_GRAPH_TENANT_ID");
    if (!tenant_id.empty()) {
        config.graph.tenant_id = tenant_id;
    }

    const auto client_id = GetEnvFallback("REPORTD_GRAPH__CLIENT_ID", "REPORTD_GRAPH_CLIENT_ID");
    if (!client_id.empty()) {
        config.graph.client_id = client_id;
    }

    const auto client_secret = GetEnvFallback("REPORTD_GRAPH__CLIENT_SECRET", "REPORTD_GRAPH_CLIENT_SECRET");
    if (!client_secret.empty()) {
        config.graph.client_secret = client_secret;
    }

    const auto graph_base = GetEnvFallback("REPORTD_GRAPH__BASE_URL", "REPORTD_GRAPH_BASE_URL");
    if (!graph_base.empty()) {
        config.graph.base_url = graph_base;
    }

    const auto webhook = GetEnvFallback(
        "REPORTD_NOTIFICATIONS__GLOBAL_WEBHOOK_URL",
        "REPORTD_GLOBAL_WEBHOOK_URL");
    if (!webhook.empty()) {
        config.notifications.global_webhook_url = webhook;
    }

    const auto rpc_host = GetEnvFallback("REPORTD_RPC__HOST", "REPORTD_RPC_HOST");
    if (!rpc_host.empty()) {
        config.rpc.host = rpc_host;
    }

    const auto rpc_port = GetEnvFallback("REPORTD_RPC__PORT", "REPORTD_RPC_PORT");
    if (!rpc_port.empty()) {
        config.rpc.port = ParseInt(rpc_port, config.rpc.port);
    }

    const auto log_level = GetEnvFallback("REPORTD_LOGGING__LEVEL", "REPORTD_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    const auto catalog = GetEnv("REPORTD_CATALOG_PATH");
    if (!catalog.empty()) {
        config.catalog_path = catalog;
    }
}

void ApplyDefaults(Config& config) {
    if (config.service.reports_dir.empty()) {
        config.service.reports_dir = (ReportdHome() / "scheduled_reports").string();
    }
    if (config.service.temp_dir.empty()) {
        std::error_code ec;
        const auto temp = std::filesystem::temp_directory_path(ec);
        config.service.temp_dir = ec ? std::string("/tmp") : temp.string();
    }
    if (config.service.pid_file.empty()) {
        config.service.pid_file = (ReportdHome() / "reportd.pid").string();
    }
    if (config.scheduler.poll_interval_s <= 0) {
        config.scheduler.poll_interval_s = 10;
    }
    if (config.scheduler.job_timeout_s <= 0) {
        config.scheduler.job_timeout_s = 300;
    }
    if (config.scheduler.interval_s <= 0) {
        config.scheduler.interval_s = 5 * 60;
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto overridden = GetEnv("REPORTD_CONFIG");
    if (!overridden.empty()) {
        return overridden;
    }
    return ReportdHome() / "config.json";
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "[config] ignoring " << path.string() << ": " << ex.what() << std::endl;
        }
    }

    ApplyEnvOverrides(config);
    ApplyDefaults(config);
    return config;
}

std::chrono::seconds ShutdownGracePeriod(const SchedulerConfig& scheduler) {
    // Download, extraction and upload come on top of the job cap.
    constexpr std::chrono::seconds kTransferAllowance(120);
    return std::chrono::seconds(std::max(scheduler.job_timeout_s, 0)) +
           std::chrono::seconds(std::max(scheduler.poll_interval_s, 0)) + kTransferAllowance;
}

Config LoadConfig() {
    return LoadConfigFromFile(GetConfigPath());
}

}  // namespace reportd::config
