#pragma once

#include <map>
#include <string>

#include "storage/storage_config.hpp"

namespace reportd::config {

struct ServiceConfig {
    std::string reports_dir;
    std::string temp_dir;
    std::string pid_file;
};

struct SchedulerConfig {
    bool enabled = true;
    int interval_s = 5 * 60;
    int poll_interval_s = 10;
    int job_timeout_s = 300;
    int utc_offset_minutes = 0;
};

struct GraphConfig {
    std::string tenant_id;
    std::string client_id;
    std::string client_secret;
    std::string base_url = "https://graph.microsoft.com/beta";
    std::string authority_url = "https://login.microsoftonline.com";
    int timeout_s = 60;
};

struct NotificationsConfig {
    std::string global_webhook_url;
};

struct StorageSection {
    std::map<std::string, reportd::storage::NamedStorageConfig> configurations;
};

struct RpcConfig {
    std::string host = "127.0.0.1";
    int port = 18790;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ServiceConfig service;
    SchedulerConfig scheduler;
    GraphConfig graph;
    NotificationsConfig notifications;
    StorageSection storage;
    RpcConfig rpc;
    LoggingConfig logging;
    std::string catalog_path;
};

}  // namespace reportd::config
