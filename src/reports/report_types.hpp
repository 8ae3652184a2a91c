#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "schedule/schedule_clock.hpp"

namespace reportd::reports {

inline constexpr const char* kDefaultFolderTemplate = "reports/{reportType}/";
inline constexpr const char* kDefaultFileNameTemplate = "{reportName}_{date}_{time}.{extension}";
inline constexpr int kDefaultLinkExpirationDays = 7;

struct DeliveryConfig {
    std::string storage_config_name;
    std::string folder_path = kDefaultFolderTemplate;
    std::string file_name_template = kDefaultFileNameTemplate;
    bool create_shareable_link = false;
    std::optional<int> link_expiration_days = kDefaultLinkExpirationDays;
};

struct NotificationConfig {
    bool enabled = false;
    bool use_global_webhook = true;
    std::string custom_webhook_url;
    std::optional<std::string> message_template;
};

struct RunResult {
    bool success = false;
    std::string format;
    std::optional<std::string> error;
    std::optional<std::string> file_name;
    std::optional<std::int64_t> file_size;
    std::optional<long long> record_count;
    std::optional<std::string> storage_link;
    std::optional<int> link_expiration_days;
    // Seconds, never negative.
    double run_duration = 0.0;
    long long completed_at_ms = 0;
};

struct ScheduledReport {
    std::string id;
    std::string name;
    std::string description;
    std::string report_type;
    std::string report_display_name;
    std::string format = "csv";
    // Ordered; rendered into the filter expression in this order.
    std::vector<std::pair<std::string, std::string>> filters;
    std::vector<std::string> selected_columns;
    std::vector<reportd::schedule::Trigger> schedule;
    bool is_enabled = true;
    DeliveryConfig delivery;
    NotificationConfig notifications;
    long long created_ms = 0;
    long long modified_ms = 0;
    std::optional<long long> last_run_ms;
    std::optional<RunResult> last_run_result;
    std::optional<long long> next_run_ms;
};

}  // namespace reportd::reports
