#include "reports/report_codec.hpp"

#include "utils/common.hpp"
#include "utils/errors.hpp"

namespace reportd::reports {
namespace {

using utils::DefinitionError;

template <typename T>
std::optional<T> OptionalField(const Json& source, const char* key) {
    if (!source.contains(key) || source[key].is_null()) {
        return std::nullopt;
    }
    return source[key].get<T>();
}

std::optional<long long> OptionalMs(const Json& source, const char* key) {
    if (!source.contains(key) || source[key].is_null()) {
        return std::nullopt;
    }
    if (!source[key].is_number()) {
        throw DefinitionError(std::string("field '") + key + "' must be a millisecond timestamp");
    }
    return source[key].get<long long>();
}

template <typename T>
Json NullableJson(const std::optional<T>& value) {
    return value.has_value() ? Json(value.value()) : Json(nullptr);
}

schedule::Trigger TriggerFromJson(const Json& item) {
    if (!item.is_object()) {
        throw DefinitionError("schedule entries must be objects");
    }
    schedule::Trigger trigger;
    trigger.weekday = OptionalField<int>(item, "weekday");
    trigger.hour = item.value("hour", 0);
    trigger.minute = item.value("minute", 0);
    return trigger;
}

RunResult RunResultFromJson(const Json& item) {
    RunResult result;
    result.success = item.value("success", false);
    result.format = item.value("format", "");
    result.error = OptionalField<std::string>(item, "error");
    result.file_name = OptionalField<std::string>(item, "fileName");
    result.file_size = OptionalField<std::int64_t>(item, "fileSize");
    result.record_count = OptionalField<long long>(item, "recordCount");
    result.storage_link = OptionalField<std::string>(item, "storageLink");
    result.link_expiration_days = OptionalField<int>(item, "linkExpirationDays");
    result.run_duration = item.value("runDuration", 0.0);
    result.completed_at_ms = item.value("completedAt", 0LL);
    return result;
}

}  // namespace

std::string ValidateReport(const ScheduledReport& report) {
    if (report.id.empty()) {
        return "missing id";
    }
    if (report.id.find('/') != std::string::npos || report.id.find("..") != std::string::npos) {
        return "id '" + report.id + "' is not a valid file stem";
    }
    if (report.name.empty()) {
        return "missing name";
    }
    if (report.report_type.empty()) {
        return "missing reportType";
    }
    const auto format = utils::ToLower(report.format);
    if (format != "csv" && format != "json") {
        return "unsupported format '" + report.format + "'";
    }
    for (const auto& trigger : report.schedule) {
        if (!trigger.IsValid()) {
            return "schedule entry out of range";
        }
    }
    if (report.last_run_result.has_value() && report.last_run_result->run_duration < 0) {
        return "negative runDuration";
    }
    return {};
}

ScheduledReport ReportFromJson(const Json& data) {
    if (!data.is_object()) {
        throw DefinitionError("report definition must be a JSON object");
    }
    ScheduledReport report;
    try {
        report.id = data.value("id", "");
        report.name = data.value("name", "");
        report.description = data.value("description", "");
        report.report_type = data.value("reportType", "");
        report.report_display_name = data.value("reportDisplayName", report.report_type);
        report.format = utils::ToLower(data.value("format", "csv"));
        report.is_enabled = data.value("isEnabled", true);

        if (data.contains("filters") && data["filters"].is_object()) {
            for (const auto& item : data["filters"].items()) {
                if (item.value().is_string()) {
                    report.filters.emplace_back(item.key(), item.value().get<std::string>());
                } else if (item.value().is_boolean()) {
                    report.filters.emplace_back(item.key(), item.value().get<bool>() ? "true" : "false");
                }
            }
        }

        if (data.contains("selectedColumns") && data["selectedColumns"].is_array()) {
            for (const auto& column : data["selectedColumns"]) {
                if (column.is_string()) {
                    report.selected_columns.push_back(column.get<std::string>());
                }
            }
        }

        if (data.contains("schedule")) {
            if (!data["schedule"].is_array()) {
                throw DefinitionError("schedule must be an array of triggers");
            }
            for (const auto& item : data["schedule"]) {
                report.schedule.push_back(TriggerFromJson(item));
            }
        }

        if (data.contains("delivery") && data["delivery"].is_object()) {
            const auto& delivery = data["delivery"];
            report.delivery.storage_config_name = delivery.value("storageConfigName", "");
            report.delivery.folder_path = delivery.value("folderPath", kDefaultFolderTemplate);
            report.delivery.file_name_template = delivery.value("fileNameTemplate", kDefaultFileNameTemplate);
            report.delivery.create_shareable_link = delivery.value("createShareableLink", false);
            if (delivery.contains("linkExpirationDays")) {
                report.delivery.link_expiration_days = OptionalField<int>(delivery, "linkExpirationDays");
            }
        }

        if (data.contains("notifications") && data["notifications"].is_object()) {
            const auto& notifications = data["notifications"];
            report.notifications.enabled = notifications.value("enabled", false);
            report.notifications.use_global_webhook = notifications.value("useGlobalWebhook", true);
            report.notifications.custom_webhook_url =
                OptionalField<std::string>(notifications, "customWebhookURL").value_or("");
            report.notifications.message_template = OptionalField<std::string>(notifications, "messageTemplate");
        }

        report.created_ms = data.value("created", 0LL);
        report.modified_ms = data.value("modified", 0LL);
        report.last_run_ms = OptionalMs(data, "lastRun");
        report.next_run_ms = OptionalMs(data, "nextRun");
        if (data.contains("lastRunResult") && data["lastRunResult"].is_object()) {
            report.last_run_result = RunResultFromJson(data["lastRunResult"]);
        }
    } catch (const Json::exception& ex) {
        throw DefinitionError(std::string("malformed report definition: ") + ex.what());
    }

    const auto problem = ValidateReport(report);
    if (!problem.empty()) {
        throw DefinitionError("invalid report definition: " + problem);
    }
    return report;
}

ScheduledReport DecodeReport(const std::string& bytes) {
    Json data;
    try {
        data = Json::parse(bytes);
    } catch (const Json::parse_error& ex) {
        throw DefinitionError(std::string("report definition is not valid JSON: ") + ex.what());
    }
    return ReportFromJson(data);
}

Json TriggerToJson(const schedule::Trigger& trigger) {
    Json entry = Json::object();
    if (trigger.weekday.has_value()) {
        entry["weekday"] = trigger.weekday.value();
    }
    entry["hour"] = trigger.hour;
    entry["minute"] = trigger.minute;
    return entry;
}

Json RunResultToJson(const RunResult& result) {
    Json entry = Json::object();
    entry["success"] = result.success;
    entry["format"] = result.format;
    entry["error"] = NullableJson(result.error);
    entry["fileName"] = NullableJson(result.file_name);
    entry["fileSize"] = NullableJson(result.file_size);
    entry["recordCount"] = NullableJson(result.record_count);
    entry["storageLink"] = NullableJson(result.storage_link);
    entry["linkExpirationDays"] = NullableJson(result.link_expiration_days);
    entry["runDuration"] = result.run_duration;
    entry["completedAt"] = result.completed_at_ms;
    return entry;
}

Json ReportToJson(const ScheduledReport& report) {
    Json data = Json::object();
    data["id"] = report.id;
    data["name"] = report.name;
    data["description"] = report.description;
    data["reportType"] = report.report_type;
    data["reportDisplayName"] = report.report_display_name;
    data["format"] = report.format;

    Json filters = Json::object();
    for (const auto& [key, value] : report.filters) {
        filters[key] = value;
    }
    data["filters"] = filters;

    data["selectedColumns"] = report.selected_columns.empty()
                                  ? Json(nullptr)
                                  : Json(report.selected_columns);

    Json schedule = Json::array();
    for (const auto& trigger : report.schedule) {
        schedule.push_back(TriggerToJson(trigger));
    }
    data["schedule"] = schedule;
    data["isEnabled"] = report.is_enabled;

    Json delivery = Json::object();
    delivery["storageConfigName"] = report.delivery.storage_config_name;
    delivery["folderPath"] = report.delivery.folder_path;
    delivery["fileNameTemplate"] = report.delivery.file_name_template;
    delivery["createShareableLink"] = report.delivery.create_shareable_link;
    delivery["linkExpirationDays"] = NullableJson(report.delivery.link_expiration_days);
    data["delivery"] = delivery;

    Json notifications = Json::object();
    notifications["enabled"] = report.notifications.enabled;
    notifications["useGlobalWebhook"] = report.notifications.use_global_webhook;
    notifications["customWebhookURL"] = report.notifications.custom_webhook_url.empty()
                                            ? Json(nullptr)
                                            : Json(report.notifications.custom_webhook_url);
    notifications["messageTemplate"] = NullableJson(report.notifications.message_template);
    data["notifications"] = notifications;

    data["created"] = report.created_ms;
    data["modified"] = report.modified_ms;
    data["lastRun"] = NullableJson(report.last_run_ms);
    data["lastRunResult"] = report.last_run_result.has_value()
                                ? RunResultToJson(report.last_run_result.value())
                                : Json(nullptr);
    data["nextRun"] = NullableJson(report.next_run_ms);
    return data;
}

std::string EncodeReport(const ScheduledReport& report) {
    return ReportToJson(report).dump(2);
}

}  // namespace reportd::reports
