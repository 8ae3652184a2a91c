#include "export/report_catalog.hpp"

#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace reportd::exporting {
namespace {

FilterDefinition Dropdown(std::string key, std::map<std::string, std::string> values = {}) {
    return FilterDefinition{std::move(key), FilterType::kDropdown, std::move(values)};
}

const std::map<std::string, std::string>& OwnerTypeValues() {
    static const std::map<std::string, std::string> values{{"Company", "1"}, {"Personal", "2"}};
    return values;
}

const std::map<std::string, std::string>& DeviceTypeValues() {
    static const std::map<std::string, std::string> values{
        {"Desktop", "0"}, {"Windows", "1"}, {"winMO6", "2"}, {"Nokia", "3"},
        {"WindowsPhone", "4"}, {"Mac", "5"}, {"WinCE", "6"}, {"WinEmbedded", "7"},
        {"iPhone", "8"}, {"iPad", "9"}, {"iPod", "10"}, {"Android", "11"},
        {"iSocConsumer", "12"}, {"Unix", "13"}, {"MacMDM", "14"}, {"HoloLens", "15"},
        {"SurfaceHub", "16"}, {"AndroidForWork", "17"}, {"AndroidEnterprise", "18"},
        {"Windows10x", "19"}, {"AndroidnGMS", "20"}, {"CloudPC", "21"}, {"Linux", "22"}};
    return values;
}

std::string Escape(const std::string& value) {
    return utils::ReplaceAll(value, "'", "''");
}

}  // namespace

std::string FilterDefinition::ApiValue(const std::string& display) const {
    const auto it = option_values.find(display);
    return it == option_values.end() ? display : it->second;
}

const FilterDefinition* ReportDefinition::FindFilter(const std::string& key) const {
    for (const auto& filter : filters) {
        if (filter.key == key) {
            return &filter;
        }
    }
    return nullptr;
}

FilterType FilterTypeFromString(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "dropdown") {
        return FilterType::kDropdown;
    }
    if (lowered == "boolean" || lowered == "bool") {
        return FilterType::kBoolean;
    }
    if (lowered == "id" || lowered == "applicationid" || lowered == "deviceid" || lowered == "userid") {
        return FilterType::kId;
    }
    if (lowered == "date") {
        return FilterType::kDate;
    }
    return FilterType::kText;
}

ReportCatalog::ReportCatalog() {
    Add({"DeviceCompliance", "Device Compliance",
         {Dropdown("ComplianceState"), Dropdown("OS"), Dropdown("OwnerType", OwnerTypeValues()),
          Dropdown("DeviceType", DeviceTypeValues())},
         {"DeviceId", "IntuneDeviceId", "AadDeviceId", "DeviceName", "DeviceType", "OSDescription",
          "OSVersion", "OwnerType", "LastContact", "InGracePeriodUntil", "IMEI", "SerialNumber",
          "ManagementAgents", "PrimaryUser", "UserId", "UPN", "UserEmail", "UserName",
          "DeviceHealthThreatLevel", "RetireAfterDatetime", "PartnerDeviceId", "ComplianceState", "OS"}});
    Add({"DeviceComplianceTrend", "Device Compliance Trend", {},
         {"ComplianceState", "Count", "Date", "DeviceType", "OSFamily", "OwnerType"}});
    Add({"DeviceNonCompliance", "Device Non Compliance",
         {Dropdown("Platform"), Dropdown("OwnerType", OwnerTypeValues())},
         {"DeviceName", "ComplianceState", "NonComplianceReason", "Platform"}});
    Add({"Devices", "All Devices",
         {Dropdown("OwnerType", OwnerTypeValues()), Dropdown("DeviceType", DeviceTypeValues()),
          FilterDefinition{"ManagementAgents", FilterType::kText, {}},
          FilterDefinition{"CategoryName", FilterType::kText, {}}},
         {"DeviceName", "ManagedBy", "Ownership", "Compliance", "OS", "OSVersion",
          "LastContact", "UPN", "DeviceId"}});
    Add({"AllAppsList", "All Apps List", {},
         {"AppIdentifier", "Assigned", "DateCreated", "Description", "Developer", "ExpirationDate",
          "FeaturedApp", "LastModified", "MoreInformationURL", "Name", "Notes", "Owner", "Platform",
          "PrivacyInformationURL", "Publisher", "Status", "StoreURL", "Type", "Version"}});
    Add({"DeviceInstallStatusByApp", "Device Install Status By App",
         {FilterDefinition{"ApplicationId", FilterType::kId, {}},
          FilterDefinition{"IsLatestVersion", FilterType::kBoolean, {}}},
         {"DeviceName", "UserPrincipalName", "Platform", "AppVersion", "InstallState",
          "InstallStateDetail", "LastModifiedDateTime", "DeviceId", "ErrorCode", "UserName", "UserId",
          "ApplicationId", "AppInstallState", "AppInstallStateDetails", "HexErrorCode"}});
}

void ReportCatalog::Add(ReportDefinition definition) {
    auto type = definition.type;
    definitions_[type] = std::move(definition);
}

void ReportCatalog::LoadFile(const std::filesystem::path& path) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(utils::ReadFile(path));
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("invalid report catalog " + path.string() + ": " + ex.what());
    }
    if (!data.is_object() || !data.contains("reports") || !data["reports"].is_array()) {
        throw std::runtime_error("report catalog " + path.string() + " has no reports array");
    }
    std::size_t added = 0;
    for (const auto& item : data["reports"]) {
        if (!item.is_object() || !item.contains("type") || !item["type"].is_string()) {
            continue;
        }
        ReportDefinition definition;
        definition.type = item["type"].get<std::string>();
        definition.display_name = item.value("displayName", definition.type);
        if (item.contains("filters") && item["filters"].is_array()) {
            for (const auto& filter_item : item["filters"]) {
                if (!filter_item.is_object() || !filter_item.contains("key")) {
                    continue;
                }
                FilterDefinition filter;
                filter.key = filter_item.value("key", "");
                filter.type = FilterTypeFromString(filter_item.value("type", "text"));
                if (filter_item.contains("optionValues") && filter_item["optionValues"].is_object()) {
                    for (const auto& option : filter_item["optionValues"].items()) {
                        if (option.value().is_string()) {
                            filter.option_values[option.key()] = option.value().get<std::string>();
                        }
                    }
                }
                definition.filters.push_back(std::move(filter));
            }
        }
        if (item.contains("defaultColumns") && item["defaultColumns"].is_array()) {
            for (const auto& column : item["defaultColumns"]) {
                if (column.is_string()) {
                    definition.default_columns.push_back(column.get<std::string>());
                }
            }
        }
        Add(std::move(definition));
        ++added;
    }
    utils::LogInfo("catalog", "loaded report catalog", {{"path", path.string()}, {"reports", std::to_string(added)}});
}

const ReportDefinition* ReportCatalog::Find(const std::string& type) const {
    const auto it = definitions_.find(type);
    return it == definitions_.end() ? nullptr : &it->second;
}

std::optional<std::string> ReportCatalog::BuildFilterExpression(
    const std::string& report_type,
    const std::vector<std::pair<std::string, std::string>>& filters) const {
    const auto* definition = Find(report_type);
    std::vector<std::string> components;
    for (const auto& [key, value] : filters) {
        if (value.empty() || value == "All") {
            continue;
        }
        const FilterDefinition* filter = definition ? definition->FindFilter(key) : nullptr;
        if (filter == nullptr) {
            components.push_back("(" + key + " eq '" + Escape(value) + "')");
            continue;
        }
        const auto api_value = filter->ApiValue(value);
        if (filter->type == FilterType::kBoolean) {
            const bool flag = utils::ToLower(api_value) == "true";
            components.push_back("(" + key + " eq " + (flag ? "true" : "false") + ")");
        } else {
            components.push_back("(" + key + " eq '" + Escape(api_value) + "')");
        }
    }
    if (components.empty()) {
        return std::nullopt;
    }
    return utils::Join(components, " and ");
}

std::vector<std::string> ReportCatalog::ColumnsFor(const std::string& report_type,
                                                   const std::vector<std::string>& selected) const {
    if (!selected.empty()) {
        return selected;
    }
    const auto* definition = Find(report_type);
    return definition ? definition->default_columns : std::vector<std::string>{};
}

}  // namespace reportd::exporting
