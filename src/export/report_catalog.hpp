#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace reportd::exporting {

enum class FilterType {
    kText,
    kDropdown,
    kBoolean,
    kId,
    kDate
};

struct FilterDefinition {
    std::string key;
    FilterType type = FilterType::kText;
    // Display option -> API value.
    std::map<std::string, std::string> option_values;

    std::string ApiValue(const std::string& display) const;
};

struct ReportDefinition {
    std::string type;
    std::string display_name;
    std::vector<FilterDefinition> filters;
    std::vector<std::string> default_columns;

    const FilterDefinition* FindFilter(const std::string& key) const;
};

class ReportCatalog {
public:
    // Built-in definitions only.
    ReportCatalog();

    // Adds or replaces definitions from a JSON file:
    // {"reports":[{"type":..., "displayName":..., "filters":[{"key","type","optionValues"}], "defaultColumns":[...]}]}
    // Throws std::runtime_error when the file cannot be parsed.
    void LoadFile(const std::filesystem::path& path);
    void Add(ReportDefinition definition);

    const ReportDefinition* Find(const std::string& type) const;
    std::size_t size() const { return definitions_.size(); }

    // "(Key eq 'value') and ..." in filter order; nullopt when nothing applies.
    std::optional<std::string> BuildFilterExpression(
        const std::string& report_type,
        const std::vector<std::pair<std::string, std::string>>& filters) const;

    // selected when non-empty, otherwise the catalog defaults (possibly empty).
    std::vector<std::string> ColumnsFor(const std::string& report_type,
                                        const std::vector<std::string>& selected) const;

private:
    std::map<std::string, ReportDefinition> definitions_;
};

FilterType FilterTypeFromString(const std::string& value);

}  // namespace reportd::exporting
