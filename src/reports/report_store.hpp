#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "reports/report_types.hpp"
#include "schedule/schedule_clock.hpp"
#include "utils/common.hpp"

namespace reportd::reports {

inline constexpr const char* kIndexFileName = "index.json";

// One <id>.json per report plus index.json, all in a single directory.
class ReportStore {
public:
    struct LoadResult {
        std::vector<ScheduledReport> reports;
        // File names that failed to decode; they are left on disk untouched.
        std::vector<std::string> skipped;
    };

    ReportStore(std::filesystem::path directory, schedule::ScheduleClock clock);

    // Throws StoreError when the directory cannot be listed. A missing
    // directory is created and yields an empty result.
    LoadResult LoadAll(utils::TimePoint now) const;
    std::optional<ScheduledReport> Find(const std::string& id, utils::TimePoint now) const;

    void Save(const ScheduledReport& report) const;
    // Front-end entry point: bytes must decode and match file_name.
    void SaveRaw(const std::string& bytes, const std::string& file_name, utils::TimePoint now) const;
    bool Delete(const std::string& file_name) const;
    void WriteIndex(const std::string& bytes) const;
    std::size_t RebuildIndex(utils::TimePoint now) const;
    bool DisableReportsByName(const std::vector<std::string>& names, utils::TimePoint now) const;

    static std::string FileNameFor(const ScheduledReport& report);
    const std::filesystem::path& directory() const { return directory_; }

private:
    void EnsureDirectory() const;
    void AssignInitialNextRun(ScheduledReport& report, utils::TimePoint now) const;
    void RemoveIndexEntry(const std::string& id) const;
    std::filesystem::path PathFor(const std::string& file_name) const;

    std::filesystem::path directory_;
    schedule::ScheduleClock clock_;
};

// Rejects names with path components, the index itself and non-.json files.
bool IsValidDefinitionFileName(const std::string& file_name);

}  // namespace reportd::reports
