#include "reports/report_store.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "reports/report_codec.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace reportd::reports {
namespace {

constexpr const char* kTag = "store";

Json IndexEntry(const ScheduledReport& report) {
    Json entry = Json::object();
    entry["id"] = report.id;
    entry["name"] = report.name;
    entry["reportType"] = report.report_type;
    entry["isEnabled"] = report.is_enabled;
    entry["nextRun"] = report.next_run_ms.has_value() ? Json(report.next_run_ms.value()) : Json(nullptr);
    entry["lastRun"] = report.last_run_ms.has_value() ? Json(report.last_run_ms.value()) : Json(nullptr);
    return entry;
}

}  // namespace

bool IsValidDefinitionFileName(const std::string& file_name) {
    if (file_name.empty() || file_name == kIndexFileName) {
        return false;
    }
    if (file_name.find('/') != std::string::npos || file_name.find('\\') != std::string::npos) {
        return false;
    }
    if (file_name.find("..") != std::string::npos) {
        return false;
    }
    const std::filesystem::path path(file_name);
    return path.extension() == ".json" && path.stem().string().size() > 0;
}

ReportStore::ReportStore(std::filesystem::path directory, schedule::ScheduleClock clock)
    : directory_(std::move(directory)), clock_(clock) {}

std::string ReportStore::FileNameFor(const ScheduledReport& report) {
    return report.id + ".json";
}

std::filesystem::path ReportStore::PathFor(const std::string& file_name) const {
    return directory_ / file_name;
}

void ReportStore::EnsureDirectory() const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw utils::StoreError("cannot create report directory " + directory_.string() + ": " + ec.message());
    }
}

void ReportStore::AssignInitialNextRun(ScheduledReport& report, utils::TimePoint now) const {
    if (report.next_run_ms.has_value() || report.schedule.empty()) {
        return;
    }
    // Anchored at the last run, else at creation, so a slot passed since then is still due.
    auto anchor = now;
    if (report.last_run_ms.has_value()) {
        anchor = utils::FromMs(report.last_run_ms.value());
    } else if (report.created_ms > 0) {
        anchor = utils::FromMs(report.created_ms);
    }
    const auto next = clock_.NextRun(report.schedule, std::min(anchor, now));
    if (next.has_value()) {
        report.next_run_ms = utils::ToMs(next.value());
    }
}

ReportStore::LoadResult ReportStore::LoadAll(utils::TimePoint now) const {
    LoadResult result;
    std::error_code ec;
    if (!std::filesystem::exists(directory_, ec)) {
        if (ec) {
            throw utils::StoreError("cannot stat report directory " + directory_.string() + ": " + ec.message());
        }
        utils::LogInfo(kTag, "report directory missing, creating", {{"dir", directory_.string()}});
        EnsureDirectory();
        return result;
    }

    std::vector<std::filesystem::path> files;
    try {
        for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            const auto name = entry.path().filename().string();
            if (entry.path().extension() != ".json" || name == kIndexFileName) {
                continue;
            }
            files.push_back(entry.path());
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        throw utils::StoreError("cannot read report directory " + directory_.string() + ": " + ex.what());
    }

    for (const auto& path : files) {
        const auto name = path.filename().string();
        try {
            auto report = DecodeReport(utils::ReadFile(path));
            AssignInitialNextRun(report, now);
            result.reports.push_back(std::move(report));
        } catch (const std::exception& ex) {
            utils::LogWarn(kTag, "skipping report definition", {{"file", name}, {"error", ex.what()}});
            result.skipped.push_back(name);
        }
    }

    std::sort(result.reports.begin(), result.reports.end(), [](const ScheduledReport& a, const ScheduledReport& b) {
        const auto left = utils::ToLower(a.name);
        const auto right = utils::ToLower(b.name);
        if (left != right) {
            return left < right;
        }
        return a.id < b.id;
    });
    utils::LogDebug(kTag, "loaded report definitions", {
        {"count", std::to_string(result.reports.size())},
        {"skipped", std::to_string(result.skipped.size())}});
    return result;
}

std::optional<ScheduledReport> ReportStore::Find(const std::string& id, utils::TimePoint now) const {
    const auto path = PathFor(id + ".json");
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }
    auto report = DecodeReport(utils::ReadFile(path));
    AssignInitialNextRun(report, now);
    return report;
}

void ReportStore::Save(const ScheduledReport& report) const {
    const auto problem = ValidateReport(report);
    if (!problem.empty()) {
        throw utils::DefinitionError("refusing to save report '" + report.name + "': " + problem);
    }
    EnsureDirectory();
    try {
        utils::WriteFileAtomic(PathFor(FileNameFor(report)), EncodeReport(report));
    } catch (const std::exception& ex) {
        throw utils::StoreError("cannot write report " + FileNameFor(report) + ": " + ex.what());
    }
}

void ReportStore::SaveRaw(const std::string& bytes, const std::string& file_name, utils::TimePoint now) const {
    if (!IsValidDefinitionFileName(file_name)) {
        throw utils::DefinitionError("invalid report file name '" + file_name + "'");
    }
    auto report = DecodeReport(bytes);
    if (FileNameFor(report) != file_name) {
        throw utils::DefinitionError("file name '" + file_name + "' does not match report id '" + report.id + "'");
    }
    AssignInitialNextRun(report, now);
    Save(report);
    utils::LogInfo(kTag, "saved report definition", {{"file", file_name}, {"name", report.name}});
}

bool ReportStore::Delete(const std::string& file_name) const {
    if (!IsValidDefinitionFileName(file_name)) {
        throw utils::DefinitionError("invalid report file name '" + file_name + "'");
    }
    std::error_code ec;
    const bool removed = std::filesystem::remove(PathFor(file_name), ec);
    if (ec) {
        throw utils::StoreError("cannot delete " + file_name + ": " + ec.message());
    }
    RemoveIndexEntry(std::filesystem::path(file_name).stem().string());
    if (removed) {
        utils::LogInfo(kTag, "deleted report definition", {{"file", file_name}});
    }
    return removed;
}

void ReportStore::RemoveIndexEntry(const std::string& id) const {
    const auto index_path = PathFor(kIndexFileName);
    if (!std::filesystem::exists(index_path)) {
        return;
    }
    Json index;
    try {
        index = Json::parse(utils::ReadFile(index_path));
    } catch (const std::exception& ex) {
        utils::LogWarn(kTag, "index unreadable, leaving it for rebuild", {{"error", ex.what()}});
        return;
    }
    if (!index.is_object() || !index.contains("reports") || !index["reports"].is_array()) {
        return;
    }
    auto& entries = index["reports"];
    const auto before = entries.size();
    Json kept = Json::array();
    for (const auto& entry : entries) {
        if (entry.is_object() && entry.value("id", "") == id) {
            continue;
        }
        kept.push_back(entry);
    }
    if (kept.size() == before) {
        return;
    }
    index["reports"] = kept;
    index["lastUpdated"] = utils::ToMs(utils::Now());
    try {
        utils::WriteFileAtomic(index_path, index.dump(2));
    } catch (const std::exception& ex) {
        throw utils::StoreError(std::string("cannot update index: ") + ex.what());
    }
}

void ReportStore::WriteIndex(const std::string& bytes) const {
    Json index;
    try {
        index = Json::parse(bytes);
    } catch (const Json::parse_error& ex) {
        throw utils::DefinitionError(std::string("index is not valid JSON: ") + ex.what());
    }
    if (!index.is_object()) {
        throw utils::DefinitionError("index must be a JSON object");
    }
    EnsureDirectory();
    try {
        utils::WriteFileAtomic(PathFor(kIndexFileName), index.dump(2));
    } catch (const std::exception& ex) {
        throw utils::StoreError(std::string("cannot write index: ") + ex.what());
    }
}

std::size_t ReportStore::RebuildIndex(utils::TimePoint now) const {
    const auto loaded = LoadAll(now);
    Json index = Json::object();
    index["reports"] = Json::array();
    for (const auto& report : loaded.reports) {
        index["reports"].push_back(IndexEntry(report));
    }
    index["lastUpdated"] = utils::ToMs(now);
    WriteIndex(index.dump());
    if (!loaded.skipped.empty()) {
        utils::LogWarn(kTag, "index rebuilt without unreadable files", {
            {"files", utils::Join(loaded.skipped, ", ")}});
    }
    utils::LogInfo(kTag, "index rebuilt", {{"reports", std::to_string(loaded.reports.size())}});
    return loaded.reports.size();
}

bool ReportStore::DisableReportsByName(const std::vector<std::string>& names, utils::TimePoint now) const {
    const auto loaded = LoadAll(now);
    std::size_t disabled = 0;
    for (const auto& name : names) {
        const auto it = std::find_if(loaded.reports.begin(), loaded.reports.end(), [&](const ScheduledReport& report) {
            return report.name == name;
        });
        if (it == loaded.reports.end()) {
            utils::LogWarn(kTag, "report not found for disabling", {{"name", name}});
            continue;
        }
        if (!it->is_enabled) {
            ++disabled;
            continue;
        }
        auto report = *it;
        report.is_enabled = false;
        report.modified_ms = utils::ToMs(now);
        try {
            Save(report);
            ++disabled;
            utils::LogInfo(kTag, "disabled report", {{"name", name}});
        } catch (const std::exception& ex) {
            utils::LogError(kTag, "failed to disable report", {{"name", name}, {"error", ex.what()}});
        }
    }
    return disabled == names.size();
}

}  // namespace reportd::reports
