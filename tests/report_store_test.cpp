#include <fstream>

#include <gtest/gtest.h>

#include "nlohmann/json.hpp"
#include "reports/due_set.hpp"
#include "reports/report_codec.hpp"
#include "reports/report_store.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"

namespace reportd::reports {
namespace {

using reportd::testing::MakeReport;
using reportd::testing::TempDir;
using reportd::testing::Utc;

void WriteText(const std::filesystem::path& path, const std::string& text) {
    std::ofstream output(path, std::ios::trunc);
    output << text;
}

ScheduledReport FullReport() {
    auto report = MakeReport("weekly-compliance", "Weekly Compliance");
    report.description = "Compliance per device owner";
    report.filters = {{"OwnerType", "Company"}, {"ComplianceState", "All"}};
    report.selected_columns = {"DeviceName", "UPN"};
    report.schedule = {schedule::Trigger{2, 7, 30}, schedule::Trigger{std::nullopt, 18, 0}};
    report.delivery.folder_path = "exports/{reportType}";
    report.delivery.file_name_template = "{reportName}_{jobId}.{extension}";
    report.delivery.create_shareable_link = true;
    report.delivery.link_expiration_days = 3;
    report.notifications.enabled = true;
    report.notifications.use_global_webhook = false;
    report.notifications.custom_webhook_url = "https://hooks.example/abc";
    report.notifications.message_template = "{reportName}: {status}";
    report.last_run_ms = utils::ToMs(Utc(2024, 1, 1, 7, 30));
    RunResult result;
    result.success = true;
    result.format = "csv";
    result.file_name = "WeeklyCompliance_job-1.csv";
    result.file_size = 2048;
    result.record_count = 12;
    result.storage_link = "https://acct.blob.example/c/x.csv?sig=1";
    result.link_expiration_days = 3;
    result.run_duration = 42.5;
    result.completed_at_ms = utils::ToMs(Utc(2024, 1, 1, 7, 31));
    report.last_run_result = result;
    report.next_run_ms = utils::ToMs(Utc(2024, 1, 1, 18, 0));
    return report;
}

void ExpectSameReport(const ScheduledReport& a, const ScheduledReport& b) {
    EXPECT_EQ(EncodeReport(a), EncodeReport(b));
}

TEST(ReportStoreTest, SaveAndReloadPreservesEveryField) {
    TempDir dir;
    ReportStore store(dir.path(), schedule::ScheduleClock());
    const auto report = FullReport();
    store.Save(report);

    const auto loaded = store.LoadAll(Utc(2024, 1, 1, 12, 0));
    ASSERT_EQ(loaded.reports.size(), 1u);
    EXPECT_TRUE(loaded.skipped.empty());
    ExpectSameReport(loaded.reports[0], report);

    const auto& back = loaded.reports[0];
    ASSERT_EQ(back.filters.size(), 2u);
    EXPECT_EQ(back.filters[0].first, "OwnerType");
    EXPECT_EQ(back.filters[1].first, "ComplianceState");
    EXPECT_EQ(back.delivery.link_expiration_days, 3);
    EXPECT_EQ(back.notifications.custom_webhook_url, "https://hooks.example/abc");
    ASSERT_TRUE(back.last_run_result.has_value());
    EXPECT_DOUBLE_EQ(back.last_run_result->run_duration, 42.5);
}

TEST(ReportStoreTest, StoredNextRunIsKeptEvenWhenInThePast) {
    TempDir dir;
    ReportStore store(dir.path(), schedule::ScheduleClock());
    const auto report = FullReport();
    store.Save(report);

    const auto loaded = store.LoadAll(Utc(2024, 1, 5, 0, 0));
    ASSERT_EQ(loaded.reports.size(), 1u);
    EXPECT_EQ(loaded.reports[0].next_run_ms, report.next_run_ms);
}

TEST(ReportStoreTest, MissingNextRunIsAnchoredAtCreation) {
    TempDir dir;
    ReportStore store(dir.path(), schedule::ScheduleClock());
    auto report = MakeReport("daily", "Daily");
    report.created_ms = utils::ToMs(Utc(2023, 12, 31, 20, 0));
    store.Save(report);

    const auto loaded = store.LoadAll(Utc(2024, 1, 1, 9, 5));
    ASSERT_EQ(loaded.reports.size(), 1u);
    ASSERT_TRUE(loaded.reports[0].next_run_ms.has_value());
    EXPECT_EQ(loaded.reports[0].next_run_ms.value(), utils::ToMs(Utc(2024, 1, 1, 9, 0)));
}

TEST(ReportStoreTest, MalformedFilesAreSkipped) {
    TempDir dir;
    ReportStore store(dir.path(), schedule::ScheduleClock());
    store.Save(MakeReport("b", "Bravo"));
    store.Save(MakeReport("a", "alpha"));
    WriteText(dir.path() / "broken.json", "{ not json");
    WriteText(dir.path() / "invalid.json", R"({"id":"invalid","name":"","reportType":"Devices"})");
    WriteText(dir.path() / "notes.txt", "ignored");
    WriteText(dir.path() / kIndexFileName, R"({"reports":[]})");

    const auto loaded = store.LoadAll(Utc(2024, 1, 1));
    ASSERT_EQ(loaded.reports.size(), 2u);
    EXPECT_EQ(loaded.reports[0].name, "alpha");
    EXPECT_EQ(loaded.reports[1].name, "Bravo");
    EXPECT_EQ(loaded.skipped.size(), 2u);
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "broken.json"));
}

TEST(ReportStoreTest, MissingDirectoryIsCreated) {
    TempDir dir;
    const auto reports_dir = dir.path() / "nested" / "reports";
    ReportStore store(reports_dir, schedule::ScheduleClock());
    const auto loaded = store.LoadAll(Utc(2024, 1, 1));
    EXPECT_TRUE(loaded.reports.empty());
    EXPECT_TRUE(std::filesystem::is_directory(reports_dir));
}

TEST(ReportStoreTest, UnlistableDirectoryThrowsStoreError) {
    TempDir dir;
    const auto not_a_dir = dir.path() / "reports";
    WriteText(not_a_dir, "plain file");
    ReportStore store(not_a_dir, schedule::ScheduleClock());
    EXPECT_THROW(store.LoadAll(Utc(2024, 1, 1)), utils::StoreError);
}

TEST(ReportStoreTest, SaveRawValidatesNameAndContent) {
    TempDir dir;
    ReportStore store(dir.path(), schedule::ScheduleClock());
    const auto bytes = EncodeReport(MakeReport("r1", "Report One"));

    EXPECT_THROW(store.SaveRaw(bytes, "../r1.json", Utc(2024, 1, 1)), utils::DefinitionError);
    EXPECT_THROW(store.SaveRaw(bytes, kIndexFileName, Utc(2024, 1, 1)), utils::DefinitionError);
    EXPECT_THROW(store.SaveRaw(bytes, "other.json", Utc(2024, 1, 1)), utils::DefinitionError);
    EXPECT_THROW(store.SaveRaw("{", "r1.json", Utc(2024, 1, 1)), utils::DefinitionError);

    store.SaveRaw(bytes, "r1.json", Utc(2024, 1, 1));
    const auto found = store.Find("r1", Utc(2024, 1, 1));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "Report One");
}

TEST(ReportStoreTest, DeleteRemovesFileAndIndexEntry) {
    TempDir dir;
    ReportStore store(dir.path(), schedule::ScheduleClock());
    store.Save(MakeReport("r1", "One"));
    store.Save(MakeReport("r2", "Two"));
    EXPECT_EQ(store.RebuildIndex(Utc(2024, 1, 1)), 2u);

    EXPECT_TRUE(store.Delete("r1.json"));
    EXPECT_FALSE(store.Delete("r1.json"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "r1.json"));

    const auto index = nlohmann::json::parse(utils::ReadFile(dir.path() / kIndexFileName));
    ASSERT_EQ(index["reports"].size(), 1u);
    EXPECT_EQ(index["reports"][0]["id"], "r2");
}

TEST(ReportStoreTest, WriteIndexRequiresJsonObject) {
    TempDir dir;
    ReportStore store(dir.path(), schedule::ScheduleClock());
    EXPECT_THROW(store.WriteIndex("[1,2]"), utils::DefinitionError);
    EXPECT_THROW(store.WriteIndex("nope"), utils::DefinitionError);
    store.WriteIndex(R"({"reports":[],"lastUpdated":1})");
    const auto index = nlohmann::json::parse(utils::ReadFile(dir.path() / kIndexFileName));
    EXPECT_EQ(index["lastUpdated"], 1);
}

TEST(ReportStoreTest, DisableReportsByName) {
    TempDir dir;
    ReportStore store(dir.path(), schedule::ScheduleClock());
    store.Save(MakeReport("r1", "One"));
    store.Save(MakeReport("r2", "Two"));

    EXPECT_TRUE(store.DisableReportsByName({"One"}, Utc(2024, 1, 1)));
    EXPECT_FALSE(store.DisableReportsByName({"Two", "Missing"}, Utc(2024, 1, 1)));

    const auto loaded = store.LoadAll(Utc(2024, 1, 1));
    ASSERT_EQ(loaded.reports.size(), 2u);
    EXPECT_FALSE(loaded.reports[0].is_enabled);
    EXPECT_FALSE(loaded.reports[1].is_enabled);
}

TEST(ReportCodecTest, RejectsInvalidDefinitions) {
    EXPECT_THROW(DecodeReport(R"({"id":"x","name":"X","reportType":"Devices","format":"xlsx"})"),
                 utils::DefinitionError);
    EXPECT_THROW(DecodeReport(R"({"id":"x","name":"X","reportType":"Devices","schedule":[{"hour":25}]})"),
                 utils::DefinitionError);
    EXPECT_THROW(DecodeReport(R"({"id":"a/b","name":"X","reportType":"Devices"})"), utils::DefinitionError);
    EXPECT_THROW(DecodeReport(R"({"id":"x","name":"X","reportType":"Devices","schedule":{}})"),
                 utils::DefinitionError);

    const auto report = DecodeReport(R"({"id":"x","name":"X","reportType":"Devices","format":"JSON"})");
    EXPECT_EQ(report.format, "json");
    EXPECT_TRUE(report.is_enabled);
    EXPECT_EQ(report.delivery.folder_path, kDefaultFolderTemplate);
}

TEST(DueSetResolverTest, SelectsEnabledReportsWithPassedNextRun) {
    const auto now = Utc(2024, 1, 1, 9, 5);
    auto due = MakeReport("due", "Due");
    due.next_run_ms = utils::ToMs(Utc(2024, 1, 1, 9, 0));
    auto exact = MakeReport("exact", "Exact");
    exact.next_run_ms = utils::ToMs(now);
    auto future = MakeReport("future", "Future");
    future.next_run_ms = utils::ToMs(Utc(2024, 1, 2, 9, 0));
    auto disabled = MakeReport("disabled", "Disabled");
    disabled.is_enabled = false;
    disabled.next_run_ms = due.next_run_ms;
    auto unscheduled = MakeReport("unscheduled", "Unscheduled");
    unscheduled.schedule.clear();
    unscheduled.next_run_ms = due.next_run_ms;
    auto no_next = MakeReport("no-next", "No Next");

    const std::vector<ScheduledReport> all = {due, exact, future, disabled, unscheduled, no_next};
    DueSetResolver resolver;
    const auto first = resolver.Resolve(all, now);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].id, "due");
    EXPECT_EQ(first[1].id, "exact");
    EXPECT_EQ(resolver.CountOverdue(all, now), 2u);

    const auto second = resolver.Resolve(all, now);
    ASSERT_EQ(second.size(), first.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(second[i].id, first[i].id);
    }
}

}  // namespace
}  // namespace reportd::reports
