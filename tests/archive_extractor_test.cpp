#include <csignal>
#include <string>

#include <gtest/gtest.h>

#include "export/archive_extractor.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"

namespace reportd::exporting {
namespace {

using reportd::testing::TempDir;
using reportd::testing::ZipBuilder;

std::size_t CountEntries(const std::filesystem::path& dir) {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        (void)entry;
        ++count;
    }
    return count;
}

TEST(ArchiveExtractorTest, ReturnsExactFormatMatch) {
    TempDir temp;
    ArchiveExtractor extractor(temp.path());
    const std::string csv = "DeviceName,OS\nlaptop-1,Windows\nlaptop-2,macOS\n";
    const auto archive = ZipBuilder()
                             .Add("readme.txt", "ignore me")
                             .Add("report.json", "[]")
                             .Add("report.csv", csv)
                             .Build();

    const auto payload = extractor.Extract(archive, "csv");
    EXPECT_EQ(payload.bytes, csv);
    EXPECT_EQ(payload.file_name, "report.csv");
    EXPECT_EQ(payload.format, "csv");
    EXPECT_FALSE(payload.used_fallback);
}

TEST(ArchiveExtractorTest, FlattensNestedEntries) {
    TempDir temp;
    ArchiveExtractor extractor(temp.path());
    const auto archive = ZipBuilder().Add("export/2024/DeviceCompliance.csv", "a,b\n1,2\n").Build();

    const auto payload = extractor.Extract(archive, "CSV");
    EXPECT_EQ(payload.file_name, "DeviceCompliance.csv");
    EXPECT_EQ(payload.bytes, "a,b\n1,2\n");
}

TEST(ArchiveExtractorTest, FallsBackToOtherDataFormat) {
    TempDir temp;
    ArchiveExtractor extractor(temp.path());
    const std::string json = R"({"value":[{"id":1},{"id":2}]})";
    const auto archive = ZipBuilder().Add("report.json", json).Build();

    const auto payload = extractor.Extract(archive, "csv");
    EXPECT_EQ(payload.bytes, json);
    EXPECT_EQ(payload.format, "json");
    EXPECT_TRUE(payload.used_fallback);
}

TEST(ArchiveExtractorTest, NoDataFileNamesExpectedFormat) {
    TempDir temp;
    ArchiveExtractor extractor(temp.path());
    const auto archive = ZipBuilder().Add("readme.txt", "nothing here").Build();

    try {
        extractor.Extract(archive, "csv");
        FAIL() << "expected ExtractionError";
    } catch (const utils::ExtractionError& ex) {
        EXPECT_NE(std::string(ex.what()).find("CSV"), std::string::npos);
    }
}

TEST(ArchiveExtractorTest, CorruptArchiveIsExtractionError) {
    TempDir temp;
    ArchiveExtractor extractor(temp.path());
    EXPECT_THROW(extractor.Extract("this is not a zip file", "csv"), utils::ExtractionError);
}

TEST(ArchiveExtractorTest, TemporaryFilesRemovedOnEveryPath) {
    TempDir temp;
    ArchiveExtractor extractor(temp.path());

    extractor.Extract(ZipBuilder().Add("r.csv", "h\n1\n").Build(), "csv");
    EXPECT_EQ(CountEntries(temp.path()), 0u);

    EXPECT_THROW(extractor.Extract(ZipBuilder().Add("r.txt", "x").Build(), "csv"), utils::ExtractionError);
    EXPECT_EQ(CountEntries(temp.path()), 0u);

    EXPECT_THROW(extractor.Extract("garbage", "json"), utils::ExtractionError);
    EXPECT_EQ(CountEntries(temp.path()), 0u);
}

TEST(ArchiveExtractorTest, ReapedChildIsAWaitFailureNotATimeout) {
    TempDir temp;
    ArchiveExtractor extractor(temp.path());
    const auto archive = ZipBuilder().Add("report.csv", "a\n1\n").Build();

    // With SIGCHLD ignored the kernel reaps unzip itself and waitpid fails with ECHILD.
    struct sigaction ignore {};
    struct sigaction previous {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ASSERT_EQ(sigaction(SIGCHLD, &ignore, &previous), 0);

    std::string message;
    try {
        extractor.Extract(archive, "csv");
    } catch (const utils::ExtractionError& ex) {
        message = ex.what();
    }
    sigaction(SIGCHLD, &previous, nullptr);

    EXPECT_NE(message.find("cannot wait for unzip"), std::string::npos) << message;
    EXPECT_EQ(message.find("timed out"), std::string::npos) << message;
    EXPECT_EQ(CountEntries(temp.path()), 0u);
}

TEST(CountRecordsTest, CsvCountsNonBlankLinesAfterHeader) {
    EXPECT_EQ(CountRecords("a,b\n1,2\n3,4\n", "csv"), 2);
    EXPECT_EQ(CountRecords("a,b\r\n1,2\r\n\r\n  \n3,4", "csv"), 2);
    EXPECT_EQ(CountRecords("a,b\n", "csv"), 0);
    EXPECT_EQ(CountRecords("", "csv"), 0);
}

TEST(CountRecordsTest, JsonCountsArrays) {
    EXPECT_EQ(CountRecords("[1,2,3]", "json"), 3);
    EXPECT_EQ(CountRecords(R"({"value":[{},{}]})", "json"), 2);
    EXPECT_EQ(CountRecords(R"({"other":1})", "json"), 0);
    EXPECT_EQ(CountRecords("{broken", "json"), 0);
}

}  // namespace
}  // namespace reportd::exporting
