#include <fstream>

#include <gtest/gtest.h>

#include "export/report_catalog.hpp"
#include "test_support.hpp"

namespace reportd::exporting {
namespace {

TEST(ReportCatalogTest, BuildsExpressionFromMappedValues) {
    ReportCatalog catalog;
    const auto expression = catalog.BuildFilterExpression(
        "DeviceCompliance",
        {{"ComplianceState", "noncompliant"}, {"OS", "All"}, {"OwnerType", "Company"}, {"DeviceType", ""}});
    ASSERT_TRUE(expression.has_value());
    EXPECT_EQ(expression.value(), "(ComplianceState eq 'noncompliant') and (OwnerType eq '1')");
}

TEST(ReportCatalogTest, NoApplicableFiltersYieldsNoExpression) {
    ReportCatalog catalog;
    EXPECT_FALSE(catalog.BuildFilterExpression("DeviceCompliance", {}).has_value());
    EXPECT_FALSE(catalog.BuildFilterExpression("DeviceCompliance", {{"OS", "All"}, {"OwnerType", ""}}).has_value());
}

TEST(ReportCatalogTest, BooleanAndQuotedValues) {
    ReportCatalog catalog;
    const auto expression = catalog.BuildFilterExpression(
        "DeviceInstallStatusByApp",
        {{"ApplicationId", "1234-abcd"}, {"IsLatestVersion", "True"}});
    EXPECT_EQ(expression.value(), "(ApplicationId eq '1234-abcd') and (IsLatestVersion eq true)");

    const auto quoted = catalog.BuildFilterExpression("Devices", {{"CategoryName", "O'Brien's"}});
    EXPECT_EQ(quoted.value(), "(CategoryName eq 'O''Brien''s')");
}

TEST(ReportCatalogTest, UnknownTypesAndKeysUsePlainEquality) {
    ReportCatalog catalog;
    EXPECT_EQ(catalog.BuildFilterExpression("Custom", {{"Field", "x"}}).value(), "(Field eq 'x')");
    EXPECT_TRUE(catalog.ColumnsFor("Custom", {}).empty());
}

TEST(ReportCatalogTest, SelectedColumnsOverrideDefaults) {
    ReportCatalog catalog;
    const auto defaults = catalog.ColumnsFor("DeviceNonCompliance", {});
    ASSERT_EQ(defaults.size(), 4u);
    EXPECT_EQ(defaults.front(), "DeviceName");
    const auto selected = catalog.ColumnsFor("DeviceNonCompliance", {"Platform"});
    ASSERT_EQ(selected.size(), 1u);
    EXPECT_EQ(selected.front(), "Platform");
}

TEST(ReportCatalogTest, LoadFileAddsDefinitions) {
    reportd::testing::TempDir dir;
    const auto path = dir.path() / "catalog.json";
    {
        std::ofstream output(path);
        output << R"({"reports":[{"type":"AppInvRawData","displayName":"App Inventory",
            "filters":[{"key":"Platform","type":"dropdown","optionValues":{"Windows":"win"}},
                       {"key":"Managed","type":"boolean"}],
            "defaultColumns":["ApplicationName","Platform"]}]})";
    }
    ReportCatalog catalog;
    const auto before = catalog.size();
    catalog.LoadFile(path);
    EXPECT_EQ(catalog.size(), before + 1);

    const auto* definition = catalog.Find("AppInvRawData");
    ASSERT_NE(definition, nullptr);
    EXPECT_EQ(definition->display_name, "App Inventory");
    EXPECT_EQ(catalog.BuildFilterExpression("AppInvRawData", {{"Platform", "Windows"}, {"Managed", "false"}}).value(),
              "(Platform eq 'win') and (Managed eq false)");
}

TEST(ReportCatalogTest, LoadFileRejectsMalformedCatalog) {
    reportd::testing::TempDir dir;
    const auto path = dir.path() / "catalog.json";
    {
        std::ofstream output(path);
        output << R"({"items":[]})";
    }
    ReportCatalog catalog;
    EXPECT_THROW(catalog.LoadFile(path), std::runtime_error);
}

}  // namespace
}  // namespace reportd::exporting
