#include "test_support.hpp"
#include <core/config.hpp>
#include <managers/status_report.hpp>
#include <fmt/format.h>

class StatusReportTest : public TreeTest {};

TEST_F(StatusReportTest, CountsStagesAndTransfers) {
    make_unit_dir("GSE1/homo_sapiens/GSM1", {10});
    mark_converted("GSE1/homo_sapiens/GSM1", 1);
    touch("GSE1/homo_sapiens/GSM1/rsem.COMPLETE");
    make_unit_dir("GSE1/homo_sapiens/GSM2", {10});
    mark_converted("GSE1/homo_sapiens/GSM2", 1);
    make_unit_dir("GSE1/homo_sapiens/GSM3", {10});
    touch(TRANSFER_LEDGER_FILE, "# 24-01-01 00:00:00\nGSE1/homo_sapiens/GSM2\n");

    auto config = Config::parse(fmt::format("local:\n  top_outdir: {}\n", top.string()));
    ASSERT_TRUE(config.is_ok());
    auto r = collect_status(config.value);
    ASSERT_TRUE(r.is_ok()) << r.error;

    ASSERT_EQ(r.value.units.size(), 3u);
    EXPECT_EQ(r.value.units[0].stage, UnitStage::FullyProcessed);
    EXPECT_EQ(r.value.units[1].stage, UnitStage::AnalysisIncomplete);
    EXPECT_TRUE(r.value.units[1].transferred);
    EXPECT_EQ(r.value.units[2].stage, UnitStage::NotStarted);
    EXPECT_EQ(r.value.counts[UnitStage::FullyProcessed], 1u);
    EXPECT_EQ(r.value.counts[UnitStage::NotStarted], 1u);
    EXPECT_EQ(r.value.transferred, 1u);
}

TEST(StatusReport, MissingTopOutdir) {
    auto config = Config::parse("local:\n  top_outdir: /nonexistent/rpctl/tree\n");
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(collect_status(config.value).kind, ErrorKind::ConfigurationInvalid);
}
