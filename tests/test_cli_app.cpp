// Speeds & Feeds - Command Line Tests

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "app/cli_app.h"
#include "core/cutting/units.h"

using sfc::parseCliArgs;

// ============================================================================
// Argument parsing
// ============================================================================

TEST(CliArgs, Parse_NumericAndFlags) {
    auto parsed = parseCliArgs({"--diameter", "6", "--flutes", "3", "--smm", "250", "--chipload",
                                "0.04", "--hsm", "--chip-thinning", "--material", "aluminum_6061"});
    ASSERT_TRUE(parsed.ok()) << parsed.error;
    const auto& o = parsed.options;
    EXPECT_DOUBLE_EQ(*o.diameter, 6.0);
    EXPECT_EQ(*o.flutes, 3);
    EXPECT_DOUBLE_EQ(*o.smm, 250.0);
    EXPECT_DOUBLE_EQ(*o.chipLoad, 0.04);
    EXPECT_TRUE(o.hsm);
    EXPECT_TRUE(o.chipThinning);
    EXPECT_EQ(*o.material, "aluminum_6061");
    EXPECT_FALSE(o.doc.has_value());
}

TEST(CliArgs, Parse_Empty) {
    auto parsed = parseCliArgs({});
    EXPECT_TRUE(parsed.ok());
    EXPECT_FALSE(parsed.options.diameter.has_value());
    EXPECT_EQ(parsed.options.maxWarnings, -1);
}

TEST(CliArgs, Parse_UnknownOption) {
    auto parsed = parseCliArgs({"--turbo"});
    EXPECT_FALSE(parsed.ok());
    EXPECT_NE(parsed.error.find("--turbo"), std::string::npos);
}

TEST(CliArgs, Parse_MissingValue) {
    auto parsed = parseCliArgs({"--diameter"});
    EXPECT_FALSE(parsed.ok());
}

TEST(CliArgs, Parse_BadNumber) {
    EXPECT_FALSE(parseCliArgs({"--diameter", "wide"}).ok());
    EXPECT_FALSE(parseCliArgs({"--flutes", "2.5"}).ok());
}

TEST(CliArgs, Parse_SfmAndSmmConflict) {
    EXPECT_FALSE(parseCliArgs({"--sfm", "500", "--smm", "150"}).ok());
}

TEST(CliArgs, Parse_Help) {
    EXPECT_TRUE(parseCliArgs({"-h"}).options.help);
    EXPECT_TRUE(parseCliArgs({"--help"}).options.help);
}

TEST(CliArgs, Usage_ListsOptions) {
    auto usage = sfc::cliUsage("sfc");
    EXPECT_NE(usage.find("--diameter"), std::string::npos);
    EXPECT_NE(usage.find("--rigidity"), std::string::npos);
}

// ============================================================================
// Input assembly
// ============================================================================

TEST(CliInputs, DefaultsFromDiameter) {
    sfc::CliOptions o;
    o.diameter = 8.0;
    o.smm = 200.0;
    o.chipLoad = 0.05;
    o.kc = 700.0;

    auto in = sfc::buildMachiningInputs(o, std::nullopt, "medium");
    EXPECT_DOUBLE_EQ(in.diameter, 8.0);
    EXPECT_DOUBLE_EQ(in.doc, 8.0);
    EXPECT_DOUBLE_EQ(in.woc, 4.0);
    EXPECT_EQ(in.flute_num, 2);
    EXPECT_EQ(in.rigidity_level, "medium");
    EXPECT_FALSE(in.material_type.has_value());
}

TEST(CliInputs, ImperialConvertsLengths) {
    sfc::CliOptions o;
    o.imperial = true;
    o.diameter = 0.25;
    o.woc = 0.1;
    o.chipLoad = 0.002;
    o.sfm = 1000.0;
    o.kc = 700.0;

    auto in = sfc::buildMachiningInputs(o, std::nullopt, "medium");
    EXPECT_NEAR(in.diameter, 6.35, 1e-12);
    EXPECT_NEAR(in.woc, 2.54, 1e-12);
    EXPECT_NEAR(in.mmpt, 0.0508, 1e-12);
    EXPECT_NEAR(in.smm, 304.8, 1e-9);
}

TEST(CliInputs, MaterialFillsBlanks) {
    sfc::MaterialData m;
    m.key = "alu";
    m.name = "Aluminum";
    m.kc = 700.0;
    m.sfm = 1000.0;
    m.smm = 304.8;
    m.chip_load_mm = 0.05;

    sfc::CliOptions o;
    o.diameter = 6.0;
    o.material = "alu";
    o.chipLoad = 0.03;

    auto in = sfc::buildMachiningInputs(o, m, "heavy");
    EXPECT_DOUBLE_EQ(in.kc, 700.0);
    EXPECT_DOUBLE_EQ(in.smm, 304.8);
    EXPECT_DOUBLE_EQ(in.mmpt, 0.03); // explicit value wins
    EXPECT_EQ(*in.material_type, "alu");
}

TEST(CliInputs, RigidityOverride) {
    sfc::CliOptions o;
    o.rigidity = "hobby";
    auto in = sfc::buildMachiningInputs(o, std::nullopt, "medium");
    EXPECT_EQ(in.rigidity_level, "hobby");
}

TEST(CliInputs, MachineLimitsOverride) {
    sfc::MachineLimits configured;
    configured.spindle_power_kw = 1.5;

    sfc::CliOptions o;
    o.maxRpm = 18000.0;
    auto limits = sfc::buildMachineLimits(o, configured);
    EXPECT_DOUBLE_EQ(limits.max_rpm, 18000.0);
    EXPECT_DOUBLE_EQ(limits.min_rpm, 1000.0);
    EXPECT_DOUBLE_EQ(limits.spindle_power_kw, 1.5);
}

// ============================================================================
// Report formatting
// ============================================================================

namespace {

sfc::CalculationReport sampleReport() {
    sfc::CalculationReport report;
    report.outputs.rpm = 6366.2;
    report.outputs.feed = 636.6;
    report.outputs.effective_mmpt = 0.05;
    report.outputs.mrr = 31831.0;
    report.outputs.power_kw = 0.37;
    report.outputs.torque_nm = 0.56;
    report.outputs.rigidity_name = "Medium Duty Mill";
    report.outputs.rigidity_factor = 0.85;
    report.warnings = {"first", "second", "third"};
    report.rpm_status = {sfc::RpmStatusLevel::Info, "within safe range"};
    return report;
}

} // namespace

TEST(CliReport, Metric) {
    auto text = sfc::formatReport(sampleReport(), false, -1);
    EXPECT_NE(text.find("6,366 RPM"), std::string::npos);
    EXPECT_NE(text.find("info: within safe range"), std::string::npos);
    EXPECT_NE(text.find("637 mm/min"), std::string::npos);
    EXPECT_NE(text.find("Medium Duty Mill (0.85)"), std::string::npos);
    EXPECT_NE(text.find("  - third"), std::string::npos);
}

TEST(CliReport, Imperial) {
    auto text = sfc::formatReport(sampleReport(), true, -1);
    EXPECT_NE(text.find("in/min"), std::string::npos);
    EXPECT_NE(text.find("in/tooth"), std::string::npos);
}

TEST(CliReport, WarningsTruncated) {
    auto text = sfc::formatReport(sampleReport(), false, 2);
    EXPECT_NE(text.find("2 of 3 shown"), std::string::npos);
    EXPECT_NE(text.find("  - second"), std::string::npos);
    EXPECT_EQ(text.find("  - third"), std::string::npos);
}

TEST(CliReport, NoWarningsSection) {
    auto report = sampleReport();
    report.warnings.clear();
    auto text = sfc::formatReport(report, false, -1);
    EXPECT_EQ(text.find("Warnings"), std::string::npos);
}
