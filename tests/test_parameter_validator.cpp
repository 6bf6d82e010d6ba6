// Speeds & Feeds - Parameter Validator Tests

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

#include "core/cutting/cutting_error.h"
#include "core/cutting/parameter_validator.h"

using sfc::validateMachiningParameters;

namespace {

bool anyContains(const std::vector<std::string>& warnings, const std::string& needle) {
    for (const auto& w : warnings) {
        if (w.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace

// --- Clean input ---

TEST(ParameterValidator, TypicalCut_NoWarnings) {
    auto warnings = validateMachiningParameters(6366.0, 636.6, 10.0, 5.0, 10.0);
    EXPECT_TRUE(warnings.empty());
}

TEST(ParameterValidator, ZeroWidth_WarnsNotCutting) {
    auto warnings = validateMachiningParameters(6366.0, 636.6, 5.0, 0.0, 10.0);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_TRUE(anyContains(warnings, "no radial engagement"));
    EXPECT_FALSE(anyContains(warnings, "full slot"));
}

TEST(ParameterValidator, RepeatedCall_SameWarnings) {
    // Several checks fire at once
    auto first = validateMachiningParameters(75000.0, 30000.0, 25.0, 9.8, 10.0);
    auto second = validateMachiningParameters(75000.0, 30000.0, 25.0, 9.8, 10.0);
    EXPECT_GE(first.size(), 3u);
    EXPECT_EQ(first, second);
}

// --- Spindle and feed ---

TEST(ParameterValidator, ZeroRpm_Warns) {
    auto warnings = validateMachiningParameters(0.0, 100.0, 5.0, 5.0, 10.0);
    EXPECT_TRUE(anyContains(warnings, "Spindle speed must be positive"));
}

TEST(ParameterValidator, ImplausibleRpm_Warns) {
    auto warnings = validateMachiningParameters(75000.0, 1000.0, 1.0, 0.5, 1.0);
    EXPECT_TRUE(anyContains(warnings, "75,000 RPM"));
}

TEST(ParameterValidator, HugeFiniteRpm_FormattedWithoutOverflow) {
    auto warnings = validateMachiningParameters(1e300, 100.0, 1.0, 1.0, 10.0);
    ASSERT_TRUE(anyContains(warnings, "beyond typical spindle capability"));
    for (const auto& w : warnings) {
        EXPECT_EQ(w.find('-'), std::string::npos) << w;
    }
    EXPECT_TRUE(anyContains(warnings, "Spindle speed 1000000000"));
}

TEST(ParameterValidator, NegativeFeed_Warns) {
    auto warnings = validateMachiningParameters(6000.0, -10.0, 5.0, 5.0, 10.0);
    EXPECT_TRUE(anyContains(warnings, "Feed rate must be positive"));
}

TEST(ParameterValidator, FeedPerRevTooHigh_Warns) {
    // 2.5 mm/rev on a 10 mm tool
    auto warnings = validateMachiningParameters(1000.0, 2500.0, 5.0, 5.0, 10.0);
    EXPECT_TRUE(anyContains(warnings, "implausibly high"));
}

// --- Geometry ---

TEST(ParameterValidator, NearZeroEngagement_Warns) {
    auto warnings = validateMachiningParameters(6000.0, 600.0, 5.0, 0.1, 10.0);
    EXPECT_TRUE(anyContains(warnings, "near-zero radial engagement"));
}

TEST(ParameterValidator, FullSlot_Warns) {
    auto warnings = validateMachiningParameters(6000.0, 600.0, 5.0, 9.5, 10.0);
    EXPECT_TRUE(anyContains(warnings, "full slot"));
}

TEST(ParameterValidator, DeepCut_WarnsDeflection) {
    auto warnings = validateMachiningParameters(6000.0, 600.0, 25.0, 5.0, 10.0);
    EXPECT_TRUE(anyContains(warnings, "tool deflection"));
}

TEST(ParameterValidator, NegativeGeometry_Warns) {
    auto warnings = validateMachiningParameters(6000.0, 600.0, -1.0, -1.0, 10.0);
    EXPECT_TRUE(anyContains(warnings, "Depth of cut cannot be negative"));
    EXPECT_TRUE(anyContains(warnings, "Width of cut cannot be negative"));
}

TEST(ParameterValidator, ZeroDiameter_WarnsWithoutRelativeChecks) {
    auto warnings = validateMachiningParameters(6000.0, 600.0, 5.0, 5.0, 0.0);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], "Tool diameter must be positive");
}

TEST(ParameterValidator, CustomLimits_Applied) {
    sfc::ValidationLimits limits;
    limits.max_doc_ratio = 0.5;
    auto warnings = validateMachiningParameters(6000.0, 600.0, 6.0, 5.0, 10.0, limits);
    EXPECT_TRUE(anyContains(warnings, "0.5x tool diameter"));
}

// --- Non-finite input ---

TEST(ParameterValidator, NaNRpm_Throws) {
    try {
        validateMachiningParameters(std::numeric_limits<double>::quiet_NaN(), 600.0, 5.0, 5.0, 10.0);
        FAIL() << "Expected CuttingError";
    } catch (const sfc::CuttingError& e) {
        EXPECT_EQ(e.kind(), sfc::CuttingErrorKind::InvalidInput);
        EXPECT_EQ(e.field(), "rpm");
    }
}

TEST(ParameterValidator, InfiniteDiameter_Throws) {
    try {
        validateMachiningParameters(6000.0, 600.0, 5.0, 5.0,
                                    std::numeric_limits<double>::infinity());
        FAIL() << "Expected CuttingError";
    } catch (const sfc::CuttingError& e) {
        EXPECT_EQ(e.kind(), sfc::CuttingErrorKind::InvalidInput);
        EXPECT_EQ(e.field(), "diameter");
    }
}
