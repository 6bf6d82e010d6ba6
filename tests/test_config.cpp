// Speeds & Feeds - Config Tests

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "core/config/config.h"

namespace fs = std::filesystem;

namespace {

// Fixture: temp config file, singleton restored to defaults around each test
class ConfigTest : public ::testing::Test {
  protected:
    void SetUp() override {
        m_tempDir = fs::temp_directory_path() / "sfc_config_test";
        fs::create_directories(m_tempDir);
        m_configPath = m_tempDir / "config.ini";
        sfc::Config::instance().reset();
    }

    void TearDown() override {
        sfc::Config::instance().reset();
        std::error_code ec;
        fs::remove_all(m_tempDir, ec);
    }

    void writeConfig(const std::string& text) {
        std::ofstream out(m_configPath);
        out << text;
    }

    fs::path m_tempDir;
    fs::path m_configPath;
};

} // namespace

TEST_F(ConfigTest, Defaults) {
    auto& config = sfc::Config::instance();
    EXPECT_DOUBLE_EQ(config.getMachineLimits().min_rpm, 1000.0);
    EXPECT_DOUBLE_EQ(config.getMachineLimits().preferred_rpm, 10000.0);
    EXPECT_DOUBLE_EQ(config.getMachineLimits().max_rpm, 24000.0);
    EXPECT_EQ(config.getRigidityLevel(), "medium");
    EXPECT_TRUE(config.getDisplayUnitsMetric());
    EXPECT_EQ(config.getWindowGeometry().width, 1200);
    EXPECT_DOUBLE_EQ(config.getTuning().max_chip_thinning_multiplier, 5.0);
}

TEST_F(ConfigTest, MissingFile_KeepsDefaults) {
    auto& config = sfc::Config::instance();
    EXPECT_TRUE(config.loadFrom(m_tempDir / "nope.ini"));
    EXPECT_DOUBLE_EQ(config.getMachineLimits().max_rpm, 24000.0);
}

TEST_F(ConfigTest, SaveLoad_RoundTrips) {
    auto& config = sfc::Config::instance();

    sfc::MachineLimits limits;
    limits.min_rpm = 6000.0;
    limits.preferred_rpm = 18000.0;
    limits.max_rpm = 24000.0;
    limits.spindle_power_kw = 2.2;
    config.setMachineLimits(limits);
    config.setRigidityLevel("hobby");
    config.setDisplayUnitsMetric(false);
    config.setWindowGeometry({10, 20, 800, 600});
    config.setLogLevel(2);
    config.setMaterialsTablePath(m_tempDir / "materials.json");

    sfc::CalcTuning tuning;
    tuning.material_tolerance = 0.25;
    config.setTuning(tuning);

    ASSERT_TRUE(config.saveTo(m_configPath));
    config.reset();
    EXPECT_EQ(config.getRigidityLevel(), "medium");

    ASSERT_TRUE(config.loadFrom(m_configPath));
    EXPECT_DOUBLE_EQ(config.getMachineLimits().min_rpm, 6000.0);
    EXPECT_DOUBLE_EQ(config.getMachineLimits().preferred_rpm, 18000.0);
    EXPECT_DOUBLE_EQ(config.getMachineLimits().spindle_power_kw, 2.2);
    EXPECT_EQ(config.getRigidityLevel(), "hobby");
    EXPECT_FALSE(config.getDisplayUnitsMetric());
    EXPECT_EQ(config.getWindowGeometry().x, 10);
    EXPECT_EQ(config.getWindowGeometry().height, 600);
    EXPECT_EQ(config.getLogLevel(), 2);
    EXPECT_EQ(config.getMaterialsTablePath(), m_tempDir / "materials.json");
    EXPECT_TRUE(config.getRigidityTablePath().empty());
    EXPECT_DOUBLE_EQ(config.getTuning().material_tolerance, 0.25);
}

TEST_F(ConfigTest, Parse_IgnoresCommentsAndUnknownKeys) {
    writeConfig("# comment\n"
                "; another\n"
                "[machine]\n"
                "  max_rpm = 18000  \n"
                "turbo = yes\n"
                "[unknown]\n"
                "max_rpm = 1\n");

    auto& config = sfc::Config::instance();
    ASSERT_TRUE(config.loadFrom(m_configPath));
    EXPECT_DOUBLE_EQ(config.getMachineLimits().max_rpm, 18000.0);
    EXPECT_DOUBLE_EQ(config.getMachineLimits().min_rpm, 1000.0);
}

TEST_F(ConfigTest, Parse_BadNumberKeepsDefault) {
    writeConfig("[machine]\nmin_rpm=slow\n[window]\nwidth=wide\n");

    auto& config = sfc::Config::instance();
    ASSERT_TRUE(config.loadFrom(m_configPath));
    EXPECT_DOUBLE_EQ(config.getMachineLimits().min_rpm, 1000.0);
    EXPECT_EQ(config.getWindowGeometry().width, 1200);
}

TEST_F(ConfigTest, Save_CreatesDirectory) {
    auto nested = m_tempDir / "nested" / "config.ini";
    EXPECT_TRUE(sfc::Config::instance().saveTo(nested));
    EXPECT_TRUE(fs::exists(nested));
}

TEST_F(ConfigTest, Tuning_OutOfRangeKeepsDefault) {
    writeConfig("[tuning]\n"
                "max_chip_thinning_multiplier=0.5\n"
                "power_divisor=0\n"
                "chip_thinning_threshold=0.8\n"
                "spindle_load_warning=nan\n"
                "material_tolerance=inf\n"
                "hsm_max_engagement=fast\n");

    auto& config = sfc::Config::instance();
    ASSERT_TRUE(config.loadFrom(m_configPath));
    const auto& tuning = config.getTuning();
    sfc::CalcTuning defaults;
    EXPECT_DOUBLE_EQ(tuning.max_chip_thinning_multiplier, defaults.max_chip_thinning_multiplier);
    EXPECT_DOUBLE_EQ(tuning.power_divisor, defaults.power_divisor);
    EXPECT_DOUBLE_EQ(tuning.chip_thinning_threshold, defaults.chip_thinning_threshold);
    EXPECT_DOUBLE_EQ(tuning.spindle_load_warning, defaults.spindle_load_warning);
    EXPECT_DOUBLE_EQ(tuning.material_tolerance, defaults.material_tolerance);
    EXPECT_DOUBLE_EQ(tuning.hsm_max_engagement, defaults.hsm_max_engagement);
}

TEST_F(ConfigTest, Tuning_InRangeAccepted) {
    writeConfig("[tuning]\n"
                "max_chip_thinning_multiplier=3\n"
                "chip_thinning_threshold=0.4\n"
                "spindle_load_warning=1\n");

    auto& config = sfc::Config::instance();
    ASSERT_TRUE(config.loadFrom(m_configPath));
    EXPECT_DOUBLE_EQ(config.getTuning().max_chip_thinning_multiplier, 3.0);
    EXPECT_DOUBLE_EQ(config.getTuning().chip_thinning_threshold, 0.4);
    EXPECT_DOUBLE_EQ(config.getTuning().spindle_load_warning, 1.0);
}
