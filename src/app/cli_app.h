#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../core/cutting/calculation_report.h"
#include "../core/cutting/material_table.h"
#include "../core/cutting/rigidity_table.h"
#include "../core/types.h"

namespace sfc {

// Command-line options as typed. Lengths and chip load are in inches when
// `imperial` is set, millimeters otherwise.
struct CliOptions {
    // Tool
    std::optional<f64> diameter;
    std::optional<int> flutes;
    std::optional<f64> stickout;

    // Cut
    std::optional<f64> doc;
    std::optional<f64> woc;
    std::optional<f64> sfm;
    std::optional<f64> smm;
    std::optional<f64> chipLoad;
    std::optional<f64> kc;
    bool hsm = false;
    bool chipThinning = false;
    bool imperial = false;
    bool metric = false; // overrides an imperial config

    // Material / machine
    std::optional<std::string> material;
    std::optional<std::string> rigidity;
    std::optional<f64> minRpm;
    std::optional<f64> preferredRpm;
    std::optional<f64> maxRpm;
    std::optional<f64> spindleKw;

    // Files
    Path configPath;
    Path materialsPath;
    Path rigidityPath;
    bool saveConfig = false;

    // Output
    int maxWarnings = -1; // -1 = all
    bool listMaterials = false;
    bool listRigidity = false;
    bool verbose = false;
    bool help = false;
};

struct CliParseResult {
    CliOptions options;
    std::string error;

    bool ok() const { return error.empty(); }
};

// Parse argv-style arguments (without the program name)
CliParseResult parseCliArgs(const std::vector<std::string>& args);

std::string cliUsage(const char* programName);

// Build metric engine inputs from CLI options. Blank kc, surface speed and
// chip load are taken from the material when one is given.
MachiningInputs buildMachiningInputs(const CliOptions& options,
                                     const std::optional<MaterialData>& material,
                                     const std::string& defaultRigidity);

// Override configured machine limits with any given on the command line
MachineLimits buildMachineLimits(const CliOptions& options, const MachineLimits& configured);

// Human-readable report; maxWarnings < 0 prints every warning
std::string formatReport(const CalculationReport& report, bool imperial, int maxWarnings);

// Headless front end: loads config and tables, runs one calculation, prints it
class CliApp {
  public:
    explicit CliApp(CliOptions options);

    bool init();
    int run();

  private:
    void initLogging();
    void loadTables();
    int listTables() const;

    CliOptions m_options;
    Path m_configPath;
    MaterialTable m_materials;
    RigidityTable m_rigidity;
};

} // namespace sfc
