#include "cli_app.h"

#include <cmath>
#include <cstdio>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <utility>

#ifndef _WIN32
    #include <unistd.h>
#endif

#include "../core/config/config.h"
#include "../core/cutting/cutting_error.h"
#include "../core/cutting/units.h"
#include "../core/paths/app_paths.h"
#include "../core/utils/file_utils.h"
#include "../core/utils/log.h"
#include "../core/utils/string_utils.h"

namespace sfc {

namespace {

// Default cut geometry relative to tool diameter when not given
constexpr f64 kDefaultDocRatio = 1.0;
constexpr f64 kDefaultWocRatio = 0.5;

using DoubleSetter = std::function<void(CliOptions&, f64)>;
using StringSetter = std::function<void(CliOptions&, const std::string&)>;
using FlagSetter = std::function<void(CliOptions&)>;

const std::map<std::string, DoubleSetter>& doubleOptions() {
    static const std::map<std::string, DoubleSetter> options = {
        {"--diameter", [](CliOptions& o, f64 v) { o.diameter = v; }},
        {"--stickout", [](CliOptions& o, f64 v) { o.stickout = v; }},
        {"--doc", [](CliOptions& o, f64 v) { o.doc = v; }},
        {"--woc", [](CliOptions& o, f64 v) { o.woc = v; }},
        {"--sfm", [](CliOptions& o, f64 v) { o.sfm = v; }},
        {"--smm", [](CliOptions& o, f64 v) { o.smm = v; }},
        {"--chipload", [](CliOptions& o, f64 v) { o.chipLoad = v; }},
        {"--kc", [](CliOptions& o, f64 v) { o.kc = v; }},
        {"--min-rpm", [](CliOptions& o, f64 v) { o.minRpm = v; }},
        {"--preferred-rpm", [](CliOptions& o, f64 v) { o.preferredRpm = v; }},
        {"--max-rpm", [](CliOptions& o, f64 v) { o.maxRpm = v; }},
        {"--spindle-kw", [](CliOptions& o, f64 v) { o.spindleKw = v; }},
    };
    return options;
}

const std::map<std::string, StringSetter>& stringOptions() {
    static const std::map<std::string, StringSetter> options = {
        {"--material", [](CliOptions& o, const std::string& v) { o.material = v; }},
        {"--rigidity", [](CliOptions& o, const std::string& v) { o.rigidity = v; }},
        {"--config", [](CliOptions& o, const std::string& v) { o.configPath = v; }},
        {"--materials", [](CliOptions& o, const std::string& v) { o.materialsPath = v; }},
        {"--rigidity-table", [](CliOptions& o, const std::string& v) { o.rigidityPath = v; }},
    };
    return options;
}

const std::map<std::string, FlagSetter>& flagOptions() {
    static const std::map<std::string, FlagSetter> options = {
        {"--hsm", [](CliOptions& o) { o.hsm = true; }},
        {"--chip-thinning", [](CliOptions& o) { o.chipThinning = true; }},
        {"--imperial", [](CliOptions& o) { o.imperial = true; }},
        {"--metric", [](CliOptions& o) { o.metric = true; }},
        {"--save-config", [](CliOptions& o) { o.saveConfig = true; }},
        {"--list-materials", [](CliOptions& o) { o.listMaterials = true; }},
        {"--list-rigidity", [](CliOptions& o) { o.listRigidity = true; }},
        {"--verbose", [](CliOptions& o) { o.verbose = true; }},
        {"--help", [](CliOptions& o) { o.help = true; }},
        {"-h", [](CliOptions& o) { o.help = true; }},
    };
    return options;
}

std::string grouped(f64 value) {
    return str::formatRounded(value);
}

} // namespace

CliParseResult parseCliArgs(const std::vector<std::string>& args) {
    CliParseResult result;
    CliOptions& opts = result.options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto flag = flagOptions().find(arg);
        if (flag != flagOptions().end()) {
            flag->second(opts);
            continue;
        }

        bool needsValue = doubleOptions().count(arg) > 0 || stringOptions().count(arg) > 0 ||
                          arg == "--flutes" || arg == "--max-warnings";
        if (!needsValue) {
            result.error = "Unknown option: " + arg;
            return result;
        }
        if (i + 1 >= args.size()) {
            result.error = "Missing value for " + arg;
            return result;
        }
        const std::string& value = args[++i];

        if (arg == "--flutes" || arg == "--max-warnings") {
            int n = 0;
            if (!str::parseInt(value, n)) {
                result.error = "Expected an integer for " + arg + ", got '" + value + "'";
                return result;
            }
            if (arg == "--flutes") {
                opts.flutes = n;
            } else {
                opts.maxWarnings = n;
            }
            continue;
        }

        auto dbl = doubleOptions().find(arg);
        if (dbl != doubleOptions().end()) {
            f64 v = 0.0;
            if (!str::parseDouble(value, v)) {
                result.error = "Expected a number for " + arg + ", got '" + value + "'";
                return result;
            }
            dbl->second(opts, v);
            continue;
        }

        stringOptions().at(arg)(opts, value);
    }

    if (opts.sfm && opts.smm) {
        result.error = "Give either --sfm or --smm, not both";
    } else if (opts.imperial && opts.metric) {
        result.error = "Give either --imperial or --metric, not both";
    }
    return result;
}

std::string cliUsage(const char* programName) {
    std::ostringstream ss;
    ss << "Usage: " << programName << " --diameter D [options]\n"
       << "\n"
       << "Tool and cut (mm, or inches with --imperial):\n"
       << "  --diameter D         Tool diameter\n"
       << "  --flutes N           Flute count (default 2)\n"
       << "  --doc D              Axial depth of cut (default 1.0 x diameter)\n"
       << "  --woc W              Radial width of cut (default 0.5 x diameter)\n"
       << "  --stickout L         Unsupported tool length\n"
       << "  --sfm S | --smm S    Surface speed (ft/min or m/min)\n"
       << "  --chipload C         Feed per tooth\n"
       << "  --kc K               Specific cutting force (N/mm^2)\n"
       << "  --hsm                High-speed machining toolpath\n"
       << "  --chip-thinning      Compensate feed for chip thinning (requires --hsm)\n"
       << "  --imperial           Inputs and outputs in inches\n"
       << "  --metric             Inputs and outputs in mm (overrides config)\n"
       << "\n"
       << "Material and machine:\n"
       << "  --material KEY       Fill blank kc / speed / chip load from the material table\n"
       << "  --rigidity KEY       Machine rigidity level\n"
       << "  --min-rpm N  --preferred-rpm N  --max-rpm N  --spindle-kw P\n"
       << "\n"
       << "Files and output:\n"
       << "  --config FILE        Config file (default: user config directory)\n"
       << "  --materials FILE     Material table (JSON)\n"
       << "  --rigidity-table FILE  Rigidity table (JSON)\n"
       << "  --save-config        Store machine settings back to the config file\n"
       << "  --max-warnings N     Show at most N warnings\n"
       << "  --list-materials     List material keys\n"
       << "  --list-rigidity      List rigidity levels\n"
       << "  --verbose            Debug logging\n";
    return ss.str();
}

MachiningInputs buildMachiningInputs(const CliOptions& options,
                                     const std::optional<MaterialData>& material,
                                     const std::string& defaultRigidity) {
    // Lengths arrive in the display unit
    auto toMm = [&](f64 v) { return options.imperial ? units::inchToMm(v) : v; };

    MachiningInputs in;
    in.diameter = options.diameter ? toMm(*options.diameter) : 0.0;
    in.flute_num = options.flutes.value_or(2);
    in.tool_stickout = options.stickout ? toMm(*options.stickout) : 0.0;
    in.doc = options.doc ? toMm(*options.doc) : in.diameter * kDefaultDocRatio;
    in.woc = options.woc ? toMm(*options.woc) : in.diameter * kDefaultWocRatio;

    if (options.smm) {
        in.smm = *options.smm;
    } else if (options.sfm) {
        in.smm = units::sfmToSmm(*options.sfm);
    } else if (material) {
        in.smm = material->smm;
    }

    if (options.chipLoad) {
        in.mmpt = toMm(*options.chipLoad);
    } else if (material) {
        in.mmpt = material->chip_load_mm;
    }

    if (options.kc) {
        in.kc = *options.kc;
    } else if (material) {
        in.kc = material->kc;
    }

    in.hsm_enabled = options.hsm;
    in.chip_thinning_enabled = options.chipThinning;
    in.rigidity_level = options.rigidity.value_or(defaultRigidity);
    in.material_type = options.material;
    return in;
}

MachineLimits buildMachineLimits(const CliOptions& options, const MachineLimits& configured) {
    MachineLimits limits = configured;
    if (options.minRpm) limits.min_rpm = *options.minRpm;
    if (options.preferredRpm) limits.preferred_rpm = *options.preferredRpm;
    if (options.maxRpm) limits.max_rpm = *options.maxRpm;
    if (options.spindleKw) limits.spindle_power_kw = *options.spindleKw;
    return limits;
}

std::string formatReport(const CalculationReport& report, bool imperial, int maxWarnings) {
    const auto& out = report.outputs;
    std::ostringstream ss;

    ss << "Spindle speed : " << grouped(out.rpm) << " RPM  ["
       << rpmStatusLevelName(report.rpm_status.level) << ": " << report.rpm_status.message << "]\n";

    if (imperial) {
        ss << "Feed rate     : " << str::formatFixed(units::mmToInch(out.feed), 1) << " in/min\n";
        ss << "Chip load     : " << str::formatFixed(units::mmToInch(out.effective_mmpt), 4)
           << " in/tooth";
    } else {
        ss << "Feed rate     : " << grouped(out.feed) << " mm/min\n";
        ss << "Chip load     : " << str::formatFixed(out.effective_mmpt, 3) << " mm/tooth";
    }
    if (out.chip_thinning_factor < 1.0) {
        ss << " (thinning factor " << str::formatFixed(out.chip_thinning_factor, 2) << ")";
    }
    ss << "\n";

    if (imperial) {
        f64 in3 = units::mmToInch(units::mmToInch(units::mmToInch(out.mrr)));
        ss << "MRR           : " << str::formatFixed(in3, 2) << " in^3/min\n";
    } else {
        ss << "MRR           : " << grouped(out.mrr) << " mm^3/min\n";
    }
    ss << "Power         : " << str::formatFixed(out.power_kw, 2) << " kW\n";
    ss << "Torque        : " << str::formatFixed(out.torque_nm, 2) << " N*m\n";

    if (!out.rigidity_name.empty()) {
        ss << "Rigidity      : " << out.rigidity_name << " ("
           << str::formatFixed(out.rigidity_factor, 2) << ")\n";
    }
    if (!out.material_name.empty()) {
        ss << "Material      : " << out.material_name << "\n";
    }

    const auto& warnings = report.warnings;
    if (!warnings.empty()) {
        size_t shown = warnings.size();
        if (maxWarnings >= 0 && static_cast<size_t>(maxWarnings) < shown) {
            shown = static_cast<size_t>(maxWarnings);
        }
        ss << "\nWarnings";
        if (shown < warnings.size()) {
            ss << " (" << shown << " of " << warnings.size() << " shown)";
        }
        ss << ":\n";
        for (size_t i = 0; i < shown; ++i) {
            ss << "  - " << warnings[i] << "\n";
        }
    }

    return ss.str();
}

CliApp::CliApp(CliOptions options)
    : m_options(std::move(options)), m_materials(MaterialTable::defaults()),
      m_rigidity(RigidityTable::defaults()) {}

bool CliApp::init() {
    auto& config = Config::instance();
    m_configPath = m_options.configPath.empty() ? config.configFilePath() : m_options.configPath;
    if (!config.loadFrom(m_configPath)) {
        std::cerr << "Error: could not read config file " << m_configPath.string() << "\n";
        return false;
    }

    initLogging();
    loadTables();
    return true;
}

void CliApp::initLogging() {
    const auto& config = Config::instance();

    log::setLevel(m_options.verbose ? log::Level::Debug : log::levelFromInt(config.getLogLevel()));
#ifndef _WIN32
    log::setColorEnabled(isatty(fileno(stderr)) != 0);
#endif

    if (config.getLogToFile()) {
        Path logPath = config.getLogFilePath().empty() ? paths::getLogPath() : config.getLogFilePath();
        if (!file::createDirectories(logPath.parent_path()) || !log::setLogFile(logPath.string())) {
            log::warningf("App", "Cannot open log file %s; logging to console only",
                          logPath.string().c_str());
        }
    }
}

void CliApp::loadTables() {
    const auto& config = Config::instance();

    // Command line beats config, config beats the per-user default location
    Path materialsPath = m_options.materialsPath;
    if (materialsPath.empty()) materialsPath = config.getMaterialsTablePath();
    if (materialsPath.empty() && file::isFile(paths::getDefaultMaterialsPath())) {
        materialsPath = paths::getDefaultMaterialsPath();
    }

    Path rigidityPath = m_options.rigidityPath;
    if (rigidityPath.empty()) rigidityPath = config.getRigidityTablePath();
    if (rigidityPath.empty() && file::isFile(paths::getDefaultRigidityPath())) {
        rigidityPath = paths::getDefaultRigidityPath();
    }

    if (!materialsPath.empty() && !m_materials.loadFile(materialsPath)) {
        log::warning("App", "Continuing with built-in materials");
    }
    if (!rigidityPath.empty() && !m_rigidity.loadFile(rigidityPath)) {
        log::warning("App", "Continuing with built-in rigidity levels");
    }
}

int CliApp::listTables() const {
    if (m_options.listMaterials) {
        std::cout << "Materials:\n";
        for (const auto& key : m_materials.keys()) {
            auto m = m_materials.lookup(key);
            std::cout << "  " << key << "  " << m->name << "  (kc " << grouped(m->kc) << " N/mm^2, "
                      << grouped(m->sfm) << " SFM, " << str::formatFixed(m->chip_load_mm, 3)
                      << " mm/tooth)\n";
        }
    }
    if (m_options.listRigidity) {
        std::cout << "Rigidity levels:\n";
        for (const auto& key : m_rigidity.keys()) {
            const auto& level = m_rigidity.at(key);
            std::cout << "  " << key << "  " << level.name << "  (factor "
                      << str::formatFixed(level.factor, 2) << ")\n";
        }
    }
    return 0;
}

int CliApp::run() {
    if (m_options.listMaterials || m_options.listRigidity) {
        return listTables();
    }

    auto& config = Config::instance();

    // Explicit flag first, then the configured display units
    CliOptions options = m_options;
    options.imperial = m_options.imperial || (!m_options.metric && !config.getDisplayUnitsMetric());
    bool imperial = options.imperial;

    std::optional<MaterialData> material;
    if (m_options.material) {
        material = m_materials.lookup(*m_options.material);
        if (!material) {
            log::warningf("App", "Unknown material '%s'; using manual values",
                          m_options.material->c_str());
        }
    }

    FeedsSpeedsCalculator calculator(m_materials, m_rigidity, config.getTuning());
    calculator.inputs() = buildMachiningInputs(options, material, config.getRigidityLevel());
    MachineLimits limits = buildMachineLimits(options, config.getMachineLimits());

    // Unknown rigidity is not fatal: the engine skips its rigidity checks
    try {
        const auto& level = m_rigidity.at(calculator.inputs().rigidity_level);
        log::debugf("App", "Rigidity: %s (%.2f)", level.name.c_str(), level.factor);
    } catch (const CuttingError& e) {
        log::warning("App", e.what());
    }

    CalculationReport report;
    try {
        report = runCalculation(calculator, limits);
    } catch (const CuttingError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << formatReport(report, imperial, m_options.maxWarnings);

    if (m_options.saveConfig) {
        config.setMachineLimits(limits);
        config.setRigidityLevel(calculator.inputs().rigidity_level);
        config.setDisplayUnitsMetric(!imperial);
        if (!config.saveTo(m_configPath)) {
            std::cerr << "Error: could not save config file " << m_configPath.string() << "\n";
            return 1;
        }
    }
    return 0;
}

} // namespace sfc
