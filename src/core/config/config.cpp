#include "config.h"

#include <iomanip>
#include <sstream>

#include "../cutting/cutting_error.h"
#include "../paths/app_paths.h"
#include "../utils/file_utils.h"
#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace sfc {

namespace {

bool parseBool(const std::string& value) {
    return value == "true" || value == "1";
}

f64* tuningField(CalcTuning& tuning, const std::string& key) {
    if (key == "chip_thinning_threshold") return &tuning.chip_thinning_threshold;
    if (key == "max_chip_thinning_multiplier") return &tuning.max_chip_thinning_multiplier;
    if (key == "power_divisor") return &tuning.power_divisor;
    if (key == "spindle_load_warning") return &tuning.spindle_load_warning;
    if (key == "material_tolerance") return &tuning.material_tolerance;
    if (key == "hsm_max_engagement") return &tuning.hsm_max_engagement;
    if (key == "max_stickout_ratio") return &tuning.max_stickout_ratio;
    return nullptr;
}

// A bad [tuning] value keeps the previous (valid) one
void parseTuningValue(CalcTuning& tuning, const std::string& key, const std::string& value) {
    CalcTuning candidate = tuning;
    f64* field = tuningField(candidate, key);
    if (!field) {
        return;
    }
    if (!str::parseDouble(value, *field)) {
        log::warningf("Config", "Ignoring [tuning] %s: '%s' is not a number", key.c_str(),
                      value.c_str());
        return;
    }

    try {
        validateTuning(candidate);
    } catch (const CuttingError& e) {
        log::warningf("Config", "Ignoring [tuning] %s: %s", key.c_str(), e.what());
        return;
    }
    tuning = candidate;
}

} // namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

Path Config::getConfigFilePath() const {
    return paths::getConfigDir() / "config.ini";
}

void Config::reset() {
    *this = Config();
}

bool Config::load() {
    return loadFrom(getConfigFilePath());
}

bool Config::save() {
    return saveTo(getConfigFilePath());
}

bool Config::loadFrom(const Path& configPath) {
    if (!file::exists(configPath)) {
        log::info("Config", "No config file found, using defaults");
        return true;
    }

    auto content = file::readText(configPath);
    if (!content) {
        log::error("Config", "Failed to read config file");
        return false;
    }

    parse(*content);
    log::debugf("Config", "Loaded %s", configPath.string().c_str());
    return true;
}

void Config::parse(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    std::string section;

    while (std::getline(stream, line)) {
        line = str::trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            section = line.substr(1, line.length() - 2);
            continue;
        }

        // Key=Value pair
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = str::trim(line.substr(0, pos));
        std::string value = str::trim(line.substr(pos + 1));

        // Parse based on section
        if (section == "window") {
            if (key == "x") {
                str::parseInt(value, m_window.x);
            } else if (key == "y") {
                str::parseInt(value, m_window.y);
            } else if (key == "width") {
                str::parseInt(value, m_window.width);
            } else if (key == "height") {
                str::parseInt(value, m_window.height);
            }
        } else if (section == "machine") {
            if (key == "min_rpm")
                str::parseDouble(value, m_machine.min_rpm);
            else if (key == "preferred_rpm")
                str::parseDouble(value, m_machine.preferred_rpm);
            else if (key == "max_rpm")
                str::parseDouble(value, m_machine.max_rpm);
            else if (key == "spindle_power_kw")
                str::parseDouble(value, m_machine.spindle_power_kw);
            else if (key == "rigidity_level" && !value.empty())
                m_rigidityLevel = value;
        } else if (section == "units") {
            if (key == "metric") {
                m_metric = parseBool(value);
            }
        } else if (section == "logging") {
            if (key == "level") {
                str::parseInt(value, m_logLevel);
            } else if (key == "to_file") {
                m_logToFile = parseBool(value);
            } else if (key == "file") {
                m_logFilePath = value;
            }
        } else if (section == "tables") {
            if (key == "materials") {
                m_materialsPath = value;
            } else if (key == "rigidity") {
                m_rigidityPath = value;
            }
        } else if (section == "tuning") {
            parseTuningValue(m_tuning, key, value);
        }
    }
}

bool Config::saveTo(const Path& configPath) const {
    // Ensure config directory exists
    if (!file::createDirectories(configPath.parent_path())) {
        log::error("Config", "Failed to create config directory");
        return false;
    }

    std::ostringstream ss;
    ss << std::setprecision(10);

    ss << "# Speeds & Feeds Calculator Configuration\n\n";

    ss << "[window]\n";
    ss << "x=" << m_window.x << "\n";
    ss << "y=" << m_window.y << "\n";
    ss << "width=" << m_window.width << "\n";
    ss << "height=" << m_window.height << "\n";
    ss << "\n";

    ss << "[machine]\n";
    ss << "min_rpm=" << m_machine.min_rpm << "\n";
    ss << "preferred_rpm=" << m_machine.preferred_rpm << "\n";
    ss << "max_rpm=" << m_machine.max_rpm << "\n";
    ss << "spindle_power_kw=" << m_machine.spindle_power_kw << "\n";
    ss << "rigidity_level=" << m_rigidityLevel << "\n";
    ss << "\n";

    ss << "[units]\n";
    ss << "metric=" << (m_metric ? "true" : "false") << "\n";
    ss << "\n";

    ss << "[logging]\n";
    ss << "level=" << m_logLevel << "\n";
    ss << "to_file=" << (m_logToFile ? "true" : "false") << "\n";
    if (!m_logFilePath.empty()) {
        ss << "file=" << m_logFilePath.string() << "\n";
    }
    ss << "\n";

    ss << "[tables]\n";
    if (!m_materialsPath.empty()) {
        ss << "materials=" << m_materialsPath.string() << "\n";
    }
    if (!m_rigidityPath.empty()) {
        ss << "rigidity=" << m_rigidityPath.string() << "\n";
    }
    ss << "\n";

    ss << "[tuning]\n";
    ss << "chip_thinning_threshold=" << m_tuning.chip_thinning_threshold << "\n";
    ss << "max_chip_thinning_multiplier=" << m_tuning.max_chip_thinning_multiplier << "\n";
    ss << "power_divisor=" << m_tuning.power_divisor << "\n";
    ss << "spindle_load_warning=" << m_tuning.spindle_load_warning << "\n";
    ss << "material_tolerance=" << m_tuning.material_tolerance << "\n";
    ss << "hsm_max_engagement=" << m_tuning.hsm_max_engagement << "\n";
    ss << "max_stickout_ratio=" << m_tuning.max_stickout_ratio << "\n";

    if (!file::writeText(configPath, ss.str())) {
        log::error("Config", "Failed to write config file");
        return false;
    }

    log::debugf("Config", "Saved %s", configPath.string().c_str());
    return true;
}

} // namespace sfc
