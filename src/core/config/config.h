#pragma once

#include <string>

#include "../cutting/feeds_speeds.h"
#include "../cutting/rpm_status.h"
#include "../types.h"

namespace sfc {

// Window geometry persisted across sessions (four integers)
struct WindowGeometry {
    int x = 100;
    int y = 100;
    int width = 1200;
    int height = 1100;
};

// Application configuration (persisted to config directory as INI)
class Config {
  public:
    // Singleton access
    static Config& instance();

    // Load/save configuration at the default location
    bool load();
    bool save();

    // Load/save configuration at an explicit location
    bool loadFrom(const Path& path);
    bool saveTo(const Path& path) const;

    // Restore all defaults
    void reset();

    // Config file path
    Path configFilePath() const { return getConfigFilePath(); }

    // Window state
    const WindowGeometry& getWindowGeometry() const { return m_window; }
    void setWindowGeometry(const WindowGeometry& g) { m_window = g; }

    // Machine limits and rigidity
    const MachineLimits& getMachineLimits() const { return m_machine; }
    void setMachineLimits(const MachineLimits& limits) { m_machine = limits; }

    const std::string& getRigidityLevel() const { return m_rigidityLevel; }
    void setRigidityLevel(const std::string& level) { m_rigidityLevel = level; }

    // Display units
    bool getDisplayUnitsMetric() const { return m_metric; }
    void setDisplayUnitsMetric(bool metric) { m_metric = metric; }

    // Log level (maps to log::Level enum)
    int getLogLevel() const { return m_logLevel; }
    void setLogLevel(int level) { m_logLevel = level; }

    bool getLogToFile() const { return m_logToFile; }
    void setLogToFile(bool v) { m_logToFile = v; }

    const Path& getLogFilePath() const { return m_logFilePath; }
    void setLogFilePath(const Path& p) { m_logFilePath = p; }

    // External lookup tables (empty = built-in defaults only)
    const Path& getMaterialsTablePath() const { return m_materialsPath; }
    void setMaterialsTablePath(const Path& p) { m_materialsPath = p; }

    const Path& getRigidityTablePath() const { return m_rigidityPath; }
    void setRigidityTablePath(const Path& p) { m_rigidityPath = p; }

    // Calculation constants
    const CalcTuning& getTuning() const { return m_tuning; }
    void setTuning(const CalcTuning& tuning) { m_tuning = tuning; }

  private:
    Config() = default;

    Path getConfigFilePath() const;
    void parse(const std::string& content);

    WindowGeometry m_window;
    MachineLimits m_machine;
    std::string m_rigidityLevel = RigidityTable::kDefaultLevel;
    bool m_metric = true;

    int m_logLevel = 1; // Info
    bool m_logToFile = false;
    Path m_logFilePath;

    Path m_materialsPath;
    Path m_rigidityPath;

    CalcTuning m_tuning;
};

} // namespace sfc
