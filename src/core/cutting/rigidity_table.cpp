#include "rigidity_table.h"

#include <cmath>
#include <utility>

#include <nlohmann/json.hpp>

#include "../utils/file_utils.h"
#include "../utils/log.h"
#include "cutting_error.h"

namespace sfc {

using json = nlohmann::json;

namespace {

bool isValid(const RigidityLevel& level) {
    return !level.key.empty() && std::isfinite(level.factor) && level.factor > 0.0;
}

} // namespace

RigidityTable RigidityTable::defaults() {
    RigidityTable table;
    table.add({"hobby", "Hobby Router", 0.50});
    table.add({"light", "Light Benchtop Mill", 0.70});
    table.add({"medium", "Medium Duty Mill", 0.85});
    table.add({"heavy", "Industrial VMC", 1.00});
    return table;
}

std::optional<RigidityLevel> RigidityTable::lookup(std::string_view key) const {
    auto it = m_levels.find(key);
    if (it == m_levels.end()) {
        return std::nullopt;
    }
    return it->second;
}

const RigidityLevel& RigidityTable::at(std::string_view key) const {
    auto it = m_levels.find(key);
    if (it == m_levels.end()) {
        throw CuttingError(CuttingErrorKind::InvalidConfig, "rigidity_level",
                           "unknown rigidity level '" + std::string(key) + "'");
    }
    return it->second;
}

bool RigidityTable::add(RigidityLevel level) {
    if (!isValid(level)) {
        log::warningf("Rigidity", "Rejected rigidity level '%s': factor must be positive",
                      level.key.c_str());
        return false;
    }
    if (level.name.empty()) {
        level.name = level.key;
    }
    std::string key = level.key;
    m_levels[key] = std::move(level);
    return true;
}

bool RigidityTable::loadJson(const std::string& jsonText) {
    std::vector<RigidityLevel> parsed;
    try {
        json doc = json::parse(jsonText);
        if (!doc.contains("rigidity_levels") || !doc["rigidity_levels"].is_array()) {
            log::error("Rigidity", "Rigidity table is missing a 'rigidity_levels' array");
            return false;
        }

        for (const auto& entry : doc["rigidity_levels"]) {
            RigidityLevel level;
            level.key = entry.at("key").get<std::string>();
            level.name = entry.value("name", level.key);
            level.factor = entry.at("factor").get<f64>();
            if (!isValid(level)) {
                log::errorf("Rigidity", "Invalid rigidity entry '%s'", level.key.c_str());
                return false;
            }
            parsed.push_back(std::move(level));
        }
    } catch (const json::exception& e) {
        log::errorf("Rigidity", "Rigidity table parse error: %s", e.what());
        return false;
    }

    for (auto& level : parsed) {
        std::string key = level.key;
        m_levels[key] = std::move(level);
    }
    log::debugf("Rigidity", "Loaded %zu rigidity levels", parsed.size());
    return true;
}

bool RigidityTable::loadFile(const Path& path) {
    auto text = file::readText(path);
    if (!text) {
        return false;
    }
    if (!loadJson(*text)) {
        log::errorf("Rigidity", "Failed to load rigidity table %s", path.string().c_str());
        return false;
    }
    log::infof("Rigidity", "Loaded rigidity table %s", path.string().c_str());
    return true;
}

std::vector<std::string> RigidityTable::keys() const {
    std::vector<std::string> result;
    result.reserve(m_levels.size());
    for (const auto& entry : m_levels) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace sfc
