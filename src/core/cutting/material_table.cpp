#include "material_table.h"

#include <cmath>
#include <utility>

#include <nlohmann/json.hpp>

#include "../utils/file_utils.h"
#include "../utils/log.h"
#include "units.h"

namespace sfc {

using json = nlohmann::json;

namespace {

bool isPositive(f64 v) {
    return std::isfinite(v) && v > 0.0;
}

MaterialData makeMaterial(const std::string& key,
                          const std::string& name,
                          f64 kc,
                          f64 sfm,
                          f64 chipLoadMm) {
    MaterialData m;
    m.key = key;
    m.name = name;
    m.kc = kc;
    m.sfm = sfm;
    m.smm = units::sfmToSmm(sfm);
    m.chip_load_mm = chipLoadMm;
    return m;
}

// Fill in whichever surface speed is missing
void deriveSurfaceSpeed(MaterialData& m) {
    if (m.smm <= 0.0 && m.sfm > 0.0) {
        m.smm = units::sfmToSmm(m.sfm);
    } else if (m.sfm <= 0.0 && m.smm > 0.0) {
        m.sfm = units::smmToSfm(m.smm);
    }
}

bool isValid(const MaterialData& m) {
    return !m.key.empty() && isPositive(m.kc) && isPositive(m.sfm) && isPositive(m.smm) &&
           isPositive(m.chip_load_mm);
}

} // namespace

MaterialTable MaterialTable::defaults() {
    MaterialTable table;

    // Carbide end mill starting points. kc values are for ~0.1 mm chip thickness.
    // Non-ferrous
    table.add(makeMaterial("aluminum_6061", "Aluminum 6061-T6", 700.0, 1000.0, 0.050));
    table.add(makeMaterial("aluminum_7075", "Aluminum 7075-T6", 850.0, 800.0, 0.050));
    table.add(makeMaterial("brass_360", "Brass C360", 780.0, 600.0, 0.050));
    table.add(makeMaterial("copper_110", "Copper C110", 1100.0, 400.0, 0.040));

    // Ferrous
    table.add(makeMaterial("steel_1018", "Mild Steel 1018", 1800.0, 400.0, 0.040));
    table.add(makeMaterial("steel_4140", "Alloy Steel 4140", 2100.0, 300.0, 0.035));
    table.add(makeMaterial("stainless_304", "Stainless Steel 304", 2300.0, 250.0, 0.030));
    table.add(makeMaterial("cast_iron", "Gray Cast Iron", 1100.0, 350.0, 0.050));

    // Exotic
    table.add(makeMaterial("titanium_6al4v", "Titanium Ti-6Al-4V", 1500.0, 150.0, 0.030));

    // Plastics
    table.add(makeMaterial("acrylic", "Acrylic (PMMA)", 150.0, 1000.0, 0.080));
    table.add(makeMaterial("delrin", "Acetal (Delrin)", 150.0, 800.0, 0.080));
    table.add(makeMaterial("hdpe", "HDPE", 100.0, 1000.0, 0.100));

    // Wood products
    table.add(makeMaterial("hardwood", "Hardwood (Oak, Maple)", 60.0, 1000.0, 0.150));
    table.add(makeMaterial("mdf", "MDF", 40.0, 1000.0, 0.150));

    return table;
}

std::optional<MaterialData> MaterialTable::lookup(std::string_view key) const {
    auto it = m_materials.find(key);
    if (it == m_materials.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MaterialTable::add(MaterialData material) {
    deriveSurfaceSpeed(material);
    if (!isValid(material)) {
        log::warningf("Materials", "Rejected material '%s': key, kc, speed and chip load are required",
                      material.key.c_str());
        return false;
    }
    if (material.name.empty()) {
        material.name = material.key;
    }
    std::string key = material.key;
    m_materials[key] = std::move(material);
    return true;
}

bool MaterialTable::loadJson(const std::string& jsonText) {
    std::vector<MaterialData> parsed;
    try {
        json doc = json::parse(jsonText);
        if (!doc.contains("materials") || !doc["materials"].is_array()) {
            log::error("Materials", "Material table is missing a 'materials' array");
            return false;
        }

        for (const auto& entry : doc["materials"]) {
            MaterialData m;
            m.key = entry.at("key").get<std::string>();
            m.name = entry.value("name", std::string{});
            m.kc = entry.at("kc").get<f64>();
            m.sfm = entry.value("sfm", 0.0);
            m.smm = entry.value("smm", 0.0);
            m.chip_load_mm = entry.at("chip_load_mm").get<f64>();
            deriveSurfaceSpeed(m);
            if (!isValid(m)) {
                log::errorf("Materials", "Invalid material entry '%s'", m.key.c_str());
                return false;
            }
            parsed.push_back(std::move(m));
        }
    } catch (const json::exception& e) {
        log::errorf("Materials", "Material table parse error: %s", e.what());
        return false;
    }

    for (auto& m : parsed) {
        if (m.name.empty()) {
            m.name = m.key;
        }
        std::string key = m.key;
        m_materials[key] = std::move(m);
    }
    log::debugf("Materials", "Loaded %zu materials", parsed.size());
    return true;
}

bool MaterialTable::loadFile(const Path& path) {
    auto text = file::readText(path);
    if (!text) {
        return false;
    }
    if (!loadJson(*text)) {
        log::errorf("Materials", "Failed to load material table %s", path.string().c_str());
        return false;
    }
    log::infof("Materials", "Loaded material table %s", path.string().c_str());
    return true;
}

std::vector<std::string> MaterialTable::keys() const {
    std::vector<std::string> result;
    result.reserve(m_materials.size());
    for (const auto& entry : m_materials) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace sfc
