#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../types.h"

namespace sfc {

// Per-material cutting defaults (all metric except sfm)
struct MaterialData {
    std::string key;
    std::string name;
    f64 kc = 0.0;           // Specific cutting force (N/mm^2)
    f64 sfm = 0.0;          // Recommended surface speed (ft/min)
    f64 smm = 0.0;          // Recommended surface speed (m/min)
    f64 chip_load_mm = 0.0; // Recommended chip load (mm/tooth)
};

// Read-only keyed material source consumed by the calculation engine
class MaterialProvider {
  public:
    virtual ~MaterialProvider() = default;

    virtual std::optional<MaterialData> lookup(std::string_view key) const = 0;
};

// In-memory material table. Populated from built-in defaults and/or JSON:
//   {"materials": [{"key": "...", "name": "...", "kc": 700, "sfm": 1000, "chip_load_mm": 0.05}]}
// Either "sfm" or "smm" may be given; the missing one is derived.
class MaterialTable : public MaterialProvider {
  public:
    MaterialTable() = default;

    // Built-in curated defaults
    static MaterialTable defaults();

    std::optional<MaterialData> lookup(std::string_view key) const override;

    // Insert or replace by key. Rejects records with empty key or non-positive values.
    bool add(MaterialData material);

    // Merge entries from a JSON document. The document is applied all-or-nothing:
    // on any parse or validation error nothing is changed and false is returned.
    bool loadJson(const std::string& jsonText);
    bool loadFile(const Path& path);

    std::vector<std::string> keys() const;
    usize size() const { return m_materials.size(); }

  private:
    std::map<std::string, MaterialData, std::less<>> m_materials;
};

} // namespace sfc
