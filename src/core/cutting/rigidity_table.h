#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../types.h"

namespace sfc {

// Machine-stiffness category. factor scales the depth/width/feed a machine can
// hold relative to a fully rigid machine (1.0).
struct RigidityLevel {
    std::string key;
    std::string name;
    f64 factor = 1.0;
};

// Read-only keyed rigidity source consumed by the calculation engine
class RigidityProvider {
  public:
    virtual ~RigidityProvider() = default;

    virtual std::optional<RigidityLevel> lookup(std::string_view key) const = 0;
};

// In-memory rigidity table. JSON form:
//   {"rigidity_levels": [{"key": "hobby", "name": "Hobby Router", "factor": 0.5}]}
class RigidityTable : public RigidityProvider {
  public:
    RigidityTable() = default;

    static RigidityTable defaults();

    // Key used when nothing else is configured
    static constexpr const char* kDefaultLevel = "medium";

    std::optional<RigidityLevel> lookup(std::string_view key) const override;

    // Hard lookup: throws CuttingError(InvalidConfig) when the key is unknown
    const RigidityLevel& at(std::string_view key) const;

    // Insert or replace by key. Rejects empty keys and non-positive factors.
    bool add(RigidityLevel level);

    // All-or-nothing merge, see MaterialTable::loadJson
    bool loadJson(const std::string& jsonText);
    bool loadFile(const Path& path);

    std::vector<std::string> keys() const;
    usize size() const { return m_levels.size(); }

  private:
    std::map<std::string, RigidityLevel, std::less<>> m_levels;
};

} // namespace sfc
