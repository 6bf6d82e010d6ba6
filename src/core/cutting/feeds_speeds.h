#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../types.h"
#include "cutting_error.h"
#include "material_table.h"
#include "rigidity_table.h"

namespace sfc {

// Constants behind chip thinning, power and advisory thresholds.
// Defaults follow the usual published machining relations.
struct CalcTuning {
    f64 chip_thinning_threshold = 0.5;      // radial engagement ratio below which chips thin
    f64 max_chip_thinning_multiplier = 5.0; // cap on feed-per-tooth compensation
    f64 power_divisor = 60.0e6;             // (mm^3/min * N/mm^2) -> kW
    f64 spindle_load_warning = 0.8;         // fraction of spindle capacity
    f64 material_tolerance = 0.5;           // +/- fraction around material recommendations
    f64 hsm_max_engagement = 0.3;           // HSM radial engagement ceiling
    f64 max_stickout_ratio = 4.0;           // stickout / diameter ceiling under HSM
    f64 base_doc_ratio = 1.0;               // axial depth / diameter on a fully rigid machine
    f64 base_doc_ratio_hsm = 2.0;           // same, for HSM toolpaths
    f64 base_woc_ratio = 1.0;               // radial width / diameter on a fully rigid machine
};

// Throws CuttingError(InvalidConfig) naming the first out-of-range constant.
// Thresholds and fractions lie in (0, 1] (chip thinning threshold in (0, 0.5]),
// the thinning cap is at least 1 and divisors and ratios are positive.
void validateTuning(const CalcTuning& tuning);

// Calculation inputs. All lengths in mm, surface speed in m/min.
struct MachiningInputs {
    // Tool
    f64 diameter = 0.0;
    int flute_num = 2;
    f64 tool_stickout = 0.0;

    // Cut
    f64 doc = 0.0;  // axial depth of cut
    f64 woc = 0.0;  // radial width of cut
    f64 smm = 0.0;  // surface speed
    f64 mmpt = 0.0; // nominal feed per tooth
    f64 kc = 0.0;   // specific cutting force (N/mm^2)

    // Strategy
    bool hsm_enabled = false;
    bool chip_thinning_enabled = false;

    // Machine
    std::string rigidity_level = RigidityTable::kDefaultLevel;
    f64 spindle_power_kw = 0.0; // 0 = unspecified

    // Material
    std::optional<std::string> material_type;
};

// Calculation outputs, rebuilt on every compute()
struct MachiningOutputs {
    f64 rpm = 0.0;
    f64 feed = 0.0;                 // mm/min
    f64 effective_mmpt = 0.0;       // commanded feed per tooth after compensation
    f64 chip_thinning_factor = 1.0; // actual chip / commanded feed per tooth
    f64 mrr = 0.0;                  // mm^3/min
    f64 power_kw = 0.0;
    f64 torque_nm = 0.0;

    f64 rigidity_factor = 1.0;
    std::string rigidity_name;
    std::string material_name;

    std::vector<std::string> warnings;
    std::vector<CuttingError> config_errors; // degraded lookups (InvalidConfig)
};

// Spindle speed, feed, MRR and power from tool/material/machine inputs.
// Set inputs(), call compute(), read outputs(). Every compute() starts from scratch.
class FeedsSpeedsCalculator {
  public:
    FeedsSpeedsCalculator(const MaterialProvider& materials,
                          const RigidityProvider& rigidity,
                          CalcTuning tuning = {}); // validated, see validateTuning

    MachiningInputs& inputs() { return m_inputs; }
    const MachiningInputs& inputs() const { return m_inputs; }
    const MachiningOutputs& outputs() const { return m_outputs; }
    const CalcTuning& tuning() const { return m_tuning; }

    // Runs the full calculation and returns the advisory warnings.
    // Throws CuttingError (InvalidInput / InvalidGeometry); outputs are reset first.
    std::vector<std::string> compute();

    // RPM = (SMM * 1000) / (pi * D)
    static f64 spindleSpeed(f64 smm, f64 diameterMm);

    // Ratio of actual to nominal chip thickness at a radial engagement ratio (woc / D).
    // 1.0 at or above half-diameter engagement, approaching 0 as engagement vanishes.
    static f64 chipThinningFactor(f64 engagementRatio);

    // Cutting power (kW) from MRR (mm^3/min) and kc (N/mm^2)
    static f64 cuttingPowerKw(f64 mrr, f64 kc, f64 powerDivisor);

    // Spindle torque (N*m) from power (kW) and spindle speed
    static f64 spindleTorqueNm(f64 powerKw, f64 rpm);

  private:
    void validateInputs() const;
    std::optional<MaterialData> resolveMaterial(MachiningOutputs& out) const;
    f64 applyChipThinning(f64 engagementRatio, MachiningOutputs& out) const;
    void checkPower(MachiningOutputs& out) const;
    void checkRigidity(const std::optional<MaterialData>& material, f64 multiplier,
                       MachiningOutputs& out) const;
    void checkMaterial(const MaterialData& material, MachiningOutputs& out) const;
    void checkHsm(f64 engagementRatio, MachiningOutputs& out) const;

    const MaterialProvider& m_materials;
    const RigidityProvider& m_rigidity;
    CalcTuning m_tuning;

    MachiningInputs m_inputs;
    MachiningOutputs m_outputs;
};

} // namespace sfc
