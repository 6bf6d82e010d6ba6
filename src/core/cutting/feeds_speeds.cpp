#include "feeds_speeds.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

#include "../utils/log.h"
#include "../utils/string_utils.h"
#include "units.h"

namespace sfc {

namespace {

std::string mm(f64 v) {
    return str::formatFixed(v, 2) + " mm";
}

std::string percent(f64 ratio) {
    return str::formatFixed(ratio * 100.0, 0) + "%";
}

void requirePositive(f64 value, const char* field) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw CuttingError(CuttingErrorKind::InvalidInput, field,
                           "must be a positive finite number, got " + std::to_string(value));
    }
}

void requireNonNegative(f64 value, const char* field) {
    if (!std::isfinite(value) || value < 0.0) {
        throw CuttingError(CuttingErrorKind::InvalidInput, field,
                           "must be zero or a positive finite number, got " + std::to_string(value));
    }
}

void requireTuningRange(f64 value, const char* field, f64 min, bool minInclusive, f64 max) {
    bool aboveMin = minInclusive ? value >= min : value > min;
    if (!std::isfinite(value) || !aboveMin || value > max) {
        throw CuttingError(CuttingErrorKind::InvalidConfig, field,
                           "out of range, got " + std::to_string(value));
    }
}

} // namespace

void validateTuning(const CalcTuning& t) {
    constexpr f64 kUnbounded = std::numeric_limits<f64>::max();

    requireTuningRange(t.chip_thinning_threshold, "chip_thinning_threshold", 0.0, false, 0.5);
    requireTuningRange(t.max_chip_thinning_multiplier, "max_chip_thinning_multiplier", 1.0, true,
                       kUnbounded);
    requireTuningRange(t.power_divisor, "power_divisor", 0.0, false, kUnbounded);
    requireTuningRange(t.spindle_load_warning, "spindle_load_warning", 0.0, false, 1.0);
    requireTuningRange(t.material_tolerance, "material_tolerance", 0.0, false, 1.0);
    requireTuningRange(t.hsm_max_engagement, "hsm_max_engagement", 0.0, false, 1.0);
    requireTuningRange(t.max_stickout_ratio, "max_stickout_ratio", 0.0, false, kUnbounded);
    requireTuningRange(t.base_doc_ratio, "base_doc_ratio", 0.0, false, kUnbounded);
    requireTuningRange(t.base_doc_ratio_hsm, "base_doc_ratio_hsm", 0.0, false, kUnbounded);
    requireTuningRange(t.base_woc_ratio, "base_woc_ratio", 0.0, false, kUnbounded);
}

FeedsSpeedsCalculator::FeedsSpeedsCalculator(const MaterialProvider& materials,
                                             const RigidityProvider& rigidity,
                                             CalcTuning tuning)
    : m_materials(materials), m_rigidity(rigidity), m_tuning(tuning) {
    validateTuning(m_tuning);
}

f64 FeedsSpeedsCalculator::spindleSpeed(f64 smm, f64 diameterMm) {
    return (smm * 1000.0) / (units::kPi * diameterMm);
}

f64 FeedsSpeedsCalculator::chipThinningFactor(f64 engagementRatio) {
    if (engagementRatio >= 0.5) return 1.0;
    if (engagementRatio <= 0.0) return 0.0;

    // sin of half the engagement angle: sqrt(1 - (1 - 2*ae/D)^2)
    f64 x = 1.0 - 2.0 * engagementRatio;
    return std::sqrt(1.0 - x * x);
}

f64 FeedsSpeedsCalculator::cuttingPowerKw(f64 mrr, f64 kc, f64 powerDivisor) {
    return (mrr * kc) / powerDivisor;
}

f64 FeedsSpeedsCalculator::spindleTorqueNm(f64 powerKw, f64 rpm) {
    if (rpm <= 0.0) return 0.0;
    f64 omega = 2.0 * units::kPi * rpm / 60.0; // rad/s
    return powerKw * 1000.0 / omega;
}

void FeedsSpeedsCalculator::validateInputs() const {
    const auto& in = m_inputs;

    requirePositive(in.diameter, "diameter");
    if (in.flute_num < 1) {
        throw CuttingError(CuttingErrorKind::InvalidInput, "flute_num",
                           "must be at least 1, got " + std::to_string(in.flute_num));
    }
    requirePositive(in.smm, "smm");
    requirePositive(in.mmpt, "mmpt");
    requirePositive(in.kc, "kc");
    requireNonNegative(in.doc, "doc");
    requireNonNegative(in.woc, "woc");
    requireNonNegative(in.tool_stickout, "tool_stickout");
    requireNonNegative(in.spindle_power_kw, "spindle_power_kw");

    if (in.woc > in.diameter) {
        throw CuttingError(CuttingErrorKind::InvalidGeometry, "woc",
                           "width of cut " + mm(in.woc) + " exceeds tool diameter " +
                               mm(in.diameter));
    }
}

std::vector<std::string> FeedsSpeedsCalculator::compute() {
    m_outputs = MachiningOutputs{};
    validateInputs();

    const auto& in = m_inputs;
    MachiningOutputs out;

    // 1. Spindle speed
    out.rpm = spindleSpeed(in.smm, in.diameter);
    if (!std::isfinite(out.rpm)) {
        throw CuttingError(CuttingErrorKind::InvalidInput, "diameter",
                           "spindle speed is not finite for diameter " + mm(in.diameter));
    }

    std::optional<MaterialData> material = resolveMaterial(out);

    // 2. Chip thinning compensation
    f64 engagementRatio = in.woc / in.diameter;
    f64 multiplier = applyChipThinning(engagementRatio, out);
    out.effective_mmpt = in.mmpt * multiplier;

    // 3-5. Feed, removal rate, power and torque
    out.feed = out.rpm * in.flute_num * out.effective_mmpt;
    out.mrr = in.doc * in.woc * out.feed;
    out.power_kw = cuttingPowerKw(out.mrr, in.kc, m_tuning.power_divisor);
    out.torque_nm = spindleTorqueNm(out.power_kw, out.rpm);
    checkPower(out);

    // 6-8. Advisories
    checkRigidity(material, multiplier, out);
    if (material) {
        checkMaterial(*material, out);
    }
    checkHsm(engagementRatio, out);

    log::debugf("Calculator", "rpm=%.0f feed=%.1f mm/min mrr=%.0f mm3/min power=%.3f kW warnings=%zu",
                out.rpm, out.feed, out.mrr, out.power_kw, out.warnings.size());

    m_outputs = std::move(out);
    return m_outputs.warnings;
}

std::optional<MaterialData> FeedsSpeedsCalculator::resolveMaterial(MachiningOutputs& out) const {
    const auto& key = m_inputs.material_type;
    if (!key || key->empty()) {
        return std::nullopt;
    }

    auto material = m_materials.lookup(*key);
    if (!material) {
        // Unknown material: fall back to the manually supplied kc/smm/mmpt
        out.config_errors.emplace_back(CuttingErrorKind::InvalidConfig, "material_type",
                                       "unknown material '" + *key + "'");
        log::debugf("Calculator", "Material '%s' not found, using manual values", key->c_str());
        return std::nullopt;
    }

    out.material_name = material->name;
    return material;
}

f64 FeedsSpeedsCalculator::applyChipThinning(f64 engagementRatio, MachiningOutputs& out) const {
    const auto& in = m_inputs;
    if (engagementRatio >= m_tuning.chip_thinning_threshold) {
        return 1.0;
    }

    f64 tf = chipThinningFactor(engagementRatio);
    out.chip_thinning_factor = tf;

    if (in.chip_thinning_enabled && in.hsm_enabled) {
        f64 cap = m_tuning.max_chip_thinning_multiplier;
        if (tf * cap <= 1.0) {
            out.warnings.push_back("Radial engagement of " + percent(engagementRatio) +
                                   " is very low; chip thinning compensation capped at " +
                                   str::formatFixed(cap, 1) + "x feed per tooth");
            return cap;
        }
        return 1.0 / tf;
    }

    if (in.chip_thinning_enabled) {
        out.warnings.push_back("Reduced radial engagement (" + percent(engagementRatio) +
                               ") produces thin chips (" + percent(tf) +
                               " of feed per tooth); enable HSM to compensate feed");
    } else if (in.hsm_enabled) {
        out.warnings.push_back("Chip thinning compensation is off; at " + percent(engagementRatio) +
                               " radial engagement the actual chip is " + percent(tf) +
                               " of feed per tooth");
    }
    return 1.0;
}

void FeedsSpeedsCalculator::checkPower(MachiningOutputs& out) const {
    f64 capacity = m_inputs.spindle_power_kw;
    if (capacity <= 0.0) {
        return;
    }

    std::string power = str::formatFixed(out.power_kw, 2) + " kW";
    std::string spindle = str::formatFixed(capacity, 2) + " kW";
    if (out.power_kw > capacity) {
        out.warnings.push_back("Estimated cutting power " + power + " exceeds spindle capacity " +
                               spindle);
    } else if (out.power_kw > capacity * m_tuning.spindle_load_warning) {
        out.warnings.push_back("Estimated cutting power " + power + " is above " +
                               percent(m_tuning.spindle_load_warning) + " of spindle capacity " +
                               spindle);
    }
}

void FeedsSpeedsCalculator::checkRigidity(const std::optional<MaterialData>& material,
                                          f64 multiplier,
                                          MachiningOutputs& out) const {
    const auto& in = m_inputs;

    auto level = m_rigidity.lookup(in.rigidity_level);
    if (!level) {
        CuttingError err(CuttingErrorKind::InvalidConfig, "rigidity_level",
                         "unknown rigidity level '" + in.rigidity_level + "'");
        log::warningf("Calculator", "%s", err.what());
        out.config_errors.push_back(err);
        out.warnings.push_back("Rigidity level '" + in.rigidity_level +
                               "' is not configured; rigidity checks skipped");
        return;
    }

    out.rigidity_factor = level->factor;
    out.rigidity_name = level->name;
    std::string machine = level->name + " rigidity (" + str::formatFixed(level->factor, 2) + ")";

    f64 docRatio = in.hsm_enabled ? m_tuning.base_doc_ratio_hsm : m_tuning.base_doc_ratio;
    f64 maxDoc = in.diameter * docRatio * level->factor;
    if (in.doc > maxDoc) {
        out.warnings.push_back("Depth of cut " + mm(in.doc) + " exceeds " + mm(maxDoc) +
                               " allowed for " + machine);
    }

    f64 maxWoc = in.diameter * m_tuning.base_woc_ratio * level->factor;
    if (in.woc > maxWoc) {
        out.warnings.push_back("Width of cut " + mm(in.woc) + " exceeds " + mm(maxWoc) +
                               " allowed for " + machine);
    }

    // Feed needs a reference chip load, which only a known material provides
    if (material) {
        f64 maxFeed = out.rpm * in.flute_num * (material->chip_load_mm * multiplier) * level->factor;
        if (out.feed > maxFeed) {
            out.warnings.push_back("Feed rate " + str::formatFixed(out.feed, 0) + " mm/min exceeds " +
                                   str::formatFixed(maxFeed, 0) + " mm/min allowed for " + machine);
        }
    }
}

void FeedsSpeedsCalculator::checkMaterial(const MaterialData& material,
                                          MachiningOutputs& out) const {
    const auto& in = m_inputs;
    f64 tol = m_tuning.material_tolerance;

    std::string speed = str::formatFixed(in.smm, 0) + " m/min";
    std::string recSpeed = str::formatFixed(material.smm, 0) + " m/min";
    if (in.smm < material.smm * (1.0 - tol)) {
        out.warnings.push_back("Surface speed " + speed + " is well below the " + recSpeed +
                               " recommended for " + material.name);
    } else if (in.smm > material.smm * (1.0 + tol)) {
        out.warnings.push_back("Surface speed " + speed + " is well above the " + recSpeed +
                               " recommended for " + material.name + "; expect rapid tool wear");
    }

    // No engagement means no chip to compare
    if (in.woc <= 0.0) {
        return;
    }

    f64 chip = out.effective_mmpt * out.chip_thinning_factor;
    std::string chipStr = str::formatFixed(chip, 3) + " mm";
    std::string recChip = str::formatFixed(material.chip_load_mm, 3) + " mm";
    if (chip < material.chip_load_mm * (1.0 - tol)) {
        out.warnings.push_back("Actual chip thickness " + chipStr + " is below the " + recChip +
                               " recommended for " + material.name + "; the tool may rub");
    } else if (chip > material.chip_load_mm * (1.0 + tol)) {
        out.warnings.push_back("Actual chip thickness " + chipStr + " is above the " + recChip +
                               " recommended for " + material.name + "; risk of tool breakage");
    }
}

void FeedsSpeedsCalculator::checkHsm(f64 engagementRatio, MachiningOutputs& out) const {
    const auto& in = m_inputs;
    if (!in.hsm_enabled) {
        return;
    }

    if (engagementRatio > m_tuning.hsm_max_engagement) {
        out.warnings.push_back("HSM toolpaths work best at or below " +
                               percent(m_tuning.hsm_max_engagement) + " radial engagement (currently " +
                               percent(engagementRatio) + ")");
    }

    f64 maxStickout = in.diameter * m_tuning.max_stickout_ratio;
    if (in.tool_stickout > maxStickout) {
        out.warnings.push_back("Tool stickout " + mm(in.tool_stickout) + " is over " +
                               str::formatFixed(m_tuning.max_stickout_ratio, 1) +
                               "x diameter; expect chatter at HSM speeds");
    }
}

} // namespace sfc
