#include "rpm_status.h"

#include <cmath>

#include "../utils/string_utils.h"

namespace sfc {

namespace {

std::string rpmLabel(f64 rpm) {
    return "(" + str::formatRounded(rpm) + " RPM)";
}

} // namespace

const char* rpmStatusLevelName(RpmStatusLevel level) {
    switch (level) {
    case RpmStatusLevel::Danger: return "danger";
    case RpmStatusLevel::Warning: return "warning";
    case RpmStatusLevel::Good: return "good";
    case RpmStatusLevel::Info: return "info";
    }
    return "info";
}

RpmStatus classifyRpm(f64 rpm, f64 minRpm, f64 preferredRpm, f64 maxRpm) {
    // Outside machine limits
    if (rpm < minRpm) {
        return {RpmStatusLevel::Danger, "below minimum " + rpmLabel(minRpm)};
    }
    if (rpm > maxRpm) {
        return {RpmStatusLevel::Danger, "above maximum " + rpmLabel(maxRpm)};
    }

    // Close to preferred takes precedence over the limit warnings
    if (std::abs(rpm - preferredRpm) <= preferredRpm * 0.1) {
        return {RpmStatusLevel::Good, "near preferred " + rpmLabel(preferredRpm)};
    }

    if (rpm > maxRpm * 0.9) {
        return {RpmStatusLevel::Warning, "approaching maximum"};
    }
    if (rpm < minRpm * 1.1) {
        return {RpmStatusLevel::Warning, "near minimum"};
    }
    return {RpmStatusLevel::Info, "within safe range"};
}

RpmStatus classifyRpm(f64 rpm, const MachineLimits& limits) {
    return classifyRpm(rpm, limits.min_rpm, limits.preferred_rpm, limits.max_rpm);
}

} // namespace sfc
