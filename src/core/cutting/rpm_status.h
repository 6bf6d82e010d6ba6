#pragma once

#include <string>

#include "../types.h"

namespace sfc {

// Caller-supplied machine bounds
struct MachineLimits {
    f64 min_rpm = 1000.0;
    f64 preferred_rpm = 10000.0;
    f64 max_rpm = 24000.0;
    f64 spindle_power_kw = 0.0; // 0 = unspecified
};

enum class RpmStatusLevel { Danger, Warning, Good, Info };

const char* rpmStatusLevelName(RpmStatusLevel level);

struct RpmStatus {
    RpmStatusLevel level = RpmStatusLevel::Info;
    std::string message;
};

// First match wins: below min, above max, within 10% of preferred,
// above 90% of max, below 110% of min, otherwise within safe range.
RpmStatus classifyRpm(f64 rpm, f64 minRpm, f64 preferredRpm, f64 maxRpm);
RpmStatus classifyRpm(f64 rpm, const MachineLimits& limits);

} // namespace sfc
