#pragma once

#include <string>
#include <vector>

#include "../types.h"

namespace sfc {

// Thresholds for the independent sanity checks
struct ValidationLimits {
    f64 min_engagement_ratio = 0.02;      // woc / D at or below this is near-zero engagement
    f64 full_slot_ratio = 0.95;           // woc / D at or above this is slotting
    f64 max_feed_per_rev_ratio = 0.2;     // (feed / rpm) / D
    f64 max_doc_ratio = 2.0;              // doc / D before deflection becomes a concern
    f64 max_plausible_rpm = 60000.0;
};

// Cross-check computed RPM/feed against the raw cut geometry.
// Pure: any finite input yields warnings, never an error. Non-finite input
// throws CuttingError(InvalidInput) naming the argument.
std::vector<std::string> validateMachiningParameters(f64 rpm, f64 feed, f64 doc, f64 woc,
                                                     f64 diameter,
                                                     const ValidationLimits& limits = {});

} // namespace sfc
