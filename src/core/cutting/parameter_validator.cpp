#include "parameter_validator.h"

#include <cmath>

#include "../utils/string_utils.h"
#include "cutting_error.h"

namespace sfc {

namespace {

void requireFinite(f64 value, const char* field) {
    if (!std::isfinite(value)) {
        throw CuttingError(CuttingErrorKind::InvalidInput, field, "must be a finite number");
    }
}

std::string mm(f64 v) {
    return str::formatFixed(v, 2) + " mm";
}

} // namespace

std::vector<std::string> validateMachiningParameters(f64 rpm, f64 feed, f64 doc, f64 woc,
                                                     f64 diameter,
                                                     const ValidationLimits& limits) {
    requireFinite(rpm, "rpm");
    requireFinite(feed, "feed");
    requireFinite(doc, "doc");
    requireFinite(woc, "woc");
    requireFinite(diameter, "diameter");

    std::vector<std::string> warnings;

    if (rpm <= 0.0) {
        warnings.push_back("Spindle speed must be positive");
    } else if (rpm > limits.max_plausible_rpm) {
        warnings.push_back("Spindle speed " + str::formatRounded(rpm) +
                           " RPM is beyond typical spindle capability");
    }

    if (feed <= 0.0) {
        warnings.push_back("Feed rate must be positive");
    }
    if (doc < 0.0) {
        warnings.push_back("Depth of cut cannot be negative");
    }
    if (woc < 0.0) {
        warnings.push_back("Width of cut cannot be negative");
    }

    // Remaining checks are relative to the tool size
    if (diameter <= 0.0) {
        warnings.push_back("Tool diameter must be positive");
        return warnings;
    }

    if (woc == 0.0) {
        warnings.push_back("Width of cut is zero: no radial engagement, the tool is not cutting");
    } else if (woc > 0.0 && woc <= diameter * limits.min_engagement_ratio) {
        warnings.push_back("Width of cut " + mm(woc) +
                           " is a near-zero radial engagement; the tool may rub instead of cut");
    } else if (woc >= diameter * limits.full_slot_ratio) {
        warnings.push_back("Width of cut " + mm(woc) +
                           " is a full slot; reduce feed or depth to manage chip evacuation");
    }

    if (rpm > 0.0 && feed > 0.0) {
        f64 feedPerRev = feed / rpm;
        if (feedPerRev > diameter * limits.max_feed_per_rev_ratio) {
            warnings.push_back("Feed of " + mm(feedPerRev) + " per revolution is implausibly high for a " +
                               mm(diameter) + " tool");
        }
    }

    if (doc > diameter * limits.max_doc_ratio) {
        warnings.push_back("Depth of cut " + mm(doc) + " exceeds " +
                           str::formatFixed(limits.max_doc_ratio, 1) +
                           "x tool diameter; high risk of tool deflection");
    }

    return warnings;
}

} // namespace sfc
