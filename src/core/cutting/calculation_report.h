#pragma once

#include <string>
#include <vector>

#include "feeds_speeds.h"
#include "parameter_validator.h"
#include "rpm_status.h"

namespace sfc {

// Everything a front end needs to render one recomputation
struct CalculationReport {
    MachiningOutputs outputs;
    std::vector<std::string> warnings; // engine warnings, then validator warnings; never truncated
    RpmStatus rpm_status;
};

// compute() -> validate -> concatenate -> classify RPM.
// A configured machine spindle power (> 0) replaces the calculator's
// spindle_power_kw input; 0 leaves the caller's value in place.
// InvalidInput / InvalidGeometry from either stage propagate to the caller.
CalculationReport runCalculation(FeedsSpeedsCalculator& calculator,
                                 const MachineLimits& limits,
                                 const ValidationLimits& validation = {});

} // namespace sfc
