#include "calculation_report.h"

#include <iterator>

namespace sfc {

CalculationReport runCalculation(FeedsSpeedsCalculator& calculator,
                                 const MachineLimits& limits,
                                 const ValidationLimits& validation) {
    if (limits.spindle_power_kw > 0.0) {
        calculator.inputs().spindle_power_kw = limits.spindle_power_kw;
    }

    CalculationReport report;
    report.warnings = calculator.compute();
    report.outputs = calculator.outputs();

    const auto& in = calculator.inputs();
    auto validationWarnings = validateMachiningParameters(report.outputs.rpm, report.outputs.feed,
                                                          in.doc, in.woc, in.diameter, validation);
    report.warnings.insert(report.warnings.end(),
                           std::make_move_iterator(validationWarnings.begin()),
                           std::make_move_iterator(validationWarnings.end()));

    report.rpm_status = classifyRpm(report.outputs.rpm, limits);
    return report;
}

} // namespace sfc
