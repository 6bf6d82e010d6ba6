#pragma once

#include "../types.h"

namespace sfc {
namespace units {

// Length conversion factors
inline constexpr f64 kFeetToMeters = 0.3048;
inline constexpr f64 kMmPerInch = 25.4;
inline constexpr f64 kInchPerMm = 1.0 / kMmPerInch;

inline constexpr f64 kPi = 3.14159265358979323846;

// Surface speed: surface feet per minute <-> surface meters per minute
constexpr f64 sfmToSmm(f64 sfm) { return sfm * kFeetToMeters; }
constexpr f64 smmToSfm(f64 smm) { return smm / kFeetToMeters; }

// Lengths, feed per tooth and feed rates (per minute) share the same factor
constexpr f64 mmToInch(f64 mm) { return mm * kInchPerMm; }
constexpr f64 inchToMm(f64 inches) { return inches * kMmPerInch; }

} // namespace units
} // namespace sfc
