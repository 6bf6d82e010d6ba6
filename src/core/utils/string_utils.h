#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sfc {
namespace str {

// Trim whitespace
std::string trim(std::string_view s);
std::string trimLeft(std::string_view s);
std::string trimRight(std::string_view s);

// Format number with thousands separators
std::string formatNumber(int64_t number);

// Round to the nearest integer and group thousands. Values outside the
// int64_t range (or non-finite) fall back to formatFixed(value, 0).
std::string formatRounded(double value);

// Format a value with a fixed number of decimals
std::string formatFixed(double value, int decimals);

// Parse the whole string; `out` is left untouched on failure
bool parseInt(std::string_view s, int& out);
bool parseDouble(std::string_view s, double& out);

} // namespace str
} // namespace sfc
