#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace sfc {
namespace str {

std::string trim(std::string_view s) {
    return trimRight(trimLeft(s));
}

std::string trimLeft(std::string_view s) {
    auto it = std::find_if(s.begin(), s.end(),
                           [](unsigned char c) { return !std::isspace(c); });
    return std::string(it, s.end());
}

std::string trimRight(std::string_view s) {
    auto it = std::find_if(s.rbegin(), s.rend(),
                           [](unsigned char c) { return !std::isspace(c); });
    return std::string(s.begin(), it.base());
}

std::string formatNumber(int64_t number) {
    std::string s = std::to_string(number < 0 ? -static_cast<uint64_t>(number)
                                              : static_cast<uint64_t>(number));
    std::string result;
    result.reserve(s.length() + s.length() / 3);

    int count = 0;
    for (auto it = s.rbegin(); it != s.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            result.push_back(',');
        }
        result.push_back(*it);
        count++;
    }

    if (number < 0) {
        result.push_back('-');
    }

    std::reverse(result.begin(), result.end());
    return result;
}

std::string formatRounded(double value) {
    // 2^63; every double below it in magnitude rounds into int64_t
    constexpr double kInt64Limit = 9223372036854775808.0;
    double rounded = std::round(value);
    if (!std::isfinite(rounded) || rounded >= kInt64Limit || rounded < -kInt64Limit) {
        return formatFixed(value, 0);
    }
    return formatNumber(static_cast<int64_t>(rounded));
}

std::string formatFixed(double value, int decimals) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value;
    return ss.str();
}

bool parseInt(std::string_view s, int& out) {
    int value = 0;
    auto result = std::from_chars(s.data(), s.data() + s.size(), value);
    if (result.ec != std::errc{} || result.ptr != s.data() + s.size()) {
        return false;
    }
    out = value;
    return true;
}

bool parseDouble(std::string_view s, double& out) {
    if (s.empty()) {
        return false;
    }
    char* end = nullptr;
    std::string buffer(s);
    double value = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size()) {
        return false;
    }
    out = value;
    return true;
}

} // namespace str
} // namespace sfc
