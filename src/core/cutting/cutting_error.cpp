#include "cutting_error.h"

#include <utility>

namespace sfc {

const char* cuttingErrorKindName(CuttingErrorKind kind) {
    switch (kind) {
    case CuttingErrorKind::InvalidInput: return "InvalidInput";
    case CuttingErrorKind::InvalidGeometry: return "InvalidGeometry";
    case CuttingErrorKind::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

CuttingError::CuttingError(CuttingErrorKind kind, std::string field, const std::string& message)
    : std::runtime_error(std::string(cuttingErrorKindName(kind)) + " (" + field + "): " + message),
      m_kind(kind), m_field(std::move(field)) {}

} // namespace sfc
