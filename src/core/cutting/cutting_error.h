#pragma once

#include <stdexcept>
#include <string>

namespace sfc {

enum class CuttingErrorKind {
    InvalidInput,    // Required numeric field is zero, negative or non-finite
    InvalidGeometry, // Geometric relationship violated (e.g. woc > diameter)
    InvalidConfig    // Material or rigidity key missing from its lookup table
};

const char* cuttingErrorKindName(CuttingErrorKind kind);

// Raised for conditions fatal to a single calculation. InvalidConfig is also
// recorded (not thrown) when the engine degrades a lookup step.
class CuttingError : public std::runtime_error {
  public:
    CuttingError(CuttingErrorKind kind, std::string field, const std::string& message);

    CuttingErrorKind kind() const { return m_kind; }
    const std::string& field() const { return m_field; }

  private:
    CuttingErrorKind m_kind;
    std::string m_field;
};

} // namespace sfc
