#ifndef BONDCURVE_ERROR_HPP
#define BONDCURVE_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace bondcurve {

// =============================================================================
// Error Kinds
// =============================================================================

enum class ErrorKind : uint8_t {
    InvalidInput = 0,      // Bad parameters, negative amounts, oversell
    CalculationError = 1   // Numeric domain violation or overflow
};

inline constexpr const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput: return "Invalid input";
        case ErrorKind::CalculationError: return "Calculation error";
    }
    return "unknown";
}

// =============================================================================
// Exceptions
// =============================================================================

class BondingCurveError : public std::runtime_error {
public:
    BondingCurveError(ErrorKind kind, const std::string& detail)
        : std::runtime_error(std::string(to_string(kind)) + ": " + detail),
          kind_(kind), detail_(detail) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }
    [[nodiscard]] const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

class InvalidInput : public BondingCurveError {
public:
    explicit InvalidInput(const std::string& detail)
        : BondingCurveError(ErrorKind::InvalidInput, detail) {}
};

class CalculationError : public BondingCurveError {
public:
    explicit CalculationError(const std::string& detail)
        : BondingCurveError(ErrorKind::CalculationError, detail) {}
};

} // namespace bondcurve

#endif // BONDCURVE_ERROR_HPP
