#ifndef BONDCURVE_CONFIG_HPP
#define BONDCURVE_CONFIG_HPP

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "curve.hpp"

namespace bondcurve {

// =============================================================================
// Configuration
//
// JSON layout:
//   {
//     "general": { "log_level": "info" },
//     "curves": {
//       "launch": { "type": "linear", "slope": "0.01" },
//       "pool":   { "type": "bancor", "reserve": "1000", "supply": "100",
//                   "connector_weight": "0.5" }
//     }
//   }
//
// Numeric values may be JSON strings (exact decimal) or JSON numbers.
// =============================================================================

struct GeneralConfig {
    std::string log_level = "info";
};

// Parameters for one curve. Only the fields used by `kind` are read.
class CurveSpec {
public:
    CurveKind kind = CurveKind::Linear;

    Fixed slope;             // linear
    Fixed coefficient;       // exponential, logarithmic
    Fixed exponent;          // exponential
    Fixed constant;          // logarithmic
    Fixed max_price;         // sigmoid
    Fixed steepness;         // sigmoid
    Fixed midpoint;          // sigmoid
    Fixed reserve;           // bancor
    Fixed connector_weight;  // bancor
    Fixed initial_supply;    // starting supply (bancor: current supply)

    CurveSpec() = default;

    static CurveSpec linear(Fixed slope) {
        CurveSpec spec;
        spec.kind = CurveKind::Linear;
        spec.slope = slope;
        return spec;
    }

    static CurveSpec exponential(Fixed coefficient, Fixed exponent) {
        CurveSpec spec;
        spec.kind = CurveKind::Exponential;
        spec.coefficient = coefficient;
        spec.exponent = exponent;
        return spec;
    }

    static CurveSpec logarithmic(Fixed coefficient, Fixed constant) {
        CurveSpec spec;
        spec.kind = CurveKind::Logarithmic;
        spec.coefficient = coefficient;
        spec.constant = constant;
        return spec;
    }

    static CurveSpec sigmoid(Fixed max_price, Fixed steepness, Fixed midpoint) {
        CurveSpec spec;
        spec.kind = CurveKind::Sigmoid;
        spec.max_price = max_price;
        spec.steepness = steepness;
        spec.midpoint = midpoint;
        return spec;
    }

    static CurveSpec bancor(Fixed reserve, Fixed supply, Fixed connector_weight) {
        CurveSpec spec;
        spec.kind = CurveKind::Bancor;
        spec.reserve = reserve;
        spec.initial_supply = supply;
        spec.connector_weight = connector_weight;
        return spec;
    }

    CurveSpec& with_initial_supply(Fixed supply) {
        initial_supply = supply;
        return *this;
    }
};

// Construct the curve described by `spec`; throws InvalidInput on bad parameters
std::unique_ptr<BondingCurve> make_curve(const CurveSpec& spec);

class Config {
public:
    GeneralConfig general;
    std::map<std::string, CurveSpec> curves;

    Config() = default;

    // Load from JSON file
    static Config from_file(std::string_view path);

    // Load from JSON string
    static Config from_json(std::string_view content);

    Config& with_curve(std::string_view name, CurveSpec spec) {
        curves[std::string(name)] = std::move(spec);
        return *this;
    }

    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    // Push general.log_level to the library logger
    void apply_logging() const;

    // Build every declared curve, keyed by name
    [[nodiscard]] std::map<std::string, std::unique_ptr<BondingCurve>> build_curves() const;
};

} // namespace bondcurve

#endif // BONDCURVE_CONFIG_HPP
