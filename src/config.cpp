// =============================================================================
// config.cpp - JSON curve configuration and curve factory
// =============================================================================

#include "bondcurve/config.hpp"
#include "bondcurve/bancor.hpp"
#include "bondcurve/exponential.hpp"
#include "bondcurve/linear.hpp"
#include "bondcurve/log.hpp"
#include "bondcurve/logarithmic.hpp"
#include "bondcurve/sigmoid.hpp"

#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace bondcurve {

namespace {

using json = nlohmann::json;

Fixed to_fixed(const json& value, const std::string& curve, const char* key) {
    if (value.is_string()) return Fixed::from_string(value.get<std::string>());
    if (value.is_number_integer()) {
        if (value.is_number_unsigned() &&
            value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw InvalidInput("Curve '" + curve + "': parameter '" + key + "' out of range");
        }
        return Fixed::from_int(value.get<int64_t>());
    }
    if (value.is_number_float()) return Fixed::from_double(value.get<double>());
    throw InvalidInput("Curve '" + curve + "': parameter '" + key + "' must be a number");
}

Fixed required(const json& obj, const std::string& curve, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw InvalidInput("Curve '" + curve + "': missing parameter '" + key + "'");
    }
    return to_fixed(*it, curve, key);
}

Fixed optional(const json& obj, const std::string& curve, const char* key) {
    auto it = obj.find(key);
    return it == obj.end() ? Fixed::zero() : to_fixed(*it, curve, key);
}

CurveSpec parse_curve(const std::string& name, const json& obj) {
    if (!obj.is_object()) {
        throw InvalidInput("Curve '" + name + "' must be an object");
    }
    auto type_it = obj.find("type");
    if (type_it == obj.end() || !type_it->is_string()) {
        throw InvalidInput("Curve '" + name + "': missing 'type'");
    }
    const std::string type = type_it->get<std::string>();
    auto kind = parse_curve_kind(type);
    if (!kind) {
        throw InvalidInput("Curve '" + name + "': unknown type '" + type + "'");
    }

    CurveSpec spec;
    switch (*kind) {
        case CurveKind::Linear:
            spec = CurveSpec::linear(required(obj, name, "slope"));
            break;
        case CurveKind::Exponential:
            spec = CurveSpec::exponential(required(obj, name, "coefficient"),
                                          required(obj, name, "exponent"));
            break;
        case CurveKind::Logarithmic:
            spec = CurveSpec::logarithmic(required(obj, name, "coefficient"),
                                          required(obj, name, "constant"));
            break;
        case CurveKind::Sigmoid:
            spec = CurveSpec::sigmoid(required(obj, name, "max_price"),
                                      required(obj, name, "steepness"),
                                      required(obj, name, "midpoint"));
            break;
        case CurveKind::Bancor:
            return CurveSpec::bancor(required(obj, name, "reserve"),
                                     required(obj, name, "supply"),
                                     required(obj, name, "connector_weight"));
    }
    return spec.with_initial_supply(optional(obj, name, "initial_supply"));
}

} // anonymous namespace

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<BondingCurve> make_curve(const CurveSpec& spec) {
    switch (spec.kind) {
        case CurveKind::Linear:
            return std::make_unique<Linear>(spec.slope, spec.initial_supply);
        case CurveKind::Exponential:
            return std::make_unique<Exponential>(spec.coefficient, spec.exponent,
                                                 spec.initial_supply);
        case CurveKind::Logarithmic:
            return std::make_unique<Logarithmic>(spec.coefficient, spec.constant,
                                                 spec.initial_supply);
        case CurveKind::Sigmoid:
            return std::make_unique<Sigmoid>(spec.max_price, spec.steepness, spec.midpoint,
                                             spec.initial_supply);
        case CurveKind::Bancor:
            return std::make_unique<Bancor>(spec.reserve, spec.initial_supply,
                                            spec.connector_weight);
    }
    throw InvalidInput("Unknown curve kind");
}

// =============================================================================
// Loading
// =============================================================================

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw InvalidInput("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw InvalidInput(std::string("Malformed config JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw InvalidInput("Config root must be a JSON object");
    }

    Config config;

    auto general = root.find("general");
    if (general != root.end()) {
        if (!general->is_object()) {
            throw InvalidInput("'general' must be a JSON object");
        }
        auto level = general->find("log_level");
        if (level != general->end()) {
            if (!level->is_string()) {
                throw InvalidInput("'general.log_level' must be a string");
            }
            config.general.log_level = level->get<std::string>();
        }
    }

    auto curves = root.find("curves");
    if (curves != root.end()) {
        if (!curves->is_object()) {
            throw InvalidInput("'curves' must be a JSON object");
        }
        for (auto it = curves->begin(); it != curves->end(); ++it) {
            config.curves[it.key()] = parse_curve(it.key(), it.value());
        }
    }

    return config;
}

void Config::apply_logging() const {
    log::set_level(general.log_level);
}

std::map<std::string, std::unique_ptr<BondingCurve>> Config::build_curves() const {
    std::map<std::string, std::unique_ptr<BondingCurve>> built;
    for (const auto& [name, spec] : curves) {
        built[name] = make_curve(spec);
        log::logger()->info("Built curve '{}' ({})", name, to_string(spec.kind));
    }
    return built;
}

} // namespace bondcurve
