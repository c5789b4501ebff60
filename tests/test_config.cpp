// Bondcurve - Config and Logging Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <bondcurve/config.hpp>
#include <bondcurve/log.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace bondcurve;
using Catch::Approx;

namespace {

Fixed num(const char* text) { return Fixed::from_string(text); }

const char* SAMPLE_CONFIG = R"({
    "general": { "log_level": "warn" },
    "curves": {
        "launch": { "type": "linear", "slope": "0.01" },
        "power":  { "type": "exponential", "coefficient": 0.001, "exponent": 2 },
        "log":    { "type": "logarithmic", "coefficient": "2", "constant": "1", "initial_supply": "10" },
        "cap":    { "type": "sigmoid", "max_price": 100, "steepness": "0.01", "midpoint": 1000 },
        "pool":   { "type": "bancor", "reserve": "1000", "supply": "100", "connector_weight": "0.5",
                    "note": "ignored" }
    }
})";

}  // namespace

TEST_CASE("Config from JSON", "[config]") {
    Config config = Config::from_json(SAMPLE_CONFIG);

    SECTION("General section") {
        REQUIRE(config.general.log_level == "warn");
    }

    SECTION("Curve specs") {
        REQUIRE(config.curves.size() == 5);

        const CurveSpec& launch = config.curves.at("launch");
        REQUIRE(launch.kind == CurveKind::Linear);
        REQUIRE(launch.slope == num("0.01"));
        REQUIRE(launch.initial_supply.is_zero());

        const CurveSpec& power = config.curves.at("power");
        REQUIRE(power.kind == CurveKind::Exponential);
        REQUIRE(power.coefficient == num("0.001"));
        REQUIRE(power.exponent == Fixed::from_int(2));

        const CurveSpec& log_curve = config.curves.at("log");
        REQUIRE(log_curve.initial_supply == Fixed::from_int(10));

        const CurveSpec& pool = config.curves.at("pool");
        REQUIRE(pool.kind == CurveKind::Bancor);
        REQUIRE(pool.reserve == Fixed::from_int(1000));
        REQUIRE(pool.initial_supply == Fixed::from_int(100));
        REQUIRE(pool.connector_weight == Fixed::half());
    }

    SECTION("Build curves") {
        auto curves = config.build_curves();
        REQUIRE(curves.size() == 5);

        REQUIRE(curves.at("launch")->buy_token(Fixed::from_int(100)) == Fixed::from_int(50));
        REQUIRE(curves.at("power")->buy_token(Fixed::from_int(50)).to_double() ==
                Approx(41.6667).margin(1e-4));
        REQUIRE(curves.at("log")->get_supply() == Fixed::from_int(10));
        REQUIRE(curves.at("cap")->kind() == CurveKind::Sigmoid);
        REQUIRE(curves.at("pool")->get_price() == Fixed::from_int(20));
    }
}

TEST_CASE("Config defaults", "[config]") {
    Config config = Config::from_json("{}");
    REQUIRE(config.general.log_level == "info");
    REQUIRE(config.curves.empty());
    REQUIRE(config.build_curves().empty());
}

TEST_CASE("Config errors", "[config]") {
    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(Config::from_json("{ not json"), InvalidInput);
        REQUIRE_THROWS_AS(Config::from_json("[1, 2]"), InvalidInput);
    }

    SECTION("Sections of the wrong type") {
        REQUIRE_THROWS_AS(Config::from_json(R"({"general": "debug"})"), InvalidInput);
        REQUIRE_THROWS_AS(Config::from_json(R"({"general": {"log_level": 3}})"), InvalidInput);
        REQUIRE_THROWS_AS(Config::from_json(R"({"curves": []})"), InvalidInput);
        REQUIRE_NOTHROW(Config::from_json(R"({"general": {}})"));
    }

    SECTION("Unknown curve type") {
        REQUIRE_THROWS_AS(Config::from_json(R"({"curves": {"x": {"type": "quadratic"}}})"), InvalidInput);
        REQUIRE_THROWS_AS(Config::from_json(R"({"curves": {"x": {"slope": "1"}}})"), InvalidInput);
    }

    SECTION("Missing parameter") {
        try {
            Config::from_json(R"({"curves": {"x": {"type": "sigmoid", "max_price": 1, "steepness": 1}}})");
            FAIL("expected InvalidInput");
        } catch (const InvalidInput& e) {
            REQUIRE(e.detail() == "Curve 'x': missing parameter 'midpoint'");
        }
    }

    SECTION("Malformed number") {
        REQUIRE_THROWS_AS(Config::from_json(R"({"curves": {"x": {"type": "linear", "slope": "1,5"}}})"),
                          InvalidInput);
        REQUIRE_THROWS_AS(Config::from_json(R"({"curves": {"x": {"type": "linear", "slope": true}}})"),
                          InvalidInput);
    }

    SECTION("Out-of-domain parameters fail when building") {
        Config config = Config::from_json(R"({"curves": {"x": {"type": "linear", "slope": "-1"}}})");
        REQUIRE_THROWS_AS(config.build_curves(), InvalidInput);
    }

    SECTION("Unreadable file") {
        REQUIRE_THROWS_AS(Config::from_file("/nonexistent/bondcurve.json"), InvalidInput);
    }
}

TEST_CASE("Config from file", "[config]") {
    auto path = std::filesystem::temp_directory_path() / "bondcurve_test_config.json";
    {
        std::ofstream out(path);
        out << SAMPLE_CONFIG;
    }

    Config config = Config::from_file(path.string());
    REQUIRE(config.curves.size() == 5);
    REQUIRE(config.general.log_level == "warn");

    std::filesystem::remove(path);
}

TEST_CASE("Config builder", "[config]") {
    Config config;
    config.with_curve("a", CurveSpec::linear(num("0.5")).with_initial_supply(Fixed::from_int(4)))
          .with_curve("b", CurveSpec::bancor(Fixed::from_int(10), Fixed::from_int(10), Fixed::one()))
          .set_log_level("debug");

    REQUIRE(config.general.log_level == "debug");

    auto curves = config.build_curves();
    REQUIRE(curves.at("a")->get_price() == Fixed::from_int(2));
    REQUIRE(curves.at("b")->get_price() == Fixed::one());
}

TEST_CASE("make_curve", "[config]") {
    auto curve = make_curve(CurveSpec::sigmoid(Fixed::from_int(100), num("0.01"), Fixed::from_int(1000)));
    REQUIRE(curve->kind() == CurveKind::Sigmoid);
    REQUIRE(curve->buy_token(Fixed::from_int(75)).to_double() == Approx(4437.24).margin(0.01));

    REQUIRE_THROWS_AS(make_curve(CurveSpec::exponential(Fixed::one(), Fixed::from_int(-1))), InvalidInput);
}

TEST_CASE("Curve kind names", "[config]") {
    REQUIRE(parse_curve_kind("linear") == CurveKind::Linear);
    REQUIRE(parse_curve_kind("bancor") == CurveKind::Bancor);
    REQUIRE_FALSE(parse_curve_kind("Linear").has_value());
    REQUIRE(std::string(to_string(CurveKind::Logarithmic)) == "logarithmic");
}

TEST_CASE("Logger", "[log]") {
    auto logger = log::logger();
    REQUIRE(logger->name() == log::LOGGER_NAME);
    REQUIRE(log::logger() == logger);

    SECTION("Level names") {
        log::set_level("debug");
        REQUIRE(logger->level() == spdlog::level::debug);

        log::set_level("error");
        REQUIRE(logger->level() == spdlog::level::err);

        log::set_level("bogus");
        REQUIRE(logger->level() == spdlog::level::info);
    }

    SECTION("Config drives the level") {
        Config config = Config::from_json(R"({"general": {"log_level": "off"}})");
        config.apply_logging();
        REQUIRE(logger->level() == spdlog::level::off);
    }

    SECTION("Trades are traced at debug level") {
        log::set_level("trace");
        Config config = Config().with_curve("t", CurveSpec::linear(Fixed::one()));
        auto curves = config.build_curves();
        REQUIRE_NOTHROW(curves.at("t")->buy_token(Fixed::from_int(3)));
    }

    log::set_level("info");
}
