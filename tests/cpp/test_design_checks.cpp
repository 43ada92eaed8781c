/**
 * @file test_design_checks.cpp
 * @brief Safety factor, serviceability and summary tests
 */

#include <catch2/catch.hpp>

#include "beamlab/design_checks.hpp"
#include "beamlab/warnings.hpp"

using namespace beamlab;
using Catch::Matchers::Contains;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Safety factor rating thresholds", "[DesignChecks][rating]") {
    REQUIRE(rate_safety_factor(0.99) == SafetyRating::Unsafe);
    REQUIRE(rate_safety_factor(1.0) == SafetyRating::Marginal);
    REQUIRE(rate_safety_factor(1.49) == SafetyRating::Marginal);
    REQUIRE(rate_safety_factor(1.5) == SafetyRating::Adequate);
    REQUIRE(rate_safety_factor(20.0) == SafetyRating::Adequate);

    REQUIRE(safety_rating_to_string(SafetyRating::Marginal) == "Marginal");
}

TEST_CASE("Reference beam passes the design checks", "[DesignChecks]") {
    BeamConfig config;  // steel, fy = 250 MPa, L = 8 m
    FieldStatistics stats;
    stats.max_stress = 1.2e7;
    stats.max_deflection = 1.28e-3;

    WarningList warnings;
    auto check = evaluate_design(config, stats, &warnings);

    REQUIRE_THAT(check.safety_factor, WithinRel(250e6 / 1.2e7, 1e-12));
    REQUIRE(check.rating == SafetyRating::Adequate);
    REQUIRE_THAT(check.allowable_deflection, WithinRel(8.0 / 360.0, 1e-12));
    REQUIRE_THAT(check.deflection_ratio, WithinRel(8.0 / 1.28e-3, 1e-12));
    REQUIRE(check.deflection_ok);
    REQUIRE(check.passes());
    REQUIRE_FALSE(warnings.has_warnings());
}

TEST_CASE("Overstressed and overdeflected beam", "[DesignChecks]") {
    BeamConfig config;
    FieldStatistics stats;
    stats.max_stress = 3.0e8;
    stats.max_deflection = 0.05;

    WarningList warnings;
    auto check = evaluate_design(config, stats, &warnings);

    REQUIRE(check.rating == SafetyRating::Unsafe);
    REQUIRE_FALSE(check.deflection_ok);
    REQUIRE_FALSE(check.passes());
    REQUIRE(warnings.contains(WarningCode::HIGH_STRESS));
    REQUIRE(warnings.contains(WarningCode::EXCESSIVE_DEFLECTION));
}

TEST_CASE("Unloaded beam keeps ratios finite", "[DesignChecks]") {
    BeamConfig config;
    FieldStatistics stats;  // all zero

    auto check = evaluate_design(config, stats);

    // Denominators floored at 1 Pa and 1e-4 m
    REQUIRE_THAT(check.safety_factor, WithinRel(250e6, 1e-12));
    REQUIRE_THAT(check.deflection_ratio, WithinRel(8.0 / 1e-4, 1e-12));
    REQUIRE(check.deflection_ok);
}

TEST_CASE("Non-positive yield strength is reported", "[DesignChecks]") {
    BeamConfig config;
    config.material.fy = 0.0;
    FieldStatistics stats;
    stats.max_stress = 1e6;

    WarningList warnings;
    auto check = evaluate_design(config, stats, &warnings);

    REQUIRE(check.rating == SafetyRating::Unsafe);
    REQUIRE(warnings.contains(WarningCode::NON_POSITIVE_YIELD));
    REQUIRE_FALSE(warnings.contains(WarningCode::HIGH_STRESS));
}

TEST_CASE("Extreme fibre stresses", "[DesignChecks][fibre]") {
    SectionProperties section;
    section.I = 0.2 * 0.125 / 12.0;
    section.depth = 0.5;

    SECTION("Sagging moment: top compression, bottom tension") {
        auto fs = extreme_fibre_stresses(100000.0, section);
        REQUIRE_THAT(fs.top, WithinRel(-1.2e7, 1e-9));
        REQUIRE_THAT(fs.bottom, WithinRel(1.2e7, 1e-9));
    }

    SECTION("Hogging moment: top tension") {
        auto fs = extreme_fibre_stresses(-5000.0, section);
        REQUIRE(fs.top > 0.0);
        REQUIRE(fs.bottom < 0.0);
    }
}

TEST_CASE("Text summary lists inputs and results", "[DesignChecks][summary]") {
    BeamConfig config;
    FieldStatistics stats;
    stats.max_stress = 1.2e7;
    stats.max_deflection = 1.28e-3;
    auto check = evaluate_design(config, stats);

    auto summary = format_summary("Bridge girder", config, check);

    REQUIRE_THAT(summary, Contains("Case: Bridge girder"));
    REQUIRE_THAT(summary, Contains("simplySupported"));
    REQUIRE_THAT(summary, Contains("rectangular"));
    REQUIRE_THAT(summary, Contains("L = 8.00 m"));
    REQUIRE_THAT(summary, Contains("E = 200.0 GPa"));
    REQUIRE_THAT(summary, Contains("fy = 250 MPa"));
    REQUIRE_THAT(summary, Contains("-50000.00 N at x = 4.00 m"));
    REQUIRE_THAT(summary, Contains("Max stress: 12.00 MPa"));
    REQUIRE_THAT(summary, Contains("Safety factor: 20.83 (Adequate"));
    REQUIRE_THAT(summary, Contains("Max deflection: 1.28 mm"));
    REQUIRE_THAT(summary, Contains("L/6250"));
}
