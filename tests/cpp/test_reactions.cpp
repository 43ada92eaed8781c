/**
 * @file test_reactions.cpp
 * @brief Support reaction and equilibrium tests
 *
 * Tests include:
 * - Simply supported and cantilever reference cases
 * - Overhanging beams with loads on the overhang
 * - Global equilibrium for mixed load lists
 * - Coincident supports
 * - Equilibrium verification
 */

#include <catch2/catch.hpp>

#include "beamlab/beam_config.hpp"
#include "beamlab/errors.hpp"
#include "beamlab/loads.hpp"
#include "beamlab/reaction_solver.hpp"
#include "beamlab/warnings.hpp"

using namespace beamlab;
using Catch::Matchers::WithinAbs;

namespace {

BeamConfig cantilever_config(double length) {
    BeamConfig config;
    config.length = length;
    config.boundary = BoundaryCondition::Cantilever;
    return config;
}

} // namespace

TEST_CASE("Simply supported midspan load splits evenly", "[Reactions][simply_supported]") {
    BeamConfig config;  // 8 m, −50 kN at 4 m
    auto loads = resolve_loads(config.load_spec(), config.length);
    auto r = solve_reactions(config, loads);

    REQUIRE_THAT(r.Ra, WithinAbs(25000.0, 1e-6));
    REQUIRE_THAT(r.Rb, WithinAbs(25000.0, 1e-6));
    REQUIRE_THAT(r.Ma, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(r.support_a, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(r.support_b, WithinAbs(8.0, 1e-12));
    REQUIRE_FALSE(r.degenerate);
}

TEST_CASE("Cantilever tip load reactions", "[Reactions][cantilever]") {
    BeamConfig config = cantilever_config(5.0);
    config.force = -1000.0;
    config.load_position = 5.0;

    auto loads = resolve_loads(config.load_spec(), config.length);
    auto r = solve_reactions(config, loads);

    REQUIRE_THAT(r.Ra, WithinAbs(1000.0, 1e-9));
    REQUIRE_THAT(r.Ma, WithinAbs(5000.0, 1e-9));
    REQUIRE_THAT(r.Rb, WithinAbs(0.0, 1e-12));
}

TEST_CASE("Cantilever with an applied moment only", "[Reactions][cantilever][moment]") {
    BeamConfig config = cantilever_config(4.0);
    config.custom_loads = {LoadDefinition::moment(2.0, 1500.0)};

    auto loads = resolve_loads(config.load_spec(), config.length);
    auto r = solve_reactions(config, loads);

    REQUIRE_THAT(r.Ra, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(r.Ma, WithinAbs(-1500.0, 1e-12));
}

TEST_CASE("Overhanging beam with tip load", "[Reactions][overhanging]") {
    BeamConfig config;
    config.length = 10.0;
    config.boundary = BoundaryCondition::Overhanging;
    config.support_a = 2.0;
    config.support_b = 8.0;
    config.custom_loads = {LoadDefinition::point(10.0, -1000.0)};

    auto loads = resolve_loads(config.load_spec(), config.length);
    auto r = solve_reactions(config, loads);

    // Moments about support A: Rb·6 = 1000·8
    REQUIRE_THAT(r.Rb, WithinAbs(8000.0 / 6.0, 1e-9));
    REQUIRE_THAT(r.Ra, WithinAbs(1000.0 - 8000.0 / 6.0, 1e-9));
    REQUIRE(r.Ra < 0.0);  // hold-down at A
}

TEST_CASE("Mixed loads satisfy global equilibrium", "[Reactions][equilibrium]") {
    const std::vector<LoadDefinition> custom = {
        LoadDefinition::point(3.0, -5000.0),
        LoadDefinition::uniform(5.0, 9.0, -1000.0),
        LoadDefinition::triangular(0.0, 4.0, -2000.0, PeakSide::Right),
        LoadDefinition::triangular(6.0, 10.0, 800.0, PeakSide::Left),
        LoadDefinition::moment(7.0, 3000.0),
    };

    for (auto bc : {BoundaryCondition::Cantilever, BoundaryCondition::SimplySupported,
                    BoundaryCondition::Overhanging}) {
        BeamConfig config;
        config.length = 10.0;
        config.boundary = bc;
        config.support_a = 1.5;
        config.support_b = 8.5;
        config.custom_loads = custom;

        auto loads = resolve_loads(config.load_spec(), config.length);
        auto r = solve_reactions(config, loads);

        INFO("Boundary condition: " << boundary_condition_to_string(bc));
        REQUIRE_NOTHROW(verify_equilibrium(r, loads, config.length));
        REQUIRE_THAT(r.force_residual(loads), WithinAbs(0.0, 1e-6));
        // Moment balance holds about any point
        for (double pivot : {0.0, 2.5, 10.0}) {
            REQUIRE_THAT(r.moment_residual(loads, pivot), WithinAbs(0.0, 1e-6));
        }
    }
}

TEST_CASE("Coincident supports use a unit span", "[Reactions][degenerate]") {
    BeamConfig config;
    config.length = 10.0;
    config.boundary = BoundaryCondition::Overhanging;
    config.support_a = 5.0;
    config.support_b = 5.0;
    config.custom_loads = {LoadDefinition::point(8.0, -1000.0)};

    WarningList warnings;
    auto loads = resolve_loads(config.load_spec(), config.length, &warnings);
    auto r = solve_reactions(config, loads, &warnings);

    REQUIRE(r.degenerate);
    // Rb = −ΣM/1 with ΣM = −1000·3
    REQUIRE_THAT(r.Rb, WithinAbs(3000.0, 1e-9));
    REQUIRE_THAT(r.Ra, WithinAbs(-2000.0, 1e-9));
    REQUIRE(warnings.contains(WarningCode::DEGENERATE_SUPPORT_SPAN));
    REQUIRE(warnings.count_by_severity(WarningSeverity::High) == 1);

    // The unit-span fallback cannot balance moments and is not verified
    REQUIRE_NOTHROW(verify_equilibrium(r, loads, config.length));
}

TEST_CASE("Unbalanced reactions raise EQUILIBRIUM_VIOLATED", "[Reactions][equilibrium]") {
    BeamConfig config;
    auto loads = resolve_loads(config.load_spec(), config.length);
    auto r = solve_reactions(config, loads);
    REQUIRE_NOTHROW(verify_equilibrium(r, loads, config.length));

    SECTION("Force imbalance") {
        r.Ra += 1.0;
        try {
            verify_equilibrium(r, loads, config.length);
            FAIL("Expected InvariantError");
        } catch (const InvariantError& e) {
            REQUIRE(e.error().code == ErrorCode::EQUILIBRIUM_VIOLATED);
            REQUIRE(e.error().details.count("force_residual") == 1);
        }
    }

    SECTION("Moment imbalance with balanced forces") {
        r.Ra += 100.0;
        r.Rb -= 100.0;
        REQUIRE_THROWS_AS(verify_equilibrium(r, loads, config.length), InvariantError);
    }
}

TEST_CASE("Overhanging supports outside the beam are clamped", "[Reactions][overhanging]") {
    BeamConfig config;
    config.length = 6.0;
    config.boundary = BoundaryCondition::Overhanging;
    config.support_a = -1.0;
    config.support_b = 9.0;

    WarningList warnings;
    auto layout = config.supports(&warnings);

    REQUIRE_THAT(layout.support_a, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(layout.support_b, WithinAbs(6.0, 1e-12));
    REQUIRE(warnings.count() == 2);
}
