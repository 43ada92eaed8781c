/**
 * @file test_piecewise_polynomial.cpp
 * @brief Exact per-segment V(x) and M(x) tests
 *
 * Tests include:
 * - Segment boundaries and coverage of [0, L]
 * - Closed-form coefficients for point, uniform, triangular and moment loads
 * - Continuity of M and jumps of V at point loads, jumps of M at couples
 * - Agreement with the numeric sweep away from discontinuities
 * - Polynomial formatting
 */

#include <catch2/catch.hpp>

#include "beamlab/beam_config.hpp"
#include "beamlab/diagram_integrator.hpp"
#include "beamlab/errors.hpp"
#include "beamlab/loads.hpp"
#include "beamlab/piecewise_polynomial.hpp"
#include "beamlab/reaction_solver.hpp"

#include <algorithm>
#include <cmath>

using namespace beamlab;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

struct Solved {
    std::vector<LoadDefinition> loads;
    ReactionSet reactions;
    std::vector<PiecewiseSegment> segments;
};

Solved solve(const BeamConfig& config) {
    Solved s;
    s.loads = resolve_loads(config.load_spec(), config.length);
    s.reactions = solve_reactions(config, s.loads);
    s.segments = build_piecewise_segments(config, s.loads, s.reactions);
    return s;
}

BeamConfig mixed_config(BoundaryCondition bc) {
    BeamConfig config;
    config.length = 10.0;
    config.boundary = bc;
    config.support_a = 1.5;
    config.support_b = 8.5;
    config.custom_loads = {
        LoadDefinition::point(3.0, -5000.0),
        LoadDefinition::uniform(5.0, 9.0, -1000.0),
        LoadDefinition::triangular(0.0, 4.0, -2000.0, PeakSide::Right),
        LoadDefinition::moment(7.0, 3000.0),
    };
    return config;
}

double moment_at(const std::vector<PiecewiseSegment>& segments, double x) {
    return find_segment(segments, x)->polynomial.moment_at(x);
}

double shear_at(const std::vector<PiecewiseSegment>& segments, double x) {
    return find_segment(segments, x)->polynomial.shear_at(x);
}

} // namespace

TEST_CASE("Simply supported midspan load segments", "[Piecewise][simply_supported]") {
    BeamConfig config;
    auto s = solve(config);

    REQUIRE(s.segments.size() == 2);
    REQUIRE_THAT(s.segments[0].x_start, WithinAbs(0.0, 1e-15));
    REQUIRE_THAT(s.segments[0].x_end, WithinAbs(4.0, 1e-15));
    REQUIRE_THAT(s.segments[1].x_end, WithinAbs(8.0, 1e-15));

    REQUIRE(s.segments[0].shear_expression == "25000.00");
    REQUIRE(s.segments[0].moment_expression == "25000.00x");
    REQUIRE(s.segments[1].shear_expression == "-25000.00");
    REQUIRE(s.segments[1].moment_expression == "-25000.00x + 200000.00");

    REQUIRE_THAT(moment_at(s.segments, 4.0), WithinAbs(100000.0, 1e-6));
    REQUIRE_THAT(moment_at(s.segments, 8.0), WithinAbs(0.0, 1e-6));
}

TEST_CASE("Cantilever tip load is a single segment", "[Piecewise][cantilever]") {
    BeamConfig config;
    config.length = 5.0;
    config.boundary = BoundaryCondition::Cantilever;
    config.force = -1000.0;
    config.load_position = 5.0;
    auto s = solve(config);

    REQUIRE(s.segments.size() == 1);
    for (double x : {0.0, 1.0, 2.5, 5.0}) {
        REQUIRE_THAT(moment_at(s.segments, x), WithinAbs(-1000.0 * (5.0 - x), 1e-9));
        REQUIRE_THAT(shear_at(s.segments, x), WithinAbs(1000.0, 1e-9));
    }
    REQUIRE(s.segments[0].moment_expression == "1000.00x - 5000.00");
}

TEST_CASE("Uniform load over the full span", "[Piecewise][uniform]") {
    BeamConfig config;
    config.length = 10.0;
    config.custom_loads = {LoadDefinition::uniform(0.0, 10.0, -2000.0)};
    auto s = solve(config);

    REQUIRE(s.segments.size() == 1);
    const auto& poly = s.segments[0].polynomial;
    REQUIRE_THAT(poly.shear_at(5.0), WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(poly.moment_at(5.0), WithinAbs(25000.0, 1e-9));
    REQUIRE_THAT(poly.moment_at(10.0), WithinAbs(0.0, 1e-9));
    REQUIRE(s.segments[0].moment_expression == "-1000.00x^2 + 10000.00x");
}

TEST_CASE("Triangular load over the full span", "[Piecewise][triangular]") {
    BeamConfig config;
    config.length = 6.0;

    SECTION("Peak right") {
        config.custom_loads = {LoadDefinition::triangular(0.0, 6.0, -3000.0, PeakSide::Right)};
        auto s = solve(config);
        REQUIRE_THAT(s.reactions.Ra, WithinAbs(3000.0, 1e-9));
        REQUIRE_THAT(s.reactions.Rb, WithinAbs(6000.0, 1e-9));

        const auto& poly = s.segments[0].polynomial;
        // V = 3000 − 250·x², zero at √12
        REQUIRE_THAT(poly.shear_at(std::sqrt(12.0)), WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(poly.shear_at(6.0), WithinAbs(-6000.0, 1e-9));
        REQUIRE_THAT(poly.moment_at(6.0), WithinAbs(0.0, 1e-9));
    }

    SECTION("Peak left") {
        config.custom_loads = {LoadDefinition::triangular(0.0, 6.0, -3000.0, PeakSide::Left)};
        auto s = solve(config);
        REQUIRE_THAT(s.reactions.Ra, WithinAbs(6000.0, 1e-9));
        REQUIRE_THAT(s.reactions.Rb, WithinAbs(3000.0, 1e-9));

        const auto& poly = s.segments[0].polynomial;
        REQUIRE_THAT(poly.shear_at(6.0), WithinAbs(-3000.0, 1e-9));
        REQUIRE_THAT(poly.moment_at(6.0), WithinAbs(0.0, 1e-9));
        // dM/dx = V
        const double h = 1e-6;
        REQUIRE_THAT((poly.moment_at(2.0 + h) - poly.moment_at(2.0 - h)) / (2.0 * h),
                     WithinAbs(poly.shear_at(2.0), 1e-3));
    }
}

TEST_CASE("Segments cover the beam exactly", "[Piecewise][coverage]") {
    for (auto bc : {BoundaryCondition::Cantilever, BoundaryCondition::SimplySupported,
                    BoundaryCondition::Overhanging}) {
        BeamConfig config = mixed_config(bc);
        auto s = solve(config);

        INFO("Boundary condition: " << boundary_condition_to_string(bc));
        REQUIRE_FALSE(s.segments.empty());
        REQUIRE(s.segments.front().x_start == 0.0);
        REQUIRE(s.segments.back().x_end == config.length);
        for (size_t i = 0; i + 1 < s.segments.size(); ++i) {
            REQUIRE(s.segments[i].x_end == s.segments[i + 1].x_start);
            REQUIRE(s.segments[i].x_end > s.segments[i].x_start);
        }
        REQUIRE_NOTHROW(verify_segment_coverage(s.segments, config.length));
    }
}

TEST_CASE("Boundaries include supports and load discontinuities", "[Piecewise][boundaries]") {
    BeamConfig config = mixed_config(BoundaryCondition::Overhanging);
    auto s = solve(config);
    auto pts = segment_boundaries(config, s.loads, s.reactions);

    const std::vector<double> expected = {0.0, 1.5, 3.0, 4.0, 5.0, 7.0, 8.5, 9.0, 10.0};
    REQUIRE(pts.size() == expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        REQUIRE_THAT(pts[i], WithinAbs(expected[i], 1e-12));
    }
}

TEST_CASE("Near-coincident boundaries are merged", "[Piecewise][boundaries]") {
    BeamConfig config;
    config.length = 10.0;
    config.custom_loads = {
        LoadDefinition::point(4.0, -1000.0),
        LoadDefinition::point(4.0 + 1e-12, -1000.0),
        LoadDefinition::point(10.0 - 1e-12, -500.0),
    };
    auto s = solve(config);

    REQUIRE(s.segments.size() == 2);
    REQUIRE(s.segments.back().x_end == 10.0);
}

TEST_CASE("Point loads jump V, couples jump M", "[Piecewise][continuity]") {
    BeamConfig config = mixed_config(BoundaryCondition::SimplySupported);
    auto s = solve(config);

    SECTION("Point load at x = 3") {
        const auto* left = find_segment(s.segments, 2.5);
        const auto* right = find_segment(s.segments, 3.0);
        REQUIRE(left != right);
        REQUIRE_THAT(right->polynomial.shear_at(3.0) - left->polynomial.shear_at(3.0),
                     WithinAbs(-5000.0, 1e-6));
        REQUIRE_THAT(right->polynomial.moment_at(3.0), WithinAbs(left->polynomial.moment_at(3.0), 1e-6));
    }

    SECTION("Applied moment at x = 7") {
        const auto* left = find_segment(s.segments, 6.5);
        const auto* right = find_segment(s.segments, 7.0);
        REQUIRE_THAT(right->polynomial.moment_at(7.0) - left->polynomial.moment_at(7.0),
                     WithinAbs(-3000.0, 1e-6));
        REQUIRE_THAT(right->polynomial.shear_at(7.0), WithinAbs(left->polynomial.shear_at(7.0), 1e-6));
    }

    SECTION("Distributed load ends are smooth in M") {
        for (double x0 : {4.0, 5.0, 9.0}) {
            const auto* left = find_segment(s.segments, x0 - 0.1);
            const auto* right = find_segment(s.segments, x0);
            REQUIRE_THAT(right->polynomial.moment_at(x0),
                         WithinAbs(left->polynomial.moment_at(x0), 1e-6));
            REQUIRE_THAT(right->polynomial.shear_at(x0),
                         WithinAbs(left->polynomial.shear_at(x0), 1e-6));
        }
    }

    SECTION("Free end of a simply supported beam closes") {
        REQUIRE_THAT(moment_at(s.segments, 10.0), WithinAbs(0.0, 1e-6));
    }
}

TEST_CASE("Exact segments agree with the numeric sweep", "[Piecewise][consistency]") {
    // Forward Euler bounds: V drifts by at most dx·Σ|q|, M by a few dx·|V|max
    const double q_total = 2000.0 + 1000.0;

    for (auto bc : {BoundaryCondition::Cantilever, BoundaryCondition::SimplySupported,
                    BoundaryCondition::Overhanging}) {
        BeamConfig config = mixed_config(bc);
        auto s = solve(config);
        const int n = 2000;
        auto d = integrate_diagrams(config, s.loads, s.reactions, n);
        auto pts = segment_boundaries(config, s.loads, s.reactions);

        const double dx = config.length / n;
        const double v_peak = std::abs(d.max_shear().value);

        INFO("Boundary condition: " << boundary_condition_to_string(bc));
        for (Eigen::Index i = 0; i < d.size(); ++i) {
            const double x = d.xs(i);
            double gap = 1e9;
            for (double p : pts) gap = std::min(gap, std::abs(x - p));
            if (gap <= 1.5 * dx) continue;

            INFO("x = " << x);
            REQUIRE_THAT(d.shear(i), WithinAbs(shear_at(s.segments, x), 2.0 * dx * q_total));
            REQUIRE_THAT(d.moment(i), WithinAbs(moment_at(s.segments, x), 3.0 * dx * v_peak));
        }
    }
}

TEST_CASE("Off-grid point loads land on the next station", "[Piecewise][consistency]") {
    BeamConfig config;
    config.length = 10.0;
    config.custom_loads = {LoadDefinition::point(3.01, -5000.0)};
    auto s = solve(config);
    auto d = integrate_diagrams(config, s.loads, s.reactions, 400);

    // dx = 0.025: x = 3.000 is still left of the load, x = 3.025 is past it
    REQUIRE_THAT(s.reactions.Ra, WithinAbs(3495.0, 1e-9));
    REQUIRE_THAT(d.shear(120), WithinAbs(3495.0, 1e-9));
    REQUIRE_THAT(d.shear(121), WithinAbs(-1505.0, 1e-9));
    REQUIRE_THAT(d.shear(120), WithinAbs(shear_at(s.segments, d.xs(120)), 1e-9));
    REQUIRE_THAT(d.shear(121), WithinAbs(shear_at(s.segments, d.xs(121)), 1e-9));

    const InternalActions swept = d.at(121);
    const InternalActions exact = find_segment(s.segments, swept.x)->polynomial.at(swept.x);
    REQUIRE_THAT(exact.x, WithinAbs(3.025, 1e-12));
    REQUIRE_THAT(swept.V, WithinAbs(exact.V, 1e-9));
    REQUIRE_THAT(swept.M, WithinAbs(exact.M, 0.025 * 3495.0));
}

TEST_CASE("Point-load shear matches the segments at every station", "[Piecewise][consistency]") {
    for (auto bc : {BoundaryCondition::Cantilever, BoundaryCondition::SimplySupported,
                    BoundaryCondition::Overhanging}) {
        BeamConfig config;
        config.length = 10.0;
        config.boundary = bc;
        config.support_a = 1.51;
        config.support_b = 8.49;
        config.custom_loads = {
            LoadDefinition::point(3.01, -5000.0),
            LoadDefinition::point(6.37, -2000.0),
        };
        auto s = solve(config);
        auto d = integrate_diagrams(config, s.loads, s.reactions, 400);

        const double dx = config.length / 400;
        const double v_peak = std::abs(d.max_shear().value);

        INFO("Boundary condition: " << boundary_condition_to_string(bc));
        for (Eigen::Index i = 0; i < d.size(); ++i) {
            const double x = d.xs(i);
            INFO("x = " << x);
            // The sweep closes V with Rb at x = L; the last segment excludes it
            if (i + 1 < d.size()) {
                REQUIRE_THAT(d.shear(i), WithinAbs(shear_at(s.segments, x), 1e-6));
            }
            // Each station integrates one step ahead
            REQUIRE_THAT(d.moment(i), WithinAbs(moment_at(s.segments, x), 1.01 * dx * v_peak));
        }
    }
}

TEST_CASE("Polynomial formatting", "[Piecewise][format]") {
    Eigen::VectorXd c(4);

    c << 5.0, -2.5, 0.0, 1.25;
    REQUIRE(format_polynomial(c) == "1.25x^3 - 2.50x + 5.00");

    c << -3.0, 0.0, 0.0, 0.0;
    REQUIRE(format_polynomial(c) == "-3.00");

    c << 0.0005, -0.0009, 0.001, 0.0;
    REQUIRE(format_polynomial(c) == "0.00");

    c << 0.0, 0.0, -4.0, 0.0;
    REQUIRE(format_polynomial(c) == "-4.00x^2");
}

TEST_CASE("Coverage violations raise InvariantError", "[Piecewise][coverage]") {
    const SegmentPolynomial zero(Eigen::Vector3d::Zero(), Eigen::Vector4d::Zero());

    SECTION("Gap between segments") {
        std::vector<PiecewiseSegment> segments = {
            PiecewiseSegment{0.0, 2.0, zero, "0.00", "0.00"},
            PiecewiseSegment{3.0, 5.0, zero, "0.00", "0.00"},
        };
        REQUIRE_THROWS_AS(verify_segment_coverage(segments, 5.0), InvariantError);
        try {
            verify_segment_coverage(segments, 5.0);
        } catch (const InvariantError& e) {
            REQUIRE(e.error().code == ErrorCode::SEGMENT_COVERAGE);
        }
    }

    SECTION("Short of the beam end") {
        std::vector<PiecewiseSegment> segments = {PiecewiseSegment{0.0, 4.0, zero, "0.00", "0.00"}};
        REQUIRE_THROWS_AS(verify_segment_coverage(segments, 5.0), InvariantError);
    }

    SECTION("Reversed segment") {
        std::vector<PiecewiseSegment> segments = {
            PiecewiseSegment{0.0, 3.0, zero, "0.00", "0.00"},
            PiecewiseSegment{3.0, 3.0, zero, "0.00", "0.00"},
            PiecewiseSegment{3.0, 5.0, zero, "0.00", "0.00"},
        };
        REQUIRE_THROWS_AS(verify_segment_coverage(segments, 5.0), InvariantError);
    }

    SECTION("Empty list") {
        REQUIRE_THROWS_AS(verify_segment_coverage({}, 5.0), InvariantError);
    }
}

TEST_CASE("Segment lookup", "[Piecewise][lookup]") {
    BeamConfig config;
    auto s = solve(config);

    REQUIRE(find_segment(s.segments, 0.0) == &s.segments[0]);
    REQUIRE(find_segment(s.segments, 4.0) == &s.segments[1]);
    REQUIRE(find_segment(s.segments, 8.0) == &s.segments[1]);
    REQUIRE(find_segment(s.segments, 8.5) == nullptr);
    REQUIRE(find_segment(s.segments, -0.1) == nullptr);
}
