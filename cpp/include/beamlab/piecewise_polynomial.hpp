#pragma once

#include "beamlab/beam_config.hpp"
#include "beamlab/internal_actions.hpp"
#include "beamlab/loads.hpp"
#include "beamlab/reaction_solver.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace beamlab {

/**
 * @brief Exact V(x) and M(x) polynomials valid on one segment
 *
 * Coefficients are stored in ascending powers of the global coordinate x:
 *   V(x) = shear(0) + shear(1)·x + shear(2)·x²
 *   M(x) = moment(0) + moment(1)·x + moment(2)·x² + moment(3)·x³
 *
 * Built once per segment and never modified afterwards.
 */
class SegmentPolynomial {
public:
    SegmentPolynomial(const Eigen::Vector3d& shear, const Eigen::Vector4d& moment)
        : shear_(shear), moment_(moment) {}

    const Eigen::Vector3d& shear_coefficients() const { return shear_; }
    const Eigen::Vector4d& moment_coefficients() const { return moment_; }

    double shear_at(double x) const;
    double moment_at(double x) const;

    InternalActions at(double x) const { return {x, shear_at(x), moment_at(x)}; }

private:
    Eigen::Vector3d shear_;
    Eigen::Vector4d moment_;
};

/**
 * @brief Sub-interval [x_start, x_end) with its polynomials
 *
 * The last segment of a beam is closed at x = L.
 */
struct PiecewiseSegment {
    double x_start = 0.0;
    double x_end = 0.0;
    SegmentPolynomial polynomial;
    std::string shear_expression;   ///< e.g. "-5000.00x + 20000.00"
    std::string moment_expression;

    double length() const { return x_end - x_start; }
    bool contains(double x) const { return x >= x_start && x < x_end; }
};

/// Coefficients at or below this magnitude are omitted when formatting
constexpr double DISPLAY_COEFFICIENT_THRESHOLD = 0.001;

/**
 * @brief Format a polynomial for display, highest power first
 *
 * Terms with |coefficient| <= 0.001 are omitted, the rest are printed with
 * two decimals as "cx^3", "cx^2", "cx" and "c". An empty polynomial reads
 * "0.00". Display only; arithmetic always uses the full coefficients.
 *
 * @param coefficients Coefficients in ascending powers
 */
std::string format_polynomial(const Eigen::VectorXd& coefficients);

/**
 * @brief Sorted, de-duplicated segment boundaries on [0, L]
 *
 * Includes both beam ends, the supports, point-load and applied-moment
 * positions, and the ends of every range load. Points closer than
 * 1e-9·max(1, L) are merged.
 */
std::vector<double> segment_boundaries(const BeamConfig& config,
                                       const std::vector<LoadDefinition>& loads,
                                       const ReactionSet& reactions);

/**
 * @brief Assemble the polynomials valid on [x_a, x_b)
 *
 * Sums the closed-form contribution of every reaction and load that acts at
 * or before x_a, or whose span covers the segment:
 * - Reactions, point loads, applied moments: constant V, linear M
 * - Range loads fully to the left: equivalent force at the centroid
 * - Uniform load spanning: linear V, quadratic M
 * - Triangular load spanning: quadratic V, cubic M (peak left or right)
 *
 * The segment must not straddle a load discontinuity; use the intervals of
 * segment_boundaries().
 */
SegmentPolynomial build_segment_polynomial(double x_a, double x_b,
                                           const BeamConfig& config,
                                           const std::vector<LoadDefinition>& loads,
                                           const ReactionSet& reactions);

/**
 * @brief Partition the beam and build every segment
 *
 * @return Segments ordered by position covering exactly [0, L]
 * @throws InvariantError if the produced list does not cover [0, L]
 */
std::vector<PiecewiseSegment> build_piecewise_segments(const BeamConfig& config,
                                                       const std::vector<LoadDefinition>& loads,
                                                       const ReactionSet& reactions);

/**
 * @brief Check that segments are ordered, contiguous and span [0, L]
 *
 * @throws InvariantError on the first violation
 */
void verify_segment_coverage(const std::vector<PiecewiseSegment>& segments, double length);

/**
 * @brief Segment containing x, or nullptr if x is outside [0, L]
 *
 * x = L maps to the last segment.
 */
const PiecewiseSegment* find_segment(const std::vector<PiecewiseSegment>& segments, double x);

} // namespace beamlab
