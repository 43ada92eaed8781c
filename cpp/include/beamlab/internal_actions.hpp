#pragma once

#include <Eigen/Dense>

namespace beamlab {

/**
 * @brief Internal actions at a position along the beam
 *
 * Sign conventions:
 * - Shear V: sum of vertical forces left of the section, upward positive
 * - Moment M: sagging positive (M = EI·v''), so dM/dx = V
 */
struct InternalActions {
    double x = 0.0;  ///< Position along beam [0, L] in meters
    double V = 0.0;  ///< Shear force [N]
    double M = 0.0;  ///< Bending moment [N·m]

    InternalActions() = default;

    explicit InternalActions(double position) : x(position) {}

    InternalActions(double position, double v, double m)
        : x(position), V(v), M(m) {}
};

/**
 * @brief Extremum location and value
 *
 * Used to report moment/shear extrema along the beam.
 */
struct ActionExtreme {
    double x = 0.0;      ///< Position along beam [m]
    double value = 0.0;  ///< Value at extremum

    ActionExtreme() = default;
    ActionExtreme(double pos, double val) : x(pos), value(val) {}
};

/**
 * @brief Find the entry of largest magnitude in a sampled curve
 *
 * @param xs Station positions
 * @param values Values at the stations (same size as xs)
 * @return ActionExtreme with the signed value of largest |value|
 */
inline ActionExtreme find_abs_extreme(const Eigen::VectorXd& xs, const Eigen::VectorXd& values) {
    ActionExtreme extreme;
    if (values.size() == 0) return extreme;

    Eigen::Index idx = 0;
    values.cwiseAbs().maxCoeff(&idx);
    extreme.x = xs(idx);
    extreme.value = values(idx);
    return extreme;
}

} // namespace beamlab
