#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <vector>

namespace beamlab {

/**
 * @brief Calibration constants of the bearing visualization model
 *
 * These scale the results into a plausible range for display. They are
 * not certified design values.
 */
namespace bearing_constants {

/// Stribeck factor for zero clearance: Qmax = Fr·5/Z
constexpr double STRIBECK_FACTOR = 5.0;

/// Scale of the contact stress: σ = 50·√(Q/D)
constexpr double HERTZ_STRESS_SCALE = 50.0;

/// Scale of the contact deformation: δ = 0.001·Q^(2/3)
constexpr double DEFORMATION_SCALE = 0.001;

/// Exponent of the cosine load distribution inside the load zone
constexpr double LOAD_DISTRIBUTION_EXPONENT = 1.5;

/// Decay of the ball interior stress away from the contact poles
constexpr double STRESS_DECAY_RATE = 2.0;

/// Direction of the radial load vector (pointing down) [rad]
constexpr double LOAD_VECTOR_ANGLE = 3.0 * M_PI / 2.0;

} // namespace bearing_constants

/**
 * @brief Radial ball bearing geometry and load
 */
struct BearingConfig {
    double outer_radius = 100.0;  ///< Outer race radius
    double inner_radius = 60.0;   ///< Inner race radius
    int ball_count = 12;          ///< Number of rolling elements
    double radial_load = 5000.0;  ///< Radial load Fr [N] (>= 0)

    double pitch_radius() const { return 0.5 * (outer_radius + inner_radius); }
    double ball_diameter() const { return outer_radius - inner_radius; }
    double ball_radius() const { return 0.5 * ball_diameter(); }

    /**
     * @brief Reject geometry with no meaningful fallback
     * @throws std::invalid_argument if outer <= inner, inner < 0 or the load
     *         is negative
     */
    void validate() const;

    bool operator==(const BearingConfig& other) const {
        return outer_radius == other.outer_radius && inner_radius == other.inner_radius &&
               ball_count == other.ball_count && radial_load == other.radial_load;
    }
    bool operator!=(const BearingConfig& other) const { return !(*this == other); }
};

/**
 * @brief One rolling element with its share of the radial load
 */
struct BearingElement {
    double angle = 0.0;        ///< Angular position θ [rad]
    double load = 0.0;         ///< Ball load Q [N], zero outside the load zone
    double max_stress = 0.0;   ///< Contact stress
    double deformation = 0.0;  ///< Contact deformation
    Eigen::Vector2d center = Eigen::Vector2d::Zero();  ///< Center on the pitch circle
    double radius = 0.0;       ///< Ball radius

    bool is_loaded() const { return load > 0.0; }
};

/**
 * @brief Interior point of a ball with its interpolated stress
 */
struct StressPoint {
    Eigen::Vector2d position = Eigen::Vector2d::Zero();
    double stress = 0.0;
};

/**
 * @brief Load carried by the most heavily loaded ball
 *
 * Qmax = Fr·5/max(1, Z)
 */
double max_ball_load(const BearingConfig& config);

/**
 * @brief Angular distance from θ to the load vector, wrapped to [0, π]
 */
double load_zone_angle(double theta);

/**
 * @brief Distribute the radial load over the balls (Stribeck)
 *
 * Ball i sits at θ = 2π·i/Z. With ψ its angular distance to the load vector,
 * the ball carries Q = Qmax·cos(ψ)^1.5 for ψ < π/2 and nothing otherwise.
 * Loaded balls get σ = 50·√(Q/D) and δ = 0.001·Q^(2/3) with D the ball
 * diameter.
 *
 * @return One element per ball in angular order (empty if ball_count < 1)
 * @throws std::invalid_argument if config.validate() fails
 */
std::vector<BearingElement> distribute_bearing_load(const BearingConfig& config);

/**
 * @brief Stress field inside one ball
 *
 * Ring r = 0..resolution lies at radius (r/resolution)·R and holds 6·r
 * points (one point at the center). The stress decays from the two contact
 * poles, center ± R·(cos θ, sin θ):
 *   σ(p) = σmax·exp(−2·d/R), d = distance to the nearer pole
 *
 * @param element Ball from distribute_bearing_load()
 * @param resolution Number of rings (>= 1)
 * @return 1 + 3·resolution·(resolution + 1) points
 * @throws std::invalid_argument if resolution < 1
 */
std::vector<StressPoint> generate_ball_stress_field(const BearingElement& element,
                                                    int resolution = 8);

} // namespace beamlab
