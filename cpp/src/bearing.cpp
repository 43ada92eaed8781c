#include "beamlab/bearing.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace beamlab {

using namespace bearing_constants;

void BearingConfig::validate() const {
    if (inner_radius < 0.0) {
        throw std::invalid_argument("Bearing inner radius must be non-negative, got " +
                                    std::to_string(inner_radius));
    }
    if (outer_radius <= inner_radius) {
        throw std::invalid_argument("Bearing outer radius (" + std::to_string(outer_radius) +
                                    ") must exceed inner radius (" +
                                    std::to_string(inner_radius) + ")");
    }
    if (radial_load < 0.0) {
        throw std::invalid_argument("Bearing radial load must be non-negative, got " +
                                    std::to_string(radial_load));
    }
}

double max_ball_load(const BearingConfig& config) {
    return config.radial_load * STRIBECK_FACTOR / std::max(1, config.ball_count);
}

double load_zone_angle(double theta) {
    double psi = std::abs(theta - LOAD_VECTOR_ANGLE);
    if (psi > M_PI) {
        psi = 2.0 * M_PI - psi;
    }
    return psi;
}

std::vector<BearingElement> distribute_bearing_load(const BearingConfig& config) {
    config.validate();

    const double pitch = config.pitch_radius();
    const double diameter = config.ball_diameter();
    const double q_max = max_ball_load(config);

    std::vector<BearingElement> elements;
    if (config.ball_count < 1) {
        return elements;
    }
    elements.reserve(config.ball_count);

    for (int i = 0; i < config.ball_count; ++i) {
        BearingElement e;
        e.angle = 2.0 * M_PI * i / config.ball_count;
        e.center = Eigen::Vector2d(pitch * std::cos(e.angle), pitch * std::sin(e.angle));
        e.radius = config.ball_radius();

        const double psi = load_zone_angle(e.angle);
        if (psi < M_PI / 2.0) {
            e.load = q_max * std::pow(std::cos(psi), LOAD_DISTRIBUTION_EXPONENT);
        }
        if (e.load > 0.0) {
            e.max_stress = HERTZ_STRESS_SCALE * std::sqrt(e.load / diameter);
            e.deformation = DEFORMATION_SCALE * std::pow(e.load, 2.0 / 3.0);
        }

        elements.push_back(e);
    }

    return elements;
}

std::vector<StressPoint> generate_ball_stress_field(const BearingElement& element,
                                                    int resolution) {
    if (resolution < 1) {
        throw std::invalid_argument("Ball stress field resolution must be at least 1, got " +
                                    std::to_string(resolution));
    }

    const double R = element.radius;
    const Eigen::Vector2d radial(std::cos(element.angle), std::sin(element.angle));
    const Eigen::Vector2d pole_outer = element.center + R * radial;
    const Eigen::Vector2d pole_inner = element.center - R * radial;

    std::vector<StressPoint> points;
    points.reserve(1 + 3 * resolution * (resolution + 1));

    for (int r = 0; r <= resolution; ++r) {
        const double dist = static_cast<double>(r) / resolution * R;
        const int ring_count = r == 0 ? 1 : 6 * r;

        for (int k = 0; k < ring_count; ++k) {
            const double phi = 2.0 * M_PI * k / ring_count;
            StressPoint p;
            p.position = element.center + dist * Eigen::Vector2d(std::cos(phi), std::sin(phi));

            const double d = std::min((p.position - pole_outer).norm(),
                                      (p.position - pole_inner).norm());
            // A zero-size ball has no interior; keep its single stress value
            p.stress = R > 0.0 ? element.max_stress * std::exp(-STRESS_DECAY_RATE * d / R)
                               : element.max_stress;
            points.push_back(p);
        }
    }

    return points;
}

} // namespace beamlab
