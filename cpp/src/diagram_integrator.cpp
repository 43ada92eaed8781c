#include "beamlab/diagram_integrator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace beamlab {

namespace {

// First station at or after position t, i.e. the station x_i with
// t in (x_i - dx, x_i]. A load exactly on a station (including x = L) stays
// on that station despite round-off.
Eigen::Index station_index(double t, double dx, int n) {
    const double k = std::ceil(t / dx - 1e-9);
    return static_cast<Eigen::Index>(std::max(0.0, std::min(k, static_cast<double>(n))));
}

} // namespace

DiagramData integrate_diagrams(const BeamConfig& config,
                               const std::vector<LoadDefinition>& loads,
                               const ReactionSet& reactions,
                               int n) {
    if (n < 1) {
        throw std::invalid_argument("Diagram sample count must be at least 1, got " +
                                    std::to_string(n));
    }

    const double L = config.length;
    const double dx = L / n;

    // Concentrated contributions binned per station
    Eigen::VectorXd shear_jump = Eigen::VectorXd::Zero(n + 1);
    Eigen::VectorXd moment_jump = Eigen::VectorXd::Zero(n + 1);

    shear_jump(station_index(reactions.support_a, dx, n)) += reactions.Ra;
    if (config.boundary == BoundaryCondition::Cantilever) {
        moment_jump(station_index(reactions.support_a, dx, n)) -= reactions.Ma;
    } else {
        shear_jump(station_index(reactions.support_b, dx, n)) += reactions.Rb;
    }

    std::vector<const LoadDefinition*> distributed;
    for (const auto& load : loads) {
        if (const auto* p = std::get_if<PointLoad>(&load.load)) {
            shear_jump(station_index(p->x, dx, n)) += p->magnitude;
        } else if (const auto* m = std::get_if<AppliedMoment>(&load.load)) {
            moment_jump(station_index(m->x, dx, n)) -= m->magnitude;
        } else {
            distributed.push_back(&load);
        }
    }

    DiagramData data;
    data.xs.resize(n + 1);
    data.shear.resize(n + 1);
    data.moment.resize(n + 1);

    double V = 0.0;
    double M = 0.0;

    for (int i = 0; i <= n; ++i) {
        const double x = i * dx;

        V += shear_jump(i);

        double q = 0.0;
        for (const auto* load : distributed) {
            q += load->intensity_at(x);
        }
        V += q * dx;

        M += V * dx;
        M += moment_jump(i);

        data.xs(i) = x;
        data.shear(i) = V;
        data.moment(i) = M;
    }

    return data;
}

} // namespace beamlab
