#include "beamlab/beam_field_solver.hpp"
#include "beamlab/loads.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace beamlab {

BeamFieldSolver::BeamFieldSolver(const BeamConfig& config, const SectionProperties& section,
                                 WarningList* warnings)
    : boundary_(config.boundary),
      L_(config.length),
      EI_(config.material.E * section.I),
      I_(section.I),
      P_(config.force),
      a_(0.0),
      depth_(section.depth) {
    config.validate();
    a_ = clamp_position(config.load_position, L_, "base load", warnings);

    if (!has_closed_form() && warnings) {
        warnings->add(BeamlabWarning::unsupported_field_boundary(
            boundary_condition_to_string(boundary_)));
    }
}

bool BeamFieldSolver::has_closed_form() const {
    return boundary_ == BoundaryCondition::Cantilever ||
           boundary_ == BoundaryCondition::SimplySupported;
}

BeamFieldSolver::Response BeamFieldSolver::response(double x) const {
    switch (boundary_) {
        case BoundaryCondition::Cantilever:
            return cantilever(x);
        case BoundaryCondition::SimplySupported:
            return simply_supported(x);
        default:
            return Response{};
    }
}

BeamFieldSolver::Response BeamFieldSolver::cantilever(double x) const {
    const double P = P_, a = a_, EI = EI_;
    Response r;

    if (x <= a) {
        r.v = P * x * x * (3.0 * a - x) / (6.0 * EI);
        r.theta = P * x * (2.0 * a - x) / (2.0 * EI);
        r.M = P * (a - x);
    } else {
        // Unloaded tip: rigid continuation of the section at x = a
        const double v_a = P * a * a * a / (3.0 * EI);
        const double theta_a = P * a * a / (2.0 * EI);
        r.v = v_a + theta_a * (x - a);
        r.theta = theta_a;
        r.M = 0.0;
    }
    return r;
}

BeamFieldSolver::Response BeamFieldSolver::simply_supported(double x) const {
    const double P = P_, a = a_, L = L_, EI = EI_;
    const double b = L - a;
    const double L2 = L * L;
    Response r;

    if (x <= a) {
        r.v = P * b * x * (L2 - b * b - x * x) / (6.0 * L * EI);
        r.theta = P * b * (L2 - b * b - 3.0 * x * x) / (6.0 * L * EI);
        r.M = -P * b * x / L;
    } else {
        const double xr = L - x;  // measured from the right support
        r.v = P * a * xr * (L2 - a * a - xr * xr) / (6.0 * L * EI);
        r.theta = -P * a * (L2 - a * a - 3.0 * xr * xr) / (6.0 * L * EI);
        r.M = -P * a * xr / L;
    }
    return r;
}

double BeamFieldSolver::deflection(double x) const { return response(x).v; }

double BeamFieldSolver::slope(double x) const { return response(x).theta; }

double BeamFieldSolver::moment(double x) const { return response(x).M; }

FieldSample BeamFieldSolver::evaluate(double x, double y, double scale) const {
    const Response r = response(x);

    FieldSample s;
    s.x = x;
    s.y = y;
    s.deflection = r.v;
    s.slope = r.theta;
    s.moment = r.M;
    s.stress = -r.M * y / I_;

    // Plane sections remain plane: u = −y·θ
    const double u = -y * r.theta;
    s.displaced = Eigen::Vector2d(x + u * scale, y + r.v * scale);
    return s;
}

FieldMesh BeamFieldSolver::build_mesh(const MeshOptions& options) const {
    if (options.density_x < 1 || options.density_y < 1) {
        throw std::invalid_argument("Mesh density must be at least 1 in each direction, got " +
                                    std::to_string(options.density_x) + " x " +
                                    std::to_string(options.density_y));
    }

    const double scale = options.deformation_scale > 0.0 ? options.deformation_scale : 1.0;
    const int nx = options.density_x;
    const int ny = options.density_y;
    const double dx = L_ / nx;
    const double dy = depth_ / ny;

    FieldMesh mesh;
    mesh.density_x = nx;
    mesh.density_y = ny;
    mesh.nodes.reserve(static_cast<size_t>(nx + 1) * (ny + 1));

    for (int i = 0; i <= nx; ++i) {
        for (int j = 0; j <= ny; ++j) {
            mesh.nodes.push_back(evaluate(i * dx, j * dy - 0.5 * depth_, scale));
        }
    }

    mesh.cells.reserve(static_cast<size_t>(nx) * ny);
    for (int i = 0; i < nx; ++i) {
        for (int j = 0; j < ny; ++j) {
            MeshCell cell;
            cell.node_ids = {mesh.node_index(i, j), mesh.node_index(i + 1, j),
                             mesh.node_index(i + 1, j + 1), mesh.node_index(i, j + 1)};
            double sum = 0.0;
            for (int id : cell.node_ids) {
                sum += mesh.nodes[id].stress;
            }
            cell.avg_stress = sum / 4.0;
            mesh.cells.push_back(cell);
        }
    }

    return mesh;
}

FieldStatistics compute_field_statistics(const FieldMesh& mesh) {
    FieldStatistics stats;
    for (const auto& n : mesh.nodes) {
        stats.max_stress = std::max(stats.max_stress, std::abs(n.stress));
        stats.max_deflection = std::max(stats.max_deflection, std::abs(n.deflection));
    }
    return stats;
}

} // namespace beamlab
