#pragma once

#include "beamlab/beam_config.hpp"
#include "beamlab/section.hpp"
#include "beamlab/warnings.hpp"

#include <Eigen/Dense>
#include <array>
#include <vector>

namespace beamlab {

/**
 * @brief Closed-form response at one point of the beam
 *
 * Physics quantities use the undeformed position; the displaced position is
 * only meant for plotting.
 */
struct FieldSample {
    double x = 0.0;           ///< Undeformed position along beam [m]
    double y = 0.0;           ///< Offset from the neutral axis [m] (upward positive)
    double deflection = 0.0;  ///< Vertical deflection v [m]
    double slope = 0.0;       ///< Rotation θ = dv/dx [rad]
    double moment = 0.0;      ///< Bending moment M [N·m]
    double stress = 0.0;      ///< Bending stress σ = −M·y/I [Pa] (tension positive)
    Eigen::Vector2d displaced = Eigen::Vector2d::Zero();  ///< Exaggerated plot position [m]
};

/**
 * @brief Quadrilateral visualization cell
 *
 * Node indices refer to FieldMesh::nodes, ordered counter-clockwise:
 * (i, j), (i+1, j), (i+1, j+1), (i, j+1).
 */
struct MeshCell {
    std::array<int, 4> node_ids{};
    double avg_stress = 0.0;  ///< Mean of the four corner stresses [Pa]
};

/**
 * @brief Structured grid of field samples along and through the beam
 */
struct FieldMesh {
    int density_x = 0;                ///< Cells along the beam
    int density_y = 0;                ///< Cells through the depth
    std::vector<FieldSample> nodes;   ///< (density_x + 1)·(density_y + 1) samples
    std::vector<MeshCell> cells;      ///< density_x·density_y cells

    int node_index(int i, int j) const { return i * (density_y + 1) + j; }
    const FieldSample& node(int i, int j) const { return nodes[node_index(i, j)]; }
};

/**
 * @brief Discretization of the visualization mesh
 */
struct MeshOptions {
    int density_x = 40;              ///< Cells along the beam (>= 1)
    int density_y = 8;               ///< Cells through the depth (>= 1)
    double deformation_scale = 50.0; ///< Displacement exaggeration (<= 0 means 1)

    bool operator==(const MeshOptions& o) const {
        return density_x == o.density_x && density_y == o.density_y &&
               deformation_scale == o.deformation_scale;
    }
};

/**
 * @brief Global extrema of a field mesh
 */
struct FieldStatistics {
    double max_stress = 0.0;      ///< max |σ| over all nodes [Pa]
    double max_deflection = 0.0;  ///< max |v| over all nodes [m], unscaled
};

/**
 * @brief Euler–Bernoulli closed-form field under the base point load
 *
 * Cantilever (fixed at x = 0), x <= a:
 *   v = P·x²·(3a − x)/(6EI),  θ = P·x·(2a − x)/(2EI),  M = P·(a − x)
 * and beyond the load the beam stays straight with the slope at x = a.
 *
 * Simply supported, b = L − a, x <= a:
 *   v = P·b·x·(L² − b² − x²)/(6LEI),  θ = P·b·(L² − b² − 3x²)/(6LEI),
 *   M = −P·b·x/L
 * and the mirrored expressions from the right support for x > a.
 *
 * M = EI·v'' throughout, so a downward (negative) P gives the physically
 * correct fibre stresses: compression on top of a simply supported span and
 * tension on top at a cantilever wall.
 *
 * Overhanging beams have no closed form here; the solver then returns zero
 * response and reports UNSUPPORTED_FIELD_BOUNDARY.
 */
class BeamFieldSolver {
public:
    /**
     * @brief Construct the field solver
     * @param config Beam configuration (force and load_position are used)
     * @param section Section properties from compute_section_properties()
     * @param warnings Optional list that receives warnings
     * @throws std::invalid_argument if the configuration fails validate()
     */
    BeamFieldSolver(const BeamConfig& config, const SectionProperties& section,
                    WarningList* warnings = nullptr);

    /**
     * @brief Evaluate the response at (x, y)
     * @param x Position along beam [0, L]
     * @param y Offset from the neutral axis [−h/2, h/2]
     * @param scale Deformation exaggeration for the displaced position
     */
    FieldSample evaluate(double x, double y, double scale = 1.0) const;

    double deflection(double x) const;
    double slope(double x) const;
    double moment(double x) const;

    /**
     * @brief Build the deformed, stress-colored visualization grid
     * @throws std::invalid_argument if a mesh density is below 1
     */
    FieldMesh build_mesh(const MeshOptions& options) const;

    /// Load position actually used, clamped into [0, L]
    double load_position() const { return a_; }

    /// True if the boundary condition has a closed-form field
    bool has_closed_form() const;

private:
    struct Response {
        double v = 0.0;
        double theta = 0.0;
        double M = 0.0;
    };

    Response response(double x) const;
    Response cantilever(double x) const;
    Response simply_supported(double x) const;

    BoundaryCondition boundary_;
    double L_, EI_, I_, P_, a_, depth_;
};

/**
 * @brief Maximum |σ| and |v| over all mesh nodes
 */
FieldStatistics compute_field_statistics(const FieldMesh& mesh);

} // namespace beamlab
