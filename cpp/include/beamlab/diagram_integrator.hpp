#pragma once

#include "beamlab/beam_config.hpp"
#include "beamlab/internal_actions.hpp"
#include "beamlab/loads.hpp"
#include "beamlab/reaction_solver.hpp"

#include <Eigen/Dense>
#include <vector>

namespace beamlab {

/**
 * @brief Sampled shear and moment diagrams
 *
 * Parallel arrays of n + 1 stations spaced L/n apart.
 */
struct DiagramData {
    Eigen::VectorXd xs;      ///< Station positions [m]
    Eigen::VectorXd shear;   ///< V at each station [N]
    Eigen::VectorXd moment;  ///< M at each station [N·m]

    Eigen::Index size() const { return xs.size(); }

    InternalActions at(Eigen::Index i) const { return {xs(i), shear(i), moment(i)}; }

    ActionExtreme max_shear() const { return find_abs_extreme(xs, shear); }
    ActionExtreme max_moment() const { return find_abs_extreme(xs, moment); }
};

/**
 * @brief Rasterize V(x) and M(x) by a forward sweep
 *
 * Walks n + 1 equally spaced stations with dx = L/n. A support or point load
 * at position t is added to the running shear at the first station x >= t,
 * so the sweep never applies a load before its position. Distributed loads add q(x)·dx at every
 * station inside their span. The moment accumulates V·dx each step (explicit
 * forward Euler); a cantilever reaction moment Ma and applied moments C jump
 * the moment by −Ma and −C at their stations.
 *
 * The result is an approximation for charting. Exact per-segment expressions
 * come from build_piecewise_segments().
 *
 * @param config Beam configuration
 * @param loads Resolved load list
 * @param reactions Reactions from solve_reactions()
 * @param n Number of intervals (must be >= 1)
 * @return DiagramData
 * @throws std::invalid_argument if n < 1
 */
DiagramData integrate_diagrams(const BeamConfig& config,
                               const std::vector<LoadDefinition>& loads,
                               const ReactionSet& reactions,
                               int n = 400);

} // namespace beamlab
