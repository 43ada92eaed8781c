#pragma once

#include "beamlab/beam_config.hpp"
#include "beamlab/loads.hpp"
#include "beamlab/warnings.hpp"

#include <vector>

namespace beamlab {

/**
 * @brief Support reactions of a statically determinate beam
 *
 * Vertical reactions are positive upward, the reaction moment is positive
 * counter-clockwise. For a cantilever Ra and Ma act at the wall (x = 0) and
 * Rb is zero.
 */
struct ReactionSet {
    double Ra = 0.0;          ///< Vertical reaction at support A [N]
    double Rb = 0.0;          ///< Vertical reaction at support B [N]
    double Ma = 0.0;          ///< Reaction moment at a fixed support [N·m]
    double support_a = 0.0;   ///< Position of support A [m]
    double support_b = 0.0;   ///< Position of support B [m]
    bool degenerate = false;  ///< Supports coincide; reactions are not physical

    /**
     * @brief Sum of vertical forces of reactions and loads [N]
     *
     * Zero (to round-off) for a non-degenerate solution.
     */
    double force_residual(const std::vector<LoadDefinition>& loads) const;

    /**
     * @brief Sum of moments of reactions and loads about a pivot [N·m]
     */
    double moment_residual(const std::vector<LoadDefinition>& loads, double pivot) const;
};

/**
 * @brief Solve static equilibrium for the support reactions
 *
 * Accumulates ΣFy and ΣM about support A over all loads, then
 * - Cantilever: Ra = −ΣFy, Ma = −ΣM
 * - Two supports: Rb = −ΣM / (xB − xA), Ra = −ΣFy − Rb
 *
 * Coincident supports use a unit span, set ReactionSet::degenerate and add a
 * High warning.
 *
 * @param config Beam configuration (boundary condition and supports)
 * @param loads Resolved load list
 * @param warnings Optional list that receives warnings
 * @return ReactionSet
 */
ReactionSet solve_reactions(const BeamConfig& config,
                            const std::vector<LoadDefinition>& loads,
                            WarningList* warnings = nullptr);

/**
 * @brief Check that reactions balance the loads
 *
 * Forces and moments about support A must vanish relative to the magnitude
 * of the forces involved. Degenerate solutions are not checked.
 *
 * @param reactions Reactions from solve_reactions()
 * @param loads Resolved load list
 * @param length Beam length [m]
 * @throws InvariantError with EQUILIBRIUM_VIOLATED on imbalance
 */
void verify_equilibrium(const ReactionSet& reactions,
                        const std::vector<LoadDefinition>& loads,
                        double length);

} // namespace beamlab
