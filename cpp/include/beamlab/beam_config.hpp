#pragma once

#include "beamlab/loads.hpp"
#include "beamlab/material.hpp"
#include "beamlab/section.hpp"
#include "beamlab/warnings.hpp"

#include <string>
#include <vector>

namespace beamlab {

/**
 * @brief Beam support arrangement
 */
enum class BoundaryCondition {
    Cantilever,       ///< Fixed at x = 0, free at x = L
    SimplySupported,  ///< Pin at x = 0, roller at x = L
    Overhanging       ///< Pin at support_a, roller at support_b, free overhangs
};

std::string boundary_condition_to_string(BoundaryCondition bc);

/**
 * @brief Resolved support positions
 *
 * For a cantilever only support_a (the wall at x = 0) is meaningful.
 */
struct SupportLayout {
    double support_a = 0.0;  ///< Fixed end or first support [m]
    double support_b = 0.0;  ///< Second support [m] (unused for cantilever)

    double span() const { return support_b - support_a; }
};

/**
 * @brief Complete input for a beam analysis
 *
 * Defaults reproduce the reference design case: 8 m simply supported steel
 * beam, 0.2 x 0.5 m rectangular section, 50 kN downward at midspan.
 *
 * The base load (force, load_position) always drives the closed-form
 * deformation field. The shear/moment analysis uses custom_loads when any
 * are given and the base load otherwise (see load_spec()).
 */
struct BeamConfig {
    double length = 8.0;                                        ///< Beam length L [m]
    BoundaryCondition boundary = BoundaryCondition::SimplySupported;
    double support_a = 1.0;                                     ///< Overhanging only [m]
    double support_b = 7.0;                                     ///< Overhanging only [m]

    Material material = Material::steel();
    SectionDescriptor section = SectionDescriptor::rectangular(0.2, 0.5);

    double force = -50000.0;       ///< Base point load [N] (negative = downward)
    double load_position = 4.0;    ///< Base point load position [m]

    std::vector<LoadDefinition> custom_loads;  ///< Mixed load list for diagrams

    /**
     * @brief Load specification as an explicit tagged variant
     *
     * ExplicitLoads when custom loads are present, ImplicitSingleLoad built
     * from the base load otherwise.
     */
    LoadSpec load_spec() const;

    /**
     * @brief Support positions for the boundary condition
     *
     * Overhanging support positions are clamped into [0, L].
     */
    SupportLayout supports(WarningList* warnings = nullptr) const;

    /**
     * @brief Throw std::invalid_argument for records with no meaningful fallback
     *
     * Rejects non-positive length or Young's modulus, and any non-positive
     * dimension of the active section shape.
     */
    void validate() const;

    bool operator==(const BeamConfig& other) const;
    bool operator!=(const BeamConfig& other) const { return !(*this == other); }
};

} // namespace beamlab
