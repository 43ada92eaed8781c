#pragma once

#include "beamlab/beam_config.hpp"
#include "beamlab/beam_field_solver.hpp"
#include "beamlab/section.hpp"
#include "beamlab/warnings.hpp"

#include <string>

namespace beamlab {

/// Serviceability limit: allowable deflection = span / 360
constexpr double DEFLECTION_LIMIT_RATIO = 360.0;

/// Safety factor below which a design is rated Marginal
constexpr double MARGINAL_SAFETY_FACTOR = 1.5;

/**
 * @brief Qualitative rating of the strength check
 */
enum class SafetyRating {
    Unsafe,    ///< Safety factor < 1.0
    Marginal,  ///< 1.0 <= safety factor < 1.5
    Adequate   ///< Safety factor >= 1.5
};

std::string safety_rating_to_string(SafetyRating rating);

/**
 * @brief Rate a safety factor
 */
SafetyRating rate_safety_factor(double safety_factor);

/**
 * @brief Strength and serviceability check of one beam analysis
 */
struct DesignCheck {
    double max_stress = 0.0;            ///< max |σ| [Pa]
    double max_deflection = 0.0;        ///< max |v| [m]
    double safety_factor = 0.0;         ///< fy / max(1, max |σ|)
    SafetyRating rating = SafetyRating::Unsafe;
    double allowable_deflection = 0.0;  ///< L / 360 [m]
    double deflection_ratio = 0.0;      ///< L / max(1e-4, max |v|)
    bool deflection_ok = false;         ///< max |v| <= L / 360

    bool passes() const { return rating != SafetyRating::Unsafe && deflection_ok; }
};

/**
 * @brief Run the strength and serviceability checks
 *
 * Adds HIGH_STRESS when max |σ| exceeds the yield strength,
 * EXCESSIVE_DEFLECTION when the L/360 limit is exceeded, and
 * NON_POSITIVE_YIELD when the material has no usable yield strength.
 */
DesignCheck evaluate_design(const BeamConfig& config, const FieldStatistics& stats,
                            WarningList* warnings = nullptr);

/**
 * @brief Bending stresses in the extreme fibres for a moment M
 *
 * top = −M·c/I, bottom = +M·c/I with c = depth/2, tension positive.
 */
struct FibreStress {
    double top = 0.0;     ///< y = +depth/2 [Pa]
    double bottom = 0.0;  ///< y = −depth/2 [Pa]
};

FibreStress extreme_fibre_stresses(double moment, const SectionProperties& section);

/**
 * @brief Plain-text summary of a beam analysis
 *
 * Lists the case name, boundary condition, section shape and dimensions,
 * material, base load and the results of the design check. Intended as the
 * context handed to a conversational assistant.
 */
std::string format_summary(const std::string& case_name, const BeamConfig& config,
                           const DesignCheck& check);

} // namespace beamlab
