#include "beamlab/design_checks.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace beamlab {

namespace {

// Floors that keep the ratios finite for unloaded beams
constexpr double MIN_STRESS_DENOMINATOR = 1.0;       // [Pa]
constexpr double MIN_DEFLECTION_DENOMINATOR = 1e-4;  // [m]

} // namespace

std::string safety_rating_to_string(SafetyRating rating) {
    switch (rating) {
        case SafetyRating::Unsafe:   return "Unsafe";
        case SafetyRating::Marginal: return "Marginal";
        case SafetyRating::Adequate: return "Adequate";
        default: return "Unknown";
    }
}

SafetyRating rate_safety_factor(double safety_factor) {
    if (safety_factor < 1.0) return SafetyRating::Unsafe;
    if (safety_factor < MARGINAL_SAFETY_FACTOR) return SafetyRating::Marginal;
    return SafetyRating::Adequate;
}

DesignCheck evaluate_design(const BeamConfig& config, const FieldStatistics& stats,
                            WarningList* warnings) {
    const double L = config.length;
    const double fy = config.material.fy;

    DesignCheck check;
    check.max_stress = stats.max_stress;
    check.max_deflection = stats.max_deflection;

    check.safety_factor = fy / std::max(MIN_STRESS_DENOMINATOR, std::abs(stats.max_stress));
    check.rating = rate_safety_factor(check.safety_factor);

    check.allowable_deflection = L / DEFLECTION_LIMIT_RATIO;
    check.deflection_ratio = L / std::max(MIN_DEFLECTION_DENOMINATOR, stats.max_deflection);
    check.deflection_ok = stats.max_deflection <= check.allowable_deflection;

    if (warnings) {
        if (fy <= 0.0) {
            warnings->add(BeamlabWarning::non_positive_yield(fy));
        } else if (stats.max_stress > fy) {
            warnings->add(BeamlabWarning::high_stress(stats.max_stress, fy));
        }
        if (!check.deflection_ok) {
            warnings->add(BeamlabWarning::excessive_deflection(stats.max_deflection,
                                                               check.allowable_deflection));
        }
    }

    return check;
}

FibreStress extreme_fibre_stresses(double moment, const SectionProperties& section) {
    const double c = section.fibre_distance();
    FibreStress fs;
    fs.top = -moment * c / section.I;
    fs.bottom = moment * c / section.I;
    return fs;
}

std::string format_summary(const std::string& case_name, const BeamConfig& config,
                           const DesignCheck& check) {
    std::ostringstream oss;
    oss << std::fixed;

    oss << "Case: " << case_name << "\n";
    oss << "Boundary condition: " << boundary_condition_to_string(config.boundary) << "\n";
    oss << "Section: " << section_shape_to_string(config.section.shape) << "\n";
    oss << std::setprecision(2)
        << "Dimensions: L = " << config.length << " m, H = " << config.section.height << " m\n";
    oss << std::setprecision(1)
        << "Material: " << config.material.name
        << ", E = " << config.material.E / 1e9 << " GPa";
    oss << std::setprecision(0) << ", fy = " << config.material.fy / 1e6 << " MPa\n";
    oss << std::setprecision(2)
        << "Load: " << config.force << " N at x = " << config.load_position << " m\n";

    oss << "Max stress: " << check.max_stress / 1e6 << " MPa\n";
    oss << "Safety factor: " << check.safety_factor << " ("
        << safety_rating_to_string(check.rating) << ", target > "
        << MARGINAL_SAFETY_FACTOR << ")\n";
    oss << "Max deflection: " << check.max_deflection * 1000.0 << " mm (allowable "
        << check.allowable_deflection * 1000.0 << " mm)\n";
    oss << std::setprecision(0)
        << "Deflection ratio: L/" << check.deflection_ratio << " (target > L/"
        << DEFLECTION_LIMIT_RATIO << ")\n";

    return oss.str();
}

} // namespace beamlab
