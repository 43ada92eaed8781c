#include "beamlab/reaction_solver.hpp"
#include "beamlab/errors.hpp"

#include <algorithm>
#include <cmath>

namespace beamlab {

namespace {
constexpr double SPAN_TOLERANCE = 1e-6;          // [m]
constexpr double EQUILIBRIUM_TOLERANCE = 1e-9;  // relative to the load scale
}

double ReactionSet::force_residual(const std::vector<LoadDefinition>& loads) const {
    double sum = Ra + Rb;
    for (const auto& load : loads) {
        sum += load.resultant_force();
    }
    return sum;
}

double ReactionSet::moment_residual(const std::vector<LoadDefinition>& loads, double pivot) const {
    double sum = Ra * (support_a - pivot) + Rb * (support_b - pivot) + Ma;
    for (const auto& load : loads) {
        sum += load.moment_about(pivot);
    }
    return sum;
}

ReactionSet solve_reactions(const BeamConfig& config,
                            const std::vector<LoadDefinition>& loads,
                            WarningList* warnings) {
    const SupportLayout layout = config.supports(warnings);
    const double pivot = layout.support_a;

    double sum_fy = 0.0;
    double sum_m = 0.0;
    for (const auto& load : loads) {
        sum_fy += load.resultant_force();
        sum_m += load.moment_about(pivot);
    }

    ReactionSet reactions;
    reactions.support_a = layout.support_a;
    reactions.support_b = layout.support_b;

    if (config.boundary == BoundaryCondition::Cantilever) {
        // Fixed end carries everything
        reactions.Ra = -sum_fy;
        reactions.Ma = -sum_m;
        reactions.Rb = 0.0;
        return reactions;
    }

    double span = layout.span();
    if (std::abs(span) < SPAN_TOLERANCE) {
        span = 1.0;
        reactions.degenerate = true;
        if (warnings) {
            warnings->add(BeamlabWarning::degenerate_support_span(layout.support_a,
                                                                  layout.support_b));
        }
    }

    reactions.Rb = -sum_m / span;
    reactions.Ra = -sum_fy - reactions.Rb;
    reactions.Ma = 0.0;
    return reactions;
}

void verify_equilibrium(const ReactionSet& reactions,
                        const std::vector<LoadDefinition>& loads,
                        double length) {
    if (reactions.degenerate) return;

    const double pivot = reactions.support_a;
    double force_scale = std::abs(reactions.Ra) + std::abs(reactions.Rb);
    double moment_scale = force_scale * length + std::abs(reactions.Ma);
    for (const auto& load : loads) {
        force_scale += std::abs(load.resultant_force());
        moment_scale += std::abs(load.resultant_force()) * length +
                        std::abs(load.moment_about(pivot));
    }

    const double fy = reactions.force_residual(loads);
    const double m = reactions.moment_residual(loads, pivot);
    if (std::abs(fy) > EQUILIBRIUM_TOLERANCE * std::max(1.0, force_scale) ||
        std::abs(m) > EQUILIBRIUM_TOLERANCE * std::max(1.0, moment_scale)) {
        throw InvariantError(BeamlabError::equilibrium_violated(fy, m));
    }
}

} // namespace beamlab
