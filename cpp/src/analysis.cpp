#include "beamlab/analysis.hpp"
#include "beamlab/errors.hpp"

#include <cmath>

namespace beamlab {

namespace {

void require_finite(const std::string& quantity, double value, double x) {
    if (!std::isfinite(value)) {
        throw InvariantError(BeamlabError::non_finite(quantity, x));
    }
}

void check_finite(const BeamAnalysisResult& r) {
    require_finite("Ra", r.reactions.Ra, r.reactions.support_a);
    require_finite("Rb", r.reactions.Rb, r.reactions.support_b);
    require_finite("Ma", r.reactions.Ma, r.reactions.support_a);

    for (const auto& n : r.mesh.nodes) {
        require_finite("deflection", n.deflection, n.x);
        require_finite("stress", n.stress, n.x);
    }
    for (Eigen::Index i = 0; i < r.diagrams.size(); ++i) {
        const InternalActions a = r.diagrams.at(i);
        require_finite("shear", a.V, a.x);
        require_finite("moment", a.M, a.x);
    }
    for (const auto& seg : r.segments) {
        const InternalActions a = seg.polynomial.at(seg.x_start);
        require_finite("segment shear", a.V, a.x);
        require_finite("segment moment", a.M, a.x);
    }
}

} // namespace

BeamAnalysisResult analyze_beam(const BeamConfig& config, const AnalysisOptions& options) {
    config.validate();

    BeamAnalysisResult r;
    r.section = compute_section_properties(config.section, &r.warnings);
    r.loads = resolve_loads(config.load_spec(), config.length, &r.warnings);
    r.reactions = solve_reactions(config, r.loads, &r.warnings);
    verify_equilibrium(r.reactions, r.loads, config.length);

    // The base load is resolved twice when it also drives the diagrams;
    // report its clamping once.
    WarningList field_warnings;
    BeamFieldSolver field(config, r.section, &field_warnings);
    if (std::holds_alternative<ImplicitSingleLoad>(config.load_spec())) {
        for (const auto& w : field_warnings.warnings) {
            if (w.code != WarningCode::POSITION_CLAMPED) r.warnings.add(w);
        }
    } else {
        r.warnings.extend(field_warnings);
    }

    r.mesh = field.build_mesh(options.mesh);
    r.statistics = compute_field_statistics(r.mesh);
    r.diagrams = integrate_diagrams(config, r.loads, r.reactions, options.diagram_samples);
    r.segments = build_piecewise_segments(config, r.loads, r.reactions);

    check_finite(r);

    r.check = evaluate_design(config, r.statistics, &r.warnings);
    r.summary = format_summary(options.case_name, config, r.check);
    return r;
}

BearingAnalysisResult analyze_bearing(const BearingConfig& config, int resolution) {
    BearingAnalysisResult r;
    r.elements = distribute_bearing_load(config);
    r.max_ball_load = max_ball_load(config);

    r.stress_fields.reserve(r.elements.size());
    for (const auto& e : r.elements) {
        r.stress_fields.push_back(generate_ball_stress_field(e, resolution));
    }
    return r;
}

std::shared_ptr<const BeamAnalysisResult> Analyzer::beam(const BeamConfig& config,
                                                        const AnalysisOptions& options) {
    if (beam_result_ && *beam_config_ == config && beam_options_ == options) {
        return beam_result_;
    }

    // A throwing input leaves the memo unchanged
    auto result = std::make_shared<const BeamAnalysisResult>(analyze_beam(config, options));
    ++evaluations_;

    beam_config_ = std::make_unique<BeamConfig>(config);
    beam_options_ = options;
    beam_result_ = result;
    return result;
}

std::shared_ptr<const BearingAnalysisResult> Analyzer::bearing(const BearingConfig& config,
                                                              int resolution) {
    if (bearing_result_ && bearing_config_ == config && bearing_resolution_ == resolution) {
        return bearing_result_;
    }

    auto result = std::make_shared<const BearingAnalysisResult>(analyze_bearing(config, resolution));
    ++evaluations_;

    bearing_config_ = config;
    bearing_resolution_ = resolution;
    bearing_result_ = result;
    return result;
}

void Analyzer::clear() {
    beam_config_.reset();
    beam_result_.reset();
    bearing_result_.reset();
}

} // namespace beamlab
