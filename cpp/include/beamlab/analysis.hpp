#pragma once

#include "beamlab/beam_config.hpp"
#include "beamlab/beam_field_solver.hpp"
#include "beamlab/bearing.hpp"
#include "beamlab/design_checks.hpp"
#include "beamlab/diagram_integrator.hpp"
#include "beamlab/loads.hpp"
#include "beamlab/piecewise_polynomial.hpp"
#include "beamlab/reaction_solver.hpp"
#include "beamlab/section.hpp"
#include "beamlab/warnings.hpp"

#include <memory>
#include <string>
#include <vector>

namespace beamlab {

/**
 * @brief Discretization and labelling of a beam analysis
 */
struct AnalysisOptions {
    std::string case_name = "Case 1";  ///< Name used in the text summary
    MeshOptions mesh;                  ///< Visualization mesh
    int diagram_samples = 400;         ///< Intervals of the numeric V/M sweep (>= 1)

    bool operator==(const AnalysisOptions& other) const {
        return case_name == other.case_name && mesh == other.mesh &&
               diagram_samples == other.diagram_samples;
    }
    bool operator!=(const AnalysisOptions& other) const { return !(*this == other); }
};

/**
 * @brief Everything derived from one beam configuration
 */
struct BeamAnalysisResult {
    SectionProperties section;
    std::vector<LoadDefinition> loads;       ///< Resolved load list
    ReactionSet reactions;
    FieldMesh mesh;
    FieldStatistics statistics;
    DiagramData diagrams;
    std::vector<PiecewiseSegment> segments;
    DesignCheck check;
    std::string summary;
    WarningList warnings;                    ///< All fallbacks and check warnings
};

/**
 * @brief Run the complete beam pipeline
 *
 * section → loads → reactions → field mesh → statistics → diagrams →
 * segments → design check → summary.
 *
 * @throws std::invalid_argument for malformed configuration or options
 * @throws InvariantError if the results contain non-finite values or the
 *         segments fail to cover the beam
 */
BeamAnalysisResult analyze_beam(const BeamConfig& config,
                                const AnalysisOptions& options = AnalysisOptions{});

/**
 * @brief Bearing load distribution with the stress field of every ball
 */
struct BearingAnalysisResult {
    std::vector<BearingElement> elements;
    std::vector<std::vector<StressPoint>> stress_fields;  ///< One field per element
    double max_ball_load = 0.0;                            ///< Qmax [N]
};

/**
 * @brief Distribute the bearing load and generate every ball stress field
 *
 * @throws std::invalid_argument for invalid geometry or resolution < 1
 */
BearingAnalysisResult analyze_bearing(const BearingConfig& config, int resolution = 8);

/**
 * @brief Memoizing front end for repeated analyses
 *
 * Keeps the last beam and bearing result and returns it again while the
 * inputs are unchanged. Any change recomputes everything from scratch;
 * results are never patched.
 *
 * Results are shared, immutable snapshots. A result obtained earlier stays
 * valid after later calls replace the memo or clear() drops it.
 *
 * Not thread-safe; use one Analyzer per thread.
 *
 * Usage:
 * @code
 *   Analyzer analyzer;
 *   auto r = analyzer.beam(config);
 *   double sf = r->check.safety_factor;
 * @endcode
 */
class Analyzer {
public:
    Analyzer() = default;

    /**
     * @brief Beam result for (config, options), recomputed only on change
     */
    std::shared_ptr<const BeamAnalysisResult> beam(const BeamConfig& config,
                                                   const AnalysisOptions& options = AnalysisOptions{});

    /**
     * @brief Bearing result for (config, resolution), recomputed only on change
     */
    std::shared_ptr<const BearingAnalysisResult> bearing(const BearingConfig& config,
                                                         int resolution = 8);

    /// Number of pipeline runs so far (beam and bearing)
    int evaluation_count() const { return evaluations_; }

    /// Drop both memoized results
    void clear();

private:
    std::unique_ptr<BeamConfig> beam_config_;
    AnalysisOptions beam_options_;
    std::shared_ptr<const BeamAnalysisResult> beam_result_;

    BearingConfig bearing_config_;
    int bearing_resolution_ = 0;
    std::shared_ptr<const BearingAnalysisResult> bearing_result_;

    int evaluations_ = 0;
};

} // namespace beamlab
