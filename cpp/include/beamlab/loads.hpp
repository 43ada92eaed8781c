#pragma once

#include "beamlab/warnings.hpp"

#include <string>
#include <variant>
#include <vector>

namespace beamlab {

/**
 * @brief End of a triangular load that carries the peak intensity
 */
enum class PeakSide {
    Left,   ///< Peak at x1, zero at x2
    Right   ///< Zero at x1, peak at x2
};

/**
 * @brief Concentrated transverse force
 *
 * Sign convention used by every load type: upward forces are positive, so a
 * downward load has a negative magnitude.
 */
struct PointLoad {
    double x = 0.0;          ///< Position along beam [m]
    double magnitude = 0.0;  ///< Force [N] (negative = downward)

    bool operator==(const PointLoad& o) const { return x == o.x && magnitude == o.magnitude; }
};

/**
 * @brief Constant distributed load over [x1, x2]
 */
struct UniformLoad {
    double x1 = 0.0;         ///< Start of loaded span [m]
    double x2 = 0.0;         ///< End of loaded span [m]
    double magnitude = 0.0;  ///< Intensity [N/m] (negative = downward)

    double span() const { return x2 - x1; }
    double total_force() const { return magnitude * span(); }
    double centroid() const { return 0.5 * (x1 + x2); }

    bool operator==(const UniformLoad& o) const {
        return x1 == o.x1 && x2 == o.x2 && magnitude == o.magnitude;
    }
};

/**
 * @brief Linearly varying distributed load over [x1, x2]
 *
 * Intensity is zero at one end and @c peak at the other. The resultant acts at
 * the centroid, one third of the span away from the peak end.
 */
struct TriangularLoad {
    double x1 = 0.0;                   ///< Start of loaded span [m]
    double x2 = 0.0;                   ///< End of loaded span [m]
    double peak = 0.0;                 ///< Peak intensity [N/m] (negative = downward)
    PeakSide peak_side = PeakSide::Right;

    double span() const { return x2 - x1; }
    double total_force() const { return 0.5 * peak * span(); }
    double centroid() const;

    /**
     * @brief Load intensity at position x (zero outside the span)
     */
    double intensity_at(double x) const;

    bool operator==(const TriangularLoad& o) const {
        return x1 == o.x1 && x2 == o.x2 && peak == o.peak && peak_side == o.peak_side;
    }
};

/**
 * @brief Concentrated couple
 */
struct AppliedMoment {
    double x = 0.0;          ///< Position along beam [m]
    double magnitude = 0.0;  ///< Moment [N·m] (positive = counter-clockwise)

    bool operator==(const AppliedMoment& o) const { return x == o.x && magnitude == o.magnitude; }
};

using LoadVariant = std::variant<PointLoad, UniformLoad, TriangularLoad, AppliedMoment>;

/**
 * @brief Load type tag
 */
enum class LoadType {
    Point,
    Uniform,
    Triangular,
    Moment
};

std::string load_type_to_string(LoadType type);

/**
 * @brief A labelled load primitive applied to the beam
 *
 * The label only serves display numbering; insertion order has no effect on
 * the analysis.
 */
struct LoadDefinition {
    std::string label;   ///< Display label
    LoadVariant load;    ///< The load primitive

    static LoadDefinition point(double x, double magnitude, std::string label = "");
    static LoadDefinition uniform(double x1, double x2, double magnitude, std::string label = "");
    static LoadDefinition triangular(double x1, double x2, double peak, PeakSide side,
                                     std::string label = "");
    static LoadDefinition moment(double x, double magnitude, std::string label = "");

    LoadType type() const;

    /**
     * @brief Vertical resultant [N] (zero for an applied moment)
     */
    double resultant_force() const;

    /**
     * @brief Moment of this load about a pivot [N·m], counter-clockwise positive
     *
     * A force F acting at x contributes F·(x − pivot); an applied moment
     * contributes its magnitude regardless of the pivot.
     */
    double moment_about(double pivot) const;

    /**
     * @brief Distributed intensity at x [N/m] (zero for concentrated loads)
     */
    double intensity_at(double x) const;

    /**
     * @brief True for uniform and triangular loads
     */
    bool is_distributed() const;

    /**
     * @brief Positions where this load makes V or M non-smooth
     */
    std::vector<double> discontinuities() const;

    bool operator==(const LoadDefinition& o) const { return label == o.label && load == o.load; }
    bool operator!=(const LoadDefinition& o) const { return !(*this == o); }
};

/**
 * @brief Load specification given by an explicit list of primitives
 */
struct ExplicitLoads {
    std::vector<LoadDefinition> loads;
};

/**
 * @brief Load specification given by a single base point load
 */
struct ImplicitSingleLoad {
    double magnitude = 0.0;  ///< Force [N] (negative = downward)
    double position = 0.0;   ///< Position along beam [m]
};

using LoadSpec = std::variant<ExplicitLoads, ImplicitSingleLoad>;

/**
 * @brief Resolve a load specification into a concrete, validated load list
 *
 * An implicit single load becomes one point load. Positions are clamped into
 * [0, L]; range loads whose extent is empty after clamping are dropped. Each
 * correction is reported to @p warnings when given.
 *
 * @param spec Load specification
 * @param length Beam length [m]
 * @param warnings Optional list that receives warnings
 * @return Resolved load list
 */
std::vector<LoadDefinition> resolve_loads(const LoadSpec& spec, double length,
                                          WarningList* warnings = nullptr);

/**
 * @brief Clamp a position into [0, L], reporting the correction
 */
double clamp_position(double x, double length, const std::string& what,
                      WarningList* warnings = nullptr);

} // namespace beamlab
