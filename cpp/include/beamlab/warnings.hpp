/**
 * @file warnings.hpp
 * @brief Warning system for degenerate or questionable configurations.
 *
 * The engine stays responsive to continuously dragged interactive inputs, so
 * invalid geometry is resolved by a defined fallback instead of a failure.
 * Every fallback taken is reported here so that callers can flag it.
 */

#ifndef BEAMLAB_WARNINGS_HPP
#define BEAMLAB_WARNINGS_HPP

#include <map>
#include <string>
#include <vector>

namespace beamlab {

/**
 * @brief Warning codes for degenerate or questionable configurations.
 */
enum class WarningCode {
    // === Geometry Warnings (100-199) ===

    /// I-beam cutout is larger than the outer box; solid inertia used
    SECTION_SOLID_FALLBACK = 100,

    /// Supports coincide; a unit span was substituted
    DEGENERATE_SUPPORT_SPAN = 101,

    /// Boundary condition has no closed-form deformation field
    UNSUPPORTED_FIELD_BOUNDARY = 102,

    // === Load Warnings (200-299) ===

    /// Load or support position outside [0, L] was clamped
    POSITION_CLAMPED = 200,

    /// Range load has x1 >= x2 or lies outside the beam
    INVALID_LOAD_RANGE = 201,

    // === Result Warnings (300-399) ===

    /// Maximum bending stress exceeds the yield strength
    HIGH_STRESS = 300,

    /// Maximum deflection exceeds the span/360 serviceability limit
    EXCESSIVE_DEFLECTION = 301,

    /// Yield strength is zero or negative; ratio denominators were clamped
    NON_POSITIVE_YIELD = 302
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Result is numerically defined but physically meaningless
    High = 2
};

/**
 * @brief Convert warning code to string representation.
 */
inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::SECTION_SOLID_FALLBACK: return "SECTION_SOLID_FALLBACK";
        case WarningCode::DEGENERATE_SUPPORT_SPAN: return "DEGENERATE_SUPPORT_SPAN";
        case WarningCode::UNSUPPORTED_FIELD_BOUNDARY: return "UNSUPPORTED_FIELD_BOUNDARY";
        case WarningCode::POSITION_CLAMPED: return "POSITION_CLAMPED";
        case WarningCode::INVALID_LOAD_RANGE: return "INVALID_LOAD_RANGE";
        case WarningCode::HIGH_STRESS: return "HIGH_STRESS";
        case WarningCode::EXCESSIVE_DEFLECTION: return "EXCESSIVE_DEFLECTION";
        case WarningCode::NON_POSITIVE_YIELD: return "NON_POSITIVE_YIELD";
        default: return "UNKNOWN_WARNING";
    }
}

/**
 * @brief Convert severity to string representation.
 */
inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning information for BeamLab.
 */
struct BeamlabWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the warning
    std::string suggestion;

    BeamlabWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common warnings ===

    /**
     * @brief Create warning for an I-beam whose cutout exceeds the outer box.
     */
    static BeamlabWarning section_solid_fallback(double inner_height, double inner_width) {
        BeamlabWarning warn(WarningCode::SECTION_SOLID_FALLBACK, WarningSeverity::Low,
            "I-beam cutout is not positive; section treated as a solid rectangle");
        warn.details["inner_height"] = std::to_string(inner_height) + " m";
        warn.details["inner_width"] = std::to_string(inner_width) + " m";
        warn.suggestion = "Reduce flange or web thickness below the outer dimensions";
        return warn;
    }

    /**
     * @brief Create warning for coincident supports.
     */
    static BeamlabWarning degenerate_support_span(double support_a, double support_b) {
        BeamlabWarning warn(WarningCode::DEGENERATE_SUPPORT_SPAN, WarningSeverity::High,
            "Supports coincide; reactions computed with a unit span are not physical");
        warn.details["support_a"] = std::to_string(support_a) + " m";
        warn.details["support_b"] = std::to_string(support_b) + " m";
        warn.suggestion = "Separate the two supports";
        return warn;
    }

    /**
     * @brief Create warning for a boundary condition without a closed-form field.
     */
    static BeamlabWarning unsupported_field_boundary(const std::string& boundary) {
        BeamlabWarning warn(WarningCode::UNSUPPORTED_FIELD_BOUNDARY, WarningSeverity::Medium,
            "No closed-form deformation field for this boundary condition; "
            "mesh is returned undeformed and unstressed");
        warn.details["boundary_condition"] = boundary;
        warn.suggestion = "Use the shear/moment diagrams for this configuration";
        return warn;
    }

    /**
     * @brief Create warning for a load or support position clamped into the beam.
     */
    static BeamlabWarning position_clamped(const std::string& what, double requested, double used) {
        BeamlabWarning warn(WarningCode::POSITION_CLAMPED, WarningSeverity::Low,
            "Position outside the beam was clamped");
        warn.details["item"] = what;
        warn.details["requested_x"] = std::to_string(requested) + " m";
        warn.details["used_x"] = std::to_string(used) + " m";
        return warn;
    }

    /**
     * @brief Create warning for a range load with an invalid extent.
     */
    static BeamlabWarning invalid_load_range(const std::string& label, double x1, double x2) {
        BeamlabWarning warn(WarningCode::INVALID_LOAD_RANGE, WarningSeverity::Medium,
            "Range load extent is empty or outside the beam");
        warn.details["load"] = label;
        warn.details["x1"] = std::to_string(x1) + " m";
        warn.details["x2"] = std::to_string(x2) + " m";
        warn.suggestion = "Ensure 0 <= x1 < x2 <= L";
        return warn;
    }

    /**
     * @brief Create warning for stress above yield.
     */
    static BeamlabWarning high_stress(double max_stress, double yield_strength) {
        BeamlabWarning warn(WarningCode::HIGH_STRESS, WarningSeverity::High,
            "Maximum bending stress exceeds the yield strength");
        warn.details["max_stress"] = std::to_string(max_stress) + " Pa";
        warn.details["yield_strength"] = std::to_string(yield_strength) + " Pa";
        warn.suggestion = "Increase the section depth or reduce the load";
        return warn;
    }

    /**
     * @brief Create warning for deflection above span/360.
     */
    static BeamlabWarning excessive_deflection(double max_deflection, double allowable) {
        BeamlabWarning warn(WarningCode::EXCESSIVE_DEFLECTION, WarningSeverity::Medium,
            "Maximum deflection exceeds the span/360 serviceability limit");
        warn.details["max_deflection"] = std::to_string(max_deflection) + " m";
        warn.details["allowable"] = std::to_string(allowable) + " m";
        warn.suggestion = "Increase bending stiffness (E or I)";
        return warn;
    }

    /**
     * @brief Create warning for a non-positive yield strength.
     */
    static BeamlabWarning non_positive_yield(double yield_strength) {
        BeamlabWarning warn(WarningCode::NON_POSITIVE_YIELD, WarningSeverity::Medium,
            "Yield strength is not positive; safety factor is not meaningful");
        warn.details["yield_strength"] = std::to_string(yield_strength) + " Pa";
        return warn;
    }
};

/**
 * @brief Collection of warnings produced by one analysis.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<BeamlabWarning> warnings;

    void add(const BeamlabWarning& warning) {
        warnings.push_back(warning);
    }

    void add(BeamlabWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    /**
     * @brief Append all warnings of another list.
     */
    void extend(const WarningList& other) {
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    /**
     * @brief Check whether a warning with the given code was raised.
     */
    bool contains(WarningCode code) const {
        for (const auto& w : warnings) {
            if (w.code == code) return true;
        }
        return false;
    }

    size_t count_by_severity(WarningSeverity severity) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    void clear() { warnings.clear(); }

    /**
     * @brief Get formatted summary string.
     */
    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) + " warning(s): ";
        result += std::to_string(count_by_severity(WarningSeverity::High)) + " high, ";
        result += std::to_string(count_by_severity(WarningSeverity::Medium)) + " medium, ";
        result += std::to_string(count_by_severity(WarningSeverity::Low)) + " low";
        return result;
    }
};

}  // namespace beamlab

#endif  // BEAMLAB_WARNINGS_HPP
