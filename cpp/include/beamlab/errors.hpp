/**
 * @file errors.hpp
 * @brief Structured error handling for BeamLab.
 *
 * The analysis functions are total for transiently invalid interactive input
 * (see warnings.hpp for the fallbacks). Errors defined here are reserved for
 * internal invariant violations, which are programming defects and are thrown
 * as InvariantError.
 */

#ifndef BEAMLAB_ERRORS_HPP
#define BEAMLAB_ERRORS_HPP

#include <map>
#include <stdexcept>
#include <string>

namespace beamlab {

/**
 * @brief Error codes for BeamLab invariant violations.
 */
enum class ErrorCode {
    /// No error
    OK = 0,

    // === Segment Errors (100-199) ===

    /// Piecewise segments leave a gap or start/end away from the beam ends
    SEGMENT_COVERAGE = 100,

    /// Piecewise segments overlap or are not sorted
    SEGMENT_ORDER = 101,

    // === Numerical Errors (200-299) ===

    /// Non-finite value produced by a closed-form expression
    NON_FINITE_RESULT = 200,

    /// Equilibrium residual exceeds tolerance after solving reactions
    EQUILIBRIUM_VIOLATED = 201,

    // === Generic Errors (900-999) ===

    /// Unknown or unspecified error
    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::SEGMENT_COVERAGE: return "SEGMENT_COVERAGE";
        case ErrorCode::SEGMENT_ORDER: return "SEGMENT_ORDER";
        case ErrorCode::NON_FINITE_RESULT: return "NON_FINITE_RESULT";
        case ErrorCode::EQUILIBRIUM_VIOLATED: return "EQUILIBRIUM_VIOLATED";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for BeamLab.
 */
struct BeamlabError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    BeamlabError()
        : code(ErrorCode::OK), message("OK") {}

    BeamlabError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }

    bool is_error() const { return code != ErrorCode::OK; }

    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;
        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }
        return result;
    }

    // === Factory methods for common errors ===

    /**
     * @brief Create error for a segment list that does not cover [0, L].
     */
    static BeamlabError segment_gap(double expected, double found) {
        BeamlabError err(ErrorCode::SEGMENT_COVERAGE,
            "Piecewise segments do not cover the beam");
        err.details["expected_x"] = std::to_string(expected);
        err.details["found_x"] = std::to_string(found);
        return err;
    }

    /**
     * @brief Create error for a segment whose end precedes its start.
     */
    static BeamlabError segment_order(double x_start, double x_end) {
        BeamlabError err(ErrorCode::SEGMENT_ORDER,
            "Piecewise segment is empty or reversed");
        err.details["x_start"] = std::to_string(x_start);
        err.details["x_end"] = std::to_string(x_end);
        return err;
    }

    /**
     * @brief Create error for reactions that do not balance the loads.
     */
    static BeamlabError equilibrium_violated(double force_residual, double moment_residual) {
        BeamlabError err(ErrorCode::EQUILIBRIUM_VIOLATED,
            "Reactions do not balance the applied loads");
        err.details["force_residual"] = std::to_string(force_residual);
        err.details["moment_residual"] = std::to_string(moment_residual);
        return err;
    }

    /**
     * @brief Create error for a NaN or infinite result.
     */
    static BeamlabError non_finite(const std::string& quantity, double x) {
        BeamlabError err(ErrorCode::NON_FINITE_RESULT,
            "Non-finite " + quantity + " computed");
        err.details["x"] = std::to_string(x);
        return err;
    }
};

/**
 * @brief Exception thrown when an internal invariant is violated.
 *
 * Never raised for user input; seeing one indicates a defect in the engine.
 */
class InvariantError : public std::logic_error {
public:
    explicit InvariantError(BeamlabError error)
        : std::logic_error(error.to_string()), error_(std::move(error)) {}

    const BeamlabError& error() const { return error_; }

private:
    BeamlabError error_;
};

}  // namespace beamlab

#endif  // BEAMLAB_ERRORS_HPP
