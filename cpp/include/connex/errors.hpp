/**
 * @file errors.hpp
 * @brief Structured error handling for connex.
 *
 * This file defines error codes, a structured error record and the
 * exception types used to report analysis failures. Every failure carries
 * a machine-readable code so that a design-check layer can decide whether
 * to halt, or to retry with the elastic method after a convergence failure.
 */

#ifndef CONNEX_ERRORS_HPP
#define CONNEX_ERRORS_HPP

#include <string>
#include <vector>
#include <map>
#include <stdexcept>

namespace connex {

/**
 * @brief Error codes for connex analysis failures.
 */
enum class ErrorCode {
    /// No error - analysis completed successfully
    OK = 0,

    // === Geometry Errors (100-199) ===

    /// Element group has no elements
    EMPTY_GROUP = 100,

    /// Total element weight (count or weld area) is zero
    ZERO_TOTAL_WEIGHT = 101,

    /// Polar or bending second moment is zero where a moment must be resisted
    ZERO_INERTIA = 102,

    /// No fastener row lies on the tension side of the neutral axis
    EMPTY_TENSION_ROWS = 103,

    /// Bearing plate has zero or negative depth
    DEGENERATE_PLATE = 104,

    // === Property Errors (200-299) ===

    /// Element or weld property is invalid (e.g., non-positive throat)
    INVALID_PROPERTY = 200,

    /// Coordinate or load component is not finite
    NON_FINITE_INPUT = 201,

    // === Usage Errors (300-399) ===

    /// Unknown analysis mode string
    UNKNOWN_MODE = 300,

    /// ICR requested with out-of-plane load on a weld group
    ICR_OUT_OF_PLANE = 301,

    /// ICR requested for a weld type other than fillet
    ICR_WELD_TYPE = 302,

    /// Fastener out-of-plane load without a bearing plate
    MISSING_PLATE = 303,

    /// Explicit row membership does not match the fastener count
    INVALID_ROW_MEMBERSHIP = 304,

    // === Solver Errors (500-599) ===

    /// ICR search hit its iteration cap without meeting the tolerance
    SOLVER_CONVERGENCE_FAILED = 500,

    /// ICR search could not bracket an equilibrium position
    SOLVER_NO_BRACKET = 501,

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
        case ErrorCode::EMPTY_GROUP: return "EMPTY_GROUP";
        case ErrorCode::ZERO_TOTAL_WEIGHT: return "ZERO_TOTAL_WEIGHT";
        case ErrorCode::ZERO_INERTIA: return "ZERO_INERTIA";
        case ErrorCode::EMPTY_TENSION_ROWS: return "EMPTY_TENSION_ROWS";
        case ErrorCode::DEGENERATE_PLATE: return "DEGENERATE_PLATE";
        case ErrorCode::INVALID_PROPERTY: return "INVALID_PROPERTY";
        case ErrorCode::NON_FINITE_INPUT: return "NON_FINITE_INPUT";
        case ErrorCode::UNKNOWN_MODE: return "UNKNOWN_MODE";
        case ErrorCode::ICR_OUT_OF_PLANE: return "ICR_OUT_OF_PLANE";
        case ErrorCode::ICR_WELD_TYPE: return "ICR_WELD_TYPE";
        case ErrorCode::MISSING_PLATE: return "MISSING_PLATE";
        case ErrorCode::INVALID_ROW_MEMBERSHIP: return "INVALID_ROW_MEMBERSHIP";
        case ErrorCode::SOLVER_CONVERGENCE_FAILED: return "SOLVER_CONVERGENCE_FAILED";
        case ErrorCode::SOLVER_NO_BRACKET: return "SOLVER_NO_BRACKET";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Error categories matching the three ways an analysis can fail.
 */
enum class ErrorCategory {
    None,
    Geometry,      ///< Degenerate geometry, fatal to the call
    Usage,         ///< Caller contract violation (mode/property)
    Convergence    ///< ICR solver failure, caller may retry elastically
};

/**
 * @brief Map an error code to its category.
 */
inline ErrorCategory error_category(ErrorCode code) {
    const int value = static_cast<int>(code);
    if (value == 0) return ErrorCategory::None;
    if (value >= 100 && value < 200) return ErrorCategory::Geometry;
    if (value >= 500 && value < 600) return ErrorCategory::Convergence;
    return ErrorCategory::Usage;
}

/**
 * @brief Structured error information for connex.
 *
 * Contains machine-readable error code, human-readable message,
 * and diagnostic information about the elements involved.
 */
struct ConnexError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Element indices involved in the error
    std::vector<int> involved_elements;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    ConnexError()
        : code(ErrorCode::OK), message("OK") {}

    ConnexError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }

    bool is_error() const { return code != ErrorCode::OK; }

    ErrorCategory category() const { return error_category(code); }

    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        if (!involved_elements.empty()) {
            result += "\n  Involved elements: ";
            for (size_t i = 0; i < involved_elements.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(involved_elements[i]);
            }
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    static ConnexError empty_group() {
        ConnexError err(ErrorCode::EMPTY_GROUP, "Element group has no elements");
        err.suggestion = "Provide at least one fastener position or weld segment.";
        return err;
    }

    static ConnexError zero_total_weight(double total_weight) {
        ConnexError err(ErrorCode::ZERO_TOTAL_WEIGHT,
            "Element group has zero total weight; centroid is undefined");
        err.details["total_weight"] = std::to_string(total_weight);
        err.suggestion = "Check weld throat and segment lengths.";
        return err;
    }

    /**
     * @brief Create error for a moment acting on a group with no lever arm.
     */
    static ConnexError zero_inertia(const std::string& quantity, double moment) {
        ConnexError err(ErrorCode::ZERO_INERTIA,
            "Second moment " + quantity + " is zero but a moment must be resisted");
        err.details["quantity"] = quantity;
        err.details["moment"] = std::to_string(moment);
        err.suggestion = "A single element (or collinear elements) cannot resist this moment. "
                        "Add elements with a lever arm about the centroid.";
        return err;
    }

    static ConnexError empty_tension_rows(const std::string& axis, double moment) {
        ConnexError err(ErrorCode::EMPTY_TENSION_ROWS,
            "No fastener row on the tension side of the neutral axis for bending about " + axis);
        err.details["axis"] = axis;
        err.details["moment"] = std::to_string(moment);
        err.suggestion = "Check the plate extent and neutral-axis mode; fasteners must lie "
                        "on the tension side to resist this moment.";
        return err;
    }

    static ConnexError invalid_property(const std::string& reason) {
        return ConnexError(ErrorCode::INVALID_PROPERTY, "Invalid property: " + reason);
    }

    static ConnexError not_converged(int iterations, double residual) {
        ConnexError err(ErrorCode::SOLVER_CONVERGENCE_FAILED,
            "ICR search did not reach the moment tolerance within the iteration cap");
        err.details["iterations"] = std::to_string(iterations);
        err.details["residual"] = std::to_string(residual);
        err.suggestion = "Increase IcrSolverSettings::max_iterations or retry with the elastic method.";
        return err;
    }
};

/**
 * @brief Base exception for analysis failures.
 *
 * Carries the structured error record. Catch one of the subclasses to react
 * to a specific category.
 */
class AnalysisError : public std::runtime_error {
public:
    explicit AnalysisError(ConnexError error)
        : std::runtime_error(error.to_string()), error_(std::move(error)) {}

    const ConnexError& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    ConnexError error_;
};

/// Empty group, coincident elements, zero weight, empty tension-side rows
class DegenerateGeometryError : public AnalysisError {
public:
    using AnalysisError::AnalysisError;
};

/// ICR iteration cap exceeded or no equilibrium bracket
class ConvergenceError : public AnalysisError {
public:
    using AnalysisError::AnalysisError;
};

/// Invalid mode combination or invalid input property
class InvalidModeError : public AnalysisError {
public:
    using AnalysisError::AnalysisError;
};

}  // namespace connex

#endif  // CONNEX_ERRORS_HPP
