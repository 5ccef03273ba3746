/**
 * @file warnings.hpp
 * @brief Warning system for questionable connection configurations.
 *
 * Warnings indicate conditions that don't prevent analysis
 * but may indicate modeling errors or approximate results.
 */

#ifndef CONNEX_WARNINGS_HPP
#define CONNEX_WARNINGS_HPP

#include <string>
#include <vector>
#include <map>

namespace connex {

/**
 * @brief Warning codes for questionable connection configurations.
 */
enum class WarningCode {
    // === Geometry Warnings (100-199) ===

    /// Group has a single element (no torsional resistance)
    SINGLE_ELEMENT_GROUP = 100,

    /// Weld path discretized into few segments
    COARSE_DISCRETIZATION = 101,

    /// Fastener lies outside the bearing plate
    FASTENER_OUTSIDE_PLATE = 102,

    /// Tolerance-based row grouping merged distinct coordinates
    ROWS_MERGED = 103,

    // === Solver Warnings (500-599) ===

    /// ICR requested but the load is concentric or pure torsion
    ICR_ELASTIC_FALLBACK = 500
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Likely indicates a modeling error
    High = 2
};

inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::SINGLE_ELEMENT_GROUP: return "SINGLE_ELEMENT_GROUP";
        case WarningCode::COARSE_DISCRETIZATION: return "COARSE_DISCRETIZATION";
        case WarningCode::FASTENER_OUTSIDE_PLATE: return "FASTENER_OUTSIDE_PLATE";
        case WarningCode::ROWS_MERGED: return "ROWS_MERGED";
        case WarningCode::ICR_ELASTIC_FALLBACK: return "ICR_ELASTIC_FALLBACK";
        default: return "UNKNOWN_WARNING";
    }
}

inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning information for connex.
 */
struct ConnexWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Element indices involved in the warning
    std::vector<int> involved_elements;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the warning
    std::string suggestion;

    ConnexWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        if (!involved_elements.empty()) {
            result += "\n  Elements: ";
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

    // === Factory methods for common warnings ===

    static ConnexWarning single_element_group() {
        ConnexWarning warn(WarningCode::SINGLE_ELEMENT_GROUP, WarningSeverity::Medium,
            "Element group has a single element");
        warn.involved_elements.push_back(0);
        warn.suggestion = "A single element cannot resist torsion about its own position";
        return warn;
    }

    static ConnexWarning coarse_discretization(int n_segments) {
        ConnexWarning warn(WarningCode::COARSE_DISCRETIZATION, WarningSeverity::Low,
            "Weld path has few discretized segments");
        warn.details["segments"] = std::to_string(n_segments);
        warn.suggestion = "Use a finer discretization for smoother stress distribution";
        return warn;
    }

    static ConnexWarning fastener_outside_plate(const std::vector<int>& fasteners) {
        ConnexWarning warn(WarningCode::FASTENER_OUTSIDE_PLATE, WarningSeverity::High,
            "Fastener lies outside the bearing plate");
        warn.involved_elements = fasteners;
        warn.suggestion = "Check plate corner coordinates against the fastener layout";
        return warn;
    }

    static ConnexWarning rows_merged(const std::string& axis, double spread) {
        ConnexWarning warn(WarningCode::ROWS_MERGED, WarningSeverity::Low,
            "Fastener rows grouped by tolerance merged distinct coordinates");
        warn.details["axis"] = axis;
        warn.details["max_spread"] = std::to_string(spread);
        return warn;
    }

    static ConnexWarning icr_elastic_fallback(const std::string& reason) {
        ConnexWarning warn(WarningCode::ICR_ELASTIC_FALLBACK, WarningSeverity::Low,
            "ICR method fell back to elastic distribution");
        warn.details["reason"] = reason;
        return warn;
    }
};

/**
 * @brief Collection of warnings from an analysis.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<ConnexWarning> warnings;

    void add(const ConnexWarning& warning) {
        warnings.push_back(warning);
    }

    void add(ConnexWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    /**
     * @brief Append all warnings of another list.
     */
    void merge(const WarningList& other) {
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

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

}  // namespace connex

#endif  // CONNEX_WARNINGS_HPP
