/**
 * @file warnings.hpp
 * @brief Warning system for questionable design inputs.
 *
 * Warnings flag conditions that don't prevent a check from completing
 * but that an engineer should review (slender members, sections outside
 * the scope of the simplified provisions, inconsistent catalog data).
 */

#ifndef STEELCHECK_WARNINGS_HPP
#define STEELCHECK_WARNINGS_HPP

#include <string>
#include <vector>
#include <map>

namespace steelcheck {

/**
 * @brief Warning codes for questionable design inputs.
 */
enum class WarningCode {
    // === Section Warnings (100-199) ===

    /// Catalog radius of gyration disagrees with sqrt(I/A)
    INCONSISTENT_SECTION = 100,

    /// Flange is non-compact for flexure (F3 interpolation applied)
    NONCOMPACT_FLANGE = 101,

    /// Flange is slender for flexure
    SLENDER_FLANGE = 102,

    /// Web shear buckling reduces Cv below 1.0
    WEB_SHEAR_BUCKLING = 103,

    // === Member Warnings (200-299) ===

    /// KL/r exceeds the recommended limit of 200
    SLENDERNESS_LIMIT = 200,

    /// Unbraced length is beyond Lr (elastic lateral-torsional buckling)
    LARGE_UNBRACED_LENGTH = 201,

    // === Demand Warnings (300-399) ===

    /// Check was run with zero demand
    ZERO_DEMAND = 300
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Informational
    Low = 0,

    /// Review recommended
    Medium = 1,

    /// Likely indicates a design or input problem
    High = 2
};

inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::INCONSISTENT_SECTION: return "INCONSISTENT_SECTION";
        case WarningCode::NONCOMPACT_FLANGE: return "NONCOMPACT_FLANGE";
        case WarningCode::SLENDER_FLANGE: return "SLENDER_FLANGE";
        case WarningCode::WEB_SHEAR_BUCKLING: return "WEB_SHEAR_BUCKLING";
        case WarningCode::SLENDERNESS_LIMIT: return "SLENDERNESS_LIMIT";
        case WarningCode::LARGE_UNBRACED_LENGTH: return "LARGE_UNBRACED_LENGTH";
        case WarningCode::ZERO_DEMAND: return "ZERO_DEMAND";
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
 * @brief Structured warning information for SteelCheck.
 */
struct CheckWarning {
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

    CheckWarning(WarningCode code, WarningSeverity severity, const std::string& message)
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

    static CheckWarning inconsistent_radius(const std::string& section_id,
                                            const std::string& axis,
                                            double catalog_value, double derived_value) {
        CheckWarning warn(WarningCode::INCONSISTENT_SECTION, WarningSeverity::Medium,
            "Catalog radius of gyration disagrees with sqrt(I/A)");
        warn.details["section"] = section_id;
        warn.details["axis"] = axis;
        warn.details["catalog_r"] = std::to_string(catalog_value) + " mm";
        warn.details["derived_r"] = std::to_string(derived_value) + " mm";
        warn.suggestion = "The derived value is used; check the catalog record";
        return warn;
    }

    static CheckWarning noncompact_flange(double lambda, double lambda_p, double lambda_r) {
        CheckWarning warn(WarningCode::NONCOMPACT_FLANGE, WarningSeverity::Low,
            "Flange is non-compact; flange local buckling reduces Mn");
        warn.details["bf/2tf"] = std::to_string(lambda);
        warn.details["lambda_pf"] = std::to_string(lambda_p);
        warn.details["lambda_rf"] = std::to_string(lambda_r);
        return warn;
    }

    static CheckWarning slender_flange(double lambda, double lambda_r) {
        CheckWarning warn(WarningCode::SLENDER_FLANGE, WarningSeverity::Medium,
            "Flange is slender; elastic flange local buckling governs");
        warn.details["bf/2tf"] = std::to_string(lambda);
        warn.details["lambda_rf"] = std::to_string(lambda_r);
        warn.suggestion = "Consider a section with thicker flanges";
        return warn;
    }

    static CheckWarning web_shear_buckling(double h_tw, double Cv) {
        CheckWarning warn(WarningCode::WEB_SHEAR_BUCKLING, WarningSeverity::Low,
            "Web shear buckling coefficient below 1.0");
        warn.details["h/tw"] = std::to_string(h_tw);
        warn.details["Cv"] = std::to_string(Cv);
        return warn;
    }

    static CheckWarning slenderness_limit(double KL_r) {
        CheckWarning warn(WarningCode::SLENDERNESS_LIMIT, WarningSeverity::High,
            "Member slenderness KL/r exceeds 200");
        warn.details["KL/r"] = std::to_string(KL_r);
        warn.suggestion = "Reduce the unbraced length or use a section with a larger radius of gyration";
        return warn;
    }

    static CheckWarning large_unbraced_length(double Lb, double Lr) {
        CheckWarning warn(WarningCode::LARGE_UNBRACED_LENGTH, WarningSeverity::Medium,
            "Unbraced length exceeds Lr; elastic lateral-torsional buckling governs");
        warn.details["Lb"] = std::to_string(Lb) + " m";
        warn.details["Lr"] = std::to_string(Lr) + " m";
        warn.suggestion = "Add lateral bracing to the compression flange";
        return warn;
    }

    static CheckWarning zero_demand(const std::string& check) {
        CheckWarning warn(WarningCode::ZERO_DEMAND, WarningSeverity::Low,
            "No demand for " + check + " check");
        return warn;
    }
};

/**
 * @brief Collection of warnings attached to a check result.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<CheckWarning> warnings;

    void add(const CheckWarning& warning) {
        warnings.push_back(warning);
    }

    void add(CheckWarning&& warning) {
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

}  // namespace steelcheck

#endif  // STEELCHECK_WARNINGS_HPP
