/**
 * @file errors.hpp
 * @brief Structured error handling for SteelCheck.
 *
 * Every check validates its inputs before computing anything. Invalid
 * input is reported by throwing a CheckException that carries a
 * machine-readable CheckError (code, offending field and value), so the
 * calling layer can map it to a status code or a precise user message.
 */

#ifndef STEELCHECK_ERRORS_HPP
#define STEELCHECK_ERRORS_HPP

#include <string>
#include <map>
#include <sstream>
#include <stdexcept>

namespace steelcheck {

/**
 * @brief Error codes for SteelCheck failures.
 */
enum class ErrorCode {
    /// No error
    OK = 0,

    // === Reference Errors (100-199) ===

    /// Unknown section identifier
    SECTION_NOT_FOUND = 100,

    /// Unknown material identifier
    MATERIAL_NOT_FOUND = 101,

    /// Unknown bolt grade
    BOLT_GRADE_NOT_FOUND = 102,

    /// Unknown bolt nominal diameter
    BOLT_DIAMETER_NOT_FOUND = 103,

    /// Frame element references a non-existent node
    NODE_NOT_FOUND = 104,

    // === Validation Errors (200-299) ===

    /// Section or material property is invalid (e.g. zero area)
    INVALID_PROPERTY = 200,

    /// Force demand is invalid (e.g. non-finite value)
    INVALID_DEMAND = 201,

    /// Length, span or spacing is invalid
    INVALID_GEOMETRY = 202,

    /// Load type tag not recognised or load magnitude not admissible
    INVALID_LOAD_TYPE = 203,

    /// Configuration not covered by the design tables
    UNSUPPORTED_CONFIGURATION = 204
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::SECTION_NOT_FOUND: return "SECTION_NOT_FOUND";
        case ErrorCode::MATERIAL_NOT_FOUND: return "MATERIAL_NOT_FOUND";
        case ErrorCode::BOLT_GRADE_NOT_FOUND: return "BOLT_GRADE_NOT_FOUND";
        case ErrorCode::BOLT_DIAMETER_NOT_FOUND: return "BOLT_DIAMETER_NOT_FOUND";
        case ErrorCode::NODE_NOT_FOUND: return "NODE_NOT_FOUND";
        case ErrorCode::INVALID_PROPERTY: return "INVALID_PROPERTY";
        case ErrorCode::INVALID_DEMAND: return "INVALID_DEMAND";
        case ErrorCode::INVALID_GEOMETRY: return "INVALID_GEOMETRY";
        case ErrorCode::INVALID_LOAD_TYPE: return "INVALID_LOAD_TYPE";
        case ErrorCode::UNSUPPORTED_CONFIGURATION: return "UNSUPPORTED_CONFIGURATION";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for SteelCheck.
 *
 * Contains machine-readable error code, human-readable message,
 * the offending field and its value.
 */
struct CheckError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Name of the offending input field (empty if not field-specific)
    std::string field;

    /// Offending value, formatted for display
    std::string value;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    /**
     * @brief Default constructor creates OK status.
     */
    CheckError()
        : code(ErrorCode::OK), message("OK") {}

    /**
     * @brief Construct error with code and message.
     */
    CheckError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }

    /**
     * @brief Unknown identifier (section, material, bolt, node).
     */
    bool is_not_found() const {
        int c = static_cast<int>(code);
        return c >= 100 && c < 200;
    }

    /**
     * @brief Invalid geometry, demand, property or configuration.
     */
    bool is_validation() const {
        int c = static_cast<int>(code);
        return c >= 200 && c < 300;
    }

    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;
        if (!field.empty()) {
            result += "\n  Field: " + field;
            if (!value.empty()) result += " = " + value;
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

    static CheckError section_not_found(const std::string& id) {
        CheckError err(ErrorCode::SECTION_NOT_FOUND, "Section '" + id + "' not found");
        err.field = "section_id";
        err.value = id;
        err.suggestion = "Use SectionCatalog::ids() to list the available sections.";
        return err;
    }

    static CheckError material_not_found(const std::string& id) {
        CheckError err(ErrorCode::MATERIAL_NOT_FOUND, "Material '" + id + "' not found");
        err.field = "material_id";
        err.value = id;
        err.suggestion = "Use MaterialCatalog::ids() to list the available steel grades.";
        return err;
    }

    static CheckError bolt_grade_not_found(const std::string& grade) {
        CheckError err(ErrorCode::BOLT_GRADE_NOT_FOUND, "Bolt grade '" + grade + "' not valid");
        err.field = "bolt_grade";
        err.value = grade;
        err.suggestion = "Valid grades: A325, A490, 4.6, 8.8, 10.9";
        return err;
    }

    static CheckError bolt_diameter_not_found(const std::string& diameter) {
        CheckError err(ErrorCode::BOLT_DIAMETER_NOT_FOUND,
            "Bolt diameter '" + diameter + "' not valid");
        err.field = "diameter";
        err.value = diameter;
        return err;
    }

    static CheckError node_not_found(int node_id, int element_id) {
        CheckError err(ErrorCode::NODE_NOT_FOUND,
            "Element " + std::to_string(element_id) + " references unknown node");
        err.field = "node_id";
        err.value = std::to_string(node_id);
        return err;
    }

    static CheckError invalid_property(const std::string& field, double value,
                                       const std::string& reason) {
        CheckError err(ErrorCode::INVALID_PROPERTY, "Invalid property: " + reason);
        err.field = field;
        err.value = format_value(value);
        err.suggestion = "Check section/material property values and units";
        return err;
    }

    static CheckError invalid_demand(const std::string& field, double value,
                                     const std::string& reason) {
        CheckError err(ErrorCode::INVALID_DEMAND, "Invalid demand: " + reason);
        err.field = field;
        err.value = format_value(value);
        return err;
    }

    static CheckError invalid_geometry(const std::string& field, double value,
                                       const std::string& reason) {
        CheckError err(ErrorCode::INVALID_GEOMETRY, "Invalid geometry: " + reason);
        err.field = field;
        err.value = format_value(value);
        return err;
    }

    static CheckError invalid_load_type(const std::string& tag, const std::string& reason) {
        CheckError err(ErrorCode::INVALID_LOAD_TYPE, "Invalid load: " + reason);
        err.field = "load_type";
        err.value = tag;
        err.suggestion = "Valid load types: D, L, Lr, S, W, E, R, H, F, T";
        return err;
    }

    static CheckError unsupported(const std::string& field, const std::string& value,
                                  const std::string& reason) {
        CheckError err(ErrorCode::UNSUPPORTED_CONFIGURATION,
            "Unsupported configuration: " + reason);
        err.field = field;
        err.value = value;
        return err;
    }

    static std::string format_value(double value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }
};

/**
 * @brief Exception thrown by every SteelCheck operation on invalid input.
 */
class CheckException : public std::runtime_error {
public:
    explicit CheckException(CheckError error)
        : std::runtime_error(error.to_string()), error_(std::move(error)) {}

    const CheckError& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    CheckError error_;
};

}  // namespace steelcheck

#endif  // STEELCHECK_ERRORS_HPP
